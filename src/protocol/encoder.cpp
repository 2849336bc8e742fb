#include "protocol/encoder.hpp"
#include <cstdio>

namespace tttarm::protocol {

namespace {

// Arguments are written as given; the receiver expects single digits
std::string digits(int value) {
    return std::to_string(value);
}

} // namespace

std::string Command::payload() const {
    return digits(static_cast<int>(opcode)) + digits(arg1) + digits(arg2);
}

Command Command::human_move(int start, int target) {
    return Command{Opcode::HumanMove, start, target};
}

Command Command::machine_move(int move_number, int target) {
    return Command{Opcode::MachineMove, move_number, target};
}

Command Command::cheat_report(int from, int to) {
    return Command{Opcode::CheatReport, from, to};
}

Command Command::calibration_a(int start, int target) {
    return Command{Opcode::CalibrationA, start, target};
}

Command Command::calibration_b(int start, int target) {
    return Command{Opcode::CalibrationB, start, target};
}

Frame encode(const std::string& payload) {
    Frame frame;
    frame.reserve(payload.size() + 3);
    frame.push_back(kHeaderHigh);
    frame.push_back(kHeaderLow);
    frame.insert(frame.end(), payload.begin(), payload.end());
    frame.push_back(kTrailer);
    return frame;
}

Frame encode(const Command& command) {
    return encode(command.payload());
}

std::optional<std::string> decode(const Frame& frame) {
    if (frame.size() < 3 || frame[0] != kHeaderHigh || frame[1] != kHeaderLow ||
        frame.back() != kTrailer) {
        return std::nullopt;
    }
    return std::string(frame.begin() + 2, frame.end() - 1);
}

std::optional<Command> parse_command(const std::string& payload) {
    if (payload.size() != 3) {
        return std::nullopt;
    }
    for (char ch : payload) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
    }

    int opcode = payload[0] - '0';
    if (opcode < static_cast<int>(Opcode::HumanMove) ||
        opcode > static_cast<int>(Opcode::CalibrationB)) {
        return std::nullopt;
    }
    return Command{static_cast<Opcode>(opcode), payload[1] - '0', payload[2] - '0'};
}

std::string to_hex(const Frame& frame) {
    std::string out;
    char buf[4];
    for (size_t i = 0; i < frame.size(); ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", frame[i]);
        if (i > 0) {
            out += ' ';
        }
        out += buf;
    }
    return out;
}

} // namespace tttarm::protocol
