#pragma once
#include "../common.hpp"
#include <optional>
#include <string>

namespace tttarm::protocol {

constexpr uint8_t kHeaderHigh = 0xAA;
constexpr uint8_t kHeaderLow = 0x55;
constexpr uint8_t kTrailer = 0x9A;

enum class Opcode : uint8_t {
    HumanMove = 1,       // start position, target position
    MachineMove = 2,     // machine move number, target position
    CheatReport = 3,     // previous board index, new board index
    CalibrationA = 4,    // rotated layout, pre-mapped positions
    CalibrationB = 5     // rotated layout, pre-mapped positions
};

// Three-digit command: opcode followed by two single-digit arguments
struct Command {
    Opcode opcode = Opcode::HumanMove;
    int arg1 = 0;
    int arg2 = 0;

    std::string payload() const;

    static Command human_move(int start, int target);
    static Command machine_move(int move_number, int target);
    static Command cheat_report(int from, int to);
    static Command calibration_a(int start, int target);
    static Command calibration_b(int start, int target);
};

// Wrap payload bytes as-is between header and trailer. Never fails.
Frame encode(const std::string& payload);
Frame encode(const Command& command);

// Payload of a well-formed frame, nothing if header or trailer are wrong
std::optional<std::string> decode(const Frame& frame);

// "214" -> {MachineMove, 1, 4}; nothing unless 3 digits with a known opcode
std::optional<Command> parse_command(const std::string& payload);

// Space separated upper-case hex, e.g. "AA 55 32 31 34 9A"
std::string to_hex(const Frame& frame);

} // namespace tttarm::protocol
