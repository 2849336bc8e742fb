#include "protocol/calibration.hpp"
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace tttarm::protocol {

namespace {

constexpr int kCenter = 4;

void check_digit(int position) {
    if (position < 0 || position > 9) {
        throw std::invalid_argument("Calibration position must be a single digit: " +
                                    std::to_string(position));
    }
}

} // namespace

int rotated_position(int position) {
    switch (position) {
        case 2: return 0;
        case 5: return 1;
        case 8: return 2;
        case 1: return 3;
        case 7: return 5;
        case 0: return 6;
        case 6: return 8;
        default: return position;
    }
}

CalibrationSequence::CalibrationSequence(Step human1, Step human2, Step machine1, Step machine2,
                                         bool rotated) {
    for (const Step& step : {human1, human2, machine1, machine2}) {
        check_digit(step.first);
        check_digit(step.second);
    }

    auto map = [rotated](const Step& step) {
        return rotated ? Step{rotated_position(step.first), rotated_position(step.second)} : step;
    };

    auto human = [&](const Step& step) {
        Step s = map(step);
        return rotated ? Command::calibration_a(s.first, s.second)
                       : Command::human_move(s.first, s.second);
    };
    auto machine = [&](const Step& step) {
        Step s = map(step);
        return rotated ? Command::calibration_b(s.first, s.second)
                       : Command::machine_move(s.first, s.second);
    };

    commands_ = {human(human1), human(human2), machine(machine1), machine(machine2)};
}

CalibrationSequence CalibrationSequence::center(int position) {
    check_digit(position);
    CalibrationSequence seq;
    seq.commands_.push_back(Command::machine_move(position, kCenter));
    return seq;
}

std::optional<Command> CalibrationSequence::next() {
    if (done()) {
        return std::nullopt;
    }
    return commands_[cursor_++];
}

} // namespace tttarm::protocol
