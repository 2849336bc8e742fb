#pragma once
#include "encoder.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace tttarm::protocol {

// Grid index on a board rotated 45 degrees; 3 and 4 pass through unchanged
int rotated_position(int position);

/**
 * Operator-triggered calibration moves for the arm.
 *
 * Four-step form: two moves of the human piece class followed by two of the
 * machine piece class. On the standard layout they go out as opcodes 1 and 2;
 * on the rotated layout as opcodes 4 and 5, with every position passed
 * through rotated_position first.
 */
class CalibrationSequence {
public:
    using Step = std::pair<int, int>;  // (start, target)

    /**
     * @throws std::invalid_argument if any position is not a single digit
     */
    CalibrationSequence(Step human1, Step human2, Step machine1, Step machine2,
                        bool rotated = false);

    // Single opcode 2 command from position to the board center
    static CalibrationSequence center(int position);

    // Next command to send, nothing once the sequence is exhausted
    std::optional<Command> next();

    bool done() const { return cursor_ >= commands_.size(); }
    size_t remaining() const { return commands_.size() - cursor_; }
    const std::vector<Command>& commands() const { return commands_; }

private:
    CalibrationSequence() = default;

    std::vector<Command> commands_;
    size_t cursor_ = 0;
};

} // namespace tttarm::protocol
