#pragma once
#include "../common.hpp"
#include "../game/rules.hpp"
#include "../io/transport.hpp"
#include "../io/vision.hpp"
#include "../protocol/encoder.hpp"
#include "../search/minimax.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tttarm::controller {

enum class MatchState {
    AwaitingHumanMove,
    MachineTurn,
    GameOver
};

struct ControllerConfig {
    // Opening cell for the machine; when set the machine moves first
    std::optional<int> machine_opening;
    // Print moves, frames and the board to stdout
    bool log_moves = true;
};

enum class StepKind {
    Waiting,          // no observation yet
    Ignored,          // duplicate, machine-colored, or not the human's turn
    Rejected,         // out of range or occupied cell
    Cheat,            // a confirmed piece was moved; cheat report sent
    Accepted,         // human move taken and machine replied
    TransportFailed,  // state advanced but a frame could not be delivered
    Finished          // the match is over
};

// What happened during one controller step
struct StepOutcome {
    StepKind kind = StepKind::Waiting;
    std::vector<Frame> frames;                  // frames handed to the transport
    std::optional<int> machine_move;
    game::RuleError rule_error = game::RuleError::None;
    std::optional<game::CheatOutcome> cheat;
    std::string transport_error;
    GameResult result = GameResult::InProgress;
};

/**
 * Runs one match against the human at a time.
 *
 * Each observation is processed to completion (validate, apply, search,
 * encode, send) before the call returns. The transport is shared with the
 * caller and held for the controller's lifetime.
 */
class GameController {
public:
    /**
     * @param strategy Picks the machine's replies; exhaustive minimax when null.
     *                 The configured opening is played without consulting it.
     * @throws std::invalid_argument if transport is null or the opening
     *         cell is outside 0-8
     */
    explicit GameController(std::shared_ptr<Transport> transport,
                            ControllerConfig config = ControllerConfig{},
                            std::shared_ptr<MoveStrategy> strategy = nullptr);

    // Play the fixed opening in machine-first mode; no-op otherwise
    StepOutcome start();

    // Process one observation (or the lack of one)
    StepOutcome submit(const std::optional<Observation>& observation);

    // Poll vision until the match ends, a send fails or the budget runs out
    GameResult play_match(VisionSource& vision, int max_observations = 1000);

    // New match with the same configuration
    void reset();

    MatchState state() const;
    GameResult result() const { return game::evaluate(board_); }
    const Board& board() const { return board_; }
    const std::set<int>& confirmed_positions() const { return confirmed_; }
    int machine_move_count() const { return machine_move_count_; }
    const ControllerConfig& config() const { return config_; }
    std::string render_board() const { return game::render(board_); }

private:
    void machine_turn(StepOutcome& outcome);
    void emit(const protocol::Command& command, StepOutcome& outcome);
    void finish(StepOutcome& outcome);

    std::shared_ptr<Transport> transport_;
    ControllerConfig config_;
    std::shared_ptr<MoveStrategy> strategy_;

    Board board_;
    std::set<int> confirmed_;
    int machine_move_count_;
    MatchState turn_;
};

const char* to_string(StepKind kind);
const char* to_string(MatchState state);

} // namespace tttarm::controller
