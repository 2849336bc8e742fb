#include "controller/game_controller.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tttarm::controller {

GameController::GameController(std::shared_ptr<Transport> transport, ControllerConfig config,
                               std::shared_ptr<MoveStrategy> strategy)
    : transport_(std::move(transport)), config_(config), strategy_(std::move(strategy)) {

    if (!transport_) {
        throw std::invalid_argument("GameController needs a transport");
    }
    if (config_.machine_opening.has_value() &&
        (*config_.machine_opening < 0 || *config_.machine_opening >= kBoardCells)) {
        throw std::invalid_argument("Machine opening must be in 0-8, got " +
                                    std::to_string(*config_.machine_opening));
    }
    if (!strategy_) {
        auto search = std::make_shared<MinimaxSearch>();
        search->set_log_usage(config_.log_moves);
        strategy_ = std::move(search);
    }
    reset();
}

void GameController::reset() {
    board_ = empty_board();
    confirmed_.clear();
    machine_move_count_ = 0;
    turn_ = config_.machine_opening.has_value() ? MatchState::MachineTurn
                                                : MatchState::AwaitingHumanMove;
}

MatchState GameController::state() const {
    if (result() != GameResult::InProgress) {
        return MatchState::GameOver;
    }
    return turn_;
}

StepOutcome GameController::start() {
    StepOutcome outcome;
    if (state() != MatchState::MachineTurn) {
        outcome.kind = StepKind::Ignored;
        outcome.result = result();
        return outcome;
    }

    outcome.kind = StepKind::Accepted;
    machine_turn(outcome);
    finish(outcome);
    return outcome;
}

StepOutcome GameController::submit(const std::optional<Observation>& observation) {
    StepOutcome outcome;
    outcome.result = result();

    if (state() == MatchState::GameOver) {
        outcome.kind = StepKind::Finished;
        return outcome;
    }
    if (state() != MatchState::AwaitingHumanMove) {
        outcome.kind = StepKind::Ignored;
        return outcome;
    }
    if (!observation.has_value()) {
        outcome.kind = StepKind::Waiting;
        return outcome;
    }

    // The arm's own pieces and pieces already accepted are not new moves
    if (observation->color != Cell::Human || confirmed_.count(observation->position) > 0) {
        outcome.kind = StepKind::Ignored;
        return outcome;
    }

    game::CheatOutcome check = game::detect_cheat(board_, observation->position, confirmed_,
                                                  observation->visible);
    if (check.error != game::RuleError::None) {
        if (config_.log_moves) {
            std::cout << "[Controller] rejected human move at " << observation->position
                      << ": " << game::to_string(check.error) << "\n";
        }
        outcome.kind = StepKind::Rejected;
        outcome.rule_error = check.error;
        return outcome;
    }

    if (check.cheat) {
        if (config_.log_moves) {
            std::cout << "[Controller] cheat: piece moved from " << check.from << " to "
                      << check.to << ", waiting for a new placement\n";
        }
        outcome.kind = StepKind::Cheat;
        outcome.cheat = check;
        emit(protocol::Command::cheat_report(check.from, check.to), outcome);
        return outcome;
    }

    confirmed_.insert(observation->position);
    if (config_.log_moves) {
        std::cout << "[Controller] human move at " << observation->position << "\n"
                  << render_board();
    }

    outcome.kind = StepKind::Accepted;
    if (result() == GameResult::InProgress) {
        turn_ = MatchState::MachineTurn;
        machine_turn(outcome);
    }
    finish(outcome);
    return outcome;
}

void GameController::machine_turn(StepOutcome& outcome) {
    std::optional<int> move;
    if (machine_move_count_ == 0 && config_.machine_opening.has_value()) {
        move = config_.machine_opening;
    } else {
        move = strategy_->select(board_);
    }
    if (!move.has_value()) {
        // The win/draw checks run before every machine turn, so a cell is free
        throw std::logic_error("Strategy returned no move with empty cells left");
    }

    game::RuleError error = game::apply_move(board_, *move, Cell::Machine);
    if (error != game::RuleError::None) {
        throw std::logic_error(std::string("Strategy produced an illegal move: ") +
                               game::to_string(error));
    }
    machine_move_count_++;
    turn_ = MatchState::AwaitingHumanMove;
    outcome.machine_move = move;

    if (config_.log_moves) {
        std::cout << "[Controller] machine move " << machine_move_count_ << " at " << *move
                  << "\n" << render_board();
    }
    emit(protocol::Command::machine_move(machine_move_count_, *move), outcome);
}

void GameController::emit(const protocol::Command& command, StepOutcome& outcome) {
    Frame frame = protocol::encode(command);
    try {
        transport_->send(frame);
    } catch (const TransportError& e) {
        if (config_.log_moves) {
            std::cout << "[Controller] send failed for " << command.payload() << ": "
                      << e.what() << "\n";
        }
        outcome.kind = StepKind::TransportFailed;
        outcome.transport_error = e.what();
        return;
    }

    if (config_.log_moves) {
        std::cout << "[Controller] sent " << command.payload() << " -> "
                  << protocol::to_hex(frame) << "\n";
    }
    outcome.frames.push_back(std::move(frame));
}

void GameController::finish(StepOutcome& outcome) {
    outcome.result = result();
    if (outcome.result == GameResult::InProgress) {
        return;
    }
    if (outcome.kind != StepKind::TransportFailed) {
        outcome.kind = StepKind::Finished;
    }
    if (config_.log_moves) {
        std::cout << "[Controller] game over: " << game::to_string(outcome.result) << "\n";
    }
}

GameResult GameController::play_match(VisionSource& vision, int max_observations) {
    if (state() == MatchState::MachineTurn) {
        StepOutcome opening = start();
        if (opening.kind == StepKind::TransportFailed) {
            return result();
        }
    }

    for (int i = 0; i < max_observations && state() != MatchState::GameOver; i++) {
        StepOutcome outcome = submit(vision.observe());
        if (outcome.kind == StepKind::TransportFailed) {
            break;
        }
    }
    return result();
}

const char* to_string(StepKind kind) {
    switch (kind) {
        case StepKind::Waiting: return "Waiting";
        case StepKind::Ignored: return "Ignored";
        case StepKind::Rejected: return "Rejected";
        case StepKind::Cheat: return "Cheat";
        case StepKind::Accepted: return "Accepted";
        case StepKind::TransportFailed: return "TransportFailed";
        default: return "Finished";
    }
}

const char* to_string(MatchState state) {
    switch (state) {
        case MatchState::AwaitingHumanMove: return "AwaitingHumanMove";
        case MatchState::MachineTurn: return "MachineTurn";
        default: return "GameOver";
    }
}

} // namespace tttarm::controller
