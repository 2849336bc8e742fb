#include "search/minimax.hpp"
#include "game/rules.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tttarm {

std::optional<int> MinimaxSearch::select(const Board& board) {
    return best_machine_move(board);
}

std::optional<int> MinimaxSearch::best_machine_move(const Board& board,
                                                    std::optional<int> fixed_first_move) {
    root_scores_.fill(kUnscored);
    nodes_visited_ = 0;

    if (fixed_first_move.has_value()) {
        if (!game::is_valid_move(board, *fixed_first_move)) {
            throw std::invalid_argument("Fixed first move must be an empty cell: " +
                                        std::to_string(*fixed_first_move));
        }
        if (log_usage_) {
            std::cout << "[Minimax] fixed opening move=" << *fixed_first_move << "\n";
        }
        return fixed_first_move;
    }

    // Work on a private copy, every trial placement is reverted
    Board work = board;
    int best_score = kUnscored;
    std::optional<int> best_move;

    for (int i = 0; i < kBoardCells; i++) {
        if (work[i] != Cell::Empty) {
            continue;
        }
        work[i] = Cell::Machine;
        int score = minimax(work, false);
        work[i] = Cell::Empty;

        root_scores_[i] = score;
        if (score > best_score) {
            best_score = score;
            best_move = i;
        }
    }

    if (log_usage_) {
        if (best_move.has_value()) {
            std::cout << "[Minimax] move=" << *best_move << " score=" << best_score
                      << " nodes=" << nodes_visited_ << "\n";
        } else {
            std::cout << "[Minimax] no empty cell\n";
        }
    }

    return best_move;
}

int MinimaxSearch::minimax(Board& board, bool machine_to_move) {
    nodes_visited_++;

    if (game::detect_winner(board, Cell::Machine)) {
        return 1;
    }
    if (game::detect_winner(board, Cell::Human)) {
        return -1;
    }
    if (game::is_full(board)) {
        return 0;
    }

    const Cell mark = machine_to_move ? Cell::Machine : Cell::Human;
    int best = machine_to_move ? -2 : 2;

    for (int i = 0; i < kBoardCells; i++) {
        if (board[i] != Cell::Empty) {
            continue;
        }
        board[i] = mark;
        int score = minimax(board, !machine_to_move);
        board[i] = Cell::Empty;

        best = machine_to_move ? std::max(best, score) : std::min(best, score);
    }

    return best;
}

} // namespace tttarm
