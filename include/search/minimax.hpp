#pragma once
#include "../common.hpp"
#include <array>
#include <optional>

namespace tttarm {

// Interface for choosing the machine player's move
class MoveStrategy {
public:
    virtual ~MoveStrategy() = default;

    // Position to play for the machine, nothing when no cell is empty
    virtual std::optional<int> select(const Board& board) = 0;
};

/**
 * Exhaustive minimax over the remaining cells.
 *
 * Terminal positions score +1 (machine wins), -1 (human wins) or 0 (draw);
 * there is no static evaluation, no pruning and no transposition table.
 * At the root the first cell with the strictly greatest score wins, so ties
 * resolve to the lowest index.
 */
class MinimaxSearch : public MoveStrategy {
public:
    static constexpr int kUnscored = -2;

    MinimaxSearch() = default;

    std::optional<int> select(const Board& board) override;

    /**
     * Main API: best machine move for the given board.
     *
     * @param fixed_first_move Play this cell instead of searching (opening
     *                         move when the machine starts)
     * @throws std::invalid_argument if fixed_first_move is not an empty cell
     */
    std::optional<int> best_machine_move(const Board& board,
                                         std::optional<int> fixed_first_move = std::nullopt);

    // Root scores from the last search (kUnscored for cells not searched)
    const std::array<int, kBoardCells>& root_scores() const { return root_scores_; }

    // Leaf and interior positions visited by the last search
    long nodes_visited() const { return nodes_visited_; }

    void set_log_usage(bool enable) { log_usage_ = enable; }

private:
    // Recursive scoring with mutate/revert on the working board
    int minimax(Board& board, bool machine_to_move);

    std::array<int, kBoardCells> root_scores_{};
    long nodes_visited_ = 0;
    bool log_usage_ = false;
};

} // namespace tttarm
