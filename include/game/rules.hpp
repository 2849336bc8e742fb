#pragma once
#include "../common.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tttarm::game {

enum class RuleError {
    None,
    OutOfRange,
    CellOccupied
};

// Result of validating a human placement against the confirmed pieces.
struct CheatOutcome {
    bool cheat = false;
    int from = -1;               // index the displaced piece was confirmed at
    int to = -1;                 // index it was found at after the update
    RuleError error = RuleError::None;  // placement rejected before comparison

    bool clean() const { return !cheat && error == RuleError::None; }
};

// Core rules (no I/O)
bool is_valid_move(const Board& board, int position);
RuleError apply_move(Board& board, int position, Cell player);
void clear_cell(Board& board, int position);
bool detect_winner(const Board& board, Cell player);
bool is_full(const Board& board);
GameResult evaluate(const Board& board);
std::vector<int> get_valid_moves(const Board& board);

/**
 * Place a human piece at candidate and check that no confirmed piece moved.
 *
 * @param confirmed Positions of human pieces accepted earlier in the match
 * @param visible   Positions where human pieces are seen after the update;
 *                  when absent every confirmed piece is assumed to stay put
 * @return Clean (board updated), Cheat (board unchanged) or a rule error
 */
CheatOutcome detect_cheat(Board& board,
                          int candidate,
                          const std::set<int>& confirmed,
                          const std::optional<std::set<int>>& visible = std::nullopt);

// Text rendering, one row per line using '.', 'X' (human) and 'O' (machine)
std::string render(const Board& board);

const char* to_string(RuleError error);
const char* to_string(GameResult result);

} // namespace tttarm::game
