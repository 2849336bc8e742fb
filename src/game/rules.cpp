#include "game/rules.hpp"
#include <map>
#include <sstream>

namespace tttarm::game {

bool is_valid_move(const Board& board, int position) {
    return position >= 0 && position < kBoardCells && board[position] == Cell::Empty;
}

RuleError apply_move(Board& board, int position, Cell player) {
    if (position < 0 || position >= kBoardCells) {
        return RuleError::OutOfRange;
    }
    if (board[position] != Cell::Empty) {
        return RuleError::CellOccupied;
    }
    board[position] = player;
    return RuleError::None;
}

void clear_cell(Board& board, int position) {
    if (position >= 0 && position < kBoardCells) {
        board[position] = Cell::Empty;
    }
}

bool detect_winner(const Board& board, Cell player) {
    // Rows
    for (int r = 0; r < kBoardSide; r++) {
        if (cell_at(board, r, 0) == player && cell_at(board, r, 1) == player &&
            cell_at(board, r, 2) == player) {
            return true;
        }
    }

    // Columns
    for (int c = 0; c < kBoardSide; c++) {
        if (cell_at(board, 0, c) == player && cell_at(board, 1, c) == player &&
            cell_at(board, 2, c) == player) {
            return true;
        }
    }

    // Main diagonal, then anti-diagonal
    if (board[0] == player && board[4] == player && board[8] == player) {
        return true;
    }
    return board[2] == player && board[4] == player && board[6] == player;
}

bool is_full(const Board& board) {
    for (Cell cell : board) {
        if (cell == Cell::Empty) {
            return false;
        }
    }
    return true;
}

GameResult evaluate(const Board& board) {
    if (detect_winner(board, Cell::Human)) {
        return GameResult::HumanWin;
    }
    if (detect_winner(board, Cell::Machine)) {
        return GameResult::MachineWin;
    }
    if (is_full(board)) {
        return GameResult::Draw;
    }
    return GameResult::InProgress;
}

std::vector<int> get_valid_moves(const Board& board) {
    std::vector<int> moves;
    for (int i = 0; i < kBoardCells; i++) {
        if (board[i] == Cell::Empty) {
            moves.push_back(i);
        }
    }
    return moves;
}

namespace {

// Board index of every confirmed piece. A confirmed piece that is no longer
// visible is taken to be the one now standing on the newly observed cell.
std::map<int, int> locate_pieces(const Board& board,
                                 int candidate,
                                 const std::set<int>& confirmed,
                                 const std::optional<std::set<int>>& visible) {
    std::map<int, int> located;
    for (int piece : confirmed) {
        if (piece < 0 || piece >= kBoardCells || board[piece] != Cell::Human) {
            continue;
        }
        if (!visible.has_value() || visible->count(piece) > 0) {
            located[piece] = piece;
        } else {
            located[piece] = candidate;
        }
    }
    return located;
}

} // namespace

CheatOutcome detect_cheat(Board& board,
                          int candidate,
                          const std::set<int>& confirmed,
                          const std::optional<std::set<int>>& visible) {
    CheatOutcome outcome;

    // Positions before the update
    std::map<int, int> before;
    for (int piece : confirmed) {
        if (piece >= 0 && piece < kBoardCells && board[piece] == Cell::Human) {
            before[piece] = piece;
        }
    }

    outcome.error = apply_move(board, candidate, Cell::Human);
    if (outcome.error != RuleError::None) {
        return outcome;
    }

    std::map<int, int> after = locate_pieces(board, candidate, confirmed, visible);
    for (const auto& [piece, index] : before) {
        auto it = after.find(piece);
        if (it != after.end() && it->second != index) {
            outcome.cheat = true;
            outcome.from = index;
            outcome.to = it->second;
            clear_cell(board, candidate);
            return outcome;
        }
    }

    return outcome;
}

std::string render(const Board& board) {
    std::ostringstream out;
    for (int r = 0; r < kBoardSide; r++) {
        for (int c = 0; c < kBoardSide; c++) {
            switch (cell_at(board, r, c)) {
                case Cell::Human: out << 'X'; break;
                case Cell::Machine: out << 'O'; break;
                default: out << '.'; break;
            }
            if (c + 1 < kBoardSide) {
                out << ' ';
            }
        }
        out << '\n';
    }
    return out.str();
}

const char* to_string(RuleError error) {
    switch (error) {
        case RuleError::OutOfRange: return "OutOfRange";
        case RuleError::CellOccupied: return "CellOccupied";
        default: return "None";
    }
}

const char* to_string(GameResult result) {
    switch (result) {
        case GameResult::HumanWin: return "HumanWin";
        case GameResult::MachineWin: return "MachineWin";
        case GameResult::Draw: return "Draw";
        default: return "InProgress";
    }
}

} // namespace tttarm::game
