#pragma once
#include <vector>
#include <array>
#include <cstdint>

namespace tttarm {

constexpr int kBoardCells = 9;
constexpr int kBoardSide = 3;

// Cell contents; values match the marks the arm firmware and vision side use
enum class Cell : int8_t {
    Empty = 0,
    Human = 1,
    Machine = 2
};

// Board representation (flat array, row-major: index = row * 3 + col)
using Board = std::array<Cell, kBoardCells>;

// Framed bytes for the actuator link
using Frame = std::vector<uint8_t>;

enum class GameResult {
    InProgress,
    HumanWin,
    MachineWin,
    Draw
};

inline Board empty_board() {
    Board board;
    board.fill(Cell::Empty);
    return board;
}

inline int to_index(int row, int col) {
    return row * kBoardSide + col;
}

inline Cell cell_at(const Board& board, int row, int col) {
    return board[to_index(row, col)];
}

inline Cell opponent(Cell player) {
    return player == Cell::Human ? Cell::Machine : Cell::Human;
}

} // namespace tttarm
