#include "core/Piece.hpp"
#include "core/Board.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace letterfall::core {

Piece::Piece(Cells shapeOffsets, Letters letters, int boardCols)
    : shapeOffsets_{std::move(shapeOffsets)}
    , letters_{std::move(letters)}
    , cells_{}
    , boardCols_{boardCols}
{
    if (shapeOffsets_.empty()) {
        throw std::invalid_argument("Piece needs at least one cell");
    }
    if (shapeOffsets_.size() != letters_.size()) {
        throw std::invalid_argument("Piece needs exactly one letter per cell");
    }
    resetToSpawn();
}

void Piece::resetToSpawn() {
    const Position spawn{0, boardCols_ / 2};
    cells_ = translated(shapeOffsets_, spawn.row, spawn.col);
}

Position Piece::minCorner() const noexcept {
    Position corner = cells_.front();
    for (const auto& c : cells_) {
        corner.row = std::min(corner.row, c.row);
        corner.col = std::min(corner.col, c.col);
    }
    return corner;
}

bool Piece::canMove(const Board& board, int dRow, int dCol) const noexcept {
    for (const auto& c : cells_) {
        const int row = c.row + dRow;
        const int col = c.col + dCol;
        if (!board.isInside(row, col) || board.isOccupied(row, col)) {
            return false;
        }
    }
    return true;
}

bool Piece::move(const Board& board, int dRow, int dCol) noexcept {
    if (!canMove(board, dRow, dCol)) {
        return false;
    }
    for (auto& c : cells_) {
        c.row += dRow;
        c.col += dCol;
    }
    return true;
}

bool Piece::tryRotate(const Board& board) {
    const Position pivot = cells_.front();

    Cells rotated;
    rotated.reserve(cells_.size());
    for (const auto& c : cells_) {
        rotated.push_back(Position{
            pivot.row + (c.col - pivot.col),
            pivot.col - (c.row - pivot.row)
        });
    }

    // Kick order matters: the first legal candidate wins
    static constexpr std::array<std::pair<int, int>, 4> kKicks{{
        {0, 0}, {1, 0}, {-1, 0}, {0, -1}
    }};

    for (const auto& [kickCol, kickRow] : kKicks) {
        Cells candidate = translated(rotated, kickRow, kickCol);
        if (board.canPlace(candidate)) {
            cells_ = std::move(candidate);
            return true;
        }
    }
    return false;
}

int Piece::hardDrop(const Board& board) noexcept {
    int dropped = 0;
    while (move(board, 1, 0)) {
        ++dropped;
    }
    return dropped;
}

Piece::Cells Piece::translated(const Cells& cells, int dRow, int dCol) {
    Cells out;
    out.reserve(cells.size());
    for (const auto& c : cells) {
        out.push_back(Position{c.row + dRow, c.col + dCol});
    }
    return out;
}

} // namespace letterfall::core
