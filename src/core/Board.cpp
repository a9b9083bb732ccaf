#include "core/Board.hpp"
#include "core/Piece.hpp"
#include <algorithm>
#include <stdexcept>

namespace letterfall::core {

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
    , grid_(rows > 0 && cols > 0 ? static_cast<std::size_t>(rows * cols) : 0U, kEmpty)
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
}

std::optional<Letter> Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    const Letter l = grid_[index(row, col)];
    if (l == kEmpty) {
        return std::nullopt;
    }
    return l;
}

void Board::setCell(int row, int col, Letter letter) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    if (letter == kEmpty) {
        throw std::invalid_argument("Board::setCell needs a letter; use clearCell");
    }
    grid_[index(row, col)] = letter;
}

void Board::clearCell(int row, int col) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::clearCell out of range");
    }
    grid_[index(row, col)] = kEmpty;
}

bool Board::canPlace(const std::vector<Position>& cells) const noexcept {
    for (const auto& c : cells) {
        if (!isInside(c.row, c.col)) {
            return false; // out of board
        }
        if (grid_[index(c.row, c.col)] != kEmpty) {
            return false; // collision
        }
    }
    return true;
}

void Board::lockPiece(const Piece& piece) {
    const auto& cells = piece.cells();
    if (!canPlace(cells)) {
        throw std::logic_error("Board::lockPiece called with a piece in an illegal position");
    }

    const auto& letters = piece.letters();
    for (std::size_t i = 0; i < cells.size(); ++i) {
        grid_[index(cells[i].row, cells[i].col)] = letters[i];
    }
}

void Board::collapseColumns() {
    for (int col = 0; col < cols_; ++col) {
        // Walk bottom-up, writing each letter to the lowest free slot
        int write = rows_ - 1;
        for (int row = rows_ - 1; row >= 0; --row) {
            const Letter l = grid_[index(row, col)];
            if (l == kEmpty) continue;
            grid_[index(write, col)] = l;
            --write;
        }
        for (int row = write; row >= 0; --row) {
            grid_[index(row, col)] = kEmpty;
        }
    }
}

void Board::shiftUp() {
    std::copy(grid_.begin() + cols_, grid_.end(), grid_.begin());
    std::fill(grid_.end() - cols_, grid_.end(), kEmpty);
}

void Board::fillBottomRow(const std::vector<Letter>& letters) {
    if (static_cast<int>(letters.size()) != cols_) {
        throw std::invalid_argument("Board::fillBottomRow expects one letter per column");
    }
    for (int col = 0; col < cols_; ++col) {
        grid_[index(rows_ - 1, col)] = letters[col];
    }
}

int Board::filledCount() const noexcept {
    return static_cast<int>(std::count_if(grid_.begin(), grid_.end(),
                                          [](Letter l) { return l != kEmpty; }));
}

void Board::clear() noexcept {
    std::fill(grid_.begin(), grid_.end(), kEmpty);
}

} // namespace letterfall::core
