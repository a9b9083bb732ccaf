#pragma once

#include "Types.hpp"
#include <optional>
#include <vector>

namespace letterfall::core {

class Piece;

// Fixed-size grid of optional letters. Row 0 is the top of the well.
class Board {
public:
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    std::optional<Letter> cell(int row, int col) const;
    void setCell(int row, int col, Letter letter);
    void clearCell(int row, int col);

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    bool isOccupied(int row, int col) const noexcept {
        return isInside(row, col) && grid_[index(row, col)] != kEmpty;
    }

    // True if every cell is inside the board and currently empty
    bool canPlace(const std::vector<Position>& cells) const noexcept;

    // Write the piece letters into the grid. Throws std::logic_error if the
    // piece overlaps a wall or an occupied cell; the board is left untouched.
    void lockPiece(const Piece& piece);

    // Compact every column downward, keeping the relative order of letters
    void collapseColumns();

    // Move every row up by one, dropping the top row and emptying the bottom row
    void shiftUp();

    // Overwrite the bottom row with the given letters (size must equal cols)
    void fillBottomRow(const std::vector<Letter>& letters);

    // Count of non-empty cells
    int filledCount() const noexcept;

    void clear() noexcept;

private:
    static constexpr Letter kEmpty = '\0';

    int rows_;
    int cols_;
    std::vector<Letter> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }
};

} // namespace letterfall::core
