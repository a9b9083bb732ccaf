#pragma once // Include guard

#include "Types.hpp"
#include <vector>

namespace letterfall::core {

class Board;

// A falling piece: a local shape (first offset is the rotation pivot), one
// letter per cell, and the absolute cells it currently occupies.
class Piece {
public:
    using Cells = std::vector<Position>;
    using Letters = std::vector<Letter>;

    // Throws std::invalid_argument if shape is empty or sizes differ.
    // The piece starts at its spawn position for a board `boardCols` wide.
    Piece(Cells shapeOffsets, Letters letters, int boardCols);

    const Cells& shapeOffsets() const noexcept { return shapeOffsets_; }
    const Letters& letters() const noexcept { return letters_; }
    const Cells& cells() const noexcept { return cells_; }
    std::size_t size() const noexcept { return letters_.size(); }

    // Place the shape back at row 0, column boardCols / 2
    void resetToSpawn();

    // Top-left corner of the bounding box of the current cells
    Position minCorner() const noexcept;

    bool canMove(const Board& board, int dRow, int dCol) const noexcept;

    // Applies the translation only if the destination is legal
    bool move(const Board& board, int dRow, int dCol) noexcept;

    // 90 degree turn about the first cell, then kicks (0,0) (+1,0) (-1,0) (0,-1)
    // given as (dCol, dRow). Returns false and leaves the piece alone if none fit.
    bool tryRotate(const Board& board);

    // Drop until blocked; returns how many rows the piece fell
    int hardDrop(const Board& board) noexcept;

private:
    Cells shapeOffsets_;
    Letters letters_;
    Cells cells_;
    int boardCols_;

    static Cells translated(const Cells& cells, int dRow, int dCol);
};

} // namespace letterfall::core
