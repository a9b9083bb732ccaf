#pragma once

#include "Types.hpp"
#include "Piece.hpp"
#include "RandomSource.hpp"
#include <vector>

namespace letterfall::core {

class PieceFactory {
public:
    /// Factory does not own the random source; caller keeps it alive.
    PieceFactory(RandomSource& random, int boardCols);

    // Random shape with weighted letters; at least one letter is a consonant
    Piece createRandom();

    // Letters for a garbage row: one random piece's letters sampled per column
    std::vector<Letter> createRandomRow(int cols);

    static const std::vector<Piece::Cells>& shapes();
    static bool isVowel(Letter l) noexcept;

private:
    RandomSource& random_;
    int boardCols_;

    Letter generateLetter();
};

} // namespace letterfall::core
