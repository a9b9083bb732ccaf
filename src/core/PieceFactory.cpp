#include "core/PieceFactory.hpp"

#include <utility>

namespace letterfall::core {

namespace {
    // Letter frequencies: vowels are weighted heavily so words can form
    const std::vector<Letter> kLetters{
        'A', 'E', 'I', 'O', 'U',
        'B', 'C', 'D', 'F', 'G', 'H', 'J', 'K', 'L', 'M',
        'N', 'P', 'Q', 'R', 'S', 'T', 'V', 'W', 'X', 'Y', 'Z'
    };
    const std::vector<int> kWeights{
        8, 8, 8, 8, 8,
        2, 2, 3, 1, 2, 2, 1, 1, 3, 2,
        4, 2, 1, 4, 4, 4, 1, 2, 1, 2, 1
    };

    std::vector<Letter> consonants() {
        std::vector<Letter> out;
        for (Letter l : kLetters) {
            if (!PieceFactory::isVowel(l)) out.push_back(l);
        }
        return out;
    }
}

PieceFactory::PieceFactory(RandomSource& random, int boardCols)
    : random_{random}
    , boardCols_{boardCols}
{
}

const std::vector<Piece::Cells>& PieceFactory::shapes() {
    // Offsets are {row, col}; the first entry is the rotation pivot
    static const std::vector<Piece::Cells> kShapes{
        // [ ][ ][ ][ ]
        {{0, 0}, {0, 1}, {0, 2}, {0, 3}},
        // [ ][ ]
        // [ ][ ]
        {{0, 0}, {0, 1}, {1, 0}, {1, 1}},
        // [ ][ ][ ]
        //       [ ]
        {{0, 0}, {0, 1}, {0, 2}, {1, 2}},
        //       [ ]
        // [ ][ ][ ]
        {{1, 0}, {1, 1}, {1, 2}, {0, 2}},
        // [ ][ ]
        //   [ ][ ]
        {{0, 0}, {0, 1}, {1, 1}, {1, 2}},
        //   [ ][ ]
        // [ ][ ]
        {{1, 0}, {1, 1}, {0, 1}, {0, 2}},
    };
    return kShapes;
}

bool PieceFactory::isVowel(Letter l) noexcept {
    switch (l) {
    case 'A': case 'E': case 'I': case 'O': case 'U':
        return true;
    default:
        return false;
    }
}

Letter PieceFactory::generateLetter() {
    return random_.weightedChoice(kLetters, kWeights);
}

Piece PieceFactory::createRandom() {
    const Piece::Cells& shape = random_.choice(shapes());

    Piece::Letters letters;
    letters.reserve(shape.size());
    bool consonantIncluded = false;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        const Letter l = generateLetter();
        if (!isVowel(l)) consonantIncluded = true;
        letters.push_back(l);
    }

    if (!consonantIncluded) {
        static const std::vector<Letter> kConsonants = consonants();
        const int slot = random_.rangeInt(0, static_cast<int>(letters.size()));
        letters[static_cast<std::size_t>(slot)] = random_.choice(kConsonants);
    }

    return Piece{shape, std::move(letters), boardCols_};
}

std::vector<Letter> PieceFactory::createRandomRow(int cols) {
    const Piece source = createRandom();
    const auto& letters = source.letters();

    std::vector<Letter> row;
    row.reserve(static_cast<std::size_t>(cols));
    for (int c = 0; c < cols; ++c) {
        row.push_back(random_.choice(letters));
    }
    return row;
}

} // namespace letterfall::core
