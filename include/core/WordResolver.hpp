#pragma once

#include "Board.hpp"
#include "Dictionary.hpp"
#include "Types.hpp"

#include <set>
#include <string>
#include <vector>

namespace letterfall::core {

enum class WordOrientation : std::uint8_t {
    Horizontal,
    Vertical
};

struct WordCandidate {
    std::string word;             // as spelled on the board (upper-case)
    std::vector<Position> cells;  // in reading order
    WordOrientation orientation{WordOrientation::Horizontal};

    std::size_t length() const noexcept { return cells.size(); }
};

using FoundWordSet = std::set<std::string>;

// Finds dictionary words on the board and picks a non-overlapping set.
// Holds the dictionary by reference; the caller keeps it alive.
class WordResolver {
public:
    explicit WordResolver(const Dictionary& dictionary);

    // Every qualifying run of at least minLength letters: rows first
    // (row, start col, length), then columns (col, start row, length).
    // Words already in `excluded` are skipped when it is non-null.
    std::vector<WordCandidate> findCandidates(const Board& board,
                                              int minLength,
                                              const FoundWordSet* excluded) const;

    // Longest first (stable), dropping any candidate that shares a cell with
    // one accepted before it. With uniqueWords, a word is accepted at most once.
    static std::vector<WordCandidate> selectNonOverlapping(std::vector<WordCandidate> candidates,
                                                           bool uniqueWords = false);

    // Empty the cells of the accepted words (no collapse)
    static void removeWords(Board& board, const std::vector<WordCandidate>& accepted);

private:
    const Dictionary& dictionary_;

    void scanLine(const Board& board, int minLength, const FoundWordSet* excluded,
                  WordOrientation orientation, int line,
                  std::vector<WordCandidate>& out) const;
};

} // namespace letterfall::core
