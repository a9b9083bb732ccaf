#include "core/WordResolver.hpp"

#include <algorithm>
#include <utility>

namespace letterfall::core {

WordResolver::WordResolver(const Dictionary& dictionary)
    : dictionary_{dictionary}
{
}

std::vector<WordCandidate> WordResolver::findCandidates(const Board& board,
                                                        int minLength,
                                                        const FoundWordSet* excluded) const {
    std::vector<WordCandidate> out;
    if (minLength <= 0) return out;

    for (int row = 0; row < board.rows(); ++row) {
        scanLine(board, minLength, excluded, WordOrientation::Horizontal, row, out);
    }
    for (int col = 0; col < board.cols(); ++col) {
        scanLine(board, minLength, excluded, WordOrientation::Vertical, col, out);
    }
    return out;
}

void WordResolver::scanLine(const Board& board, int minLength, const FoundWordSet* excluded,
                            WordOrientation orientation, int line,
                            std::vector<WordCandidate>& out) const {
    const bool horizontal = (orientation == WordOrientation::Horizontal);
    const int extent = horizontal ? board.cols() : board.rows();

    auto at = [&](int i) {
        return horizontal ? Position{line, i} : Position{i, line};
    };

    for (int start = 0; start < extent; ++start) {
        std::string word;
        for (int end = start; end < extent; ++end) {
            const Position p = at(end);
            const auto letter = board.cell(p.row, p.col);
            if (!letter) {
                break; // every longer run from this start contains the gap
            }
            word.push_back(*letter);

            const int length = end - start + 1;
            if (length < minLength) continue;

            const std::string normalized = normalizeWord(word);
            if (!dictionary_.contains(normalized)) continue;
            if (excluded && excluded->count(normalized) > 0) continue;

            WordCandidate candidate;
            candidate.word = word;
            candidate.orientation = orientation;
            candidate.cells.reserve(static_cast<std::size_t>(length));
            for (int i = start; i <= end; ++i) {
                candidate.cells.push_back(at(i));
            }
            out.push_back(std::move(candidate));
        }
    }
}

std::vector<WordCandidate> WordResolver::selectNonOverlapping(std::vector<WordCandidate> candidates,
                                                              bool uniqueWords) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const WordCandidate& a, const WordCandidate& b) {
                         return a.length() > b.length();
                     });

    std::set<Position> claimed;
    std::set<std::string> acceptedWords;
    std::vector<WordCandidate> accepted;

    for (auto& candidate : candidates) {
        if (uniqueWords && acceptedWords.count(normalizeWord(candidate.word)) > 0) continue;

        const bool overlaps = std::any_of(candidate.cells.begin(), candidate.cells.end(),
                                          [&](const Position& p) { return claimed.count(p) > 0; });
        if (overlaps) continue;

        claimed.insert(candidate.cells.begin(), candidate.cells.end());
        acceptedWords.insert(normalizeWord(candidate.word));
        accepted.push_back(std::move(candidate));
    }
    return accepted;
}

void WordResolver::removeWords(Board& board, const std::vector<WordCandidate>& accepted) {
    for (const auto& w : accepted) {
        for (const auto& p : w.cells) {
            board.clearCell(p.row, p.col);
        }
    }
}

} // namespace letterfall::core
