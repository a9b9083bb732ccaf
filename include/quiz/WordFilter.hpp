#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace letterfall::quiz {

// Banned-word screening for quiz text. The board scan never consults it.
class WordFilter {
public:
    WordFilter() = default;
    explicit WordFilter(const std::vector<std::string>& bannedWords);

    // One entry per line; a missing file yields an empty filter and a
    // warning on std::cerr.
    static WordFilter loadFromFile(const std::string& path);

    // Lower-case, fold leetspeak (@ 4 -> a, 0 -> o, 1 ! -> i, $ 5 -> s,
    // 7 -> t, 3 -> e), turn punctuation into spaces, collapse whitespace.
    static std::string normalize(const std::string& text);

    bool isBanned(const std::string& word) const;

    // True if any banned entry appears as a whole word (or phrase) in text
    bool containsBannedWord(const std::string& text) const;

    // Keeps the definitions that contain no banned word, in order
    std::vector<std::string> filterDefinitions(const std::vector<std::string>& definitions) const;

    void add(const std::string& word);
    std::size_t size() const noexcept { return banned_.size(); }

private:
    std::unordered_set<std::string> banned_;
};

} // namespace letterfall::quiz
