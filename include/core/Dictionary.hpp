#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace letterfall::core {

// Lower-cases ASCII letters and folds UTF-8 accented Latin-1 letters
// ("\xC3\xA9" -> 'e'). Anything else is kept as-is.
std::string normalizeWord(const std::string& word);

// Membership test over normalized (lower-case) words.
class Dictionary {
public:
    virtual ~Dictionary() = default;

    virtual bool contains(const std::string& normalizedWord) const = 0;
};

// In-memory word list. An empty list is valid: no word ever qualifies.
class WordSet : public Dictionary {
public:
    WordSet() = default;
    explicit WordSet(const std::vector<std::string>& words);

    // One word per line; blank lines are skipped. A missing or unreadable
    // file yields an empty set and a warning on std::cerr.
    static WordSet loadFromFile(const std::string& path);

    bool contains(const std::string& normalizedWord) const override;

    void add(const std::string& word);
    std::size_t size() const noexcept { return words_.size(); }
    bool empty() const noexcept { return words_.empty(); }

    // Words in insertion order (used to draw quiz decoys)
    const std::vector<std::string>& words() const noexcept { return ordered_; }

private:
    std::unordered_set<std::string> words_;
    std::vector<std::string> ordered_;
};

} // namespace letterfall::core
