#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace letterfall::quiz {

// Supplies definitions for quiz words. Lookups are synchronous; a source
// backed by slow storage should be filled before the run starts.
class DefinitionSource {
public:
    virtual ~DefinitionSource() = default;

    // Possibly empty; word is normalized (lower-case)
    virtual std::vector<std::string> definitionsFor(const std::string& word) const = 0;
};

// In-memory table, loadable from "word<TAB>definition" lines. A word may
// appear on several lines to carry several definitions.
class DefinitionTable : public DefinitionSource {
public:
    DefinitionTable() = default;

    static DefinitionTable loadFromFile(const std::string& path);

    std::vector<std::string> definitionsFor(const std::string& word) const override;

    // Drops brackets and quotes, trims, and ignores blanks and
    // case-insensitive duplicates
    void add(const std::string& word, const std::string& definition);

    std::size_t size() const noexcept { return table_.size(); }

private:
    std::unordered_map<std::string, std::vector<std::string>> table_;
};

} // namespace letterfall::quiz
