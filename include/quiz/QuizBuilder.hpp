#pragma once

#include "core/Dictionary.hpp"
#include "core/RandomSource.hpp"
#include "core/Types.hpp"
#include "quiz/DefinitionSource.hpp"
#include "quiz/WordFilter.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace letterfall::quiz {

struct QuizCard {
    std::string word;                 // upper-case, as shown
    std::vector<std::string> choices; // always kChoiceCount entries
    std::size_t correctIndex{0};

    const std::string& correctChoice() const { return choices.at(correctIndex); }

    // nullopt means the player skipped; an index past the end counts as wrong
    core::QuizOutcome judge(std::optional<std::size_t> pick) const noexcept;
};

// Multiple-choice card for a cleared word: its first safe definition plus
// decoy definitions of other dictionary words, shuffled.
class QuizBuilder {
public:
    static constexpr std::size_t kChoiceCount = 4;
    static constexpr int kMaxDecoyAttempts = 12;
    static constexpr const char* kNoDefinition = "No definition";
    static constexpr const char* kMissingDecoy = "--";

    // Holds references; the caller keeps every collaborator alive
    QuizBuilder(const DefinitionSource& definitions,
                const WordFilter& filter,
                core::RandomSource& random,
                const core::WordSet& decoyPool);

    QuizCard build(const std::string& word);

private:
    const DefinitionSource& definitions_;
    const WordFilter& filter_;
    core::RandomSource& random_;
    const core::WordSet& decoyPool_;

    std::vector<std::string> safeDefinitions(const std::string& word) const;
};

} // namespace letterfall::quiz
