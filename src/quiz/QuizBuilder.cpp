#include "quiz/QuizBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace letterfall::quiz {

core::QuizOutcome QuizCard::judge(std::optional<std::size_t> pick) const noexcept {
    if (!pick) return core::QuizOutcome::Skipped;
    return *pick == correctIndex ? core::QuizOutcome::Correct : core::QuizOutcome::Incorrect;
}

QuizBuilder::QuizBuilder(const DefinitionSource& definitions,
                         const WordFilter& filter,
                         core::RandomSource& random,
                         const core::WordSet& decoyPool)
    : definitions_{definitions}
    , filter_{filter}
    , random_{random}
    , decoyPool_{decoyPool}
{
}

std::vector<std::string> QuizBuilder::safeDefinitions(const std::string& word) const {
    return filter_.filterDefinitions(definitions_.definitionsFor(core::normalizeWord(word)));
}

QuizCard QuizBuilder::build(const std::string& word) {
    QuizCard card;
    card.word.reserve(word.size());
    for (char c : word) {
        card.word.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    const auto defs = safeDefinitions(word);
    const std::string correct = defs.empty() ? kNoDefinition : defs.front();

    std::vector<std::string> decoys;
    const auto& pool = decoyPool_.words();
    const std::string self = core::normalizeWord(word);
    for (int i = 0; i < kMaxDecoyAttempts && decoys.size() < kChoiceCount - 1 && !pool.empty(); ++i) {
        const std::string& candidate = random_.choice(pool);
        if (candidate == self || filter_.isBanned(candidate)) continue;

        const auto d = safeDefinitions(candidate);
        if (d.empty() || d.front() == correct) continue;
        if (std::find(decoys.begin(), decoys.end(), d.front()) != decoys.end()) continue;
        decoys.push_back(d.front());
    }
    while (decoys.size() < kChoiceCount - 1) {
        decoys.emplace_back(kMissingDecoy);
    }

    card.choices.reserve(kChoiceCount);
    card.choices.push_back(correct);
    card.choices.insert(card.choices.end(), decoys.begin(), decoys.end());

    // Fisher-Yates; track where the correct answer lands
    std::size_t correctAt = 0;
    for (std::size_t i = card.choices.size() - 1; i > 0; --i) {
        const auto j = static_cast<std::size_t>(random_.rangeInt(0, static_cast<int>(i) + 1));
        std::swap(card.choices[i], card.choices[j]);
        if (correctAt == i) correctAt = j;
        else if (correctAt == j) correctAt = i;
    }
    card.correctIndex = correctAt;
    return card;
}

} // namespace letterfall::quiz
