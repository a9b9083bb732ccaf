#include "core/GameConfig.hpp"
#include "core/Dictionary.hpp"

#include <algorithm>

namespace letterfall::core {

int gravityForDifficulty(DifficultyPreset preset) noexcept {
    switch (preset) {
    case DifficultyPreset::Casual:   return 750;
    case DifficultyPreset::Standard: return 600;
    case DifficultyPreset::Hard:     return 480;
    case DifficultyPreset::Insane:   return 380;
    }
    return 600;
}

DifficultyPreset parseDifficulty(const std::string& text) {
    const std::string t = normalizeWord(text);
    if (t == "casual") return DifficultyPreset::Casual;
    if (t == "hard")   return DifficultyPreset::Hard;
    if (t == "insane") return DifficultyPreset::Insane;
    return DifficultyPreset::Standard;
}

const char* toString(DifficultyPreset preset) noexcept {
    switch (preset) {
    case DifficultyPreset::Casual:   return "Casual";
    case DifficultyPreset::Standard: return "Standard";
    case DifficultyPreset::Hard:     return "Hard";
    case DifficultyPreset::Insane:   return "Insane";
    }
    return "Standard";
}

int GameConfig::clampedStartingLevel() const noexcept {
    return std::clamp(startingLevel, kMinStartingLevel, kMaxStartingLevel);
}

} // namespace letterfall::core
