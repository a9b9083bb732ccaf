#pragma once

#include "ComboTracker.hpp"

#include <cstdint>
#include <string>

namespace letterfall::core {

enum class DifficultyPreset : std::uint8_t {
    Casual,
    Standard,
    Hard,
    Insane
};

// Starting gravity for each preset, in milliseconds per row
int gravityForDifficulty(DifficultyPreset preset) noexcept;

// Parses "casual", "standard", "hard" or "insane" (any case); Standard otherwise
DifficultyPreset parseDifficulty(const std::string& text);

const char* toString(DifficultyPreset preset) noexcept;

struct GameConfig {
    static constexpr int kDefaultRows = 33;
    static constexpr int kDefaultCols = 10;
    static constexpr int kMinStartingLevel = 1;
    static constexpr int kMaxStartingLevel = 20;

    int rows{kDefaultRows};
    int cols{kDefaultCols};

    std::string playerName;              // session identity; empty disables saving
    int startingLevel{1};                // clamped to [1, 20]
    DifficultyPreset difficulty{DifficultyPreset::Standard};

    ComboSettings combo{};
    double scoreMultiplier{1.0};
    double softDropFactor{5.0};          // gravity speed-up while soft drop is held
    int maxFrameDeltaMs{100};            // longer frames are clamped

    int quizEveryRemovedWords{5};
    std::int64_t quizBonusPoints{50};
    std::size_t recentWordsCapacity{12};

    int clampedStartingLevel() const noexcept;
    int startingGravityIntervalMs() const noexcept { return gravityForDifficulty(difficulty); }
};

} // namespace letterfall::core
