#pragma once

namespace letterfall::core {

class LevelManager {
public:
    static constexpr int kWordsPerLevel = 10;
    static constexpr int kMinGravityIntervalMs = 120;

    LevelManager(int startingLevel = 1, int gravityIntervalMs = 600);

    int level() const noexcept { return level_; }
    int wordsFoundSinceLevelUp() const noexcept { return wordsFoundSinceLevelUp_; }
    int gravityIntervalMs() const noexcept { return gravityIntervalMs_; }

    // 3 + min(2, level / 10)
    int minWordLength() const noexcept { return minWordLength(level_); }
    static int minWordLength(int level) noexcept;

    // Words cannot be scored twice once the minimum length reaches 5
    bool noRepeatsActive() const noexcept { return minWordLength() >= 5; }

    void onWordFound() noexcept { ++wordsFoundSinceLevelUp_; }

    // Call once after a pass that removed words; true if the level went up
    bool checkLevelUp() noexcept;

    void reset(int startingLevel, int gravityIntervalMs) noexcept;

    // Values coming from a restored session
    void restore(int level, int wordsFoundSinceLevelUp, int gravityIntervalMs) noexcept;

private:
    int level_;
    int wordsFoundSinceLevelUp_{0};
    int gravityIntervalMs_;
};

} // namespace letterfall::core
