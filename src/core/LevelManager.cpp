#include "core/LevelManager.hpp"
#include <algorithm>

namespace letterfall::core {

LevelManager::LevelManager(int startingLevel, int gravityIntervalMs)
    : level_{std::max(1, startingLevel)}
    , gravityIntervalMs_{std::max(1, gravityIntervalMs)}
{
}

int LevelManager::minWordLength(int level) noexcept {
    return 3 + std::min(2, level / 10);
}

bool LevelManager::checkLevelUp() noexcept {
    if (wordsFoundSinceLevelUp_ < kWordsPerLevel) {
        return false;
    }

    ++level_;
    wordsFoundSinceLevelUp_ = 0;
    // 10% faster per level, never below the floor
    gravityIntervalMs_ = std::max(kMinGravityIntervalMs,
                                  static_cast<int>(gravityIntervalMs_ * 0.9));
    return true;
}

void LevelManager::reset(int startingLevel, int gravityIntervalMs) noexcept {
    level_ = std::max(1, startingLevel);
    wordsFoundSinceLevelUp_ = 0;
    gravityIntervalMs_ = std::max(1, gravityIntervalMs);
}

void LevelManager::restore(int level, int wordsFoundSinceLevelUp, int gravityIntervalMs) noexcept {
    level_ = std::max(1, level);
    wordsFoundSinceLevelUp_ = std::max(0, wordsFoundSinceLevelUp);
    gravityIntervalMs_ = std::max(1, gravityIntervalMs);
}

} // namespace letterfall::core
