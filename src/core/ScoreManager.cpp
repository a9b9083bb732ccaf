#include "core/ScoreManager.hpp"
#include <cmath>

namespace letterfall::core {

std::int64_t ScoreManager::addWord(int length, int level, double multiplier) {
    if (length <= 0 || level <= 0 || multiplier <= 0.0) return 0;

    const auto points = static_cast<std::int64_t>(
        std::floor(static_cast<double>(length) * 10.0 * level * multiplier));
    score_ += points;
    return points;
}

void ScoreManager::addBonus(std::int64_t points) {
    if (points <= 0) return;
    score_ += points;
}

} // namespace letterfall::core
