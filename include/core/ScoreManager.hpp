#pragma once

#include <cstdint>

namespace letterfall::core {

class ScoreManager {
public:
    // floor(length * 10 * level * multiplier); returns the points added
    std::int64_t addWord(int length, int level, double multiplier);

    void addBonus(std::int64_t points);

    std::int64_t score() const noexcept { return score_; }

    void reset(std::int64_t score = 0) noexcept { score_ = score < 0 ? 0 : score; }

private:
    std::int64_t score_{0};
};

} // namespace letterfall::core
