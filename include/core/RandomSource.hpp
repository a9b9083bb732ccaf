#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace letterfall::core {

// Source of randomness used for shapes, letters and quiz decoys.
// Only rangeInt() is virtual so tests can script the sequence.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform integer in [minInclusive, maxExclusive).
    virtual int rangeInt(int minInclusive, int maxExclusive) = 0;

    template <typename T>
    const T& choice(const std::vector<T>& items) {
        if (items.empty()) {
            throw std::invalid_argument("RandomSource::choice on empty list");
        }
        return items[static_cast<std::size_t>(rangeInt(0, static_cast<int>(items.size())))];
    }

    template <typename T>
    const T& weightedChoice(const std::vector<T>& items, const std::vector<int>& weights) {
        if (items.empty() || items.size() != weights.size()) {
            throw std::invalid_argument("RandomSource::weightedChoice: items and weights mismatch");
        }
        int total = 0;
        for (int w : weights) total += w;
        if (total <= 0) {
            throw std::invalid_argument("RandomSource::weightedChoice: weights must sum to a positive value");
        }

        const int pick = rangeInt(0, total);
        int acc = 0;
        for (std::size_t i = 0; i < items.size(); ++i) {
            acc += weights[i];
            if (pick < acc) return items[i];
        }
        return items.back();
    }
};

class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(std::uint32_t seed);

    int rangeInt(int minInclusive, int maxExclusive) override;

private:
    std::mt19937 rng_;
};

} // namespace letterfall::core
