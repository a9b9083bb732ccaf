#include "core/RandomSource.hpp"

namespace letterfall::core {

MersenneRandomSource::MersenneRandomSource()
    : rng_{std::random_device{}()}
{
}

MersenneRandomSource::MersenneRandomSource(std::uint32_t seed)
    : rng_{seed}
{
}

int MersenneRandomSource::rangeInt(int minInclusive, int maxExclusive) {
    if (maxExclusive <= minInclusive) {
        throw std::invalid_argument("MersenneRandomSource::rangeInt: empty range");
    }
    std::uniform_int_distribution<int> dist(minInclusive, maxExclusive - 1);
    return dist(rng_);
}

} // namespace letterfall::core
