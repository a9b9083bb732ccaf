#include "core/ComboTracker.hpp"
#include <algorithm>

namespace letterfall::core {

namespace {
    constexpr int kClearFlashMs = 300;
    constexpr int kDecayFlashMs = 240;
}

ComboTracker::ComboTracker(ComboSettings settings)
    : settings_{settings}
{
    reset();
}

void ComboTracker::reset() noexcept {
    step_ = 0;
    multiplier_ = settings_.startMultiplier;
    msSinceLastClear_ = 0;
    flashMs_ = 0;
}

void ComboTracker::onClear() noexcept {
    ++step_;
    multiplier_ = std::min(settings_.startMultiplier + settings_.growthPerStep * (step_ - 1),
                           settings_.maxMultiplier);
    msSinceLastClear_ = 0;
    flashMs_ = kClearFlashMs;
}

void ComboTracker::update(int elapsedMs) noexcept {
    if (elapsedMs < 0) return;

    msSinceLastClear_ += elapsedMs;
    if (msSinceLastClear_ > settings_.decayWindowMs && step_ > 0) {
        --step_;
        multiplier_ = std::max(settings_.startMultiplier
                                   + settings_.growthPerStep * std::max(0, step_ - 1),
                               settings_.startMultiplier);
        msSinceLastClear_ = 0;
        flashMs_ = kDecayFlashMs;
    }

    if (flashMs_ > 0) {
        flashMs_ = std::max(0, flashMs_ - elapsedMs);
    }
}

} // namespace letterfall::core
