#pragma once

namespace letterfall::core {

struct ComboSettings {
    int decayWindowMs{9000};
    double growthPerStep{0.5};
    double startMultiplier{1.0};
    double maxMultiplier{4.0};
};

// Multiplier that grows on every clear and decays one step per idle window.
class ComboTracker {
public:
    explicit ComboTracker(ComboSettings settings = {});

    int step() const noexcept { return step_; }
    double multiplier() const noexcept { return multiplier_; }
    int msSinceLastClear() const noexcept { return msSinceLastClear_; }
    int flashMs() const noexcept { return flashMs_; }
    bool isActive() const noexcept { return step_ > 0; }
    const ComboSettings& settings() const noexcept { return settings_; }

    void onClear() noexcept;
    void update(int elapsedMs) noexcept;

    double effectiveMultiplier(double base = 1.0) const noexcept {
        return base * multiplier_;
    }

    void reset() noexcept;

private:
    ComboSettings settings_;
    int step_{0};
    double multiplier_{1.0};
    int msSinceLastClear_{0};
    int flashMs_{0}; // remaining highlight time after a change, for the UI
};

} // namespace letterfall::core
