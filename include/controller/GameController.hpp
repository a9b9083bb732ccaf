#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include <chrono>

namespace letterfall::controller {

class GameController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(letterfall::core::GameState& game);

    /// Handle a single discrete player action (e.g. key press).
    void handleAction(InputAction action);

    // Called once per frame with the time since the previous frame.
    // Deltas are clamped to the configured maximum; combo decay is fed
    // every frame and gravity steps run while the accumulator allows.
    void update(Duration elapsed);

    // Reset timing accumulator (e.g. when game is reset or restored)
    void resetTiming();

    bool softDropHeld() const noexcept { return softDrop_; }
    double accumulatedMs() const noexcept { return accumulatedMs_; }

private:
    letterfall::core::GameState& game_;
    double accumulatedMs_{0.0};
    bool softDrop_{false};
};

} // namespace letterfall::controller
