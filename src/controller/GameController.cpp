#include "controller/GameController.hpp"

#include <algorithm>

namespace letterfall::controller {

GameController::GameController(letterfall::core::GameState& game)
    : game_{game}
{
}

void GameController::handleAction(InputAction action) {
    using core::GameStatus;

    // If the game is over, only a restart from outside brings it back.
    if (game_.status() == GameStatus::GameOver) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        game_.moveLeft();
        break;
    case InputAction::MoveRight:
        game_.moveRight();
        break;
    case InputAction::Rotate:
        game_.rotate();
        break;
    case InputAction::SoftDropPressed:
        softDrop_ = (game_.status() == GameStatus::Playing);
        break;
    case InputAction::SoftDropReleased:
        softDrop_ = false;
        break;
    case InputAction::HardDrop:
        if (game_.isResolving()) break;
        game_.hardDrop();
        // The next piece starts with a fresh gravity interval
        accumulatedMs_ = 0.0;
        break;
    case InputAction::Hold:
        game_.holdSwap();
        break;
    case InputAction::PauseResume:
        game_.togglePause();
        break;
    }
}

void GameController::update(Duration elapsed) {
    using core::GameStatus;

    const auto& config = game_.config();
    const int dtMs = static_cast<int>(std::clamp<Duration::rep>(
        elapsed.count(), 0, static_cast<Duration::rep>(config.maxFrameDeltaMs)));

    game_.advanceTime(dtMs);

    if (game_.status() != GameStatus::Playing || game_.isResolving()) {
        // Nothing falls while paused or in a quiz; resume starts from zero
        accumulatedMs_ = 0.0;
        softDrop_ = false;
        return;
    }

    const int intervalMs = game_.gravityIntervalMs();
    if (intervalMs <= 0) {
        return;
    }

    accumulatedMs_ += dtMs * (softDrop_ ? config.softDropFactor : 1.0);

    // If a lot of time passed (lag), we might need several steps
    while (accumulatedMs_ >= intervalMs && game_.status() == GameStatus::Playing) {
        accumulatedMs_ -= intervalMs;
        if (!game_.tick()) {
            // Locked (or the mode changed): the next piece starts fresh
            accumulatedMs_ = 0.0;
            break;
        }
    }
}

void GameController::resetTiming() {
    accumulatedMs_ = 0.0;
    softDrop_ = false;
}

} // namespace letterfall::controller
