// tests/test_controller.cpp

#include <catch2/catch_test_macros.hpp>

#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"
#include "core/Dictionary.hpp"
#include "core/GameState.hpp"
#include "core/RandomSource.hpp"
#include "BoardBuilders.hpp"

using letterfall::core::Board;
using letterfall::core::GameConfig;
using letterfall::core::GameState;
using letterfall::core::GameStatus;
using letterfall::core::MersenneRandomSource;
using letterfall::core::Piece;
using letterfall::core::Position;
using letterfall::core::WordSet;
using letterfall::controller::GameController;
using letterfall::controller::InputAction;
using Ms = GameController::Duration;

TEST_CASE("GameController maps lateral input actions to GameState movement", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{21};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    REQUIRE(game.status() == GameStatus::Playing);
    auto before = game.activePiece()->minCorner();

    controller.handleAction(InputAction::MoveLeft);
    auto afterLeft = game.activePiece()->minCorner();
    REQUIRE(afterLeft.row == before.row);
    REQUIRE(afterLeft.col == before.col - 1);

    controller.handleAction(InputAction::MoveRight);
    REQUIRE(game.activePiece()->minCorner() == before);
}

TEST_CASE("GameController toggles pause/resume", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{21};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::Paused);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::Playing);
}

TEST_CASE("GameController update applies gravity once the interval accumulates", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{22};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    REQUIRE(game.gravityIntervalMs() == 600);
    const auto before = game.activePiece()->minCorner();

    for (int i = 0; i < 5; ++i) {
        controller.update(Ms{100});
    }
    REQUIRE(game.activePiece()->minCorner() == before);

    controller.update(Ms{100});
    REQUIRE(game.activePiece()->minCorner().row == before.row + 1);
    REQUIRE(controller.accumulatedMs() == 0.0);
}

TEST_CASE("GameController clamps long frames", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{23};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    const auto before = game.activePiece()->minCorner();
    controller.update(Ms{5000});
    REQUIRE(controller.accumulatedMs() == 100.0);
    REQUIRE(game.activePiece()->minCorner() == before);

    controller.update(Ms{-40});
    REQUIRE(controller.accumulatedMs() == 100.0);
}

TEST_CASE("GameController soft drop speeds gravity up five times", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{24};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    const auto before = game.activePiece()->minCorner();
    controller.handleAction(InputAction::SoftDropPressed);
    REQUIRE(controller.softDropHeld());

    controller.update(Ms{100});
    REQUIRE(controller.accumulatedMs() == 500.0);
    controller.update(Ms{100});
    REQUIRE(game.activePiece()->minCorner().row == before.row + 1);
    REQUIRE(controller.accumulatedMs() == 400.0);

    controller.handleAction(InputAction::SoftDropReleased);
    REQUIRE_FALSE(controller.softDropHeld());
}

TEST_CASE("GameController runs several gravity steps in one frame", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{25};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    Board b{33, 10};
    auto run = testing_support::runWith(b, testing_support::pieceAt(testing_support::kDot, "A", b, {0, 0}),
                                        Piece{testing_support::kDot, testing_support::letters("B"), 10});
    run.gravityIntervalMs = 100;
    testing_support::playFrom(game, run);

    controller.handleAction(InputAction::SoftDropPressed);
    controller.update(Ms{100});
    REQUIRE(game.activePiece()->minCorner() == Position{5, 0});
}

TEST_CASE("GameController holds gravity while paused", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{26};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    controller.handleAction(InputAction::SoftDropPressed);
    controller.update(Ms{100});
    controller.handleAction(InputAction::PauseResume);

    const auto before = game.activePiece()->minCorner();
    controller.update(Ms{100});
    controller.update(Ms{100});

    REQUIRE(game.activePiece()->minCorner() == before);
    REQUIRE(controller.accumulatedMs() == 0.0);
    REQUIRE_FALSE(controller.softDropHeld());

    // Soft drop cannot be armed while paused
    controller.handleAction(InputAction::SoftDropPressed);
    REQUIRE_FALSE(controller.softDropHeld());
}

TEST_CASE("GameController hard drop locks and starts the next piece fresh", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{27};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    const auto nextLetters = game.nextPiece()->letters();
    controller.update(Ms{100});
    controller.handleAction(InputAction::HardDrop);

    REQUIRE(controller.accumulatedMs() == 0.0);
    REQUIRE(game.lockedPieces() == 1);
    REQUIRE(game.activePiece()->letters() == nextLetters);
    REQUIRE(game.activePiece()->minCorner().row == 0);
}

TEST_CASE("GameController ignores input after game over", "[controller]")
{
    const WordSet dict;
    MersenneRandomSource random{28};
    GameState game{GameConfig{}, dict, random};
    GameController controller{game};

    Board b{33, 10};
    b.setCell(0, 5, 'Q');
    testing_support::playFrom(game, testing_support::runWith(
        b, testing_support::pieceAt(testing_support::kDot, "A", b, {32, 0}),
        Piece{testing_support::kDot, testing_support::letters("B"), 10}));

    controller.handleAction(InputAction::HardDrop);
    REQUIRE(game.status() == GameStatus::GameOver);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::GameOver);
}
