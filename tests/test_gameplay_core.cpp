#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "core/Board.hpp"
#include "core/Dictionary.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/RandomSource.hpp"
#include "BoardBuilders.hpp"

using namespace letterfall::core;
using testing_support::kBar3;
using testing_support::kBar4;
using testing_support::kDot;
using testing_support::letters;
using testing_support::pieceAt;
using testing_support::playFrom;
using testing_support::runWith;
using testing_support::writeColumn;
using testing_support::writeRow;

namespace {
    GameConfig smallBoard() {
        GameConfig config;
        config.rows = 8;
        config.cols = 6;
        return config;
    }

    std::vector<GameEvent> eventsOfKind(const std::vector<GameEvent>& events, GameEventKind kind) {
        std::vector<GameEvent> out;
        for (const auto& e : events) {
            if (e.kind == kind) out.push_back(e);
        }
        return out;
    }

    // No letter may sit above an empty cell once a resolve has finished
    bool isSettled(const Board& b) {
        for (int c = 0; c < b.cols(); ++c) {
            bool seenLetter = false;
            for (int r = 0; r < b.rows(); ++r) {
                if (b.isOccupied(r, c)) {
                    seenLetter = true;
                } else if (seenLetter) {
                    return false;
                }
            }
        }
        return true;
    }
}

TEST_CASE("Locking C,A,T in row 10 clears the word and collapses the columns", "[gameplay][words]") {
    const WordSet dict{{"cat"}};
    MersenneRandomSource random{11};
    GameState game{GameConfig{}, dict, random};

    // Columns 3-5 are solid below row 10 so the collapse is exactly one row
    Board b{33, 10};
    for (int r = 11; r < 33; ++r) {
        writeRow(b, r, 3, "ZZZ");
    }
    b.setCell(9, 4, 'X');

    playFrom(game, runWith(b, pieceAt(kBar3, "CAT", b, {10, 3}), Piece{kDot, letters("E"), 10}));

    REQUIRE_FALSE(game.tick()); // blocked below: locks and resolves

    REQUIRE(game.score() == 30);
    REQUIRE(game.removedWords() == std::vector<std::string>{"CAT"});
    REQUIRE(game.foundWords().count("cat") == 1);

    REQUIRE_FALSE(game.board().cell(10, 3).has_value());
    REQUIRE(game.board().cell(10, 4) == 'X');
    REQUIRE_FALSE(game.board().cell(10, 5).has_value());
    REQUIRE_FALSE(game.board().cell(9, 4).has_value());
    REQUIRE(isSettled(game.board()));

    const auto events = game.drainEvents();
    REQUIRE(eventsOfKind(events, GameEventKind::PieceLocked).size() == 1);
    const auto cleared = eventsOfKind(events, GameEventKind::WordsCleared);
    REQUIRE(cleared.size() == 1);
    REQUIRE(cleared[0].words == std::vector<std::string>{"CAT"});
    REQUIRE(cleared[0].cells == std::vector<Position>{{10, 3}, {10, 4}, {10, 5}});
    REQUIRE(cleared[0].value == 30);

    REQUIRE(game.status() == GameStatus::Playing);
    REQUIRE_FALSE(game.isResolving());
    REQUIRE(game.activePiece()->letters() == letters("E"));
}

TEST_CASE("Collapses that form new words resolve in further passes", "[gameplay][cascade]") {
    const WordSet dict{{"cat", "dog"}};
    MersenneRandomSource random{12};
    GameState game{smallBoard(), dict, random};

    // Removing CAT from column 1 drops the O between D and G
    Board b{8, 6};
    writeColumn(b, 4, 1, "OCAT");
    writeRow(b, 7, 0, "D.G");

    playFrom(game, runWith(b, pieceAt(kDot, "Z", b, {7, 5}), Piece{kDot, letters("E"), 6}));
    game.tick();

    REQUIRE(game.removedWords() == std::vector<std::string>{"CAT", "DOG"});
    REQUIRE(game.score() == 60);
    REQUIRE(game.combo().step() == 2);
    REQUIRE(game.combo().multiplier() == 1.5);

    REQUIRE(game.board().filledCount() == 1);
    REQUIRE(game.board().cell(7, 5) == 'Z');
    REQUIRE(eventsOfKind(game.drainEvents(), GameEventKind::WordsCleared).size() == 2);
}

TEST_CASE("Consecutive clears grow the combo and idle time decays it", "[gameplay][combo]") {
    const WordSet dict{{"cat"}};
    MersenneRandomSource random{13};
    GameState game{smallBoard(), dict, random};

    Board b{8, 6};
    playFrom(game, runWith(b, pieceAt(kBar3, "CAT", b, {7, 0}), Piece{kBar3, letters("CAT"), 6}));

    game.tick();
    REQUIRE(game.score() == 30);
    REQUIRE(game.combo().step() == 1);

    // Scored at the multiplier in force before this clear
    game.hardDrop();
    REQUIRE(game.score() == 60);
    REQUIRE(game.combo().multiplier() == 1.5);

    game.advanceTime(9001);
    REQUIRE(game.combo().step() == 1);
    REQUIRE(game.combo().multiplier() == 1.0);

    // Paused time does not decay the combo
    game.pause();
    game.advanceTime(20000);
    REQUIRE(game.combo().step() == 1);
}

TEST_CASE("No-repeat rule blocks words already found", "[gameplay][norepeat]") {
    const WordSet dict{{"house"}};
    MersenneRandomSource random{14};
    GameConfig config;
    config.rows = 8;
    config.cols = 8;
    GameState game{config, dict, random};

    const Piece::Cells bar5{{0, 0}, {0, 1}, {0, 2}, {0, 3}, {0, 4}};
    Board b{8, 8};
    auto run = runWith(b, pieceAt(bar5, "HOUSE", b, {7, 0}), Piece{kDot, letters("E"), 8});
    run.level = 20;

    SECTION("already found") {
        run.foundWords = {"house"};
        playFrom(game, run);
        REQUIRE(game.noRepeatsActive());
        game.tick();
        REQUIRE(game.score() == 0);
        REQUIRE(game.board().cell(7, 0) == 'H');
    }

    SECTION("first time") {
        playFrom(game, run);
        game.tick();
        REQUIRE(game.score() == 1000);
        REQUIRE(game.board().filledCount() == 0);
    }
}

TEST_CASE("Every fifth removed word opens a definition quiz", "[gameplay][quiz]") {
    const WordSet dict{{"cat"}};
    MersenneRandomSource random{15};
    GameState game{smallBoard(), dict, random};

    Board b{8, 6};
    auto run = runWith(b, pieceAt(kBar3, "CAT", b, {7, 0}), Piece{kDot, letters("E"), 6});
    run.removedWords = {"ONE", "TWO", "SIX", "TEN"};
    playFrom(game, run);

    game.tick();
    REQUIRE(game.status() == GameStatus::Quiz);
    REQUIRE(game.pendingQuizWord() == std::string{"CAT"});

    const auto requested = eventsOfKind(game.drainEvents(), GameEventKind::QuizRequested);
    REQUIRE(requested.size() == 1);
    REQUIRE(requested[0].words.front() == "CAT");

    REQUIRE_FALSE(game.moveLeft());
    REQUIRE_FALSE(game.tick());

    SECTION("correct answer adds the bonus") {
        REQUIRE(game.answerQuiz(QuizOutcome::Correct));
        REQUIRE(game.score() == 80);
        REQUIRE(game.status() == GameStatus::Playing);
        const auto ok = eventsOfKind(game.drainEvents(), GameEventKind::QuizCorrect);
        REQUIRE(ok.size() == 1);
        REQUIRE(ok[0].value == 50);
    }

    SECTION("wrong answer raises a random bottom row") {
        REQUIRE(game.board().filledCount() == 0);
        REQUIRE(game.answerQuiz(QuizOutcome::Incorrect));
        REQUIRE(game.score() == 30);
        REQUIRE(game.board().filledCount() == 6);
        for (int c = 0; c < 6; ++c) {
            REQUIRE(game.board().isOccupied(7, c));
        }
        REQUIRE(eventsOfKind(game.drainEvents(), GameEventKind::QuizWrong).size() == 1);
        // Nothing rose into the piece at spawn
        REQUIRE(game.status() == GameStatus::Playing);
        REQUIRE(game.activePiece()->minCorner() == Position{0, 3});
        REQUIRE_FALSE(game.result().has_value());
    }

    SECTION("a pause requested during the quiz holds after it") {
        game.addPauseReason("lifecycle");
        REQUIRE(game.status() == GameStatus::Quiz);

        REQUIRE(game.answerQuiz(QuizOutcome::Skipped));
        REQUIRE(game.status() == GameStatus::Paused);
        REQUIRE(game.score() == 30);

        game.removePauseReason("lifecycle");
        REQUIRE(game.status() == GameStatus::Playing);
    }

    REQUIRE_FALSE(game.answerQuiz(QuizOutcome::Correct));
}

TEST_CASE("A wrong answer that lifts letters into the new piece ends the run", "[gameplay][quiz]") {
    const WordSet dict{{"cat"}};
    MersenneRandomSource random{17};
    GameState game{smallBoard(), dict, random};

    // Column 3 is full below the spawn cell
    Board b{8, 6};
    writeColumn(b, 1, 3, "QQQQQQQ");
    auto run = runWith(b, pieceAt(kBar3, "CAT", b, {7, 0}), Piece{kDot, letters("E"), 6});
    run.removedWords = {"ONE", "TWO", "SIX", "TEN"};
    playFrom(game, run);

    game.tick();
    REQUIRE(game.status() == GameStatus::Quiz);
    REQUIRE(game.activePiece()->minCorner() == Position{0, 3});
    game.drainEvents();

    REQUIRE(game.answerQuiz(QuizOutcome::Incorrect));

    REQUIRE(game.status() == GameStatus::GameOver);
    REQUIRE(game.board().cell(0, 3) == 'Q');
    REQUIRE(game.result().has_value());
    REQUIRE(game.result()->score == 30);
    REQUIRE(game.result()->wordsRemoved == 5);

    const auto events = game.drainEvents();
    REQUIRE(eventsOfKind(events, GameEventKind::QuizWrong).size() == 1);
    REQUIRE(eventsOfKind(events, GameEventKind::GameOver).size() == 1);
    REQUIRE_FALSE(game.moveLeft());
}

TEST_CASE("Ten words level up and four cells make a big clear", "[gameplay][level]") {
    const WordSet dict{{"cats"}};
    MersenneRandomSource random{16};
    GameState game{smallBoard(), dict, random};

    Board b{8, 6};
    auto run = runWith(b, pieceAt(kBar4, "CATS", b, {7, 0}), Piece{kDot, letters("E"), 6});
    run.wordsFoundSinceLevelUp = 9;
    playFrom(game, run);

    game.tick();

    REQUIRE(game.score() == 40);
    REQUIRE(game.level() == 2);
    REQUIRE(game.gravityIntervalMs() == 540);
    REQUIRE(game.wordsFoundSinceLevelUp() == 0);

    const auto events = game.drainEvents();
    const auto levelUps = eventsOfKind(events, GameEventKind::LevelUp);
    REQUIRE(levelUps.size() == 1);
    REQUIRE(levelUps[0].value == 2);
    REQUIRE(eventsOfKind(events, GameEventKind::BigClear).size() == 1);
}

TEST_CASE("Hard drop reports the rows fallen and resolves at once", "[gameplay]") {
    const WordSet dict{{"cat"}};
    MersenneRandomSource random{17};
    GameState game{smallBoard(), dict, random};

    Board b{8, 6};
    playFrom(game, runWith(b, pieceAt(kBar3, "CAT", b, {0, 0}), Piece{kDot, letters("E"), 6}));

    REQUIRE(game.hardDrop() == 7);
    REQUIRE(game.score() == 30);
    REQUIRE(game.lockedPieces() == 1);
    REQUIRE(game.recentWords().front() == "CAT");
}
