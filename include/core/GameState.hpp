#pragma once

#include "Board.hpp"
#include "ComboTracker.hpp"
#include "Dictionary.hpp"
#include "GameConfig.hpp"
#include "GameEvents.hpp"
#include "GameResult.hpp"
#include "LevelManager.hpp"
#include "Piece.hpp"
#include "PieceFactory.hpp"
#include "RandomSource.hpp"
#include "RunState.hpp"
#include "ScoreManager.hpp"
#include "WordResolver.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace letterfall::core {

class GameState {
public:
    static constexpr const char* kUserPauseReason = "user";

    /// Does not own the dictionary or the random source; caller keeps them alive.
    /// The run starts immediately in Playing with fresh pieces.
    GameState(GameConfig config, const Dictionary& dictionary, RandomSource& random);

    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return board_; }
    const std::optional<Piece>& activePiece() const noexcept { return activePiece_; }
    const std::optional<Piece>& nextPiece() const noexcept { return nextPiece_; }
    const std::optional<Piece>& heldPiece() const noexcept { return heldPiece_; }

    std::int64_t score() const noexcept { return scoreManager_.score(); }
    int level() const noexcept { return levelManager_.level(); }
    int gravityIntervalMs() const noexcept { return levelManager_.gravityIntervalMs(); }
    int wordsFoundSinceLevelUp() const noexcept { return levelManager_.wordsFoundSinceLevelUp(); }
    int minWordLength() const noexcept { return levelManager_.minWordLength(); }
    bool noRepeatsActive() const noexcept { return levelManager_.noRepeatsActive(); }

    const FoundWordSet& foundWords() const noexcept { return foundWords_; }
    const std::vector<std::string>& removedWords() const noexcept { return removedWords_; }
    const std::deque<std::string>& recentWords() const noexcept { return recentWords_; }
    const ComboTracker& combo() const noexcept { return combo_; }

    bool holdUsed() const noexcept { return holdUsed_; }
    GameStatus status() const noexcept { return status_; }
    bool isResolving() const noexcept { return resolving_; }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }

    // Bumped on every change worth persisting (locks, holds, quiz answers, restarts)
    std::uint64_t revision() const noexcept { return revision_; }

    // Word waiting for a definition quiz while status() == Quiz
    const std::optional<std::string>& pendingQuizWord() const noexcept { return pendingQuizWord_; }

    const std::set<std::string>& pauseReasons() const noexcept { return pauseReasons_; }
    bool hasPauseReason(const std::string& reason) const;

    // Set once when the run ends; cleared by restart()
    const std::optional<GameResult>& result() const noexcept { return result_; }

    // Fresh run using the configured starting level and difficulty
    void restart();

    // Replace the run with a restored one. The game comes back Paused with no
    // pause reasons. Throws std::invalid_argument if the state is not playable.
    void resumeFrom(RunState run);

    // Player actions; refused unless Playing and no resolve is in progress
    bool moveLeft();
    bool moveRight();
    bool rotate();
    bool softDrop();      // one row down, no lock
    int hardDrop();       // drop, lock and resolve; returns rows dropped
    bool holdSwap();

    // One gravity step. True if the piece moved down; false if it locked or
    // the game is not in a state where gravity applies.
    bool tick();

    // Feed elapsed time for combo decay and run duration
    void advanceTime(int elapsedMs);

    // Pause bookkeeping: the game stays paused while any reason is held
    void addPauseReason(const std::string& reason);
    void removePauseReason(const std::string& reason);
    void pause() { addPauseReason(kUserPauseReason); }
    void resume() { removePauseReason(kUserPauseReason); }
    void togglePause();

    // Apply the answer to the pending quiz; false if no quiz is open
    bool answerQuiz(QuizOutcome outcome);

    std::vector<GameEvent> drainEvents();

private:
    GameConfig config_;
    WordResolver resolver_;
    PieceFactory factory_;

    Board board_;
    ScoreManager scoreManager_;
    LevelManager levelManager_;
    ComboTracker combo_;

    std::optional<Piece> activePiece_;
    std::optional<Piece> nextPiece_;
    std::optional<Piece> heldPiece_;
    bool holdUsed_{false};

    FoundWordSet foundWords_;
    std::vector<std::string> removedWords_;
    std::deque<std::string> recentWords_;

    GameStatus status_{GameStatus::Playing};
    std::set<std::string> pauseReasons_;
    std::optional<std::string> pendingQuizWord_;
    bool resolving_{false};

    std::uint64_t lockedPieces_{0};
    std::uint64_t revision_{0};
    std::chrono::milliseconds runTime_{0};
    std::optional<GameResult> result_;
    std::vector<GameEvent> events_;

    bool canPlayInput() const noexcept;

    void lockActivePieceAndResolve();
    void resolveCascade();
    void spawnNextPiece();
    void enterGameOver();
    void leaveQuiz();

    void emit(GameEventKind kind, std::int64_t value = 0);
};

} // namespace letterfall::core
