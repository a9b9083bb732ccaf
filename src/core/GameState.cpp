#include "core/GameState.hpp"

#include <stdexcept>
#include <utility>

namespace letterfall::core {

namespace {
    constexpr std::size_t kBigClearCells = 4;

    // Sets the flag for the lifetime of one lock-and-resolve cycle
    class ResolveScope {
    public:
        explicit ResolveScope(bool& flag) : flag_{flag} { flag_ = true; }
        ~ResolveScope() { flag_ = false; }
        ResolveScope(const ResolveScope&) = delete;
        ResolveScope& operator=(const ResolveScope&) = delete;
    private:
        bool& flag_;
    };
}

GameState::GameState(GameConfig config, const Dictionary& dictionary, RandomSource& random)
    : config_{std::move(config)}
    , resolver_{dictionary}
    , factory_{random, config_.cols}
    , board_{config_.rows, config_.cols}
    , scoreManager_{}
    , levelManager_{config_.clampedStartingLevel(), config_.startingGravityIntervalMs()}
    , combo_{config_.combo}
{
    restart();
}

bool GameState::hasPauseReason(const std::string& reason) const {
    return pauseReasons_.count(normalizeWord(reason)) > 0;
}

void GameState::restart() {
    board_.clear();
    scoreManager_.reset();
    levelManager_.reset(config_.clampedStartingLevel(), config_.startingGravityIntervalMs());
    combo_.reset();

    activePiece_ = factory_.createRandom();
    nextPiece_ = factory_.createRandom();
    heldPiece_.reset();
    holdUsed_ = false;

    foundWords_.clear();
    removedWords_.clear();
    recentWords_.clear();

    status_ = GameStatus::Playing;
    pauseReasons_.clear();
    pendingQuizWord_.reset();
    resolving_ = false;

    lockedPieces_ = 0;
    runTime_ = std::chrono::milliseconds{0};
    result_.reset();
    events_.clear();
    ++revision_;
}

void GameState::resumeFrom(RunState run) {
    if (run.board.rows() != board_.rows() || run.board.cols() != board_.cols()) {
        throw std::invalid_argument("GameState::resumeFrom: board dimensions differ");
    }
    if (!run.current || !run.next) {
        throw std::invalid_argument("GameState::resumeFrom: current and next pieces are required");
    }
    if (!run.current->canMove(run.board, 0, 0)) {
        throw std::invalid_argument("GameState::resumeFrom: active piece collides with the board");
    }

    board_ = std::move(run.board);
    activePiece_ = std::move(run.current);
    nextPiece_ = std::move(run.next);
    heldPiece_ = std::move(run.held);
    holdUsed_ = run.holdUsed;

    scoreManager_.reset(run.score);
    levelManager_.restore(run.level, run.wordsFoundSinceLevelUp, run.gravityIntervalMs);
    combo_.reset();

    foundWords_ = std::move(run.foundWords);
    removedWords_ = std::move(run.removedWords);
    recentWords_.clear();
    for (auto it = removedWords_.rbegin();
         it != removedWords_.rend() && recentWords_.size() < config_.recentWordsCapacity; ++it) {
        recentWords_.push_back(*it);
    }

    // Back paused but with nothing holding the pause, so one resume() continues
    status_ = GameStatus::Paused;
    pauseReasons_.clear();
    pendingQuizWord_.reset();
    resolving_ = false;

    lockedPieces_ = 0;
    runTime_ = std::chrono::milliseconds{0};
    result_.reset();
    events_.clear();
}

bool GameState::canPlayInput() const noexcept {
    return status_ == GameStatus::Playing && !resolving_ && activePiece_.has_value();
}

bool GameState::moveLeft() {
    if (!canPlayInput()) return false;
    return activePiece_->move(board_, 0, -1);
}

bool GameState::moveRight() {
    if (!canPlayInput()) return false;
    return activePiece_->move(board_, 0, 1);
}

bool GameState::rotate() {
    if (!canPlayInput()) return false;
    return activePiece_->tryRotate(board_);
}

bool GameState::softDrop() {
    if (!canPlayInput()) return false;
    return activePiece_->move(board_, 1, 0);
}

int GameState::hardDrop() {
    if (!canPlayInput()) return 0;

    const int dropped = activePiece_->hardDrop(board_);
    lockActivePieceAndResolve();
    return dropped;
}

bool GameState::holdSwap() {
    if (!canPlayInput()) return false;
    if (holdUsed_ || !nextPiece_) return false;

    if (!heldPiece_) {
        heldPiece_ = std::move(activePiece_);
        activePiece_ = std::move(nextPiece_);
        nextPiece_ = factory_.createRandom();
    } else {
        std::swap(heldPiece_, activePiece_);
    }
    heldPiece_->resetToSpawn();
    activePiece_->resetToSpawn();
    holdUsed_ = true;
    ++revision_;

    if (!activePiece_->canMove(board_, 0, 0)) {
        enterGameOver();
    }
    return true;
}

bool GameState::tick() {
    if (!canPlayInput()) return false;

    if (activePiece_->move(board_, 1, 0)) {
        return true;
    }

    // Cannot move down => lock piece and bring in the next one
    lockActivePieceAndResolve();
    return false;
}

void GameState::advanceTime(int elapsedMs) {
    if (elapsedMs <= 0 || status_ == GameStatus::GameOver) return;

    runTime_ += std::chrono::milliseconds{elapsedMs};
    if (status_ == GameStatus::Playing && !resolving_) {
        combo_.update(elapsedMs);
    }
}

void GameState::addPauseReason(const std::string& reason) {
    if (status_ == GameStatus::GameOver) return;

    pauseReasons_.insert(normalizeWord(reason));
    if (status_ == GameStatus::Playing) {
        status_ = GameStatus::Paused;
    }
}

void GameState::removePauseReason(const std::string& reason) {
    pauseReasons_.erase(normalizeWord(reason));

    // Quiz and GameOver are never left from here
    if (status_ == GameStatus::Paused && pauseReasons_.empty()) {
        status_ = GameStatus::Playing;
    }
}

void GameState::togglePause() {
    if (status_ == GameStatus::Playing) {
        pause();
    } else if (status_ == GameStatus::Paused) {
        resume();
    }
}

bool GameState::answerQuiz(QuizOutcome outcome) {
    if (status_ != GameStatus::Quiz || !pendingQuizWord_) return false;

    switch (outcome) {
    case QuizOutcome::Correct:
        scoreManager_.addBonus(config_.quizBonusPoints);
        emit(GameEventKind::QuizCorrect, config_.quizBonusPoints);
        break;
    case QuizOutcome::Incorrect:
        board_.shiftUp();
        board_.fillBottomRow(factory_.createRandomRow(board_.cols()));
        emit(GameEventKind::QuizWrong);
        break;
    case QuizOutcome::Skipped:
        break;
    }

    pendingQuizWord_.reset();
    leaveQuiz();
    ++revision_;

    // A quiz only opens with a freshly spawned piece on the top row, so
    // letters raised into it leave no room above
    if (activePiece_ && !activePiece_->canMove(board_, 0, 0)) {
        enterGameOver();
    }
    return true;
}

void GameState::leaveQuiz() {
    if (status_ == GameStatus::Quiz) {
        status_ = pauseReasons_.empty() ? GameStatus::Playing : GameStatus::Paused;
    }
}

std::vector<GameEvent> GameState::drainEvents() {
    std::vector<GameEvent> out;
    out.swap(events_);
    return out;
}

void GameState::lockActivePieceAndResolve() {
    if (!activePiece_ || !nextPiece_) return;

    ResolveScope scope{resolving_};

    board_.lockPiece(*activePiece_);
    ++lockedPieces_;

    GameEvent locked;
    locked.kind = GameEventKind::PieceLocked;
    locked.cells = activePiece_->cells();
    events_.push_back(std::move(locked));
    activePiece_.reset();

    resolveCascade();
    spawnNextPiece();
    ++revision_;

    if (status_ == GameStatus::Playing && pendingQuizWord_) {
        status_ = GameStatus::Quiz;
        GameEvent quiz;
        quiz.kind = GameEventKind::QuizRequested;
        quiz.words.push_back(*pendingQuizWord_);
        events_.push_back(std::move(quiz));
    }
}

void GameState::resolveCascade() {
    while (true) {
        const bool noRepeats = levelManager_.noRepeatsActive();
        const double effective = combo_.effectiveMultiplier(config_.scoreMultiplier);

        auto accepted = WordResolver::selectNonOverlapping(
            resolver_.findCandidates(board_, levelManager_.minWordLength(),
                                     noRepeats ? &foundWords_ : nullptr),
            noRepeats);
        if (accepted.empty()) {
            break;
        }

        GameEvent cleared;
        cleared.kind = GameEventKind::WordsCleared;

        for (const auto& w : accepted) {
            const auto points = scoreManager_.addWord(static_cast<int>(w.length()),
                                                      levelManager_.level(), effective);
            cleared.value += points;

            removedWords_.push_back(w.word);
            foundWords_.insert(normalizeWord(w.word));
            levelManager_.onWordFound();

            recentWords_.push_front(w.word);
            while (recentWords_.size() > config_.recentWordsCapacity) {
                recentWords_.pop_back();
            }

            // Cadence follows the whole-run removal count, not the level
            if (config_.quizEveryRemovedWords > 0
                && removedWords_.size() % static_cast<std::size_t>(config_.quizEveryRemovedWords) == 0
                && !pendingQuizWord_) {
                pendingQuizWord_ = w.word;
            }

            cleared.words.push_back(w.word);
            cleared.cells.insert(cleared.cells.end(), w.cells.begin(), w.cells.end());
        }

        WordResolver::removeWords(board_, accepted);
        board_.collapseColumns();

        const bool bigClear = cleared.cells.size() >= kBigClearCells;
        events_.push_back(std::move(cleared));
        if (bigClear) {
            emit(GameEventKind::BigClear);
        }

        combo_.onClear();
        if (levelManager_.checkLevelUp()) {
            emit(GameEventKind::LevelUp, levelManager_.level());
        }
    }
}

void GameState::spawnNextPiece() {
    activePiece_ = std::move(nextPiece_);
    activePiece_->resetToSpawn();
    nextPiece_ = factory_.createRandom();
    holdUsed_ = false;

    if (!activePiece_->canMove(board_, 0, 0)) {
        enterGameOver();
    }
}

void GameState::enterGameOver() {
    if (status_ == GameStatus::GameOver) return;

    status_ = GameStatus::GameOver;
    pauseReasons_.clear();
    pendingQuizWord_.reset();

    GameResult r;
    r.score = scoreManager_.score();
    r.level = levelManager_.level();
    r.wordsCleared = static_cast<int>(foundWords_.size());
    r.wordsRemoved = static_cast<int>(removedWords_.size());
    r.duration = runTime_;
    r.endedAt = std::chrono::system_clock::now();
    result_ = r;

    emit(GameEventKind::GameOver, r.score);
}

void GameState::emit(GameEventKind kind, std::int64_t value) {
    GameEvent e;
    e.kind = kind;
    e.value = value;
    events_.push_back(std::move(e));
}

} // namespace letterfall::core
