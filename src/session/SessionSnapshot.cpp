#include "session/SessionSnapshot.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace letterfall::session {

using core::Board;
using core::Letter;
using core::Piece;
using core::Position;
using core::RunState;

namespace {
    bool isLetter(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    Letter toUpper(char c) {
        return static_cast<Letter>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::string trimmed(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    // Far beyond any real clock, and small enough to convert to nanoseconds
    constexpr std::int64_t kMaxEpochMs = 1'000'000'000'000'000;

    bool insideBoard(const Position& p, int rows, int cols) {
        return p.row >= 0 && p.row < rows && p.col >= 0 && p.col < cols;
    }

    // Corner, offsets and every absolute cell must lie on the board
    bool isWellFormed(const PieceSnapshot& snap, int rows, int cols) {
        if (snap.offsets.empty() || snap.offsets.size() != snap.letters.size()) {
            return false;
        }
        if (!insideBoard(snap.minCorner, rows, cols)) return false;
        for (const auto& o : snap.offsets) {
            if (!insideBoard(o, rows, cols)) return false;
            if (!insideBoard(Position{snap.minCorner.row + o.row, snap.minCorner.col + o.col}, rows, cols)) {
                return false;
            }
        }
        return std::all_of(snap.letters.begin(), snap.letters.end(), isLetter);
    }

    // Walk one axis at a time with the ordinary legality check.
    // Returns false at the first blocked step, leaving the piece there.
    bool stepToward(Piece& piece, const Board& board, int dRow, int dCol) {
        const int colStep = (dCol > 0) - (dCol < 0);
        for (int i = 0; i < std::abs(dCol); ++i) {
            if (!piece.move(board, 0, colStep)) return false;
        }
        const int rowStep = (dRow > 0) - (dRow < 0);
        for (int i = 0; i < std::abs(dRow); ++i) {
            if (!piece.move(board, rowStep, 0)) return false;
        }
        return true;
    }

    Piece rebuildPiece(const PieceSnapshot& snap, const Board& board) {
        Piece::Letters letters;
        letters.reserve(snap.letters.size());
        for (char c : snap.letters) letters.push_back(toUpper(c));

        Piece piece{snap.offsets, std::move(letters), board.cols()};

        const Position spawnCorner = piece.minCorner();
        const int dCol = snap.minCorner.col - spawnCorner.col;
        const int dRow = snap.minCorner.row - spawnCorner.row;

        // Best effort: a blocked walk leaves the piece at the furthest legal spot
        if (stepToward(piece, board, 0, dCol)) {
            stepToward(piece, board, dRow, 0);
        }
        return piece;
    }
}

const char* toString(RestoreStatus status) noexcept {
    switch (status) {
    case RestoreStatus::Restored:            return "restored";
    case RestoreStatus::NoSession:           return "no session";
    case RestoreStatus::Corrupt:             return "corrupt";
    case RestoreStatus::VersionMismatch:     return "version mismatch";
    case RestoreStatus::IdentityMismatch:    return "identity mismatch";
    case RestoreStatus::ClockSkew:           return "saved in the future";
    case RestoreStatus::Stale:               return "stale";
    case RestoreStatus::DimensionMismatch:   return "board dimensions differ";
    case RestoreStatus::MissingPiece:        return "missing piece";
    case RestoreStatus::ActivePieceCollides: return "active piece collides";
    }
    return "unknown";
}

std::int64_t toEpochMs(TimePoint t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint fromEpochMs(std::int64_t ms) noexcept {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds{ms})};
}

bool sameIdentity(const std::string& a, const std::string& b) {
    const std::string ta = core::normalizeWord(trimmed(a));
    const std::string tb = core::normalizeWord(trimmed(b));
    return !ta.empty() && ta == tb;
}

PieceSnapshot snapshotPiece(const Piece& piece) {
    PieceSnapshot snap;
    snap.minCorner = piece.minCorner();
    snap.offsets.reserve(piece.size());
    for (const auto& c : piece.cells()) {
        snap.offsets.push_back(Position{c.row - snap.minCorner.row, c.col - snap.minCorner.col});
    }
    snap.letters = piece.letters();
    return snap;
}

SessionSnapshot takeSnapshot(const core::GameState& game,
                             const std::string& identity,
                             TimePoint savedAt) {
    SessionSnapshot s;
    s.version = kSessionVersion;
    s.savedAtMs = toEpochMs(savedAt);
    s.identity = trimmed(identity);

    s.score = game.score();
    s.level = game.level();
    s.gravityIntervalMs = game.gravityIntervalMs();
    s.wordsFoundSinceLevelUp = game.wordsFoundSinceLevelUp();
    s.holdUsed = game.holdUsed();

    const Board& board = game.board();
    s.boardRows.reserve(static_cast<std::size_t>(board.rows()));
    for (int row = 0; row < board.rows(); ++row) {
        std::string line(static_cast<std::size_t>(board.cols()), kEmptyCell);
        for (int col = 0; col < board.cols(); ++col) {
            if (const auto l = board.cell(row, col)) {
                line[static_cast<std::size_t>(col)] = *l;
            }
        }
        s.boardRows.push_back(std::move(line));
    }

    s.foundWords.assign(game.foundWords().begin(), game.foundWords().end());
    s.removedWords = game.removedWords();

    if (game.activePiece()) s.current = snapshotPiece(*game.activePiece());
    if (game.nextPiece())   s.next = snapshotPiece(*game.nextPiece());
    if (game.heldPiece())   s.hold = snapshotPiece(*game.heldPiece());
    return s;
}

RestoreResult restoreSnapshot(const SessionSnapshot& snapshot,
                              const std::string& identity,
                              TimePoint now,
                              int rows,
                              int cols) {
    RestoreResult result;

    if (snapshot.version != kSessionVersion) {
        result.status = RestoreStatus::VersionMismatch;
        return result;
    }
    if (!sameIdentity(snapshot.identity, identity)) {
        result.status = RestoreStatus::IdentityMismatch;
        return result;
    }

    if (snapshot.savedAtMs > kMaxEpochMs || snapshot.savedAtMs < -kMaxEpochMs) {
        result.status = RestoreStatus::Corrupt;
        return result;
    }
    const auto age = now - fromEpochMs(snapshot.savedAtMs);
    if (age < TimePoint::duration::zero()) {
        result.status = RestoreStatus::ClockSkew;
        return result;
    }
    if (age > kFreshnessWindow) {
        result.status = RestoreStatus::Stale;
        return result;
    }

    if (static_cast<int>(snapshot.boardRows.size()) != rows
        || std::any_of(snapshot.boardRows.begin(), snapshot.boardRows.end(),
                       [cols](const std::string& r) { return static_cast<int>(r.size()) != cols; })) {
        result.status = RestoreStatus::DimensionMismatch;
        return result;
    }

    RunState run{Board{rows, cols}};
    for (int row = 0; row < rows; ++row) {
        const std::string& line = snapshot.boardRows[static_cast<std::size_t>(row)];
        for (int col = 0; col < cols; ++col) {
            const char c = line[static_cast<std::size_t>(col)];
            if (c == kEmptyCell) continue;
            if (!isLetter(c)) {
                result.status = RestoreStatus::Corrupt;
                return result;
            }
            run.board.setCell(row, col, toUpper(c));
        }
    }

    if (!snapshot.current || !snapshot.next) {
        result.status = RestoreStatus::MissingPiece;
        return result;
    }
    for (const auto* p : {&snapshot.current, &snapshot.next, &snapshot.hold}) {
        if (p->has_value() && !isWellFormed(**p, rows, cols)) {
            result.status = RestoreStatus::Corrupt;
            return result;
        }
    }

    run.current = rebuildPiece(*snapshot.current, run.board);
    run.next = rebuildPiece(*snapshot.next, run.board);
    if (snapshot.hold) {
        run.held = rebuildPiece(*snapshot.hold, run.board);
    }

    if (!run.current->canMove(run.board, 0, 0)) {
        result.status = RestoreStatus::ActivePieceCollides;
        return result;
    }

    run.score = std::max<std::int64_t>(0, snapshot.score);
    run.level = std::max(1, snapshot.level);
    run.gravityIntervalMs = std::max(kMinRestoredGravityMs, snapshot.gravityIntervalMs);
    run.wordsFoundSinceLevelUp = std::max(0, snapshot.wordsFoundSinceLevelUp);
    run.holdUsed = snapshot.holdUsed;

    for (const auto& w : snapshot.foundWords) {
        const std::string n = core::normalizeWord(trimmed(w));
        if (!n.empty()) run.foundWords.insert(n);
    }
    run.removedWords = snapshot.removedWords;

    result.status = RestoreStatus::Restored;
    result.run = std::move(run);
    return result;
}

} // namespace letterfall::session
