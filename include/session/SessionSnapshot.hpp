#pragma once

#include "core/GameState.hpp"
#include "core/Piece.hpp"
#include "core/RunState.hpp"
#include "core/Types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace letterfall::session {

using TimePoint = std::chrono::system_clock::time_point;

constexpr int kSessionVersion = 1;
constexpr char kEmptyCell = '.';
constexpr std::chrono::minutes kFreshnessWindow{10};
constexpr int kMinRestoredGravityMs = 60;

// A piece stored independently of the board: where its bounding box starts,
// the cells relative to that corner, and one letter per cell.
struct PieceSnapshot {
    core::Position minCorner;
    std::vector<core::Position> offsets;
    std::vector<core::Letter> letters;
};

// Decoupled copy of a run, safe to serialize and keep after the game moves on.
struct SessionSnapshot {
    int version{kSessionVersion};
    std::int64_t savedAtMs{0}; // milliseconds since the Unix epoch
    std::string identity;

    std::int64_t score{0};
    int level{1};
    int gravityIntervalMs{0};
    int wordsFoundSinceLevelUp{0};
    bool holdUsed{false};

    // One string per row, one char per column, kEmptyCell for empty
    std::vector<std::string> boardRows;

    std::vector<std::string> foundWords;
    std::vector<std::string> removedWords;

    std::optional<PieceSnapshot> current;
    std::optional<PieceSnapshot> next;
    std::optional<PieceSnapshot> hold;
};

enum class RestoreStatus {
    Restored,
    NoSession,
    Corrupt,
    VersionMismatch,
    IdentityMismatch,
    ClockSkew,
    Stale,
    DimensionMismatch,
    MissingPiece,
    ActivePieceCollides
};

const char* toString(RestoreStatus status) noexcept;

struct RestoreResult {
    RestoreStatus status{RestoreStatus::NoSession};
    std::optional<core::RunState> run;

    bool ok() const noexcept { return status == RestoreStatus::Restored && run.has_value(); }
};

std::int64_t toEpochMs(TimePoint t) noexcept;
TimePoint fromEpochMs(std::int64_t ms) noexcept;

// Trimmed, case-insensitive comparison; an empty identity never matches
bool sameIdentity(const std::string& a, const std::string& b);

PieceSnapshot snapshotPiece(const core::Piece& piece);

SessionSnapshot takeSnapshot(const core::GameState& game,
                             const std::string& identity,
                             TimePoint savedAt);

// Validate a snapshot and rebuild the run it describes for a rows x cols
// board. Never touches a live game: commit the result with
// GameState::resumeFrom().
RestoreResult restoreSnapshot(const SessionSnapshot& snapshot,
                              const std::string& identity,
                              TimePoint now,
                              int rows,
                              int cols);

} // namespace letterfall::session
