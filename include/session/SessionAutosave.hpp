#pragma once

#include "core/GameState.hpp"
#include "session/SessionSnapshot.hpp"
#include "session/SessionStore.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace letterfall::session {

struct AutosaveSettings {
    std::chrono::milliseconds debounce{1500};   // quiet period after the last change
    std::chrono::milliseconds throttle{30000};  // minimum spacing between writes
};

// Decides when a running game is written to a SessionStore, and performs the
// one restore attempt a fresh process gets. Nothing here feeds back into the
// simulation; the game only ever sees resumeFrom().
class SessionAutosave {
public:
    explicit SessionAutosave(SessionStore& store, AutosaveSettings settings = {});

    // Pick up mutations since the last call (via GameState::revision())
    void observe(const core::GameState& game, TimePoint now);

    bool isDirty() const noexcept { return dirty_; }
    bool isInitialized() const noexcept { return initialized_; }
    const std::optional<TimePoint>& lastSaveTime() const noexcept { return lastSave_; }

    // A save would be allowed right now, ignoring debounce and throttle
    bool isEligible(const core::GameState& game, const std::string& identity) const;

    // observe() then trySave(); call once per frame
    bool update(const core::GameState& game, const std::string& identity, TimePoint now);

    // Write if eligible, quiet for the debounce period and outside the throttle
    bool trySave(const core::GameState& game, const std::string& identity, TimePoint now);

    // Write immediately (app going to background). A finished game clears the
    // store instead. Refused only while resolving; a run saved during a quiz
    // comes back without the quiz.
    bool saveNow(const core::GameState& game, const std::string& identity, TimePoint now);

    // Only the first call per instance reads the store; any failure clears it.
    RestoreStatus restoreInto(core::GameState& game, const std::string& identity, TimePoint now);

    // A new run replaces whatever was saved
    void onRestart(const core::GameState& game);

private:
    SessionStore& store_;
    AutosaveSettings settings_;
    std::mutex writeMutex_;

    bool initialized_{false};
    bool restoreAttempted_{false};
    bool dirty_{false};
    std::optional<std::uint64_t> seenRevision_;
    std::optional<TimePoint> lastChange_;
    std::optional<TimePoint> lastSave_;

    bool write(const core::GameState& game, const std::string& identity, TimePoint now);
    void discardStored(const char* why);
};

} // namespace letterfall::session
