#include "session/SessionAutosave.hpp"

#include "session/SessionCodec.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace letterfall::session {

using core::GameState;
using core::GameStatus;

SessionAutosave::SessionAutosave(SessionStore& store, AutosaveSettings settings)
    : store_{store}
    , settings_{settings}
{
}

void SessionAutosave::observe(const GameState& game, TimePoint now) {
    if (!seenRevision_) {
        seenRevision_ = game.revision();
        return;
    }
    if (*seenRevision_ != game.revision()) {
        seenRevision_ = game.revision();
        dirty_ = true;
        lastChange_ = now;
    }
}

bool SessionAutosave::isEligible(const GameState& game, const std::string& identity) const {
    if (!initialized_ || !dirty_) return false;
    if (game.status() == GameStatus::GameOver || game.status() == GameStatus::Quiz) return false;
    if (game.isResolving()) return false;
    return identity.find_first_not_of(" \t\r\n") != std::string::npos;
}

bool SessionAutosave::update(const GameState& game, const std::string& identity, TimePoint now) {
    observe(game, now);
    return trySave(game, identity, now);
}

bool SessionAutosave::trySave(const GameState& game, const std::string& identity, TimePoint now) {
    if (!isEligible(game, identity)) return false;
    if (lastChange_ && now - *lastChange_ < settings_.debounce) return false;
    if (lastSave_ && now - *lastSave_ < settings_.throttle) return false;
    return write(game, identity, now);
}

bool SessionAutosave::saveNow(const GameState& game, const std::string& identity, TimePoint now) {
    observe(game, now);

    if (game.status() == GameStatus::GameOver) {
        discardStored("run is over");
        dirty_ = false;
        return true;
    }
    if (game.isResolving()) return false;
    if (!initialized_) return false;
    if (identity.find_first_not_of(" \t\r\n") == std::string::npos) return false;

    return write(game, identity, now);
}

bool SessionAutosave::write(const GameState& game, const std::string& identity, TimePoint now) {
    std::unique_lock<std::mutex> lock(writeMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false; // another save is in flight
    }

    try {
        store_.write(serialize(takeSnapshot(game, identity, now)));
    } catch (const std::runtime_error& e) {
        std::cerr << "SessionAutosave: save failed: " << e.what() << "\n";
        return false;
    }

    dirty_ = false;
    lastSave_ = now;
    return true;
}

RestoreStatus SessionAutosave::restoreInto(GameState& game, const std::string& identity, TimePoint now) {
    if (restoreAttempted_) {
        return RestoreStatus::NoSession;
    }
    restoreAttempted_ = true;
    initialized_ = true;

    const auto bytes = store_.read();
    if (!bytes) {
        seenRevision_ = game.revision();
        return RestoreStatus::NoSession;
    }

    const auto snapshot = deserialize(*bytes);
    if (!snapshot) {
        discardStored(toString(RestoreStatus::Corrupt));
        seenRevision_ = game.revision();
        return RestoreStatus::Corrupt;
    }

    auto result = restoreSnapshot(*snapshot, identity, now,
                                  game.config().rows, game.config().cols);
    if (!result.ok()) {
        discardStored(toString(result.status));
        seenRevision_ = game.revision();
        return result.status;
    }

    try {
        game.resumeFrom(std::move(*result.run));
    } catch (const std::invalid_argument& e) {
        std::cerr << "SessionAutosave: " << e.what() << "\n";
        discardStored(toString(RestoreStatus::Corrupt));
        seenRevision_ = game.revision();
        return RestoreStatus::Corrupt;
    }

    seenRevision_ = game.revision();
    dirty_ = false;
    lastChange_.reset();
    std::cerr << "SessionAutosave: resumed saved session\n";
    return RestoreStatus::Restored;
}

void SessionAutosave::onRestart(const GameState& game) {
    initialized_ = true;
    discardStored("new run");
    seenRevision_ = game.revision();
    dirty_ = false;
    lastChange_.reset();
}

void SessionAutosave::discardStored(const char* why) {
    if (!store_.hasSession()) return;
    std::cerr << "SessionAutosave: discarding stored session (" << why << ")\n";
    store_.clear();
}

} // namespace letterfall::session
