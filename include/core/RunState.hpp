#pragma once

#include "Board.hpp"
#include "Piece.hpp"
#include "WordResolver.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace letterfall::core {

// Value copy of everything a run needs to continue: produced by a session
// restore and handed to GameState::resumeFrom().
struct RunState {
    Board board;
    std::optional<Piece> current;
    std::optional<Piece> next;
    std::optional<Piece> held;

    std::int64_t score{0};
    int level{1};
    int gravityIntervalMs{600};
    int wordsFoundSinceLevelUp{0};
    bool holdUsed{false};

    FoundWordSet foundWords;               // normalized (lower-case)
    std::vector<std::string> removedWords; // as spelled, oldest first
};

} // namespace letterfall::core
