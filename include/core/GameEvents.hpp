#pragma once

#include "Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace letterfall::core {

// One-shot notifications for the presentation layer. GameState appends them
// as things happen; the caller drains the queue once per frame.
enum class GameEventKind : std::uint8_t {
    PieceLocked,
    WordsCleared,   // words + cells of one resolution pass
    BigClear,       // a pass that removed 4 or more cells
    LevelUp,        // value = new level
    QuizRequested,  // words[0] = word to define
    QuizCorrect,
    QuizWrong,
    GameOver        // value = final score
};

struct GameEvent {
    GameEventKind kind{};
    std::vector<std::string> words;
    std::vector<Position> cells;
    std::int64_t value{0};
};

} // namespace letterfall::core
