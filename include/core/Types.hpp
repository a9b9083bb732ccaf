#pragma once // Include guard

#include <cstdint> // For fixed-width integer types

// Namespace for Letterfall core types
namespace letterfall::core {

// Position structure representing a cell in the letter grid
struct Position {
    int row{};
    int col{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Ordering used when positions are kept in sorted containers
inline bool operator<(Position a, Position b) noexcept {
    return a.row != b.row ? a.row < b.row : a.col < b.col;
}

// Letters are stored upper-case; '\0' is never a valid letter
using Letter = char;

// Mode of a running match
enum class GameStatus : std::uint8_t {
    Playing,
    Paused,
    Quiz,
    GameOver
};

// How the player answered a definition quiz
enum class QuizOutcome : std::uint8_t {
    Correct,
    Incorrect,
    Skipped
};

} // namespace letterfall::core
