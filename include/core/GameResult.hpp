#pragma once

#include <chrono>
#include <cstdint>

namespace letterfall::core {

// Immutable summary handed to the leaderboard/summary layer at game over.
struct GameResult {
    std::int64_t score{};
    int level{};
    int wordsCleared{};   // distinct words
    int wordsRemoved{};   // every removal, repeats included
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point endedAt{};
};

} // namespace letterfall::core
