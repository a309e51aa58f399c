#pragma once

#include <cstdint>

namespace blockfall::core {

constexpr int kLinesPerLevel = 10;

// Points for clearing `lines` rows with one lock at `level`:
// {1: 40, 2: 100, 3: 300, 4: 1200, more: 1500} * (level + 1)
std::uint64_t pointsForLines(int lines, int level) noexcept;

// level = floor(lineCount / 10)
int levelForLines(std::uint64_t lineCount) noexcept;

// Delay between two gravity steps. With the default policy the delay is
// fixed; a per-level decrease speeds the game up, never below minDelayMs.
struct GravityPolicy {
    int baseDelayMs{200};
    int decreasePerLevelMs{0};
    int minDelayMs{50};

    int delayMs(int level) const noexcept;
};

} // namespace blockfall::core
