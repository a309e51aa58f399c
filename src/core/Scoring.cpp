#include "core/Scoring.hpp"

#include <algorithm>

namespace blockfall::core {

std::uint64_t pointsForLines(int lines, int level) noexcept {
    if (lines <= 0) return 0;

    const int l = level + 1; // formula uses (level + 1)
    std::uint64_t base = 0;
    switch (lines) {
    case 1: base = 40;   break;
    case 2: base = 100;  break;
    case 3: base = 300;  break;
    case 4: base = 1200; break;
    default:
        // wider fields can complete more than 4 rows at once
        base = 1500;
        break;
    }

    return base * static_cast<std::uint64_t>(l);
}

int levelForLines(std::uint64_t lineCount) noexcept {
    return static_cast<int>(lineCount / kLinesPerLevel);
}

int GravityPolicy::delayMs(int level) const noexcept {
    const int interval = baseDelayMs - level * decreasePerLevelMs;
    return std::max(interval, std::min(minDelayMs, baseDelayMs));
}

} // namespace blockfall::core
