#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <string>

// Namespace for the core game types
namespace blockfall::core {

using PlayerId = std::string;
using GameId   = std::string;

// A cell offset or an absolute cell on the field.
// x grows to the right (columns), y grows downwards (rows).
struct Vector {
    int x{};
    int y{};
};

inline bool operator==(const Vector& a, const Vector& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vector& a, const Vector& b) {
    return !(a == b);
}

// Player intents consumed by a game tick
enum class Action : std::uint8_t {
    Rotate,
    Left,
    Right,
    Down
};

// Game lifecycle: Waiting -> Running -> {Ended | Paused | Stopping}
enum class GameStatus : std::uint8_t {
    Waiting,
    Running,
    Paused,
    Stopping,
    Ended
};

const char* toString(Action action) noexcept;
const char* toString(GameStatus status) noexcept;

} // namespace blockfall::core
