#pragma once

#include <cstdint>

namespace blockfall::core {

// Lifecycle and progress notifications of a game
enum class GameEvent : std::uint8_t {
    Started,
    Stopped,
    Looped,
    BlockCreated,
    NextBlockCreated,
    RoundDone,
    LinesCompleted,
    ConfigUpdated,
    PlayerAdded,
    PlayerRemoved,
    StatusChanged
};

// Event name as sent on the wire ("blockCreated", "linesCompleted", ...)
const char* toString(GameEvent event) noexcept;

} // namespace blockfall::core
