#include "core/Types.hpp"

namespace blockfall::core {

const char* toString(Action action) noexcept {
    switch (action) {
    case Action::Rotate: return "rotate";
    case Action::Left:   return "left";
    case Action::Right:  return "right";
    case Action::Down:   return "down";
    }
    return "unknown";
}

const char* toString(GameStatus status) noexcept {
    switch (status) {
    case GameStatus::Waiting:  return "waiting";
    case GameStatus::Running:  return "running";
    case GameStatus::Paused:   return "paused";
    case GameStatus::Stopping: return "stopping";
    case GameStatus::Ended:    return "ended";
    }
    return "unknown";
}

} // namespace blockfall::core
