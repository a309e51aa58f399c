#include "core/GameEvent.hpp"

namespace blockfall::core {

const char* toString(GameEvent event) noexcept {
    switch (event) {
    case GameEvent::Started:          return "started";
    case GameEvent::Stopped:          return "stopped";
    case GameEvent::Looped:           return "looped";
    case GameEvent::BlockCreated:     return "blockCreated";
    case GameEvent::NextBlockCreated: return "nextBlockCreated";
    case GameEvent::RoundDone:        return "roundDone";
    case GameEvent::LinesCompleted:   return "linesCompleted";
    case GameEvent::ConfigUpdated:    return "configUpdated";
    case GameEvent::PlayerAdded:      return "playerAdded";
    case GameEvent::PlayerRemoved:    return "playerRemoved";
    case GameEvent::StatusChanged:    return "statusChanged";
    }
    return "unknown";
}

} // namespace blockfall::core
