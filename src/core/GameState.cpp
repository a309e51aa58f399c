#include "core/GameState.hpp"

namespace blockfall::core {

const PlayerState* GameState::findPlayer(const PlayerId& playerId) const {
    for (const auto& p : players) {
        if (p.playerId == playerId) return &p;
    }
    return nullptr;
}

} // namespace blockfall::core
