#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Types.hpp"
#include "server/BroadcastHub.hpp"
#include "server/GameRegistry.hpp"
#include "server/IdentityService.hpp"

namespace blockfall::server {

/// Lobby-facing view of one player of a game.
struct Participant {
    core::PlayerId id;
    std::string name;
    std::uint64_t points{0};
};

void to_json(nlohmann::json& j, const Participant& participant);
void to_json(nlohmann::json& j, const Identity& identity);

/// Shared collaborators of every connection, plus the broadcasts more than
/// one of them needs.
class SessionContext {
public:
    SessionContext(GameRegistry& registry, BroadcastHub& hub, IIdentityService& identities);

    GameRegistry& registry() noexcept { return m_registry; }
    BroadcastHub& hub() noexcept { return m_hub; }
    IIdentityService& identities() noexcept { return m_identities; }

    /// Players of a game joined with their names; nullopt if the game is unknown.
    std::optional<std::vector<Participant>> participants(const core::GameId& gameId) const;

    /// "games_list" with every game's state to the lobby.
    void broadcastGames();

    /// "participant_list" to the game, or "game_not_found" if it is gone.
    void broadcastParticipants(const core::GameId& gameId);

private:
    GameRegistry& m_registry;
    BroadcastHub& m_hub;
    IIdentityService& m_identities;
};

} // namespace blockfall::server
