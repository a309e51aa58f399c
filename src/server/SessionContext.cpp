#include "server/SessionContext.hpp"

#include "network/StateMapper.hpp"

namespace blockfall::server {

void to_json(nlohmann::json& j, const Participant& participant)
{
    j = nlohmann::json{
        {"id", participant.id},
        {"name", participant.name},
        {"points", participant.points}
    };
}

void to_json(nlohmann::json& j, const Identity& identity)
{
    j = nlohmann::json{{"id", identity.id}, {"name", identity.name}};
}

SessionContext::SessionContext(GameRegistry& registry, BroadcastHub& hub, IIdentityService& identities)
    : m_registry(registry)
    , m_hub(hub)
    , m_identities(identities)
{
}

std::optional<std::vector<Participant>> SessionContext::participants(const core::GameId& gameId) const
{
    auto engine = m_registry.find(gameId);
    if (!engine) {
        return std::nullopt;
    }

    const auto state = engine->snapshot();
    std::vector<Participant> out;
    out.reserve(state.players.size());
    for (const auto& player : state.players) {
        Participant p;
        p.id     = player.playerId;
        p.points = player.points;
        if (auto identity = m_identities.findPlayer(player.playerId)) {
            p.name = identity->name;
        }
        out.push_back(std::move(p));
    }
    return out;
}

void SessionContext::broadcastGames()
{
    m_hub.deliverToLobby("games_list", m_registry.snapshots());
}

void SessionContext::broadcastParticipants(const core::GameId& gameId)
{
    if (auto list = participants(gameId)) {
        m_hub.deliverToGame(gameId, "participant_list", *list);
    } else {
        m_hub.deliverToGame(gameId, "game_not_found", gameId);
    }
}

} // namespace blockfall::server
