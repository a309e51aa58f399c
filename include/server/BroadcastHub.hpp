#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Types.hpp"
#include "network/IConnection.hpp"

namespace blockfall::server {

/// Directory of connections and their delivery scopes:
///   - lobby: every subscribed connection, receives the games list;
///   - game: connections associated with one game id (at most one game per
///     connection).
/// Delivery is fire-and-forget and at most once per connected socket.
class BroadcastHub {
public:
    void subscribeLobby(const net::IConnectionPtr& connection);

    /// Moves the connection from its previous game, if any.
    void subscribeGame(const net::IConnectionPtr& connection, const core::GameId& gameId);

    /// Leave the game scope, stay in the lobby.
    void unsubscribeGame(const net::IConnection& connection);

    /// Forget the connection entirely.
    void unsubscribe(const net::IConnection& connection);

    /// Drop every connection of a game from the game scope and return them.
    std::vector<net::IConnectionPtr> releaseGame(const core::GameId& gameId);

    std::optional<core::GameId> gameOf(const net::IConnection& connection) const;
    std::size_t gameConnectionCount(const core::GameId& gameId) const;
    std::size_t lobbyConnectionCount() const;

    /// "<event>@<json>" to every connection of the game. Unknown or empty
    /// game: nothing happens.
    void deliverToGame(const core::GameId& gameId, const std::string& event,
                       const nlohmann::json& data) const;

    /// "<event>@<json>" to every lobby connection.
    void deliverToLobby(const std::string& event, const nlohmann::json& data) const;

private:
    static void deliver(const std::vector<net::IConnectionPtr>& targets, const std::string& frame);

    mutable std::mutex m_mutex;
    std::unordered_map<const net::IConnection*, net::IConnectionPtr> m_lobby;
    std::unordered_map<const net::IConnection*, core::GameId> m_gameOf;
    std::unordered_map<core::GameId, std::vector<net::IConnectionPtr>> m_games;

    void eraseFromGameLocked(const net::IConnection& connection);
};

} // namespace blockfall::server
