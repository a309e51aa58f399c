#include "server/BroadcastHub.hpp"

#include <algorithm>

#include "network/Protocol.hpp"

namespace blockfall::server {

void BroadcastHub::subscribeLobby(const net::IConnectionPtr& connection)
{
    if (!connection) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lobby[connection.get()] = connection;
}

void BroadcastHub::subscribeGame(const net::IConnectionPtr& connection, const core::GameId& gameId)
{
    if (!connection) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    eraseFromGameLocked(*connection);
    m_games[gameId].push_back(connection);
    m_gameOf[connection.get()] = gameId;
}

void BroadcastHub::unsubscribeGame(const net::IConnection& connection)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    eraseFromGameLocked(connection);
}

void BroadcastHub::unsubscribe(const net::IConnection& connection)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    eraseFromGameLocked(connection);
    m_lobby.erase(&connection);
}

std::vector<net::IConnectionPtr> BroadcastHub::releaseGame(const core::GameId& gameId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_games.find(gameId);
    if (it == m_games.end()) {
        return {};
    }

    auto released = std::move(it->second);
    m_games.erase(it);
    for (const auto& connection : released) {
        m_gameOf.erase(connection.get());
    }
    return released;
}

std::optional<core::GameId> BroadcastHub::gameOf(const net::IConnection& connection) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_gameOf.find(&connection);
    if (it == m_gameOf.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t BroadcastHub::gameConnectionCount(const core::GameId& gameId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_games.find(gameId);
    return it == m_games.end() ? 0 : it->second.size();
}

std::size_t BroadcastHub::lobbyConnectionCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lobby.size();
}

void BroadcastHub::deliverToGame(const core::GameId& gameId, const std::string& event,
                                 const nlohmann::json& data) const
{
    std::vector<net::IConnectionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_games.find(gameId);
        if (it == m_games.end()) {
            return;
        }
        targets = it->second;
    }
    deliver(targets, net::assembleEvent(event, data));
}

void BroadcastHub::deliverToLobby(const std::string& event, const nlohmann::json& data) const
{
    std::vector<net::IConnectionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets.reserve(m_lobby.size());
        for (const auto& [key, connection] : m_lobby) {
            (void)key;
            targets.push_back(connection);
        }
    }
    deliver(targets, net::assembleEvent(event, data));
}

void BroadcastHub::deliver(const std::vector<net::IConnectionPtr>& targets, const std::string& frame)
{
    for (const auto& connection : targets) {
        if (connection && connection->isConnected()) {
            connection->send(frame);
        }
    }
}

void BroadcastHub::eraseFromGameLocked(const net::IConnection& connection)
{
    auto owner = m_gameOf.find(&connection);
    if (owner == m_gameOf.end()) {
        return;
    }

    auto it = m_games.find(owner->second);
    if (it != m_games.end()) {
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const net::IConnectionPtr& c) { return c.get() == &connection; }),
                   list.end());
        if (list.empty()) {
            m_games.erase(it);
        }
    }
    m_gameOf.erase(owner);
}

} // namespace blockfall::server
