#include "server/GameServer.hpp"

#include <iostream>
#include <vector>

#include "network/Protocol.hpp"
#include "network/StateMapper.hpp"

namespace blockfall::server {

using core::GameEvent;

GameServer::GameServer(ServerConfig config, std::unique_ptr<IIdentityService> identities)
    : m_config(config)
    , m_identities(identities ? std::move(identities) : std::make_unique<InMemoryIdentityService>())
    , m_registry(config.engineSettings())
    , m_context(m_registry, m_hub, *m_identities)
    , m_tcpServer(config.port, config.outboxLimit,
                  [this](net::IConnectionPtr connection) { attach(connection); })
{
    m_registry.setCreateHook([this](const GameEnginePtr& engine) { installListener(engine); });
}

GameServer::~GameServer()
{
    stop();
}

bool GameServer::start()
{
    if (m_tcpServer.isRunning()) return true;

    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_acceptingCallbacks = true;
    }

    if (!m_tcpServer.start()) {
        std::cerr << "[SERVER] Could not listen on port " << m_config.port << "\n";
        return false;
    }
    std::cout << "[SERVER] Listening on port " << m_config.port << "\n";
    return true;
}

void GameServer::stop()
{
    m_tcpServer.stop();

    {
        std::unique_lock<std::mutex> lock(m_callbackMutex);
        m_acceptingCallbacks = false;
        m_callbackCv.wait(lock, [this] { return m_activeCallbacks == 0; });
    }

    // Ending a game evicts it through the listener
    for (const auto& state : m_registry.snapshots()) {
        if (auto engine = m_registry.find(state.id)) {
            engine->stop();
        }
    }

    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        for (auto& [key, session] : m_sessions) {
            (void)key;
            sessions.push_back(session);
        }
        m_sessions.clear();
    }

    for (const auto& session : sessions) {
        session->connection->setMessageHandler({});
        session->connection->setCloseHandler({});
        session->connection->close();
    }
}

void GameServer::attach(const net::IConnectionPtr& connection)
{
    if (!connection) return;

    auto session = std::make_shared<Session>();
    session->connection = connection;

    const net::IConnection* key = connection.get();
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        m_sessions[key] = session;
    }

    connection->setMessageHandler([this, key](const std::string& frame) {
        CallbackScope scope(*this);
        if (scope) onFrame(key, frame);
    });
    connection->setCloseHandler([this, key] {
        CallbackScope scope(*this);
        if (scope) onClosed(key);
    });
}

GameServer::CallbackScope::CallbackScope(GameServer& server)
    : m_server(server)
{
    std::lock_guard<std::mutex> lock(m_server.m_callbackMutex);
    if (m_server.m_acceptingCallbacks) {
        ++m_server.m_activeCallbacks;
        m_entered = true;
    }
}

GameServer::CallbackScope::~CallbackScope()
{
    if (!m_entered) return;

    // Notify under the lock: stop() may return and the server go away as
    // soon as the lock is released
    std::lock_guard<std::mutex> lock(m_server.m_callbackMutex);
    --m_server.m_activeCallbacks;
    m_server.m_callbackCv.notify_all();
}

std::size_t GameServer::sessionCount() const
{
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    return m_sessions.size();
}

std::shared_ptr<GameServer::Session> GameServer::findSession(const net::IConnection* key) const
{
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    auto it = m_sessions.find(key);
    return it == m_sessions.end() ? nullptr : it->second;
}

void GameServer::onFrame(const net::IConnection* key, const std::string& frame)
{
    auto session = findSession(key);
    if (!session) return;

    if (!session->router) {
        authenticate(*session, frame);
        return;
    }
    session->router->handle(frame);
}

void GameServer::authenticate(Session& session, const std::string& frame)
{
    const auto at = frame.find('@');
    std::string token;
    bool valid = at != std::string::npos && frame.compare(0, at, "auth") == 0;

    if (valid) {
        try {
            const auto payload = nlohmann::json::parse(frame.substr(at + 1));
            if (payload.is_string()) {
                token = payload.get<std::string>();
            } else if (!payload.is_null()) {
                valid = false;
            }
        } catch (const nlohmann::json::exception&) {
            valid = false;
        }
    }

    if (!valid) {
        std::cerr << "[SERVER] Unauthenticated connection, closing\n";
        session.connection->send(net::assembleEvent("unauthenticated", nullptr));
        session.connection->close();
        return;
    }

    const auto identity = m_identities->resolvePlayer(token);
    session.router = std::make_shared<CommandRouter>(session.connection, identity.id, m_context);
    m_hub.subscribeLobby(session.connection);

    std::cout << "[SERVER] Player " << identity.name << " (" << identity.id << ") authenticated\n";
    session.connection->send(net::assembleEvent("authenticated", identity));
}

void GameServer::onClosed(const net::IConnection* key)
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        auto it = m_sessions.find(key);
        if (it == m_sessions.end()) return;
        session = it->second;
        m_sessions.erase(it);
    }

    if (session->router) {
        std::cout << "[SERVER] Connection of player " << session->router->playerId() << " closed\n";
        session->router->onDisconnect();
    } else {
        m_hub.unsubscribe(*session->connection);
    }
}

void GameServer::installListener(const GameEnginePtr& engine)
{
    engine->addListener([this](const GameEngine::StatePtr& state, GameEvent event) {
        onGameEvent(*state, event);
    });
}

void GameServer::onGameEvent(const core::GameState& state, GameEvent event)
{
    const std::string name = core::toString(event);
    if (event != GameEvent::Looped) {
        std::cout << "[SERVER] Incoming event from game " << state.id << ": " << name << "\n";
    }

    const nlohmann::json payload = state;
    m_hub.deliverToGame(state.id, name, payload);

    switch (event) {
    case GameEvent::ConfigUpdated:
    case GameEvent::PlayerRemoved:
    case GameEvent::Started:
        m_context.broadcastGames();
        break;
    case GameEvent::PlayerAdded:
        m_context.broadcastParticipants(state.id);
        m_context.broadcastGames();
        break;
    case GameEvent::Stopped:
        m_registry.remove(state.id);
        m_hub.releaseGame(state.id);
        m_context.broadcastGames();
        break;
    default:
        break;
    }
}

} // namespace blockfall::server
