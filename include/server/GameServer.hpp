#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/GameEvent.hpp"
#include "core/GameState.hpp"
#include "network/IConnection.hpp"
#include "network/TcpServer.hpp"
#include "server/BroadcastHub.hpp"
#include "server/CommandRouter.hpp"
#include "server/GameRegistry.hpp"
#include "server/IdentityService.hpp"
#include "server/ServerConfig.hpp"
#include "server/SessionContext.hpp"

namespace blockfall::server {

/// Owns the registry, the connection directory and the identity service,
/// and ties them to the transport.
///
/// Each attached connection must first authenticate with
///   auth@<json string token | null>
/// and is answered with authenticated@{"id","name"}; anything else gets
/// unauthenticated@null and the connection is closed. After that every frame
/// goes to the connection's CommandRouter.
class GameServer {
public:
    explicit GameServer(ServerConfig config,
                        std::unique_ptr<IIdentityService> identities = nullptr);
    ~GameServer();

    GameServer(const GameServer&) = delete;
    GameServer& operator=(const GameServer&) = delete;

    /// Start accepting TCP connections on the configured port.
    bool start();

    /// Stop accepting, wait for the connection callbacks already running,
    /// then end every game and close every connection.
    void stop();

    /// Take over a connection (from the TcpServer, or a fake in tests).
    void attach(const net::IConnectionPtr& connection);

    GameRegistry& registry() noexcept { return m_registry; }
    BroadcastHub& hub() noexcept { return m_hub; }
    IIdentityService& identities() noexcept { return *m_identities; }

    std::size_t sessionCount() const;

private:
    struct Session {
        net::IConnectionPtr connection;
        std::shared_ptr<CommandRouter> router; // null until authenticated
    };

    // Held for the duration of one connection callback. Not entered once
    // stop() has begun; a reader thread may still hold an old handler copy.
    class CallbackScope {
    public:
        explicit CallbackScope(GameServer& server);
        ~CallbackScope();

        CallbackScope(const CallbackScope&) = delete;
        CallbackScope& operator=(const CallbackScope&) = delete;

        explicit operator bool() const noexcept { return m_entered; }

    private:
        GameServer& m_server;
        bool m_entered{false};
    };

    void onFrame(const net::IConnection* key, const std::string& frame);
    void onClosed(const net::IConnection* key);
    void authenticate(Session& session, const std::string& frame);

    void installListener(const GameEnginePtr& engine);
    void onGameEvent(const core::GameState& state, core::GameEvent event);

    std::shared_ptr<Session> findSession(const net::IConnection* key) const;

    ServerConfig m_config;

    // Outlives every other member: connection threads may still reach it
    std::mutex m_callbackMutex;
    std::condition_variable m_callbackCv;
    std::size_t m_activeCallbacks{0};
    bool m_acceptingCallbacks{true};

    std::unique_ptr<IIdentityService> m_identities;
    BroadcastHub m_hub;
    GameRegistry m_registry;
    SessionContext m_context;

    mutable std::mutex m_sessionsMutex;
    std::unordered_map<const net::IConnection*, std::shared_ptr<Session>> m_sessions;

    net::TcpServer m_tcpServer;
};

} // namespace blockfall::server
