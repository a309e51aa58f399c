#pragma once

#include <string>

#include "core/Types.hpp"
#include "network/IConnection.hpp"
#include "network/Protocol.hpp"
#include "server/GameEngine.hpp"
#include "server/SessionContext.hpp"

namespace blockfall::server {

/// Per-connection command decoder. Parses "<command>:<id>@<json>" frames and
/// maps each command onto the registry, the identity service or the engine
/// of the connection's current game. Ownership checks happen here.
class CommandRouter {
public:
    CommandRouter(net::IConnectionPtr connection, core::PlayerId playerId, SessionContext& context);

    /// Handle one inbound frame. A malformed frame is answered with an error
    /// and closes the connection.
    void handle(const std::string& frame);

    /// Connection gone: leave the current game, end it if nobody is left.
    void onDisconnect();

    const core::PlayerId& playerId() const noexcept { return m_playerId; }

    /// Game the connection is subscribed to, empty if none.
    core::GameId currentGame() const;

private:
    void dispatch(const net::CommandFrame& cmd);

    void createGame(const net::CommandFrame& cmd);
    void enterGame(const net::CommandFrame& cmd);
    void leaveGame(const net::CommandFrame& cmd);
    void cancelGame(const net::CommandFrame& cmd);
    void startGame(const net::CommandFrame& cmd);
    void changeConfig(const net::CommandFrame& cmd);
    void handleInput(core::Action action);
    void sendState(const net::CommandFrame& cmd);
    void sendGames(const net::CommandFrame& cmd);
    void sendParticipants(const net::CommandFrame& cmd);
    void signup(const net::CommandFrame& cmd);
    void loadUser(const net::CommandFrame& cmd);

    // Unsubscribe from the current game and drop the player from it
    void leaveCurrentGame();
    void dropPlayer(GameEngine& engine);

    void respond(const std::string& commandId, const net::Response& response);

    net::IConnectionPtr m_connection;
    core::PlayerId m_playerId;
    SessionContext& m_context;
};

} // namespace blockfall::server
