#include "server/CommandRouter.hpp"

#include <iostream>
#include <stdexcept>

#include "network/StateMapper.hpp"

namespace blockfall::server {

using net::errorResponse;
using net::okResponse;

namespace {

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

CommandRouter::CommandRouter(net::IConnectionPtr connection, core::PlayerId playerId, SessionContext& context)
    : m_connection(std::move(connection))
    , m_playerId(std::move(playerId))
    , m_context(context)
{
}

core::GameId CommandRouter::currentGame() const
{
    return m_context.hub().gameOf(*m_connection).value_or(core::GameId{});
}

void CommandRouter::handle(const std::string& frame)
{
    net::CommandFrame cmd;
    try {
        cmd = net::parseCommand(frame);
    } catch (const net::ProtocolError& e) {
        std::cerr << "[SERVER] Rejected frame from player " << m_playerId << ": " << e.what() << "\n";
        respond(e.commandId(), errorResponse({e.what()}));
        m_connection->close();
        return;
    }

    std::cout << "[SERVER] Incoming command on game " << currentGame() << ": " << cmd.command << "\n";

    try {
        dispatch(cmd);
    } catch (const nlohmann::json::exception& e) {
        respond(cmd.id, errorResponse({e.what()}));
    }
}

void CommandRouter::dispatch(const net::CommandFrame& cmd)
{
    const auto& c = cmd.command;

    if (c == "create_game")            createGame(cmd);
    else if (c == "enter_game")        enterGame(cmd);
    else if (c == "leave_game")        leaveGame(cmd);
    else if (c == "cancel_game")       cancelGame(cmd);
    else if (c == "start_game")        startGame(cmd);
    else if (c == "change_config")     changeConfig(cmd);
    else if (c == "move_left")         handleInput(core::Action::Left);
    else if (c == "move_right")        handleInput(core::Action::Right);
    else if (c == "move_down")         handleInput(core::Action::Down);
    else if (c == "rotate")            handleInput(core::Action::Rotate);
    else if (c == "send_state")        sendState(cmd);
    else if (c == "send_games")        sendGames(cmd);
    else if (c == "send_participants") sendParticipants(cmd);
    else if (c == "signup")            signup(cmd);
    else if (c == "load_user")         loadUser(cmd);
    else {
        respond(cmd.id, errorResponse(
            {"command " + c + " for command id " + cmd.id + " not found"}));
    }
}

void CommandRouter::createGame(const net::CommandFrame& cmd)
{
    // The creator leaves whatever game it was looking at
    leaveCurrentGame();

    auto engine = m_context.registry().create(m_playerId);
    m_context.hub().subscribeGame(m_connection, engine->id());

    respond(cmd.id, okResponse(nlohmann::json(engine->snapshot())));
    m_context.broadcastGames();
}

void CommandRouter::enterGame(const net::CommandFrame& cmd)
{
    const auto gameId = net::parseStringPayload(cmd.payload);
    std::cout << "[SERVER] Enter game " << gameId << "\n";

    auto engine = m_context.registry().find(gameId);
    if (!engine) {
        std::cout << "[SERVER] Game not found\n";
        respond(cmd.id, errorResponse({"Game not found"}, nlohmann::json(gameId)));
        return;
    }

    if (currentGame() != gameId) {
        leaveCurrentGame();
    }

    m_context.hub().subscribeGame(m_connection, gameId);
    engine->addPlayer(m_playerId);
    respond(cmd.id, okResponse(nlohmann::json(gameId)));
}

void CommandRouter::leaveGame(const net::CommandFrame& cmd)
{
    auto engine = m_context.registry().find(currentGame());
    if (!engine) {
        respond(cmd.id, errorResponse({"Game not found"}));
        return;
    }

    leaveCurrentGame();
    respond(cmd.id, okResponse());
}

void CommandRouter::cancelGame(const net::CommandFrame& cmd)
{
    auto engine = m_context.registry().find(currentGame());
    if (!engine) {
        respond(cmd.id, errorResponse({"Game not found"}));
        return;
    }
    if (engine->owner() != m_playerId) {
        return;
    }

    engine->stop();
    respond(cmd.id, okResponse());
}

void CommandRouter::startGame(const net::CommandFrame& cmd)
{
    auto engine = m_context.registry().find(currentGame());
    if (!engine) {
        respond(cmd.id, errorResponse({"Game not found"}));
        return;
    }
    if (engine->owner() != m_playerId) {
        return;
    }

    engine->start();
    respond(cmd.id, okResponse());
}

void CommandRouter::changeConfig(const net::CommandFrame& cmd)
{
    const auto config = nlohmann::json::parse(cmd.payload).get<core::GameConfig>();

    auto engine = m_context.registry().find(currentGame());
    if (!engine) {
        return;
    }
    if (engine->owner() != m_playerId) {
        respond(cmd.id, errorResponse({"config_changes_are_only_allowed_to_the_owner"}));
        return;
    }

    engine->configure(config);
    respond(cmd.id, okResponse());
}

void CommandRouter::handleInput(core::Action action)
{
    auto engine = m_context.registry().find(currentGame());
    if (!engine) {
        std::cout << "[SERVER] Game not found\n";
        return;
    }

    if (!engine->isCurrentPlayer(m_playerId)) {
        std::cout << "[SERVER] It is not player " << m_playerId << "'s turn ("
                  << core::toString(action) << ")\n";
    }
    engine->enqueue(action);
}

void CommandRouter::sendState(const net::CommandFrame& cmd)
{
    auto engine = m_context.registry().find(currentGame());
    if (!engine) {
        return;
    }
    respond(cmd.id, okResponse(nlohmann::json(engine->snapshot())));
}

void CommandRouter::sendGames(const net::CommandFrame& cmd)
{
    respond(cmd.id, okResponse(nlohmann::json(m_context.registry().snapshots())));
}

void CommandRouter::sendParticipants(const net::CommandFrame& cmd)
{
    const auto gameId = currentGame();
    if (auto list = m_context.participants(gameId)) {
        respond(cmd.id, okResponse(nlohmann::json(*list)));
        return;
    }

    // The scope of a game that is gone is empty; the caller is the audience
    m_connection->send(net::assembleEvent("game_not_found", nlohmann::json(gameId)));
}

void CommandRouter::signup(const net::CommandFrame& cmd)
{
    const auto name = trim(net::parseStringPayload(cmd.payload));
    try {
        const auto identity = m_context.identities().registerName(name);
        respond(cmd.id, okResponse(nlohmann::json(identity)));
    } catch (const std::invalid_argument& e) {
        respond(cmd.id, errorResponse({e.what()}));
    }
}

void CommandRouter::loadUser(const net::CommandFrame& cmd)
{
    const auto id = trim(net::parseStringPayload(cmd.payload));
    auto identity = m_context.identities().findPlayer(id);
    if (!identity) {
        respond(cmd.id, errorResponse({"User not found"}));
        return;
    }
    respond(cmd.id, okResponse(nlohmann::json(*identity)));
}

void CommandRouter::onDisconnect()
{
    const auto gameId = currentGame();
    m_context.hub().unsubscribe(*m_connection);

    auto engine = m_context.registry().find(gameId);
    if (!engine) {
        return;
    }

    // The owner drives start/cancel; without them the game cannot go on
    if (engine->owner() == m_playerId) {
        engine->interrupt();
    }
    dropPlayer(*engine);
}

void CommandRouter::leaveCurrentGame()
{
    const auto gameId = currentGame();
    if (gameId.empty()) {
        return;
    }

    m_context.hub().unsubscribeGame(*m_connection);
    if (auto engine = m_context.registry().find(gameId)) {
        dropPlayer(*engine);
    }
}

void CommandRouter::dropPlayer(GameEngine& engine)
{
    engine.removePlayer(m_playerId);

    // A game nobody watches any more is ended, which evicts it
    if (m_context.hub().gameConnectionCount(engine.id()) == 0) {
        std::cout << "[SERVER] Game " << engine.id() << " has no connections left\n";
        engine.stop();
    }
}

void CommandRouter::respond(const std::string& commandId, const net::Response& response)
{
    m_connection->send(net::assembleResponse(commandId, response));
}

} // namespace blockfall::server
