#include "network/TcpServer.hpp"

#include <iostream>
#include <memory>

#include "network/SocketOps.hpp"
#include "network/TcpConnection.hpp"

namespace blockfall::net {

TcpServer::TcpServer(std::uint16_t port, std::size_t outboxLimit, NewConnectionCallback onNewConnection)
    : m_port(port)
    , m_outboxLimit(outboxLimit)
    , m_onNewConnection(std::move(onNewConnection))
    , m_listener(sock::kInvalid)
{
}

TcpServer::~TcpServer()
{
    stop();
}

bool TcpServer::start()
{
    if (m_running) return true;
    if (!sock::initialize()) return false;

    std::string error;
    const int listener = sock::openListener(m_port, error);
    if (listener == sock::kInvalid) {
        std::cerr << "TcpServer: " << error << "\n";
        return false;
    }

    m_listener = listener;
    m_running  = true;
    m_acceptThread = std::thread(&TcpServer::acceptLoop, this);
    return true;
}

void TcpServer::stop()
{
    if (!m_running.exchange(false)) return;

    // shutdown() unblocks accept() on Linux, close() alone does not
    const int listener = m_listener.exchange(sock::kInvalid);
    sock::shutdownBoth(listener);
    sock::closeSocket(listener);

    if (m_acceptThread.joinable()) {
        m_acceptThread.join();
    }
}

void TcpServer::acceptLoop()
{
    while (m_running) {
        std::string peer;
        const int client = sock::acceptClient(m_listener, peer);
        if (client != sock::kInvalid) {
            handOff(client, peer);
        } else if (m_running) {
            std::cerr << "TcpServer: accept failed\n";
        }
    }
}

void TcpServer::handOff(int clientSocket, const std::string& peer)
{
    std::cout << "TcpServer: connection from " << peer << "\n";

    std::shared_ptr<TcpConnection> connection(new TcpConnection(clientSocket, m_outboxLimit));
    if (m_onNewConnection) {
        m_onNewConnection(connection);
    }
    connection->start();
}

} // namespace blockfall::net
