#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "network/IConnection.hpp"

namespace blockfall::net {

/// Listens on a port and wraps every accepted socket in a TcpConnection.
/// The callback installs the connection's handlers; the connection starts
/// reading once the callback returns.
class TcpServer {
public:
    using NewConnectionCallback = std::function<void(IConnectionPtr)>;

    /// `outboxLimit` caps the frames queued per connection.
    TcpServer(std::uint16_t port, std::size_t outboxLimit, NewConnectionCallback onNewConnection);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    /// Bind, listen and run the accept loop on a background thread.
    /// Returns false if the socket could not be set up.
    bool start();

    /// Close the listener and join the accept thread. Connections already
    /// handed out stay open.
    void stop();

    bool isRunning() const { return m_running; }

private:
    void acceptLoop();
    void handOff(int clientSocket, const std::string& peer);

    const std::uint16_t m_port;
    const std::size_t m_outboxLimit;
    NewConnectionCallback m_onNewConnection;

    std::atomic<int> m_listener;
    std::atomic<bool> m_running{false};
    std::thread m_acceptThread;
};

} // namespace blockfall::net
