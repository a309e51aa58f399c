#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "network/IConnection.hpp"
#include "network/Outbox.hpp"

namespace blockfall::net {

class TcpServer;

/// Concrete IConnection over a TCP socket, one frame per '\n'-terminated
/// line. Two background threads:
///   - the reader splits incoming bytes on '\n' and invokes the
///     MessageHandler for each line;
///   - the writer drains the outbox, so send() never blocks the caller on
///     a slow peer.
/// A peer that lets the outbox fill up is disconnected.
class TcpConnection : public IConnection {
public:
    static constexpr std::size_t kDefaultOutboxLimit = 1024;

    ~TcpConnection() override;

    void send(const std::string& frame) override;
    void close() override;
    void setMessageHandler(MessageHandler handler) override;
    void setCloseHandler(CloseHandler handler) override;
    bool isConnected() const override { return m_connected; }

    // Non-copyable, non-movable
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

private:
    // Constructed by TcpServer with an already-accepted socket.
    TcpConnection(int socketFd, std::size_t outboxLimit);

    friend class TcpServer;

    // Start both threads; called once the handlers are installed.
    void start();

    void readLoop();
    void writeLoop();
    void dispatchLine(const std::string& line);
    void notifyClosed();

    int m_socket;
    std::atomic<bool> m_connected{true};
    std::atomic<bool> m_closeNotified{false};

    Outbox m_outbox;

    std::thread m_reader;
    std::thread m_writer;

    std::mutex m_handlerMutex;
    MessageHandler m_messageHandler;
    CloseHandler m_closeHandler;
};

} // namespace blockfall::net
