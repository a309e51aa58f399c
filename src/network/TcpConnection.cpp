#include "network/TcpConnection.hpp"

#include <iostream>

#include "network/SocketOps.hpp"

namespace {

// The last owner may release the connection from inside its own close
// handler, i.e. on the reader thread.
void joinOrDetach(std::thread& t)
{
    if (!t.joinable()) return;
    if (t.get_id() == std::this_thread::get_id()) {
        t.detach();
    } else {
        t.join();
    }
}

} // namespace

namespace blockfall::net {

TcpConnection::TcpConnection(int socketFd, std::size_t outboxLimit)
    : m_socket(socketFd)
    , m_outbox(outboxLimit)
{
}

TcpConnection::~TcpConnection()
{
    m_connected = false;
    m_outbox.discard();
    sock::shutdownBoth(m_socket);

    joinOrDetach(m_writer);
    joinOrDetach(m_reader);

    sock::closeSocket(m_socket);
}

void TcpConnection::start()
{
    m_reader = std::thread(&TcpConnection::readLoop, this);
    m_writer = std::thread(&TcpConnection::writeLoop, this);
}

void TcpConnection::send(const std::string& frame)
{
    if (!m_connected) return;

    if (m_outbox.push(frame) == Outbox::PushResult::Full) {
        // The peer stopped reading
        std::cerr << "TcpConnection: " << m_outbox.capacity()
                  << " frames pending, dropping the connection\n";
        m_connected = false;
        m_outbox.discard();
        sock::shutdownBoth(m_socket);
    }
}

void TcpConnection::close()
{
    // The writer flushes the outbox, then shuts the socket down
    m_outbox.close();
}

void TcpConnection::setMessageHandler(MessageHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_messageHandler = std::move(handler);
}

void TcpConnection::setCloseHandler(CloseHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_closeHandler = std::move(handler);
}

void TcpConnection::writeLoop()
{
    while (auto frame = m_outbox.pop()) {
        frame->push_back('\n');
        if (!sock::sendAll(m_socket, frame->data(), frame->size())) {
            m_connected = false;
            m_outbox.discard();
            break;
        }
    }

    // Wakes the reader up
    sock::shutdownBoth(m_socket);
}

void TcpConnection::readLoop()
{
    std::string buffer;
    buffer.reserve(4096);
    char chunk[1024];

    while (m_connected) {
        const int received = sock::receive(m_socket, chunk, sizeof(chunk));
        if (received <= 0) {
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(received));

        std::size_t start = 0;
        for (auto end = buffer.find('\n'); end != std::string::npos; end = buffer.find('\n', start)) {
            std::string line = buffer.substr(start, end - start);
            start = end + 1;

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                dispatchLine(line);
            }
        }
        buffer.erase(0, start);
    }

    // Peer gone: whatever is still queued cannot be delivered
    m_connected = false;
    m_outbox.discard();

    // Must stay the last statement: the handler may destroy this object.
    notifyClosed();
}

void TcpConnection::dispatchLine(const std::string& line)
{
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_messageHandler;
    }
    if (handler) {
        handler(line);
    }
}

void TcpConnection::notifyClosed()
{
    if (m_closeNotified.exchange(true)) return;

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_closeHandler;
    }
    if (handler) {
        handler();
    }
}

} // namespace blockfall::net
