#pragma once

#include <functional>
#include <memory>
#include <string>

namespace blockfall::net {

/// A persistent, message-oriented, full-duplex connection carrying text
/// frames.
class IConnection {
public:
    using MessageHandler = std::function<void(const std::string&)>;
    using CloseHandler   = std::function<void()>;

    virtual ~IConnection() = default;

    // Queue a frame for the remote peer. Never blocks on the socket.
    virtual void send(const std::string& frame) = 0;

    // Flush what was queued, then close.
    virtual void close() = 0;

    // Set callback invoked for every complete frame received.
    virtual void setMessageHandler(MessageHandler handler) = 0;

    // Set callback invoked once the connection is gone.
    virtual void setCloseHandler(CloseHandler handler) = 0;

    virtual bool isConnected() const = 0;
};

using IConnectionPtr = std::shared_ptr<IConnection>;

} // namespace blockfall::net
