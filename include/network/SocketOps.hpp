#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Thin wrappers over the BSD / Winsock calls used by the TCP transport.
// Sockets travel as int, as in the rest of the network layer.
namespace blockfall::net::sock {

constexpr int kInvalid = -1;

/// WSAStartup once on Windows; no-op elsewhere. False if it failed.
bool initialize();

/// Bound, listening IPv4 socket on every interface, or kInvalid with the
/// reason in `error`.
int openListener(std::uint16_t port, std::string& error);

/// Blocks for the next client. kInvalid on failure; `peer` gets the
/// dotted address otherwise.
int acceptClient(int listener, std::string& peer);

/// Writes the whole buffer. False once the peer is gone.
bool sendAll(int socket, const char* data, std::size_t size);

/// Bytes read, 0 on orderly shutdown, negative on error.
int receive(int socket, char* buffer, std::size_t size);

/// Wakes up threads blocked on the socket.
void shutdownBoth(int socket);

void closeSocket(int socket);

} // namespace blockfall::net::sock
