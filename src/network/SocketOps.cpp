#include "network/SocketOps.hpp"

#include <iostream>

#ifdef _WIN32
    #include <mutex>
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using native_socket = SOCKET;
    using addr_len      = int;
    #define NATIVE_CLOSE closesocket
    #define NATIVE_SHUT_BOTH SD_BOTH
#else
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>
    using native_socket = int;
    using addr_len      = socklen_t;
    #define NATIVE_CLOSE ::close
    #define NATIVE_SHUT_BOTH SHUT_RDWR
#endif

namespace blockfall::net::sock {

namespace {

native_socket native(int socket)
{
    return static_cast<native_socket>(socket);
}

bool valid(native_socket s)
{
#ifdef _WIN32
    return s != INVALID_SOCKET;
#else
    return s >= 0;
#endif
}

// A peer that went away must not kill the process with SIGPIPE
constexpr int kSendFlags =
#ifdef MSG_NOSIGNAL
    MSG_NOSIGNAL;
#else
    0;
#endif

} // namespace

bool initialize()
{
#ifdef _WIN32
    static std::once_flag flag;
    static bool ok = false;
    std::call_once(flag, [] {
        WSADATA wsaData;
        const int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
        if (result != 0) {
            std::cerr << "WSAStartup failed: " << result << "\n";
        }
        ok = result == 0;
    });
    return ok;
#else
    return true;
#endif
}

int openListener(std::uint16_t port, std::string& error)
{
    const native_socket s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (!valid(s)) {
        error = "failed to create socket";
        return kInvalid;
    }

    int reuse = 1;
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port        = htons(port);

    if (::bind(s, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind failed on port " + std::to_string(port);
    } else if (::listen(s, SOMAXCONN) < 0) {
        error = "listen failed";
    } else {
        return static_cast<int>(s);
    }

    NATIVE_CLOSE(s);
    return kInvalid;
}

int acceptClient(int listener, std::string& peer)
{
    sockaddr_in addr{};
    addr_len length = sizeof(addr);

    const native_socket s = ::accept(native(listener), reinterpret_cast<sockaddr*>(&addr), &length);
    if (!valid(s)) {
        return kInvalid;
    }

    char text[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text))) {
        peer = text;
    } else {
        peer = "?";
    }
    return static_cast<int>(s);
}

bool sendAll(int socket, const char* data, std::size_t size)
{
    while (size > 0) {
        const int sent = ::send(native(socket), data, static_cast<int>(size), kSendFlags);
        if (sent <= 0) {
            return false;
        }
        size -= static_cast<std::size_t>(sent);
        data += sent;
    }
    return true;
}

int receive(int socket, char* buffer, std::size_t size)
{
    return static_cast<int>(::recv(native(socket), buffer, static_cast<int>(size), 0));
}

void shutdownBoth(int socket)
{
    if (socket == kInvalid) return;
    ::shutdown(native(socket), NATIVE_SHUT_BOTH);
}

void closeSocket(int socket)
{
    if (socket == kInvalid) return;
    NATIVE_CLOSE(native(socket));
}

} // namespace blockfall::net::sock
