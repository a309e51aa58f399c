#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "server/GameServer.hpp"
#include "server/ServerConfig.hpp"

using namespace blockfall::server;

int main(int argc, char* argv[]) {
    ServerConfig config;
    int port = config.port;

    try {
        if (argc > 1) port = std::stoi(argv[1]);
        if (argc > 2) config.tickQuantum = std::chrono::milliseconds(std::stoi(argv[2]));
        if (argc > 3) config.gravityBaseDelayMs = std::stoi(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "Usage: " << argv[0] << " [port] [tickMs] [gravityMs]\n"
                  << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    if (argc > 4 || port <= 0 || port > 65535
        || config.tickQuantum.count() <= 0 || config.gravityBaseDelayMs <= 0) {
        std::cerr << "Usage: " << argv[0] << " [port] [tickMs] [gravityMs]\n";
        return 1;
    }
    config.port = static_cast<std::uint16_t>(port);

    std::cout << "[SERVER] Starting on port " << config.port
              << " (tick " << config.tickQuantum.count() << " ms, gravity "
              << config.gravityBaseDelayMs << " ms)" << std::endl;

    GameServer server(config);
    if (!server.start()) {
        return 1;
    }

    std::cout << "[SERVER] Press Enter to shut down..." << std::endl;
    std::cin.get();

    server.stop();
    std::cout << "[SERVER] Stopped." << std::endl;
    return 0;
}
