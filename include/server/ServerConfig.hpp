#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "server/GameEngine.hpp"

namespace blockfall::server {

struct ServerConfig {
    std::uint16_t port{5000};                     // TCP listen port
    std::size_t outboxLimit{1024};                // frames queued per connection

    std::chrono::milliseconds tickQuantum{10};    // per-game timer period
    int gravityBaseDelayMs{200};                  // level 0 fall delay
    int gravityDecreasePerLevelMs{0};             // 0 = constant speed
    int gravityMinDelayMs{50};

    bool autoTick{true};                          // tests tick by hand

    EngineSettings engineSettings() const
    {
        EngineSettings s;
        s.tickQuantum                = tickQuantum;
        s.gravity.baseDelayMs        = gravityBaseDelayMs;
        s.gravity.decreasePerLevelMs = gravityDecreasePerLevelMs;
        s.gravity.minDelayMs         = gravityMinDelayMs;
        s.autoTick                   = autoTick;
        return s;
    }
};

} // namespace blockfall::server
