#pragma once

#include "Types.hpp"
#include "Block.hpp"
#include "CollisionField.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockfall::core {

struct GameConfig {
    int cols{10};
    int rows{20};
    std::string name{"New Game"};
};

struct PlayerState {
    PlayerId playerId;
    std::uint64_t points{0};
};

// Authoritative state of one game. Plain data: GameSimulation is the only
// writer, everybody else gets copies.
struct GameState {
    GameId id;
    PlayerId owner;
    GameConfig config;
    GameStatus status{GameStatus::Waiting};

    // Empty until the game starts
    CollisionField matrix;

    std::optional<Block> activeBlock;
    std::optional<Block> nextBlock;

    std::uint64_t blockCount{0};
    std::uint64_t lineCount{0};
    int level{0};

    std::vector<PlayerState> players;
    std::size_t currentPlayerIndex{0};

    // Accepted moves and rotations so far
    std::uint64_t stepCount{0};

    const PlayerState* findPlayer(const PlayerId& playerId) const;
};

} // namespace blockfall::core
