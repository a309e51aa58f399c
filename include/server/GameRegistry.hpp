#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "core/GameSimulation.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "server/GameEngine.hpp"

namespace blockfall::server {

/// Owns every open game, keyed by game id.
class GameRegistry {
public:
    using CreateHook         = std::function<void(const GameEnginePtr&)>;
    using BlockSourceFactory = std::function<core::GameSimulation::BlockSource()>;

    explicit GameRegistry(EngineSettings settings = {});

    /// Called for every new engine before it is published, e.g. to attach
    /// listeners.
    void setCreateHook(CreateHook hook);

    /// Tests inject deterministic pieces through this.
    void setBlockSourceFactory(BlockSourceFactory factory);

    /// New game in Waiting status, owned by (and containing) `owner`.
    GameEnginePtr create(const core::PlayerId& owner);

    /// nullptr if unknown
    GameEnginePtr find(const core::GameId& id) const;

    /// Returns false if the id was not registered.
    bool remove(const core::GameId& id);

    /// Snapshots of all games, in no particular order
    std::vector<core::GameState> snapshots() const;

    std::size_t size() const;

private:
    EngineSettings m_settings;

    mutable std::mutex m_mutex;
    std::unordered_map<core::GameId, GameEnginePtr> m_games;
    CreateHook m_createHook;
    BlockSourceFactory m_blockSourceFactory;
};

} // namespace blockfall::server
