#include "server/GameRegistry.hpp"

#include "server/IdGenerator.hpp"

namespace blockfall::server {

GameRegistry::GameRegistry(EngineSettings settings)
    : m_settings(settings)
{
}

void GameRegistry::setCreateHook(CreateHook hook)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_createHook = std::move(hook);
}

void GameRegistry::setBlockSourceFactory(BlockSourceFactory factory)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_blockSourceFactory = std::move(factory);
}

GameEnginePtr GameRegistry::create(const core::PlayerId& owner)
{
    CreateHook hook;
    core::GameSimulation::BlockSource blocks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        hook = m_createHook;
        if (m_blockSourceFactory) {
            blocks = m_blockSourceFactory();
        }
    }

    auto engine = GameEngine::create(makeUuid(), owner, m_settings, std::move(blocks));
    if (hook) {
        hook(engine);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_games.emplace(engine->id(), engine);
    return engine;
}

GameEnginePtr GameRegistry::find(const core::GameId& id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_games.find(id);
    return it == m_games.end() ? nullptr : it->second;
}

bool GameRegistry::remove(const core::GameId& id)
{
    GameEnginePtr evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_games.find(id);
        if (it == m_games.end()) {
            return false;
        }
        evicted = std::move(it->second);
        m_games.erase(it);
    }
    // evicted may be the last reference; released outside the lock
    return true;
}

std::vector<core::GameState> GameRegistry::snapshots() const
{
    std::vector<GameEnginePtr> engines;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        engines.reserve(m_games.size());
        for (const auto& [id, engine] : m_games) {
            (void)id;
            engines.push_back(engine);
        }
    }

    std::vector<core::GameState> out;
    out.reserve(engines.size());
    for (const auto& engine : engines) {
        out.push_back(engine->snapshot());
    }
    return out;
}

std::size_t GameRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_games.size();
}

} // namespace blockfall::server
