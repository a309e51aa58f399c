#include "server/GameEngine.hpp"

#include <iostream>
#include <stdexcept>

namespace blockfall::server {

using core::Action;
using core::GameEvent;
using core::GameStatus;

std::shared_ptr<GameEngine> GameEngine::create(core::GameId id,
                                               core::PlayerId owner,
                                               EngineSettings settings,
                                               core::GameSimulation::BlockSource blocks)
{
    return std::shared_ptr<GameEngine>(
        new GameEngine(std::move(id), std::move(owner), settings, std::move(blocks)));
}

GameEngine::GameEngine(core::GameId id,
                       core::PlayerId owner,
                       EngineSettings settings,
                       core::GameSimulation::BlockSource blocks)
    : m_id(id)
    , m_owner(owner)
    , m_settings(settings)
    , m_simulation(blocks ? core::GameSimulation(id, owner, std::move(blocks))
                          : core::GameSimulation(id, owner))
    , m_lastGravity(Clock::now())
{
    m_simulation.setEventSink([this](GameEvent event) { collect(event); });
}

GameEngine::~GameEngine()
{
    m_timer.cancel();
}

core::GameState GameEngine::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_simulation.state();
}

core::GameStatus GameEngine::status() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_simulation.state().status;
}

void GameEngine::addListener(Listener listener)
{
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.push_back(std::move(listener));
}

bool GameEngine::addPlayer(const core::PlayerId& playerId)
{
    return mutate([&] { return m_simulation.addPlayer(playerId); });
}

bool GameEngine::removePlayer(const core::PlayerId& playerId)
{
    return mutate([&] { return m_simulation.removePlayer(playerId); });
}

bool GameEngine::configure(const core::GameConfig& config)
{
    return mutate([&] { return m_simulation.configure(config); });
}

bool GameEngine::start()
{
    const bool started = mutate([this] {
        if (!m_simulation.start()) return false;
        m_lastGravity = Clock::now();
        return true;
    });

    if (started && m_settings.autoTick) {
        std::weak_ptr<GameEngine> weak = weak_from_this();
        m_timer.start(m_settings.tickQuantum, [weak] {
            if (auto self = weak.lock()) {
                self->tick(Clock::now());
            }
        });
    }
    return started;
}

bool GameEngine::stop()
{
    const bool stopped = mutate([this] { return m_simulation.stop(); });
    // Outside the mutexes: the tick may be waiting for them
    m_timer.cancel();
    return stopped;
}

bool GameEngine::interrupt()
{
    return mutate([this] { return m_simulation.interrupt(); });
}

bool GameEngine::isCurrentPlayer(const core::PlayerId& playerId) const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_simulation.isCurrentPlayer(playerId);
}

bool GameEngine::enqueue(Action action)
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    if (m_ended) return false;
    m_queue.push_back(action);
    return true;
}

std::size_t GameEngine::pendingInputs() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}

void GameEngine::tick(Clock::time_point now)
{
    mutate([this, now] {
        std::deque<Action> drained;
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            drained.swap(m_queue);
        }

        if (!drained.empty()) {
            for (const auto action : drained) {
                m_simulation.apply(action);
            }
            collect(GameEvent::Looped);
            return true;
        }

        // Paused / stopping: no gravity
        if (!m_simulation.gravityEnabled()) {
            return false;
        }

        const std::chrono::milliseconds delay{
            m_settings.gravity.delayMs(m_simulation.state().level)};
        if (now - m_lastGravity > delay) {
            m_lastGravity = now;
            m_simulation.apply(Action::Down);
            collect(GameEvent::Looped);
            return true;
        }
        return false;
    });

    if (m_ended) {
        m_timer.cancel();
    }
}

bool GameEngine::mutate(const std::function<bool()>& fn)
{
    std::lock_guard<std::recursive_mutex> dispatchLock(m_dispatchMutex);

    std::vector<Emitted> emitted;
    bool result = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        try {
            result = fn();
        } catch (const std::exception& e) {
            std::cerr << "GameEngine: game " << m_id << " failed: " << e.what() << "\n";
            m_simulation.stop();
            result = false;
        }

        if (m_simulation.state().status == GameStatus::Ended && !m_ended) {
            // Intents accepted before the end are discarded, later ones refused
            std::lock_guard<std::mutex> queueLock(m_queueMutex);
            m_ended = true;
            m_queue.clear();
        }

        emitted.swap(m_pending);
    }

    dispatch(emitted);
    return result;
}

void GameEngine::collect(GameEvent event)
{
    m_pending.push_back(Emitted{
        std::make_shared<const core::GameState>(m_simulation.state()),
        event
    });
}

void GameEngine::dispatch(const std::vector<Emitted>& emitted)
{
    if (emitted.empty()) return;

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listeners = m_listeners;
    }

    for (const auto& e : emitted) {
        for (const auto& listener : listeners) {
            try {
                listener(e.state, e.event);
            } catch (const std::exception& ex) {
                std::cerr << "GameEngine: listener failed on " << core::toString(e.event)
                          << " of game " << m_id << ": " << ex.what() << "\n";
            }
        }
    }
}

} // namespace blockfall::server
