#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "core/GameEvent.hpp"
#include "core/GameSimulation.hpp"
#include "core/GameState.hpp"
#include "core/Scoring.hpp"
#include "core/Types.hpp"
#include "server/RecurringTimer.hpp"

namespace blockfall::server {

struct EngineSettings {
    // Scheduling quantum of the tick, independent of the gravity delay
    std::chrono::milliseconds tickQuantum{10};
    core::GravityPolicy gravity{};
    // Tests switch the timer off and call tick() themselves
    bool autoTick{true};
};

/// One running game as a single-writer actor.
///
/// Directional input is only queued by the command path; the tick drains
/// the queue and is, together with the owner operations, the only writer of
/// the simulation. All writers go through the same state mutex. Events are
/// collected with a snapshot while the state is locked and handed to the
/// listeners after it is released, in emission order.
class GameEngine : public std::enable_shared_from_this<GameEngine> {
public:
    using Clock     = std::chrono::steady_clock;
    using StatePtr  = std::shared_ptr<const core::GameState>;
    using Listener  = std::function<void(const StatePtr&, core::GameEvent)>;

    static std::shared_ptr<GameEngine> create(core::GameId id,
                                              core::PlayerId owner,
                                              EngineSettings settings = {},
                                              core::GameSimulation::BlockSource blocks = {});

    ~GameEngine();

    GameEngine(const GameEngine&) = delete;
    GameEngine& operator=(const GameEngine&) = delete;

    const core::GameId& id() const noexcept { return m_id; }
    const core::PlayerId& owner() const noexcept { return m_owner; }

    /// Copy of the current state, never observed mid-mutation.
    core::GameState snapshot() const;
    core::GameStatus status() const;

    /// Listeners are called in subscription order.
    void addListener(Listener listener);

    // Owner / lobby operations, applied immediately
    bool addPlayer(const core::PlayerId& playerId);
    bool removePlayer(const core::PlayerId& playerId);
    bool configure(const core::GameConfig& config);
    bool start();
    bool stop();
    bool interrupt();
    bool isCurrentPlayer(const core::PlayerId& playerId) const;

    // Player intents, consumed by the next tick
    void moveLeft()  { enqueue(core::Action::Left); }
    void moveRight() { enqueue(core::Action::Right); }
    void moveDown()  { enqueue(core::Action::Down); }
    void rotate()    { enqueue(core::Action::Rotate); }

    /// Returns false once the game has ended; the intent is dropped.
    bool enqueue(core::Action action);

    std::size_t pendingInputs() const;

    /// One tick: drain the input queue, or apply gravity when the delay for
    /// the current level has elapsed since the last gravity step.
    void tick(Clock::time_point now);

private:
    struct Emitted {
        StatePtr state;
        core::GameEvent event;
    };

    GameEngine(core::GameId id,
               core::PlayerId owner,
               EngineSettings settings,
               core::GameSimulation::BlockSource blocks);

    // Runs fn under the state mutex, then dispatches what it emitted.
    // A failing step ends this game only.
    bool mutate(const std::function<bool()>& fn);

    void collect(core::GameEvent event);
    void dispatch(const std::vector<Emitted>& emitted);

    const core::GameId m_id;
    const core::PlayerId m_owner;
    const EngineSettings m_settings;

    // Order: dispatch before state. Recursive so a listener may call back
    // into this engine.
    std::recursive_mutex m_dispatchMutex;
    mutable std::mutex m_stateMutex;
    core::GameSimulation m_simulation;
    std::vector<Emitted> m_pending;
    Clock::time_point m_lastGravity;

    mutable std::mutex m_queueMutex;
    std::deque<core::Action> m_queue;
    std::atomic<bool> m_ended{false};

    std::mutex m_listenerMutex;
    std::vector<Listener> m_listeners;

    RecurringTimer m_timer;
};

using GameEnginePtr = std::shared_ptr<GameEngine>;

} // namespace blockfall::server
