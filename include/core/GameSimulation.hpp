#pragma once

#include "Types.hpp"
#include "Block.hpp"
#include "BlockGenerator.hpp"
#include "GameEvent.hpp"
#include "GameState.hpp"
#include <functional>

namespace blockfall::core {

// Rules of one game, single-threaded. Every mutation goes through this
// class; callers serialize access (see server::GameEngine).
class GameSimulation {
public:
    using EventSink   = std::function<void(GameEvent)>;
    using BlockSource = std::function<Block(Vector origin)>;

    // The owner is the first player of a new game.
    GameSimulation(GameId id, PlayerId owner);
    GameSimulation(GameId id, PlayerId owner, BlockSource blocks);

    const GameState& state() const noexcept { return state_; }

    // Receives every event synchronously, after the state change it reports
    void setEventSink(EventSink sink) { sink_ = std::move(sink); }

    // Lifecycle. Each returns false when the transition is not allowed
    // from the current status; nothing changes in that case.
    bool start();      // Waiting -> Running
    bool stop();       // any non-ended status -> Ended
    bool pause();      // Running -> Paused
    bool interrupt();  // Running -> Stopping

    // Waiting only; duplicates are rejected
    bool addPlayer(const PlayerId& playerId);
    bool removePlayer(const PlayerId& playerId);

    // Waiting only; non-positive dimensions are rejected
    bool configure(const GameConfig& config);

    bool isCurrentPlayer(const PlayerId& playerId) const;

    // Gravity runs only while Running
    bool gravityEnabled() const noexcept { return state_.status == GameStatus::Running; }

    // Apply one queued action (no-op outside Running)
    void apply(Action action);

private:
    GameState state_;
    BlockSource blocks_;
    EventSink sink_;

    void emit(GameEvent event);

    Vector spawnOrigin() const noexcept;
    void move(Action direction);
    void rotate();
    void materializeNextBlock();
    void lockActiveBlock();
    void updateLines();
    void end();
};

} // namespace blockfall::core
