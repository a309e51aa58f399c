#include "core/GameSimulation.hpp"

#include "core/Scoring.hpp"

#include <algorithm>
#include <memory>

namespace blockfall::core {

namespace {

GameSimulation::BlockSource bagSource() {
    auto generator = std::make_shared<BlockGenerator>();
    return [generator](Vector origin) { return generator->next(origin); };
}

} // namespace

GameSimulation::GameSimulation(GameId id, PlayerId owner)
    : GameSimulation(std::move(id), std::move(owner), bagSource())
{
}

GameSimulation::GameSimulation(GameId id, PlayerId owner, BlockSource blocks)
    : blocks_{std::move(blocks)}
{
    state_.id     = std::move(id);
    state_.owner  = owner;
    state_.status = GameStatus::Waiting;
    state_.players.push_back(PlayerState{std::move(owner), 0});
}

void GameSimulation::emit(GameEvent event) {
    if (sink_) {
        sink_(event);
    }
}

bool GameSimulation::start() {
    if (state_.status != GameStatus::Waiting) return false;

    state_.matrix = CollisionField(state_.config.cols, state_.config.rows);
    state_.status = GameStatus::Running;

    state_.activeBlock = blocks_(spawnOrigin());
    state_.nextBlock   = blocks_(spawnOrigin());
    state_.blockCount  = 1;
    state_.matrix.drawBlock(*state_.activeBlock);

    emit(GameEvent::Started);
    return true;
}

bool GameSimulation::stop() {
    if (state_.status == GameStatus::Ended) return false;
    end();
    return true;
}

bool GameSimulation::pause() {
    if (state_.status != GameStatus::Running) return false;
    state_.status = GameStatus::Paused;
    emit(GameEvent::StatusChanged);
    return true;
}

bool GameSimulation::interrupt() {
    if (state_.status != GameStatus::Running) return false;
    state_.status = GameStatus::Stopping;
    emit(GameEvent::StatusChanged);
    return true;
}

bool GameSimulation::addPlayer(const PlayerId& playerId) {
    if (state_.status != GameStatus::Waiting) return false;
    if (state_.findPlayer(playerId)) return false;

    state_.players.push_back(PlayerState{playerId, 0});
    emit(GameEvent::PlayerAdded);
    return true;
}

bool GameSimulation::removePlayer(const PlayerId& playerId) {
    auto& players = state_.players;
    auto it = std::find_if(players.begin(), players.end(),
                           [&](const PlayerState& p) { return p.playerId == playerId; });
    if (it == players.end()) return false;

    players.erase(it);

    if (state_.currentPlayerIndex >= players.size()) {
        state_.currentPlayerIndex = 0;
    }

    emit(GameEvent::PlayerRemoved);
    return true;
}

bool GameSimulation::configure(const GameConfig& config) {
    if (state_.status != GameStatus::Waiting) return false;
    if (config.cols <= 0 || config.rows <= 0) return false;

    state_.config = config;
    emit(GameEvent::ConfigUpdated);
    return true;
}

bool GameSimulation::isCurrentPlayer(const PlayerId& playerId) const {
    if (state_.players.empty() || playerId.empty()) return false;
    return state_.players[state_.currentPlayerIndex].playerId == playerId;
}

void GameSimulation::apply(Action action) {
    switch (action) {
    case Action::Rotate:
        rotate();
        break;
    case Action::Left:
    case Action::Right:
    case Action::Down:
        move(action);
        break;
    }
}

Vector GameSimulation::spawnOrigin() const noexcept {
    return Vector{state_.config.cols / 2, 0};
}

void GameSimulation::move(Action direction) {
    if (state_.status != GameStatus::Running) return;

    ++state_.stepCount;

    if (!state_.activeBlock) {
        materializeNextBlock();
        // A top-out has already reported the end
        if (state_.status == GameStatus::Running) {
            emit(GameEvent::NextBlockCreated);
        }
        return;
    }

    const Block current = *state_.activeBlock;
    const int dx = direction == Action::Left ? -1 : (direction == Action::Right ? 1 : 0);
    const int dy = direction == Action::Down ? 1 : 0;
    const Block candidate = current.shifted(dx, dy);

    // Erase first so the block does not collide with itself
    state_.matrix.eraseBlock(current);

    if (state_.matrix.isBlocked(candidate)) {
        state_.matrix.drawBlock(current);
        if (direction == Action::Down) {
            lockActiveBlock();
        }
        return;
    }

    state_.activeBlock = candidate;
    state_.matrix.drawBlock(candidate);
}

void GameSimulation::rotate() {
    if (!state_.activeBlock || state_.status != GameStatus::Running) return;

    ++state_.stepCount;

    const Block current = *state_.activeBlock;
    const Block rotated = current.rotatedClockwise();

    state_.matrix.eraseBlock(current);
    if (state_.matrix.isBlocked(rotated)) {
        // No wall kicks: a blocked rotation is dropped
        state_.matrix.drawBlock(current);
        return;
    }

    state_.activeBlock = rotated;
    state_.matrix.drawBlock(rotated);
}

void GameSimulation::materializeNextBlock() {
    if (!state_.nextBlock) {
        state_.nextBlock = blocks_(spawnOrigin());
    }

    state_.activeBlock = state_.nextBlock;
    state_.nextBlock   = blocks_(spawnOrigin());
    ++state_.blockCount;

    const bool blocked = state_.matrix.isBlocked(*state_.activeBlock);
    state_.matrix.drawBlock(*state_.activeBlock);
    emit(GameEvent::BlockCreated);

    if (blocked) {
        // Topped out
        end();
    }
}

void GameSimulation::lockActiveBlock() {
    state_.activeBlock.reset();
    emit(GameEvent::RoundDone);
    updateLines();
}

void GameSimulation::updateLines() {
    const auto rows = state_.matrix.completedRows();
    if (rows.empty()) return;

    const int count = static_cast<int>(rows.size());
    state_.lineCount += static_cast<std::uint64_t>(count);
    state_.level = levelForLines(state_.lineCount);

    // Credited to whoever holds the turn, not to the player who moved
    if (!state_.players.empty()) {
        state_.players[state_.currentPlayerIndex].points += pointsForLines(count, state_.level);
    }

    state_.matrix.dropRows(rows);
    emit(GameEvent::LinesCompleted);
}

void GameSimulation::end() {
    state_.status = GameStatus::Ended;
    emit(GameEvent::StatusChanged);
    emit(GameEvent::Stopped);
}

} // namespace blockfall::core
