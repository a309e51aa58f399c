#include <catch2/catch_test_macros.hpp>

#include "core/BlockGenerator.hpp"
#include "server/GameEngine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace blockfall::core;
using namespace blockfall::server;
using namespace std::chrono_literals;

namespace {

Block bar(Vector origin) {
    return Block{origin, BlockGenerator::catalog()[0]};
}

EngineSettings manualTicks() {
    EngineSettings s;
    s.autoTick = false;
    return s;
}

struct EventLog {
    std::mutex mutex;
    std::vector<GameEvent> events;
    std::vector<GameStatus> statuses;

    void attach(GameEngine& engine) {
        engine.addListener([this](const GameEngine::StatePtr& state, GameEvent e) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(e);
            statuses.push_back(state->status);
        });
    }

    std::size_t count(GameEvent e) {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (auto ev : events) {
            if (ev == e) ++n;
        }
        return n;
    }
};

} // namespace

TEST_CASE("GameEngine: listeners see the state of each event", "[engine]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);
    EventLog log;
    log.attach(*engine);

    REQUIRE(engine->addPlayer("bob"));
    REQUIRE(engine->start());

    REQUIRE(log.events == std::vector<GameEvent>{GameEvent::PlayerAdded, GameEvent::Started});
    CHECK(log.statuses[0] == GameStatus::Waiting);
    CHECK(log.statuses[1] == GameStatus::Running);
}

TEST_CASE("GameEngine: input is queued until the next tick", "[engine][tick]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);
    EventLog log;
    log.attach(*engine);
    REQUIRE(engine->start());

    engine->moveLeft();
    engine->moveLeft();
    engine->rotate();
    CHECK(engine->pendingInputs() == 3);
    CHECK(engine->snapshot().activeBlock->origin() == Vector{5, 0});

    engine->tick(GameEngine::Clock::now());

    CHECK(engine->pendingInputs() == 0);
    CHECK(engine->snapshot().stepCount == 3);
    CHECK(engine->snapshot().activeBlock->degrees() == 90);
    CHECK(log.count(GameEvent::Looped) == 1);
}

TEST_CASE("GameEngine: gravity waits for the level delay", "[engine][tick]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);
    EventLog log;
    log.attach(*engine);
    REQUIRE(engine->start());

    const auto t0 = GameEngine::Clock::now();

    engine->tick(t0 + 1s);
    CHECK(engine->snapshot().activeBlock->origin() == Vector{5, 1});

    // Not enough time since the last gravity step
    engine->tick(t0 + 1s + 50ms);
    CHECK(engine->snapshot().activeBlock->origin() == Vector{5, 1});

    engine->tick(t0 + 1s + 250ms);
    CHECK(engine->snapshot().activeBlock->origin() == Vector{5, 2});
    CHECK(log.count(GameEvent::Looped) == 2);
}

TEST_CASE("GameEngine: queued input replaces gravity for that tick", "[engine][tick]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);
    REQUIRE(engine->start());

    engine->moveRight();
    engine->tick(GameEngine::Clock::now() + 10s);

    CHECK(engine->snapshot().activeBlock->origin() == Vector{6, 0});
}

TEST_CASE("GameEngine: no gravity while waiting or interrupted", "[engine][tick]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);
    EventLog log;
    log.attach(*engine);

    engine->tick(GameEngine::Clock::now() + 10s);
    CHECK(log.events.empty());

    REQUIRE(engine->start());
    REQUIRE(engine->interrupt());
    CHECK(engine->status() == GameStatus::Stopping);

    engine->tick(GameEngine::Clock::now() + 10s);
    CHECK(engine->snapshot().activeBlock->origin() == Vector{5, 0});
    CHECK(log.count(GameEvent::Looped) == 0);
}

TEST_CASE("GameEngine: stop ends the game and refuses input", "[engine][end]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);
    EventLog log;
    log.attach(*engine);
    REQUIRE(engine->start());

    engine->moveDown();
    REQUIRE(engine->stop());

    CHECK(engine->status() == GameStatus::Ended);
    CHECK(engine->pendingInputs() == 0);
    CHECK(log.count(GameEvent::Stopped) == 1);

    CHECK_FALSE(engine->enqueue(Action::Left));
    CHECK_FALSE(engine->stop());
    CHECK_FALSE(engine->configure(GameConfig{}));
}

TEST_CASE("GameEngine: a failing block source ends only that game", "[engine][end]") {
    int drawn = 0;
    auto failing = [&drawn](Vector origin) {
        if (++drawn > 2) {
            throw std::logic_error("no more pieces");
        }
        return bar(origin);
    };

    auto engine = GameEngine::create("g1", "alice", manualTicks(), failing);
    EventLog log;
    log.attach(*engine);

    GameConfig small;
    small.cols = 4;
    small.rows = 4;
    REQUIRE(engine->configure(small));
    REQUIRE(engine->start());

    // Lock the first bar, then the next move needs a third piece
    engine->moveDown();
    engine->tick(GameEngine::Clock::now());
    engine->moveDown();
    engine->tick(GameEngine::Clock::now());

    CHECK(engine->status() == GameStatus::Ended);
    CHECK(log.count(GameEvent::Stopped) == 1);
    CHECK_FALSE(engine->enqueue(Action::Down));
}

TEST_CASE("GameEngine: a listener may call back into the engine", "[engine]") {
    auto engine = GameEngine::create("g1", "alice", manualTicks(), bar);

    GameStatus seen = GameStatus::Waiting;
    engine->addListener([&](const GameEngine::StatePtr&, GameEvent e) {
        if (e == GameEvent::Started) {
            seen = engine->status();
        }
    });

    REQUIRE(engine->start());
    CHECK(seen == GameStatus::Running);
}

TEST_CASE("GameEngine: the timer drives gravity", "[engine][timer]") {
    EngineSettings settings;
    settings.tickQuantum = 5ms;
    settings.gravity.baseDelayMs = 20;
    settings.gravity.minDelayMs = 10;

    auto engine = GameEngine::create("g1", "alice", settings, bar);
    EventLog log;
    log.attach(*engine);
    REQUIRE(engine->start());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (log.count(GameEvent::Looped) < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(log.count(GameEvent::Looped) >= 3);

    REQUIRE(engine->stop());
    const auto after = log.count(GameEvent::Looped);
    std::this_thread::sleep_for(60ms);
    CHECK(log.count(GameEvent::Looped) == after);
}

TEST_CASE("GameEngine: concurrent input while the timer drains the queue", "[engine][timer][concurrency]") {
    EngineSettings settings;
    settings.tickQuantum = 1ms;
    // No gravity during the run: only queued input moves the piece
    settings.gravity.baseDelayMs = 60000;
    auto engine = GameEngine::create("g1", "alice", settings, bar);
    EventLog log;
    log.attach(*engine);
    REQUIRE(engine->start());

    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;
    std::atomic<int> accepted{0};
    std::atomic<bool> producing{true};

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&engine, &accepted, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                const auto action = (i + p) % 2 == 0 ? Action::Left : Action::Right;
                if (engine->enqueue(action)) {
                    ++accepted;
                }
            }
        });
    }
    std::thread reader([&engine, &producing] {
        while (producing) {
            const auto state = engine->snapshot();
            if (state.activeBlock) {
                (void)state.activeBlock->absoluteCells();
            }
        }
    });

    for (auto& t : producers) {
        t.join();
    }
    producing = false;
    reader.join();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (engine->pendingInputs() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    CHECK(accepted == kProducers * kPerProducer);
    CHECK(engine->pendingInputs() == 0);
    const auto state = engine->snapshot();
    CHECK(state.status == GameStatus::Running);
    CHECK(state.stepCount > 0);
    CHECK(state.stepCount <= static_cast<std::uint64_t>(kProducers * kPerProducer));
    CHECK(log.count(GameEvent::Looped) > 0);

    CHECK(engine->stop());
}
