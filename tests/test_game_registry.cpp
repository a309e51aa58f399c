#include <catch2/catch_test_macros.hpp>

#include "core/BlockGenerator.hpp"
#include "server/GameRegistry.hpp"

using namespace blockfall::core;
using namespace blockfall::server;

namespace {

EngineSettings manualTicks() {
    EngineSettings s;
    s.autoTick = false;
    return s;
}

} // namespace

TEST_CASE("GameRegistry: create registers a waiting game", "[registry]") {
    GameRegistry registry(manualTicks());

    auto engine = registry.create("alice");
    REQUIRE(engine);
    CHECK_FALSE(engine->id().empty());
    CHECK(engine->owner() == "alice");
    CHECK(engine->status() == GameStatus::Waiting);

    CHECK(registry.find(engine->id()) == engine);
    CHECK(registry.find("unknown") == nullptr);
    CHECK(registry.size() == 1);
}

TEST_CASE("GameRegistry: ids are unique", "[registry]") {
    GameRegistry registry(manualTicks());

    auto a = registry.create("alice");
    auto b = registry.create("alice");
    CHECK(a->id() != b->id());
    CHECK(registry.snapshots().size() == 2);
}

TEST_CASE("GameRegistry: the create hook runs before the game is listed", "[registry]") {
    GameRegistry registry(manualTicks());

    std::size_t listedDuringHook = 99;
    registry.setCreateHook([&](const GameEnginePtr&) { listedDuringHook = registry.size(); });

    registry.create("alice");
    CHECK(listedDuringHook == 0);
}

TEST_CASE("GameRegistry: injected pieces", "[registry]") {
    GameRegistry registry(manualTicks());
    registry.setBlockSourceFactory([] {
        return [](Vector origin) { return Block{origin, BlockGenerator::catalog()[3]}; };
    });

    auto engine = registry.create("alice");
    REQUIRE(engine->start());
    CHECK(engine->snapshot().activeBlock->vectors() == BlockGenerator::catalog()[3]);
}

TEST_CASE("GameRegistry: remove", "[registry]") {
    GameRegistry registry(manualTicks());
    auto engine = registry.create("alice");

    CHECK(registry.remove(engine->id()));
    CHECK_FALSE(registry.remove(engine->id()));
    CHECK(registry.find(engine->id()) == nullptr);
    CHECK(registry.size() == 0);
}
