#include <catch2/catch_test_macros.hpp>

#include "core/BlockGenerator.hpp"
#include "core/GameSimulation.hpp"
#include "network/Protocol.hpp"
#include "network/StateMapper.hpp"

using namespace blockfall;
using namespace blockfall::net;
using nlohmann::json;

namespace {

json responseBody(const std::string& frame, const std::string& expectedPrefix) {
    const auto at = frame.find('@');
    REQUIRE(at != std::string::npos);
    REQUIRE(frame.substr(0, at) == expectedPrefix);
    return json::parse(frame.substr(at + 1));
}

} // namespace

TEST_CASE("Protocol: command frame is split into name, id and payload", "[protocol]") {
    const auto cmd = parseCommand("enter_game:abc-123@\"g1\"");

    CHECK(cmd.command == "enter_game");
    CHECK(cmd.id == "abc-123");
    CHECK(cmd.payload == "\"g1\"");
}

TEST_CASE("Protocol: only the first '@' separates the payload", "[protocol]") {
    const auto cmd = parseCommand("signup:7@\"bob@example.org\"");

    CHECK(cmd.command == "signup");
    CHECK(cmd.payload == "\"bob@example.org\"");
    CHECK(parseStringPayload(cmd.payload) == "bob@example.org");
}

TEST_CASE("Protocol: malformed frames raise ProtocolError", "[protocol][errors]") {
    SECTION("no payload delimiter") {
        try {
            parseCommand("create_game:42");
            FAIL("expected ProtocolError");
        } catch (const ProtocolError& e) {
            CHECK(std::string(e.what()) == "Invalid message format");
            CHECK(e.commandId() == "42");
        }
    }

    SECTION("no id in the prefix") {
        try {
            parseCommand("create_game@null");
            FAIL("expected ProtocolError");
        } catch (const ProtocolError& e) {
            CHECK(std::string(e.what()) == "Invalid message command prefix");
            CHECK(e.commandId() == kNilCommandId);
        }
    }

    SECTION("empty payload") {
        CHECK_THROWS_AS(parseCommand("send_games:1@"), ProtocolError);
    }
}

TEST_CASE("Protocol: responses carry status, data and errors", "[protocol]") {
    SECTION("ok without data") {
        const auto body = responseBody(assembleResponse("9", okResponse()), "response_9");
        CHECK(body["status"] == "ok");
        CHECK_FALSE(body.contains("data"));
        CHECK_FALSE(body.contains("errors"));
    }

    SECTION("error with data") {
        const auto frame = assembleResponse("9", errorResponse({"Game not found"}, json("g1")));
        const auto body = responseBody(frame, "response_9");
        CHECK(body["status"] == "error");
        CHECK(body["data"] == "g1");
        CHECK(body["errors"] == json::array({"Game not found"}));
    }
}

TEST_CASE("Protocol: events are name@json", "[protocol]") {
    CHECK(assembleEvent("game_not_found", json("g1")) == "game_not_found@\"g1\"");
    CHECK(assembleEvent("unauthenticated", nullptr) == "unauthenticated@null");
}

TEST_CASE("Protocol: non-string payloads are rejected", "[protocol][errors]") {
    CHECK_THROWS_AS(parseStringPayload("42"), json::exception);
    CHECK_THROWS_AS(parseStringPayload("{oops"), json::exception);
}

TEST_CASE("StateMapper: waiting game has no blocks", "[protocol][state]") {
    core::GameSimulation sim("g1", "alice");
    const json j = sim.state();

    CHECK(j["id"] == "g1");
    CHECK(j["owner"] == "alice");
    CHECK(j["name"] == "New Game");
    CHECK(j["cols"] == 10);
    CHECK(j["rows"] == 20);
    CHECK(j["status"] == "waiting");
    CHECK(j["matrix"].empty());
    CHECK_FALSE(j.contains("activeBlock"));
    CHECK_FALSE(j.contains("nextBlock"));
    CHECK(j["players"] == json::array({{{"playerId", "alice"}, {"points", 0}}}));
    CHECK(j["currentPlayer"] == 0);
}

TEST_CASE("StateMapper: running game carries the field and blocks", "[protocol][state]") {
    core::GameSimulation sim("g1", "alice", [](core::Vector origin) {
        return core::Block{origin, core::BlockGenerator::catalog()[0]};
    });
    REQUIRE(sim.start());

    const json j = sim.state();
    CHECK(j["status"] == "running");
    REQUIRE(j["matrix"].size() == 20);
    CHECK(j["matrix"][0].size() == 10);
    CHECK(j["matrix"][0][5] == 1);
    CHECK(j["matrix"][0][4] == 0);

    REQUIRE(j.contains("activeBlock"));
    CHECK(j["activeBlock"]["zero"] == json{{"x", 5}, {"y", 0}});
    CHECK(j["activeBlock"]["degrees"] == 0);
    CHECK(j["activeBlock"]["vectors"].size() == 4);
    CHECK(j.contains("nextBlock"));
}

TEST_CASE("StateMapper: config is read from cols, rows and name", "[protocol][state]") {
    const auto config = json::parse(R"({"cols":6,"rows":12,"name":"duel"})").get<core::GameConfig>();
    CHECK(config.cols == 6);
    CHECK(config.rows == 12);
    CHECK(config.name == "duel");

    CHECK_THROWS_AS(json::parse(R"({"cols":6})").get<core::GameConfig>(), json::exception);
}
