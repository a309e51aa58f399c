#include <catch2/catch_test_macros.hpp>

#include "server/IdentityService.hpp"

#include <stdexcept>

using namespace blockfall::server;

TEST_CASE("IdentityService: unknown tokens get a fresh identity", "[identity]") {
    InMemoryIdentityService ids({"Only Name"});

    const auto a = ids.resolvePlayer("");
    const auto b = ids.resolvePlayer("not-a-known-token");

    CHECK_FALSE(a.id.empty());
    CHECK(a.name == "Only Name");
    CHECK(a.id != b.id);
    CHECK(b.id != "not-a-known-token");
}

TEST_CASE("IdentityService: known tokens resolve to the same player", "[identity]") {
    InMemoryIdentityService ids;

    const auto first = ids.resolvePlayer("");
    const auto again = ids.resolvePlayer(first.id);

    CHECK(again.id == first.id);
    CHECK(again.name == first.name);
}

TEST_CASE("IdentityService: nickname registration", "[identity]") {
    InMemoryIdentityService ids;

    const auto alice = ids.registerName("Alice");
    CHECK(alice.name == "Alice");

    auto found = ids.findPlayer(alice.id);
    REQUIRE(found.has_value());
    CHECK(found->name == "Alice");

    CHECK_THROWS_AS(ids.registerName(""), std::invalid_argument);
    CHECK_THROWS_AS(ids.registerName("aLiCe"), std::invalid_argument);

    try {
        ids.registerName("ALICE");
        FAIL("expected a duplicate name error");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()) == "name already in use");
    }

    CHECK_FALSE(ids.findPlayer("nobody").has_value());
}

TEST_CASE("IdentityService: needs at least one nickname", "[identity]") {
    CHECK_THROWS_AS(InMemoryIdentityService(std::vector<std::string>{}), std::invalid_argument);
}
