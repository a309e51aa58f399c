#include <catch2/catch_test_macros.hpp>

#include "core/Scoring.hpp"

using namespace blockfall::core;

TEST_CASE("Scoring: line table scaled by level", "[score]") {
    CHECK(pointsForLines(0, 0) == 0);
    CHECK(pointsForLines(1, 0) == 40);
    CHECK(pointsForLines(2, 0) == 100);
    CHECK(pointsForLines(3, 0) == 300);
    CHECK(pointsForLines(4, 0) == 1200);

    CHECK(pointsForLines(1, 2) == 120);
    CHECK(pointsForLines(4, 1) == 2400);
}

TEST_CASE("Scoring: more than four rows use the top entry", "[score]") {
    CHECK(pointsForLines(5, 0) == 1500);
    CHECK(pointsForLines(6, 1) == 3000);
}

TEST_CASE("Scoring: level is lines / 10", "[score][level]") {
    CHECK(levelForLines(0) == 0);
    CHECK(levelForLines(9) == 0);
    CHECK(levelForLines(10) == 1);
    CHECK(levelForLines(25) == 2);
}

TEST_CASE("GravityPolicy: constant by default", "[score][gravity]") {
    GravityPolicy g;
    CHECK(g.delayMs(0) == 200);
    CHECK(g.delayMs(15) == 200);
}

TEST_CASE("GravityPolicy: faster per level down to the minimum", "[score][gravity]") {
    GravityPolicy g;
    g.decreasePerLevelMs = 30;

    CHECK(g.delayMs(0) == 200);
    CHECK(g.delayMs(3) == 110);
    CHECK(g.delayMs(10) == 50);

    SECTION("minimum above the base delay is capped by the base") {
        g.baseDelayMs = 40;
        CHECK(g.delayMs(5) == 40);
    }
}
