#include <catch2/catch_test_macros.hpp>

#include "core/Block.hpp"
#include "core/BlockGenerator.hpp"

#include <algorithm>

using namespace blockfall::core;

namespace {

Block::Cells sorted(Block::Cells cells) {
    std::sort(cells.begin(), cells.end(), [](const Vector& a, const Vector& b) {
        return a.x != b.x ? a.x < b.x : a.y < b.y;
    });
    return cells;
}

} // namespace

TEST_CASE("Block: shifted moves only the origin", "[block]") {
    const Block b{Vector{3, 4}, {{0, 0}, {1, 0}}};
    const Block moved = b.shifted(-1, 2);

    CHECK(moved.origin() == Vector{2, 6});
    CHECK(moved.vectors() == b.vectors());
    CHECK(b.origin() == Vector{3, 4});

    const auto abs = moved.absoluteCells();
    REQUIRE(abs.size() == 2);
    CHECK(abs[0] == Vector{2, 6});
    CHECK(abs[1] == Vector{3, 6});
}

TEST_CASE("Block: vertical bar turns horizontal and stays centered", "[block][rotation]") {
    const Block bar{Vector{5, 0}, BlockGenerator::catalog()[0]};
    const Block turned = bar.rotatedClockwise();

    CHECK(turned.degrees() == 90);
    CHECK(turned.origin() == Vector{3, 1});

    const auto abs = sorted(turned.absoluteCells());
    REQUIRE(abs.size() == 4);
    for (int i = 0; i < 4; ++i) {
        CHECK(abs[i] == Vector{3 + i, 1});
    }
}

TEST_CASE("Block: four rotations restore the T shape", "[block][rotation]") {
    const Block t{Vector{4, 4}, BlockGenerator::catalog()[4]};

    Block b = t;
    for (int i = 0; i < 4; ++i) {
        b = b.rotatedClockwise();
    }

    CHECK(b.degrees() == 0);
    CHECK(b.vectors() == t.vectors());
    CHECK(b.origin() == t.origin());
}

TEST_CASE("Block: angle accumulates modulo 360", "[block][rotation]") {
    Block b{Vector{0, 0}, BlockGenerator::catalog()[5]};
    const int expected[] = {90, 180, 270, 0, 90};
    for (int angle : expected) {
        b = b.rotatedClockwise();
        CHECK(b.degrees() == angle);
    }
}

TEST_CASE("Block: every catalog shape keeps its cells over a full turn", "[block][rotation]") {
    for (const auto& cells : BlockGenerator::catalog()) {
        Block b{Vector{5, 5}, cells};
        for (int i = 0; i < 4; ++i) {
            b = b.rotatedClockwise();
        }
        CHECK(sorted(b.vectors()) == sorted(cells));
    }
}
