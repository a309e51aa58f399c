#include <catch2/catch_test_macros.hpp>

#include "core/BlockGenerator.hpp"

#include <set>
#include <vector>

using namespace blockfall::core;

namespace {

std::size_t shapeIndex(const Block& b) {
    const auto& shapes = BlockGenerator::catalog();
    for (std::size_t i = 0; i < shapes.size(); ++i) {
        if (shapes[i] == b.vectors()) return i;
    }
    return shapes.size();
}

} // namespace

TEST_CASE("BlockGenerator: catalog holds nine shapes", "[generator]") {
    const auto& shapes = BlockGenerator::catalog();
    REQUIRE(shapes.size() == 9);

    // two 3-cell pieces, the rest have four
    std::size_t small = 0;
    for (const auto& s : shapes) {
        if (s.size() == 3) ++small;
        else CHECK(s.size() == 4);
    }
    CHECK(small == 2);
}

TEST_CASE("BlockGenerator: no shape repeats within a bag", "[generator]") {
    BlockGenerator gen(1234u);
    const auto bagSize = BlockGenerator::catalog().size();

    for (int bag = 0; bag < 3; ++bag) {
        std::set<std::size_t> seen;
        for (std::size_t i = 0; i < bagSize; ++i) {
            const auto idx = shapeIndex(gen.next(Vector{0, 0}));
            REQUIRE(idx < bagSize);
            CHECK(seen.insert(idx).second);
        }
        CHECK(seen.size() == bagSize);
        CHECK(gen.remaining() == 0);
    }
}

TEST_CASE("BlockGenerator: pieces start at the given origin with angle 0", "[generator]") {
    BlockGenerator gen(7u);
    const Block b = gen.next(Vector{5, 0});

    CHECK(b.origin() == Vector{5, 0});
    CHECK(b.degrees() == 0);
    CHECK(gen.remaining() == BlockGenerator::catalog().size() - 1);
}

TEST_CASE("BlockGenerator: same seed, same sequence", "[generator]") {
    BlockGenerator a(42u);
    BlockGenerator b(42u);

    for (int i = 0; i < 20; ++i) {
        CHECK(a.next(Vector{0, 0}).vectors() == b.next(Vector{0, 0}).vectors());
    }
}
