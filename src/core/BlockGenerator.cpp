#include "core/BlockGenerator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace blockfall::core {

BlockGenerator::BlockGenerator()
    : rng_{std::random_device{}()}
{
}

BlockGenerator::BlockGenerator(std::mt19937::result_type seed)
    : rng_{seed}
{
}

const std::vector<Block::Cells>& BlockGenerator::catalog() {
    // Cells are (x, y) with y growing downwards.
    static const std::vector<Block::Cells> shapes{
        // 1x4
        {{0, 0}, {0, 1}, {0, 2}, {0, 3}},
        // half-T left
        // . #
        // . #
        // # #
        {{0, 2}, {1, 2}, {1, 1}, {1, 0}},
        // half-T right
        // # .
        // # .
        // # #
        {{1, 2}, {0, 2}, {0, 1}, {0, 0}},
        // square
        {{0, 0}, {1, 0}, {0, 1}, {1, 1}},
        // T
        // . # .
        // # # #
        {{0, 1}, {1, 1}, {1, 0}, {2, 1}},
        // . # #
        // # # .
        {{0, 1}, {1, 1}, {1, 0}, {2, 0}},
        // # # .
        // . # #
        {{0, 0}, {1, 0}, {1, 1}, {2, 1}},
        // corner
        // . #
        // # #
        {{1, 0}, {1, 1}, {0, 1}},
        // 1x3
        {{0, 0}, {0, 1}, {0, 2}},
    };
    return shapes;
}

Block BlockGenerator::next(Vector origin) {
    if (bag_.empty()) {
        refill();
    }
    if (bag_.empty()) {
        // refill() always yields the full catalog; reaching this is a bug.
        throw std::logic_error("BlockGenerator: no shapes left in bag");
    }

    const std::size_t index = bag_.back();
    bag_.pop_back();
    return Block{origin, catalog()[index], 0};
}

void BlockGenerator::refill() {
    bag_.resize(catalog().size());
    std::iota(bag_.begin(), bag_.end(), std::size_t{0});
    std::shuffle(bag_.begin(), bag_.end(), rng_);
}

} // namespace blockfall::core
