#pragma once

#include "Types.hpp"
#include "Block.hpp"
#include <cstddef>
#include <random>
#include <vector>

namespace blockfall::core {

// Bag randomizer over the shape catalog: every shape is handed out exactly
// once per bag, then a fresh bag is shuffled.
class BlockGenerator {
public:
    BlockGenerator();
    explicit BlockGenerator(std::mt19937::result_type seed);

    // Next piece from the bag, placed at origin with angle 0
    Block next(Vector origin);

    // Number of shapes still in the current bag
    std::size_t remaining() const noexcept { return bag_.size(); }

    static const std::vector<Block::Cells>& catalog();

private:
    std::mt19937 rng_;
    std::vector<std::size_t> bag_;

    void refill();
};

} // namespace blockfall::core
