#include "core/Block.hpp"

#include <algorithm>
#include <cmath>

namespace blockfall::core {

namespace {

int maxX(const Block::Cells& cells) {
    int m = 0;
    for (const auto& v : cells) {
        m = std::max(m, v.x);
    }
    return m;
}

int maxY(const Block::Cells& cells) {
    int m = 0;
    for (const auto& v : cells) {
        m = std::max(m, v.y);
    }
    return m;
}

} // namespace

Block::Block(Vector origin, Cells vectors, int degrees)
    : origin_{origin}, vectors_{std::move(vectors)}, degrees_{degrees}
{
}

Block Block::shifted(int dx, int dy) const {
    Block out = *this;
    out.origin_.x += dx;
    out.origin_.y += dy;
    return out;
}

Block Block::rotatedClockwise() const {
    const int oldMaxX = maxX(vectors_);
    const int oldMaxY = maxY(vectors_);

    Cells rotated;
    rotated.reserve(vectors_.size());
    for (const auto& v : vectors_) {
        rotated.push_back(Vector{oldMaxY - v.y, v.x});
    }

    const int newMaxX = maxX(rotated);
    const int newMaxY = maxY(rotated);

    // ceil on 0/180, floor on 90/270
    const bool useCeil = (degrees_ % 180) == 0;
    auto half = [useCeil](int delta) {
        const double h = static_cast<double>(delta) / 2.0;
        return static_cast<int>(useCeil ? std::ceil(h) : std::floor(h));
    };

    Vector origin = origin_;
    origin.x -= half(newMaxX - oldMaxX);
    origin.y -= half(newMaxY - oldMaxY);

    return Block{origin, std::move(rotated), (degrees_ + 90) % 360};
}

Block::Cells Block::absoluteCells() const {
    Cells abs;
    abs.reserve(vectors_.size());
    for (const auto& v : vectors_) {
        abs.push_back(Vector{origin_.x + v.x, origin_.y + v.y});
    }
    return abs;
}

} // namespace blockfall::core
