#pragma once // Include guard

#include "Types.hpp" // For Vector
#include <vector>

// Namespace for the core game types
namespace blockfall::core {

// A falling piece: an origin on the field plus the cells it occupies,
// relative to that origin.
class Block {
public:
    using Cells = std::vector<Vector>;

    Block() = default;
    Block(Vector origin, Cells vectors, int degrees = 0);

    Vector origin() const noexcept { return origin_; }
    const Cells& vectors() const noexcept { return vectors_; }
    int degrees() const noexcept { return degrees_; }

    // Copy moved by (dx, dy)
    Block shifted(int dx, int dy) const;

    // Copy rotated 90 degrees clockwise around its local bounding box.
    // The origin is moved by half the change in extents so the piece stays
    // centered; odd halves alternate between ceil and floor with the angle
    // so repeated rotations do not drift.
    Block rotatedClockwise() const;

    // Positions of the cells in field coordinates
    Cells absoluteCells() const;

private:
    Vector origin_{};
    Cells vectors_;
    int degrees_{0};
};

} // namespace blockfall::core
