#include "core/CollisionField.hpp"

#include <algorithm>
#include <stdexcept>

namespace blockfall::core {

CollisionField::CollisionField(int cols, int rows)
    : cols_{cols}
    , rows_{rows}
{
    if (cols <= 0 || rows <= 0) {
        throw std::invalid_argument("CollisionField dimensions must be positive");
    }
    grid_.assign(rows, Row(cols, CellState::Empty));
}

CellState CollisionField::cell(int x, int y) const {
    if (!isInside(x, y)) {
        throw std::out_of_range("CollisionField::cell out of range");
    }
    return grid_[y][x];
}

void CollisionField::setCell(int x, int y, CellState state) {
    if (!isInside(x, y)) {
        throw std::out_of_range("CollisionField::setCell out of range");
    }
    grid_[y][x] = state;
}

void CollisionField::drawBlock(const Block& block) {
    for (const auto& v : block.absoluteCells()) {
        if (isInside(v.x, v.y)) {
            grid_[v.y][v.x] = CellState::Occupied;
        }
    }
}

void CollisionField::eraseBlock(const Block& block) {
    for (const auto& v : block.absoluteCells()) {
        if (isInside(v.x, v.y)) {
            grid_[v.y][v.x] = CellState::Empty;
        }
    }
}

bool CollisionField::isBlocked(const Block& block) const noexcept {
    for (const auto& v : block.absoluteCells()) {
        if (v.x < 0 || v.x >= cols_ || v.y >= rows_) {
            return true; // out of field
        }
        if (v.y >= 0 && grid_[v.y][v.x] == CellState::Occupied) {
            return true; // collision
        }
    }
    return false;
}

std::vector<int> CollisionField::completedRows() const {
    std::vector<int> found;
    for (int y = 0; y < rows_; ++y) {
        const auto& row = grid_[y];
        const bool full = std::all_of(row.begin(), row.end(),
                                      [](CellState c) { return c == CellState::Occupied; });
        if (full) {
            found.push_back(y);
        }
    }
    return found;
}

void CollisionField::dropRows(const std::vector<int>& rows) {
    if (rows.empty()) return;

    std::vector<Row> next;
    next.reserve(rows_);

    int removed = 0;
    for (int y = 0; y < rows_; ++y) {
        if (std::find(rows.begin(), rows.end(), y) != rows.end()) {
            ++removed;
        }
    }

    // Empty rows on top, then the surviving rows in their original order
    for (int i = 0; i < removed; ++i) {
        next.emplace_back(cols_, CellState::Empty);
    }
    for (int y = 0; y < rows_; ++y) {
        if (std::find(rows.begin(), rows.end(), y) == rows.end()) {
            next.push_back(grid_[y]);
        }
    }

    grid_ = std::move(next);
}

} // namespace blockfall::core
