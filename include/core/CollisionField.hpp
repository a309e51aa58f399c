#pragma once

#include "Types.hpp"
#include "Block.hpp"
#include <cstdint>
#include <vector>

namespace blockfall::core {

enum class CellState : std::uint8_t {
    Empty    = 0,
    Occupied = 1
};

// Occupancy grid of one game. Geometry only: the field does not know which
// block is active, callers erase and redraw it around collision tests.
class CollisionField {
public:
    using Row = std::vector<CellState>;

    CollisionField() = default;
    CollisionField(int cols, int rows);

    int cols() const noexcept { return cols_; }
    int rows() const noexcept { return rows_; }
    bool empty() const noexcept { return grid_.empty(); }

    CellState cell(int x, int y) const;
    void setCell(int x, int y, CellState state);

    const std::vector<Row>& grid() const noexcept { return grid_; }

    // Mark / clear the block's cells. Cells outside the field are skipped.
    void drawBlock(const Block& block);
    void eraseBlock(const Block& block);

    // True if any cell is left of column 0, right of the last column, below
    // the last row, or (for y >= 0) on an occupied cell. Cells above the top
    // edge are only checked horizontally.
    bool isBlocked(const Block& block) const noexcept;

    // Indices of rows in which every cell is occupied, top to bottom
    std::vector<int> completedRows() const;

    // Remove the given rows and insert as many empty rows at the top
    void dropRows(const std::vector<int>& rows);

private:
    int cols_{0};
    int rows_{0};
    std::vector<Row> grid_; // grid_[y][x]

    bool isInside(int x, int y) const noexcept {
        return x >= 0 && x < cols_ && y >= 0 && y < rows_;
    }
};

} // namespace blockfall::core
