#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace routegrid {

/// Rectangular walkability grid: 0 = free, 1 = blocked.
///
/// Cells are stored row-major. Copies are deep, so a routing matrix derived
/// from a copy never touches the canvas matrix it came from.
class GridMatrix {
public:
    static constexpr uint8_t FREE = 0;
    static constexpr uint8_t BLOCKED = 1;

    GridMatrix() = default;
    GridMatrix(int rows, int columns);

    int rows() const { return rows_; }
    int columns() const { return columns_; }
    bool empty() const { return cells_.empty(); }

    bool inBounds(int col, int row) const {
        return col >= 0 && row >= 0 && col < columns_ && row < rows_;
    }

    /// Cell value; caller must check inBounds first
    uint8_t at(int col, int row) const { return cells_[index(col, row)]; }

    /// Out-of-range cells count as free
    bool isBlocked(int col, int row) const {
        return inBounds(col, row) && at(col, row) == BLOCKED;
    }

    /// Mark a cell blocked. Out-of-range writes are ignored.
    /// @return true if the cell was inside the matrix
    bool mark(int col, int row);

    /// Number of blocked cells
    size_t blockedCount() const;

    /// One line per row, cells separated by spaces
    std::string toString() const;

    bool operator==(const GridMatrix& o) const {
        return rows_ == o.rows_ && columns_ == o.columns_ && cells_ == o.cells_;
    }
    bool operator!=(const GridMatrix& o) const { return !(*this == o); }

private:
    size_t index(int col, int row) const {
        return static_cast<size_t>(row) * static_cast<size_t>(columns_) + static_cast<size_t>(col);
    }

    int rows_ = 0;
    int columns_ = 0;
    std::vector<uint8_t> cells_;
};

}  // namespace routegrid
