#include "routegrid/routing/GridMatrix.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace routegrid {

GridMatrix::GridMatrix(int rows, int columns) {
    if (rows < 0 || columns < 0) {
        throw std::invalid_argument("Matrix dimensions must not be negative");
    }
    rows_ = rows;
    columns_ = columns;
    cells_.assign(static_cast<size_t>(rows) * static_cast<size_t>(columns), FREE);
}

bool GridMatrix::mark(int col, int row) {
    if (!inBounds(col, row)) {
        return false;
    }
    cells_[index(col, row)] = BLOCKED;
    return true;
}

size_t GridMatrix::blockedCount() const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), BLOCKED));
}

std::string GridMatrix::toString() const {
    std::ostringstream out;
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < columns_; ++col) {
            if (col > 0) out << ' ';
            out << static_cast<int>(at(col, row));
        }
        out << '\n';
    }
    return out.str();
}

}  // namespace routegrid
