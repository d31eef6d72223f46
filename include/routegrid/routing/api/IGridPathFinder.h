#pragma once

#include "routegrid/core/Types.h"
#include "routegrid/routing/GridMatrix.h"

#include <vector>

namespace routegrid {

/// Grid search used to connect two cells of a routing matrix.
///
/// routegrid does not ship a search. Hosts plug in A*, jump point search or
/// whatever suits their diagrams.
class IGridPathFinder {
public:
    virtual ~IGridPathFinder() = default;

    /// Find a path of matrix cells from start to goal, both inclusive.
    /// Blocked cells (value 1) must be avoided.
    /// @return Cells in order, or empty if no path exists
    virtual std::vector<GridPoint> findPath(
        const GridPoint& start,
        const GridPoint& goal,
        const GridMatrix& matrix) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace routegrid
