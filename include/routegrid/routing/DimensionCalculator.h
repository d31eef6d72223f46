#pragma once

#include "routegrid/routing/BoundingBoxCollector.h"
#include "routegrid/routing/config/RoutingTypes.h"

namespace routegrid {

/**
 * @brief Computes the routing grid extent from geometry and viewport.
 *
 * The grid always covers the viewport anchored at (0,0) plus every node,
 * port and waypoint box. Negative coordinates are floored to a multiple of
 * the scaling factor and absorbed into the adjustment offsets, with one
 * extra cell of margin on the negative side.
 *
 * With no geometry at all the grid falls back to the viewport alone.
 */
class DimensionCalculator {
public:
    /// @param scalingFactor Pixels per grid cell (must be > 0)
    static Dimensions calculate(const CollectedBoxes& boxes,
                                const Size& viewport,
                                int scalingFactor);

    /// Convenience overload collecting boxes from the snapshot first
    static Dimensions calculate(const GeometrySnapshot& snapshot, int scalingFactor);
};

}  // namespace routegrid
