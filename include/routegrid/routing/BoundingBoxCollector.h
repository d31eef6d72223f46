#pragma once

#include "routegrid/geometry/GeometrySnapshot.h"

#include <vector>

namespace routegrid {

/// Boxes gathered from one geometry snapshot, grouped by origin
struct CollectedBoxes {
    std::vector<Rect> nodes;
    std::vector<Rect> ports;       ///< Present source/target ports of every link
    std::vector<Rect> waypoints;   ///< Zero-sized boxes at each link point

    bool empty() const { return nodes.empty() && ports.empty() && waypoints.empty(); }

    /// Nodes, then ports, then waypoints
    std::vector<Rect> all() const;
};

/**
 * @brief Extracts axis-aligned bounding boxes from a geometry snapshot.
 *
 * Absent ports are skipped. Waypoints carry no size, so they contribute
 * only to the grid extent and are never rasterized as obstacles.
 */
class BoundingBoxCollector {
public:
    static CollectedBoxes collect(const GeometrySnapshot& snapshot);

    static std::vector<Rect> collectNodes(const GeometrySnapshot& snapshot);
    static std::vector<Rect> collectPorts(const GeometrySnapshot& snapshot);
    static std::vector<Rect> collectWaypoints(const GeometrySnapshot& snapshot);
};

}  // namespace routegrid
