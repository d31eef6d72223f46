#pragma once

#include "../core/Types.h"

#include <optional>
#include <vector>

namespace routegrid {

/// Position and size of one diagram node
struct NodeGeometry {
    NodeId id = INVALID_NODE;
    Rect bounds;
};

/// Geometry of one link: its optional end ports and ordered waypoints
struct LinkGeometry {
    LinkId id = INVALID_LINK;
    std::optional<Rect> sourcePort;   ///< Absent while the link is dangling
    std::optional<Rect> targetPort;
    std::vector<Point> points;        ///< Waypoints in drawing order
};

/// Read-only copy of everything the router needs from the diagram model.
///
/// Built by the host for each rasterization pass. The engine never keeps a
/// reference to it past the call that received it.
struct GeometrySnapshot {
    std::vector<NodeGeometry> nodes;
    std::vector<LinkGeometry> links;
    Size viewport;                    ///< Visible canvas size in pixels

    bool empty() const { return nodes.empty() && links.empty(); }
};

}  // namespace routegrid
