#include "routegrid/routing/BoundingBoxCollector.h"

namespace routegrid {

std::vector<Rect> CollectedBoxes::all() const {
    std::vector<Rect> result;
    result.reserve(nodes.size() + ports.size() + waypoints.size());
    result.insert(result.end(), nodes.begin(), nodes.end());
    result.insert(result.end(), ports.begin(), ports.end());
    result.insert(result.end(), waypoints.begin(), waypoints.end());
    return result;
}

CollectedBoxes BoundingBoxCollector::collect(const GeometrySnapshot& snapshot) {
    CollectedBoxes boxes;
    boxes.nodes = collectNodes(snapshot);
    boxes.ports = collectPorts(snapshot);
    boxes.waypoints = collectWaypoints(snapshot);
    return boxes;
}

std::vector<Rect> BoundingBoxCollector::collectNodes(const GeometrySnapshot& snapshot) {
    std::vector<Rect> result;
    result.reserve(snapshot.nodes.size());
    for (const auto& node : snapshot.nodes) {
        result.push_back(node.bounds);
    }
    return result;
}

std::vector<Rect> BoundingBoxCollector::collectPorts(const GeometrySnapshot& snapshot) {
    std::vector<Rect> result;
    for (const auto& link : snapshot.links) {
        if (link.sourcePort) {
            result.push_back(*link.sourcePort);
        }
        if (link.targetPort) {
            result.push_back(*link.targetPort);
        }
    }
    return result;
}

std::vector<Rect> BoundingBoxCollector::collectWaypoints(const GeometrySnapshot& snapshot) {
    std::vector<Rect> result;
    for (const auto& link : snapshot.links) {
        for (const auto& point : link.points) {
            result.push_back(Rect::fromPoint(point));
        }
    }
    return result;
}

}  // namespace routegrid
