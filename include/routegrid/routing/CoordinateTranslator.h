#pragma once

#include "routegrid/core/Types.h"
#include "routegrid/routing/config/RoutingTypes.h"

#include <cmath>

namespace routegrid {

/**
 * @brief Maps between diagram-space cells and non-negative matrix indices.
 *
 * Diagram space may go negative; the routing matrix cannot. Each axis is
 * shifted by its adjustment factor:
 *
 *   toGrid(v)    = v + adjustment
 *   toDiagram(v) = v - adjustment
 *
 * Adjustments are integers, so the round trip is exact.
 */
class CoordinateTranslator {
public:
    constexpr CoordinateTranslator() = default;
    constexpr CoordinateTranslator(int hAdjustment, int vAdjustment)
        : hAdjustment_(hAdjustment), vAdjustment_(vAdjustment) {}
    explicit constexpr CoordinateTranslator(const Dimensions& dims)
        : hAdjustment_(dims.hAdjustment), vAdjustment_(dims.vAdjustment) {}

    constexpr int hAdjustment() const { return hAdjustment_; }
    constexpr int vAdjustment() const { return vAdjustment_; }

    constexpr int toGridX(int x) const { return x + hAdjustment_; }
    constexpr int toGridY(int y) const { return y + vAdjustment_; }
    constexpr int toDiagramX(int x) const { return x - hAdjustment_; }
    constexpr int toDiagramY(int y) const { return y - vAdjustment_; }

    constexpr double toGridX(double x) const { return x + hAdjustment_; }
    constexpr double toGridY(double y) const { return y + vAdjustment_; }
    constexpr double toDiagramX(double x) const { return x - hAdjustment_; }
    constexpr double toDiagramY(double y) const { return y - vAdjustment_; }

    constexpr GridPoint toGrid(const GridPoint& p) const {
        return {toGridX(p.x), toGridY(p.y)};
    }
    constexpr GridPoint toDiagram(const GridPoint& p) const {
        return {toDiagramX(p.x), toDiagramY(p.y)};
    }

    /// Matrix cell containing a diagram-space pixel position
    GridPoint cellFor(const Point& p, int scalingFactor) const {
        return toGrid(GridPoint::fromPixelFloor(p, static_cast<float>(scalingFactor)));
    }

private:
    int hAdjustment_ = 0;
    int vAdjustment_ = 0;
};

}  // namespace routegrid
