#pragma once

namespace routegrid {

namespace constants {

/// Blocked cells added on every side of a node or port box
constexpr int OBSTACLE_MARGIN_CELLS = 1;

/// Extra cells reserved before the most negative coordinate
constexpr int ADJUSTMENT_MARGIN_CELLS = 1;

/// Default divisor between diagram pixels and grid cells
constexpr int DEFAULT_SCALING_FACTOR = 5;

}  // namespace constants

/// Extent of the routing grid and its offset from diagram space.
///
/// width/height are in diagram units (before scaling); the adjustments are
/// in grid cells and move the most negative coordinate onto a valid index.
struct Dimensions {
    float width = 0.0f;
    float height = 0.0f;
    int hAdjustment = 0;
    int vAdjustment = 0;

    bool operator==(const Dimensions& o) const {
        return width == o.width && height == o.height &&
               hAdjustment == o.hAdjustment && vAdjustment == o.vAdjustment;
    }
    bool operator!=(const Dimensions& o) const { return !(*this == o); }
};

}  // namespace routegrid
