#include "routegrid/routing/DimensionCalculator.h"
#include "routegrid/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace routegrid {

namespace {

/// Floor the smaller of 0 and minValue to a multiple of the scaling factor
float alignedMinimum(float minValue, int scalingFactor) {
    float s = static_cast<float>(scalingFactor);
    return std::floor(std::min(minValue, 0.0f) / s) * s;
}

int adjustmentFor(float alignedMin, int scalingFactor) {
    // alignedMin is a whole multiple of scalingFactor, so this is exact
    int cells = static_cast<int>(std::lround(std::abs(alignedMin) / static_cast<float>(scalingFactor)));
    return cells + constants::ADJUSTMENT_MARGIN_CELLS;
}

}  // namespace

Dimensions DimensionCalculator::calculate(const CollectedBoxes& boxes,
                                          const Size& viewport,
                                          int scalingFactor) {
    if (scalingFactor <= 0) {
        throw std::invalid_argument("Scaling factor must be positive");
    }

    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = viewport.width;
    float maxY = viewport.height;

    if (boxes.empty()) {
        LOG_DEBUG("No geometry, using viewport {}x{} only", viewport.width, viewport.height);
    } else {
        auto accumulate = [&](const std::vector<Rect>& rects) {
            for (const auto& r : rects) {
                minX = std::min(minX, r.x);
                minY = std::min(minY, r.y);
                maxX = std::max(maxX, r.right());
                maxY = std::max(maxY, r.bottom());
            }
        };
        accumulate(boxes.nodes);
        accumulate(boxes.ports);
        accumulate(boxes.waypoints);
    }

    float alignedMinX = alignedMinimum(minX, scalingFactor);
    float alignedMinY = alignedMinimum(minY, scalingFactor);

    Dimensions dims;
    dims.width = std::ceil(std::abs(alignedMinX) + maxX);
    dims.height = std::ceil(std::abs(alignedMinY) + maxY);
    dims.hAdjustment = adjustmentFor(alignedMinX, scalingFactor);
    dims.vAdjustment = adjustmentFor(alignedMinY, scalingFactor);
    return dims;
}

Dimensions DimensionCalculator::calculate(const GeometrySnapshot& snapshot, int scalingFactor) {
    return calculate(BoundingBoxCollector::collect(snapshot), snapshot.viewport, scalingFactor);
}

}  // namespace routegrid
