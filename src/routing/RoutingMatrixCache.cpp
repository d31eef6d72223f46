#include "routegrid/routing/RoutingMatrixCache.h"
#include "routegrid/common/Logger.h"
#include "routegrid/routing/BoundingBoxCollector.h"
#include "routegrid/routing/CanvasMatrixBuilder.h"
#include "routegrid/routing/DimensionCalculator.h"
#include "routegrid/routing/ObstacleRasterizer.h"

#include <stdexcept>

namespace routegrid {

RoutingMatrixCache::RoutingMatrixCache(int scalingFactor)
    : scalingFactor_(scalingFactor) {
    if (scalingFactor_ <= 0) {
        throw std::invalid_argument("Scaling factor must be positive");
    }
}

const GridMatrix& RoutingMatrixCache::canvasMatrix(const GeometrySnapshot& snapshot) {
    if (!canvas_) {
        computeCanvasMatrix(snapshot);
    }
    return *canvas_;
}

const GridMatrix& RoutingMatrixCache::routingMatrix(const GeometrySnapshot& snapshot) {
    if (!routing_) {
        computeRoutingMatrix(snapshot);
    }
    return *routing_;
}

void RoutingMatrixCache::invalidate() {
    canvas_.reset();
    routing_.reset();
}

void RoutingMatrixCache::computeCanvasMatrix(const GeometrySnapshot& snapshot) {
    dimensions_ = DimensionCalculator::calculate(snapshot, scalingFactor_);
    translator_ = CoordinateTranslator(dimensions_);
    canvas_ = CanvasMatrixBuilder::build(dimensions_, scalingFactor_);
    ++canvasComputations_;

    LOG_DEBUG("Canvas matrix {}x{} (size {}x{}, adjustment {},{})",
              canvas_->rows(), canvas_->columns(),
              dimensions_.width, dimensions_.height,
              dimensions_.hAdjustment, dimensions_.vAdjustment);
}

void RoutingMatrixCache::computeRoutingMatrix(const GeometrySnapshot& snapshot) {
    const GridMatrix& canvas = canvasMatrix(snapshot);

    ObstacleRasterizer rasterizer(translator_, scalingFactor_);
    routing_ = rasterizer.rasterize(canvas,
                                    BoundingBoxCollector::collectNodes(snapshot),
                                    BoundingBoxCollector::collectPorts(snapshot));
    ++routingComputations_;
}

}  // namespace routegrid
