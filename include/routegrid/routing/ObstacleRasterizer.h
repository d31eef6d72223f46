#pragma once

#include "routegrid/routing/CoordinateTranslator.h"
#include "routegrid/routing/GridMatrix.h"

#include <vector>

namespace routegrid {

/**
 * @brief Marks node and port boxes as blocked cells.
 *
 * Each box covers the cells from floor(x / s) to ceil((x + w) / s) on each
 * axis, widened by constants::OBSTACLE_MARGIN_CELLS on every side, then
 * shifted into matrix indices by the translator. Cells outside the matrix
 * are skipped.
 *
 * Marking is a set union, so box order does not change the result. The
 * matrix is written in place: pass a copy the caller owns, never the cached
 * canvas matrix.
 */
class ObstacleRasterizer {
public:
    ObstacleRasterizer(const CoordinateTranslator& translator, int scalingFactor);

    /// Mark a single box
    /// @return Number of cells that fell inside the matrix
    int markBox(GridMatrix& matrix, const Rect& box) const;

    /// Mark every box in order
    int markBoxes(GridMatrix& matrix, const std::vector<Rect>& boxes) const;

    /// Produce the routing matrix: a copy of canvas with nodes, then ports, marked
    GridMatrix rasterize(const GridMatrix& canvas,
                         const std::vector<Rect>& nodes,
                         const std::vector<Rect>& ports) const;

private:
    CoordinateTranslator translator_;
    int scalingFactor_;
};

}  // namespace routegrid
