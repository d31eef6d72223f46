#include "routegrid/routing/ObstacleRasterizer.h"
#include "routegrid/common/Logger.h"

#include <cmath>
#include <stdexcept>

namespace routegrid {

ObstacleRasterizer::ObstacleRasterizer(const CoordinateTranslator& translator, int scalingFactor)
    : translator_(translator), scalingFactor_(scalingFactor) {
    if (scalingFactor_ <= 0) {
        throw std::invalid_argument("Scaling factor must be positive");
    }
}

int ObstacleRasterizer::markBox(GridMatrix& matrix, const Rect& box) const {
    const float s = static_cast<float>(scalingFactor_);
    const int margin = constants::OBSTACLE_MARGIN_CELLS;

    int startCol = static_cast<int>(std::floor(box.x / s)) - margin;
    int endCol = static_cast<int>(std::ceil(box.right() / s)) + margin;
    int startRow = static_cast<int>(std::floor(box.y / s)) - margin;
    int endRow = static_cast<int>(std::ceil(box.bottom() / s)) + margin;

    int marked = 0;
    for (int row = startRow; row <= endRow; ++row) {
        for (int col = startCol; col <= endCol; ++col) {
            if (matrix.mark(translator_.toGridX(col), translator_.toGridY(row))) {
                ++marked;
            }
        }
    }
    return marked;
}

int ObstacleRasterizer::markBoxes(GridMatrix& matrix, const std::vector<Rect>& boxes) const {
    int marked = 0;
    for (const auto& box : boxes) {
        marked += markBox(matrix, box);
    }
    return marked;
}

GridMatrix ObstacleRasterizer::rasterize(const GridMatrix& canvas,
                                         const std::vector<Rect>& nodes,
                                         const std::vector<Rect>& ports) const {
    GridMatrix matrix = canvas;

    int nodeCells = markBoxes(matrix, nodes);
    int portCells = markBoxes(matrix, ports);

    LOG_DEBUG("Rasterized {} nodes ({} cells) and {} ports ({} cells) into {}x{} matrix",
              nodes.size(), nodeCells, ports.size(), portCells,
              matrix.rows(), matrix.columns());
    return matrix;
}

}  // namespace routegrid
