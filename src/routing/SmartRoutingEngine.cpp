#include "routegrid/routing/SmartRoutingEngine.h"
#include "routegrid/common/Logger.h"

#include <algorithm>
#include <iterator>

namespace routegrid {

namespace {

RoutingOptions validated(const RoutingOptions& options) {
    options.validate();
    return options;
}

/// Pull a cell at most one step outside the matrix back onto its edge.
/// The adjustment margin shifts geometry on the far edges one cell out.
/// @return false if the cell is further out than that
bool clampToMatrix(GridPoint& cell, const GridMatrix& matrix) {
    if (matrix.empty() ||
        cell.x < -1 || cell.x > matrix.columns() ||
        cell.y < -1 || cell.y > matrix.rows()) {
        return false;
    }
    cell.x = std::clamp(cell.x, 0, matrix.columns() - 1);
    cell.y = std::clamp(cell.y, 0, matrix.rows() - 1);
    return true;
}

}  // namespace

SmartRoutingEngine::SmartRoutingEngine(const RoutingOptions& options)
    : options_(validated(options)),
      cache_(options_.scalingFactor),
      emitter_(options_.scalingFactor) {}

std::optional<DrawablePath> SmartRoutingEngine::routeLink(const GeometrySnapshot& snapshot,
                                                          const Point& from,
                                                          const Point& to,
                                                          const IGridPathFinder& pathFinder) {
    const GridMatrix& canvas = cache_.canvasMatrix(snapshot);
    const GridMatrix& routing = cache_.routingMatrix(snapshot);
    const CoordinateTranslator& translator = cache_.translator();

    GridPoint start = translator.cellFor(from, options_.scalingFactor);
    GridPoint goal = translator.cellFor(to, options_.scalingFactor);

    if (!clampToMatrix(start, canvas) || !clampToMatrix(goal, canvas)) {
        LOG_WARN("Link endpoints ({},{}) -> ({},{}) outside {}x{} matrix",
                 start.x, start.y, goal.x, goal.y, canvas.rows(), canvas.columns());
        return std::nullopt;
    }

    std::vector<GridPoint> directPath = pathFinder.findPath(start, goal, canvas);
    if (directPath.empty()) {
        LOG_DEBUG("{} found no direct path ({},{}) -> ({},{})",
                  pathFinder.algorithmName(), start.x, start.y, goal.x, goal.y);
        return std::nullopt;
    }

    std::vector<GridPoint> cells = assembleRoute(directPath, routing, pathFinder);
    if (cells.empty()) {
        return std::nullopt;
    }

    for (auto& cell : cells) {
        cell = translator.toDiagram(cell);
    }
    return emitter_.emit(cells);
}

std::vector<GridPoint> SmartRoutingEngine::assembleRoute(const std::vector<GridPoint>& directPath,
                                                         const GridMatrix& routingMatrix,
                                                         const IGridPathFinder& pathFinder) {
    auto isFree = [&](const GridPoint& p) {
        return routingMatrix.inBounds(p.x, p.y) && !routingMatrix.isBlocked(p.x, p.y);
    };

    auto firstFree = std::find_if(directPath.begin(), directPath.end(), isFree);
    if (firstFree == directPath.end()) {
        LOG_DEBUG("Direct path of {} cells has no free cell", directPath.size());
        return {};
    }
    auto lastFree = std::find_if(directPath.rbegin(), directPath.rend(), isFree);

    auto startIt = firstFree;
    auto endIt = std::prev(lastFree.base());

    std::vector<GridPoint> routed = pathFinder.findPath(
        *startIt, *endIt, routingMatrix);
    if (routed.empty()) {
        LOG_DEBUG("{} found no route ({},{}) -> ({},{})", pathFinder.algorithmName(),
                  startIt->x, startIt->y, endIt->x, endIt->y);
        return {};
    }

    std::vector<GridPoint> result(directPath.begin(), startIt);
    result.insert(result.end(), routed.begin(), routed.end());
    result.insert(result.end(), std::next(endIt), directPath.end());
    return result;
}

}  // namespace routegrid
