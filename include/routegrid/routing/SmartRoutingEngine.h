#pragma once

#include "routegrid/geometry/GeometrySnapshot.h"
#include "routegrid/routing/PathEmitter.h"
#include "routegrid/routing/RoutingMatrixCache.h"
#include "routegrid/routing/api/IGridPathFinder.h"
#include "routegrid/routing/config/RoutingOptions.h"

#include <optional>
#include <vector>

namespace routegrid {

/**
 * @brief Entry point for obstacle-avoiding link routing.
 *
 * One engine per diagram. It owns the matrix cache and the emitter, and
 * hands the routing matrix to a host-supplied IGridPathFinder.
 *
 * Example:
 * @code
 * routegrid::SmartRoutingEngine engine;
 * auto path = engine.routeLink(snapshot, sourcePoint, targetPoint, finder);
 * if (path) {
 *     widget.setPathData(path->toSvgPathData());
 * }
 * // after any node move, resize, port change or viewport resize:
 * engine.invalidate();
 * @endcode
 */
class SmartRoutingEngine {
public:
    /// @throws std::invalid_argument if options are invalid
    explicit SmartRoutingEngine(const RoutingOptions& options = {});

    const RoutingOptions& options() const { return options_; }

    const GridMatrix& canvasMatrix(const GeometrySnapshot& snapshot) {
        return cache_.canvasMatrix(snapshot);
    }

    const GridMatrix& routingMatrix(const GeometrySnapshot& snapshot) {
        return cache_.routingMatrix(snapshot);
    }

    /// Drop cached matrices; call on every geometry change
    void invalidate() { cache_.invalidate(); }

    const CoordinateTranslator& translator() const { return cache_.translator(); }
    const RoutingMatrixCache& cache() const { return cache_; }

    /// Emit a drawable path for diagram-space cells
    /// @throws std::invalid_argument if points is empty
    DrawablePath emitPath(const std::vector<GridPoint>& points) const {
        return emitter_.emit(points);
    }

    /**
     * @brief Route a link between two diagram-space points around obstacles.
     *
     * The endpoints usually sit inside port obstacles, so the search runs in
     * two stages: a direct path over the free canvas matrix, then a routed
     * path over the routing matrix between the first and last free cells of
     * that direct path. The direct prefix and suffix are kept as-is.
     *
     * @return Drawable path, or std::nullopt when no route exists
     */
    std::optional<DrawablePath> routeLink(const GeometrySnapshot& snapshot,
                                          const Point& from,
                                          const Point& to,
                                          const IGridPathFinder& pathFinder);

    /**
     * @brief Combine a direct path with a routed detour.
     *
     * Finds the first and last cells of directPath free in routingMatrix,
     * searches between them, and splices the result in.
     *
     * @return Matrix cells of the full path, or empty if no route exists
     */
    static std::vector<GridPoint> assembleRoute(const std::vector<GridPoint>& directPath,
                                                const GridMatrix& routingMatrix,
                                                const IGridPathFinder& pathFinder);

private:
    RoutingOptions options_;
    RoutingMatrixCache cache_;
    PathEmitter emitter_;
};

}  // namespace routegrid
