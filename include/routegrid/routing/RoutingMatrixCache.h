#pragma once

#include "routegrid/geometry/GeometrySnapshot.h"
#include "routegrid/routing/CoordinateTranslator.h"
#include "routegrid/routing/GridMatrix.h"
#include "routegrid/routing/config/RoutingTypes.h"

#include <optional>

namespace routegrid {

/**
 * @brief Lazily computes and memoizes the canvas and routing matrices.
 *
 * Both matrices are built on first access after construction or after the
 * last invalidate(), and returned unchanged until the next invalidate().
 * The snapshot passed to a getter is only read when a recomputation is due.
 *
 * The cache cannot detect geometry changes on its own. The host must call
 * invalidate() on every node move or resize, port add or remove, waypoint
 * change and viewport resize; otherwise the matrices go stale.
 *
 * Not thread-safe. Intended for a single UI thread.
 */
class RoutingMatrixCache {
public:
    explicit RoutingMatrixCache(int scalingFactor);

    /// All-free matrix covering geometry and viewport.
    /// The reference stays valid until invalidate().
    const GridMatrix& canvasMatrix(const GeometrySnapshot& snapshot);

    /// Canvas matrix with node and port obstacles marked.
    /// The reference stays valid until invalidate().
    const GridMatrix& routingMatrix(const GeometrySnapshot& snapshot);

    /// Drop both matrices together
    void invalidate();

    bool hasCanvasMatrix() const { return canvas_.has_value(); }
    bool hasRoutingMatrix() const { return routing_.has_value(); }

    /// Translator for the current matrices (identity offsets before first build)
    const CoordinateTranslator& translator() const { return translator_; }
    const Dimensions& dimensions() const { return dimensions_; }
    int scalingFactor() const { return scalingFactor_; }

    /// Number of times each matrix has been (re)computed
    int canvasComputations() const { return canvasComputations_; }
    int routingComputations() const { return routingComputations_; }

private:
    void computeCanvasMatrix(const GeometrySnapshot& snapshot);
    void computeRoutingMatrix(const GeometrySnapshot& snapshot);

    int scalingFactor_;
    std::optional<GridMatrix> canvas_;
    std::optional<GridMatrix> routing_;
    Dimensions dimensions_;
    CoordinateTranslator translator_;
    int canvasComputations_ = 0;
    int routingComputations_ = 0;
};

}  // namespace routegrid
