#pragma once

#include "routegrid/routing/GridMatrix.h"
#include "routegrid/routing/config/RoutingTypes.h"

namespace routegrid {

/// Allocates the all-free canvas matrix for a set of dimensions.
///
/// Rows = ceil(height / scalingFactor), columns = ceil(width / scalingFactor).
class CanvasMatrixBuilder {
public:
    static GridMatrix build(const Dimensions& dims, int scalingFactor);
};

}  // namespace routegrid
