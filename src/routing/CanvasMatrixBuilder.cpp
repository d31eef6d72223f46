#include "routegrid/routing/CanvasMatrixBuilder.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace routegrid {

GridMatrix CanvasMatrixBuilder::build(const Dimensions& dims, int scalingFactor) {
    if (scalingFactor <= 0) {
        throw std::invalid_argument("Scaling factor must be positive");
    }

    float s = static_cast<float>(scalingFactor);
    int columns = static_cast<int>(std::ceil(dims.width / s));
    int rows = static_cast<int>(std::ceil(dims.height / s));
    return GridMatrix(std::max(rows, 0), std::max(columns, 0));
}

}  // namespace routegrid
