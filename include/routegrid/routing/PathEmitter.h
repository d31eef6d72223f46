#pragma once

#include "routegrid/core/Types.h"

#include <string>
#include <vector>

namespace routegrid {

/// One drawing instruction of an emitted path
struct PathCommand {
    enum class Kind {
        MoveTo,
        LineTo
    };

    Kind kind = Kind::MoveTo;
    Point point;

    bool operator==(const PathCommand& o) const { return kind == o.kind && point == o.point; }
};

/// Drawable polyline in diagram space: one MoveTo followed by LineTos
struct DrawablePath {
    std::vector<PathCommand> commands;

    bool empty() const { return commands.empty(); }

    /// SVG path data, e.g. "M 0 0 L 10 15"
    std::string toSvgPathData() const;
};

/**
 * @brief Converts a grid-cell sequence into a drawable path.
 *
 * Every cell is multiplied by the scaling factor. Consecutive duplicates are
 * kept; compressing the path is the pathfinder's job.
 */
class PathEmitter {
public:
    explicit PathEmitter(int scalingFactor);

    /// @throws std::invalid_argument if points is empty
    DrawablePath emit(const std::vector<GridPoint>& points) const;

    int scalingFactor() const { return scalingFactor_; }

private:
    int scalingFactor_;
};

}  // namespace routegrid
