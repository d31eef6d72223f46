#include "routegrid/routing/PathEmitter.h"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace routegrid {

std::string DrawablePath::toSvgPathData() const {
    std::ostringstream out;
    out.precision(std::numeric_limits<float>::max_digits10);
    for (size_t i = 0; i < commands.size(); ++i) {
        if (i > 0) out << ' ';
        out << (commands[i].kind == PathCommand::Kind::MoveTo ? "M " : "L ")
            << commands[i].point.x << ' ' << commands[i].point.y;
    }
    return out.str();
}

PathEmitter::PathEmitter(int scalingFactor) : scalingFactor_(scalingFactor) {
    if (scalingFactor_ <= 0) {
        throw std::invalid_argument("Scaling factor must be positive");
    }
}

DrawablePath PathEmitter::emit(const std::vector<GridPoint>& points) const {
    if (points.empty()) {
        throw std::invalid_argument("Cannot emit a path without points");
    }

    const float s = static_cast<float>(scalingFactor_);

    DrawablePath path;
    path.commands.reserve(points.size());
    path.commands.push_back({PathCommand::Kind::MoveTo, points.front().toPixel(s)});
    for (size_t i = 1; i < points.size(); ++i) {
        path.commands.push_back({PathCommand::Kind::LineTo, points[i].toPixel(s)});
    }
    return path;
}

}  // namespace routegrid
