#pragma once

#include <cmath>
#include <cstdint>

namespace routegrid {

using NodeId = uint32_t;
using LinkId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr LinkId INVALID_LINK = UINT32_MAX;

/// Diagram-space coordinate (continuous, any sign)
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Grid-space coordinate (integer cell indices)
struct GridPoint {
    int x = 0;
    int y = 0;

    constexpr GridPoint() = default;
    constexpr GridPoint(int x_, int y_) : x(x_), y(y_) {}

    /// Convert to pixel coordinates
    constexpr Point toPixel(float cellSize) const {
        return {x * cellSize, y * cellSize};
    }

    /// Convert from pixel coordinates, flooring toward the containing cell
    static GridPoint fromPixelFloor(const Point& p, float cellSize) {
        return {
            static_cast<int>(std::floor(p.x / cellSize)),
            static_cast<int>(std::floor(p.y / cellSize))
        };
    }

    constexpr GridPoint operator+(const GridPoint& o) const { return {x + o.x, y + o.y}; }

    constexpr bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const GridPoint& o) const { return !(*this == o); }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

/// Axis-aligned bounding box in diagram space
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    /// Zero-sized box at a single point (used for link waypoints)
    static constexpr Rect fromPoint(const Point& p) { return {p.x, p.y, 0.0f, 0.0f}; }

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace routegrid
