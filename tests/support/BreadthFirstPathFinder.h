#pragma once

#include <routegrid/routing/api/IGridPathFinder.h>

#include <algorithm>
#include <queue>
#include <vector>

namespace routegrid::test {

/// 4-connected BFS over free cells. Start and goal may be blocked.
class BreadthFirstPathFinder : public IGridPathFinder {
public:
    std::vector<GridPoint> findPath(const GridPoint& start,
                                    const GridPoint& goal,
                                    const GridMatrix& matrix) const override {
        ++calls;
        if (!matrix.inBounds(start.x, start.y) || !matrix.inBounds(goal.x, goal.y)) {
            return {};
        }

        const int cols = matrix.columns();
        auto indexOf = [cols](const GridPoint& p) { return p.y * cols + p.x; };

        std::vector<int> parent(static_cast<size_t>(matrix.rows()) * cols, -1);
        std::vector<bool> visited(parent.size(), false);
        std::queue<GridPoint> open;
        open.push(start);
        visited[indexOf(start)] = true;

        const GridPoint steps[] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
        while (!open.empty()) {
            GridPoint current = open.front();
            open.pop();
            if (current == goal) {
                std::vector<GridPoint> path;
                for (int idx = indexOf(goal); idx != -1; idx = parent[idx]) {
                    path.push_back({idx % cols, idx / cols});
                    if (idx == indexOf(start)) break;
                }
                std::reverse(path.begin(), path.end());
                return path;
            }
            for (const auto& step : steps) {
                GridPoint next = current + step;
                if (!matrix.inBounds(next.x, next.y) || visited[indexOf(next)]) continue;
                if (matrix.isBlocked(next.x, next.y) && next != goal) continue;
                visited[indexOf(next)] = true;
                parent[indexOf(next)] = indexOf(current);
                open.push(next);
            }
        }
        return {};
    }

    const char* algorithmName() const override { return "BreadthFirst"; }

    mutable int calls = 0;
};

/// Always reports that no path exists
class NoPathFinder : public IGridPathFinder {
public:
    std::vector<GridPoint> findPath(const GridPoint&, const GridPoint&,
                                    const GridMatrix&) const override {
        return {};
    }

    const char* algorithmName() const override { return "NoPath"; }
};

}  // namespace routegrid::test
