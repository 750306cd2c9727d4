#include "path_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <queue>
#include <tuple>

namespace {

inline bool inBounds(int w, int h, int x, int y) {
    return x >= 0 && y >= 0 && x < w && y < h;
}

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

constexpr int DIRS8[8][2] = {
    {0,1},{1,0},{0,-1},{-1,0},
    {1,1},{-1,-1},{1,-1},{-1,1}
};

const double DIAGONAL_COST = std::sqrt(2.0);

// (f, insertion order, idx): the min-heap pops lowest f first, then the
// earliest pushed entry.
using Node = std::tuple<double, uint64_t, int>;

} // namespace

std::vector<Vec2i> astarPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable)
{
    if (width <= 0 || height <= 0) return {};
    if (!inBounds(width, height, start.x, start.y)) return {};
    if (!inBounds(width, height, goal.x, goal.y)) return {};
    if (start == goal) return {start};

    const int startI = idxOf(width, start.x, start.y);
    const int goalI = idxOf(width, goal.x, goal.y);

    auto heuristic = [&](int x, int y) {
        return static_cast<double>(std::abs(x - goal.x) + std::abs(y - goal.y));
    };

    const double INF = std::numeric_limits<double>::infinity();
    std::vector<double> gScore(static_cast<size_t>(width * height), INF);
    std::vector<int> prev(static_cast<size_t>(width * height), -1);

    std::priority_queue<Node, std::vector<Node>, std::greater<Node>> open;
    uint64_t order = 0;

    gScore[static_cast<size_t>(startI)] = 0.0;
    open.emplace(heuristic(start.x, start.y), order++, startI);

    bool found = false;
    while (!open.empty()) {
        const Node cur = open.top();
        open.pop();

        const int i = std::get<2>(cur);
        const int x = i % width;
        const int y = i / width;
        const double g = gScore[static_cast<size_t>(i)];

        // Stale entry: a cheaper route to this tile was pushed later.
        if (std::get<0>(cur) != g + heuristic(x, y)) continue;

        if (i == goalI) {
            found = true;
            break;
        }

        for (const auto& dv : DIRS8) {
            const int nx = x + dv[0];
            const int ny = y + dv[1];
            if (!inBounds(width, height, nx, ny)) continue;
            if (!passable(nx, ny)) continue;

            const double step = (dv[0] != 0 && dv[1] != 0) ? DIAGONAL_COST : 1.0;
            const double ng = g + step;
            const int ni = idxOf(width, nx, ny);
            if (ng < gScore[static_cast<size_t>(ni)]) {
                gScore[static_cast<size_t>(ni)] = ng;
                prev[static_cast<size_t>(ni)] = i;
                open.emplace(ng + heuristic(nx, ny), order++, ni);
            }
        }
    }

    if (!found) return {};

    std::vector<Vec2i> path;
    int cur = goalI;
    while (cur != -1) {
        path.push_back({cur % width, cur / width});
        if (cur == startI) break;
        cur = prev[static_cast<size_t>(cur)];
    }

    if (path.empty() || path.back() != start) return {};
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<std::vector<Vec2i>> findPlayerPaths(const GeneratedLevel& level) {
    const TileGrid& g = level.tiles;
    const PassableFn walkable = [&](int x, int y) { return g.isWalkable(x, y); };

    std::vector<std::vector<Vec2i>> paths;
    for (const Vec2i& spawn : level.spawnPoints) {
        for (const Vec2i& goal : level.goalPoints) {
            std::vector<Vec2i> p = astarPath(g.width, g.height, spawn, goal, walkable);
            if (!p.empty()) paths.push_back(std::move(p));
        }
    }
    return paths;
}
