#include "visibility_map.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr int RAY_STEP_DEGREES = 5;
constexpr int VIEW_RADIUS = 7;
constexpr size_t MAX_PATHS = 3;
constexpr size_t WAYPOINT_STRIDE = 2;

const double PI = 3.14159265358979323846;

} // namespace

void castVisibilityRays(const TileGrid& g, Vec2i origin, int radius, Field2D& acc) {
    const double cx = static_cast<double>(origin.x);
    const double cy = static_cast<double>(origin.y);

    for (int deg = 0; deg < 360; deg += RAY_STEP_DEGREES) {
        const double a = static_cast<double>(deg) * PI / 180.0;
        const double dx = std::cos(a);
        const double dy = std::sin(a);

        for (int step = 1; step <= radius; ++step) {
            const int x = static_cast<int>(cx + dx * step);
            const int y = static_cast<int>(cy + dy * step);
            if (!g.inBounds(x, y)) break;
            if (g.at(x, y) == TileType::Wall) break;
            if (acc.inBounds(x, y)) acc.at(x, y) += 1.0f;
        }
    }
}

Field2D computeVisibilityMap(const GeneratedLevel& level,
                             const std::vector<std::vector<Vec2i>>& paths) {
    const TileGrid& g = level.tiles;
    Field2D field(g.width, g.height, 0.0f);

    const size_t n = std::min(paths.size(), MAX_PATHS);
    for (size_t pi = 0; pi < n; ++pi) {
        const auto& path = paths[pi];
        for (size_t i = 0; i < path.size(); i += WAYPOINT_STRIDE) {
            castVisibilityRays(g, path[i], VIEW_RADIUS, field);
        }
    }

    field.normalizeByMax();
    return field;
}
