#include "difficulty_zones.hpp"

#include <algorithm>

namespace {

constexpr int DIRS8[8][2] = {
    {1,0},{-1,0},{0,1},{0,-1},
    {1,1},{1,-1},{-1,1},{-1,-1}
};

constexpr float SPAWN_FALLOFF = 10.0f;
constexpr int CHOKE_MAX_OPEN = 3;
constexpr float GOAL_RADIUS = 5.0f;

int walkableNeighbors(const TileGrid& g, int x, int y) {
    int n = 0;
    for (const auto& d : DIRS8) {
        if (g.isWalkable(x + d[0], y + d[1])) ++n;
    }
    return n;
}

} // namespace

Field2D analyzeDifficultyZones(const GeneratedLevel& level,
                               const std::vector<std::vector<Vec2i>>& /*paths*/) {
    const TileGrid& g = level.tiles;
    Field2D field(g.width, g.height, 0.0f);

    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (!g.isWalkable(x, y)) continue;
            const Vec2i p{x, y};

            float v = 0.0f;
            for (const Vec2i& s : level.spawnPoints) {
                v += std::min(euclid(p, s) / SPAWN_FALLOFF, 1.0f);
            }

            const int open = walkableNeighbors(g, x, y);
            if (open <= CHOKE_MAX_OPEN) {
                v += static_cast<float>(4 - open) / 4.0f;
            }

            for (const Vec2i& goal : level.goalPoints) {
                const float d = euclid(p, goal);
                if (d < GOAL_RADIUS) v += (GOAL_RADIUS - d) / GOAL_RADIUS;
            }

            field.at(x, y) = v;
        }
    }

    field.normalizeByMax();
    return field;
}
