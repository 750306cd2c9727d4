#include "level_algorithms.hpp"

#include <vector>

namespace procgen {

TileGrid generateCellular(const GenerationConfig& cfg, RNG& rng) {
    TileGrid g(cfg.width, cfg.height, TileType::Wall);

    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            g.at(x, y) = rng.chance(cfg.wallProbability) ? TileType::Wall : TileType::Floor;
        }
    }

    auto wallCount8 = [&](int x, int y) {
        int c = 0;
        for (int oy = -1; oy <= 1; ++oy) {
            for (int ox = -1; ox <= 1; ++ox) {
                if (ox == 0 && oy == 0) continue;
                if (g.at(x + ox, y + oy) == TileType::Wall) c++;
            }
        }
        return c;
    };

    // Interior cells only; the ring is overwritten below anyway.
    std::vector<TileType> next = g.tiles;
    for (int it = 0; it < cfg.iterations; ++it) {
        for (int y = 1; y < g.height - 1; ++y) {
            for (int x = 1; x < g.width - 1; ++x) {
                const int wc = wallCount8(x, y);
                TileType& dst = next[static_cast<size_t>(y * g.width + x)];
                if (wc >= 5) dst = TileType::Wall;
                else if (wc <= 3) dst = TileType::Floor;
                else dst = g.at(x, y);
            }
        }
        g.tiles = next;
    }

    g.fillBorder(TileType::Wall);
    return g;
}

} // namespace procgen
