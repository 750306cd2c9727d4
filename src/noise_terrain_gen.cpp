#include "level_algorithms.hpp"
#include "noise.hpp"

namespace procgen {

TileGrid generateNoiseTerrain(const GenerationConfig& cfg, RNG& rng) {
    TileGrid g(cfg.width, cfg.height, TileType::Floor);

    const uint32_t seed = hashCombine(rng.nextU32(), "NOISE_TERRAIN"_tag);

    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const float n = fbm(seed,
                                static_cast<float>(x) * cfg.noiseScale,
                                static_cast<float>(y) * cfg.noiseScale,
                                cfg.octaves, cfg.persistence, cfg.lacunarity);

            TileType t = TileType::Wall;
            if (n < -0.3f) t = TileType::Water;
            else if (n < 0.0f) t = TileType::Floor;
            else if (n < 0.3f) t = TileType::Obstacle;
            g.at(x, y) = t;
        }
    }

    return g;
}

} // namespace procgen
