#include "level_algorithms.hpp"
#include "wfc.hpp"

#include <array>
#include <vector>

namespace procgen {

namespace {

using Pattern3 = std::array<std::array<TileType, 3>, 3>; // [row][col]

constexpr TileType W = TileType::Wall;
constexpr TileType F = TileType::Floor;
constexpr TileType D = TileType::Door;

// Exemplar library: open floor, wall corner, straight wall, doorway.
const Pattern3 EXEMPLARS[] = {
    {{ {F, F, F},
       {F, F, F},
       {F, F, F} }},
    {{ {W, W, F},
       {W, W, F},
       {F, F, F} }},
    {{ {W, W, W},
       {F, F, F},
       {F, F, F} }},
    {{ {W, D, W},
       {F, F, F},
       {F, F, F} }},
};

// Solver tile ids.
constexpr TileType SOLVER_TILES[] = {TileType::Floor, TileType::Wall, TileType::Door};
constexpr int N_SOLVER_TILES = 3;

int solverId(TileType t) {
    for (int i = 0; i < N_SOLVER_TILES; ++i) {
        if (SOLVER_TILES[i] == t) return i;
    }
    return 0;
}

Pattern3 rotate90(const Pattern3& p) {
    Pattern3 r{};
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            r[static_cast<size_t>(col)][static_cast<size_t>(2 - row)] = p[static_cast<size_t>(row)][static_cast<size_t>(col)];
        }
    }
    return r;
}

struct PatternRules {
    std::vector<uint32_t> allow[4];
    std::vector<float> weights;
};

// Adjacency is learned from every neighboring pair inside the exemplars and
// their rotations; weights are the tile frequencies over the same set.
PatternRules learnRules() {
    PatternRules r;
    for (auto& a : r.allow) a.assign(N_SOLVER_TILES, 0u);
    r.weights.assign(N_SOLVER_TILES, 0.0f);

    auto link = [&](TileType from, int dir, TileType to) {
        const int a = solverId(from);
        const int b = solverId(to);
        r.allow[dir][static_cast<size_t>(a)] |= (1u << static_cast<uint32_t>(b));
        r.allow[wfc::opposite(dir)][static_cast<size_t>(b)] |= (1u << static_cast<uint32_t>(a));
    };

    for (const Pattern3& base : EXEMPLARS) {
        Pattern3 p = base;
        for (int rot = 0; rot < 4; ++rot) {
            for (size_t row = 0; row < 3; ++row) {
                for (size_t col = 0; col < 3; ++col) {
                    r.weights[static_cast<size_t>(solverId(p[row][col]))] += 1.0f;
                    if (col + 1 < 3) link(p[row][col], wfc::PosX, p[row][col + 1]);
                    if (row + 1 < 3) link(p[row][col], wfc::PosY, p[row + 1][col]);
                }
            }
            p = rotate90(p);
        }
    }
    return r;
}

} // namespace

TileGrid generatePatternCollapse(const GenerationConfig& cfg, RNG& rng) {
    TileGrid g(cfg.width, cfg.height, TileType::Floor);

    static const PatternRules rules = learnRules();

    std::vector<uint8_t> ids;
    if (wfc::solve(g.width, g.height, N_SOLVER_TILES, rules.allow, rules.weights, rng, ids)) {
        for (size_t i = 0; i < ids.size(); ++i) {
            g.tiles[i] = SOLVER_TILES[ids[i]];
        }
        return g;
    }

    // Solver gave up: each cell takes the center tile of a pattern picked per
    // cell. Every exemplar center is Floor, so this is an all-Floor grid.
    for (auto& t : g.tiles) {
        t = rng.pick(EXEMPLARS)[1][1];
    }
    return g;
}

} // namespace procgen
