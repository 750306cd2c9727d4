#include "level_generator.hpp"

#include "level_algorithms.hpp"
#include "level_config.hpp"

#include <algorithm>
#include <ctime>
#include <utility>

namespace {

float nearestCornerDistance(const TileGrid& g, const Vec2i& p) {
    const Vec2i corners[4] = {
        {0, 0},
        {g.width - 1, 0},
        {0, g.height - 1},
        {g.width - 1, g.height - 1},
    };
    float best = euclid(p, corners[0]);
    for (int i = 1; i < 4; ++i) best = std::min(best, euclid(p, corners[i]));
    return best;
}

// Floor tiles in row-major order paired with their nearest-corner distance.
std::vector<std::pair<float, Vec2i>> rankFloorByCorner(const TileGrid& g) {
    std::vector<std::pair<float, Vec2i>> ranked;
    for (const Vec2i& p : g.positionsOf(TileType::Floor)) {
        ranked.push_back({nearestCornerDistance(g, p), p});
    }
    return ranked;
}

Vec2i clampedPoint(const TileGrid& g, int x, int y) {
    return {clampi(x, 0, std::max(0, g.width - 1)), clampi(y, 0, std::max(0, g.height - 1))};
}

} // namespace

const std::vector<GenreLevelProfile>& genreLevelProfiles() {
    static const std::vector<GenreLevelProfile> profiles = {
        {"cyberpunk",       0.30f, 0, {TileType::Trap, TileType::Secret}},
        {"fantasy",         0.40f, 0, {TileType::Secret}},
        {"horror",          0.60f, 1, {TileType::Trap}},
        {"postapocalyptic", 0.35f, 0, {TileType::Obstacle, TileType::Trap}},
    };
    return profiles;
}

const GenreLevelProfile* findGenreLevelProfile(const std::string& genre) {
    const std::string g = canonicalGenre(genre);
    for (const GenreLevelProfile& p : genreLevelProfiles()) {
        if (g == p.genre) return &p;
    }
    return nullptr;
}

bool LevelGenerator::applyGenreModifiers(GenerationConfig& cfg, const std::string& genre, std::string* err) {
    if (const GenreLevelProfile* p = findGenreLevelProfile(genre)) {
        if (p->wallProbability >= 0.0f) cfg.wallProbability = p->wallProbability;
        if (p->corridorWidth > 0) cfg.corridorWidth = p->corridorWidth;
    }

    for (const auto& kv : cfg.genreModifiers) {
        std::string perr;
        if (!applyConfigParam(cfg, kv.first, kv.second, &perr)) {
            if (err) *err = "Genre modifier: " + perr;
            return false;
        }
    }
    return true;
}

bool LevelGenerator::generateLevel(const ScenarioInput& scenario,
                                   const GenerationConfig& config,
                                   GeneratedLevel& out,
                                   std::string* err) const {
    const uint32_t seed = config.seed ? *config.seed : hash32(static_cast<uint32_t>(std::time(nullptr)));
    RNG rng(seed);
    return generateLevel(scenario, config, rng, out, err);
}

bool LevelGenerator::generateLevel(const ScenarioInput& scenario,
                                   const GenerationConfig& config,
                                   RNG& rng,
                                   GeneratedLevel& out,
                                   std::string* err) const {
    const uint32_t entryState = rng.state;

    GenerationConfig cfg = config;
    if (!applyGenreModifiers(cfg, scenario.genre, err)) return false;
    if (!procgen::validateGenerationConfig(cfg, err)) return false;

    const procgen::LevelAlgorithm* algo = procgen::findLevelAlgorithm(cfg.algorithm);
    TileGrid grid = algo->generate(cfg, rng);

    if (const GenreLevelProfile* p = findGenreLevelProfile(scenario.genre)) {
        grid = scatterSpecialTiles(grid, p->specialTiles, rng);
    }

    GeneratedLevel lvl;
    lvl.width = grid.width;
    lvl.height = grid.height;
    lvl.spawnPoints = findSpawnPoints(grid);
    lvl.goalPoints = findGoalPoints(grid);
    lvl.specialAreas = collectSpecialAreas(grid);
    lvl.tiles = std::move(grid);

    lvl.metadata = configParams(cfg);
    lvl.metadata["algorithm"] = algo->tag;
    lvl.metadata["genre"] = canonicalGenre(scenario.genre);
    lvl.metadata["seed"] = std::to_string(entryState);

    out = std::move(lvl);
    return true;
}

TileGrid LevelGenerator::scatterSpecialTiles(const TileGrid& g, const std::vector<TileType>& special, RNG& rng) {
    TileGrid out = g;
    if (special.empty()) return out;

    std::vector<Vec2i> floor = out.positionsOf(TileType::Floor);
    const int n = static_cast<int>(floor.size());
    const int count = std::min(n / 10, MAX_SPECIAL_TILES);

    // Partial Fisher-Yates: the first `count` entries become a uniform sample.
    for (int i = 0; i < count; ++i) {
        const int j = rng.range(i, n - 1);
        std::swap(floor[static_cast<size_t>(i)], floor[static_cast<size_t>(j)]);
        const Vec2i& p = floor[static_cast<size_t>(i)];
        out.at(p.x, p.y) = special[static_cast<size_t>(i) % special.size()];
    }
    return out;
}

std::vector<Vec2i> LevelGenerator::findSpawnPoints(const TileGrid& g) {
    auto ranked = rankFloorByCorner(g);
    if (ranked.empty()) return {clampedPoint(g, 1, 1)};

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const std::pair<float, Vec2i>& a, const std::pair<float, Vec2i>& b) {
                         return a.first < b.first;
                     });

    std::vector<Vec2i> out;
    for (size_t i = 0; i < ranked.size() && static_cast<int>(i) < SPAWN_POINT_COUNT; ++i) {
        out.push_back(ranked[i].second);
    }
    return out;
}

std::vector<Vec2i> LevelGenerator::findGoalPoints(const TileGrid& g) {
    std::vector<Vec2i> goals = g.positionsOf(TileType::Goal);
    if (!goals.empty()) return goals;

    auto ranked = rankFloorByCorner(g);
    if (ranked.empty()) return {clampedPoint(g, g.width - 2, g.height - 2)};

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const std::pair<float, Vec2i>& a, const std::pair<float, Vec2i>& b) {
                         return a.first > b.first;
                     });

    std::vector<Vec2i> out;
    for (size_t i = 0; i < ranked.size() && static_cast<int>(i) < GOAL_POINT_COUNT; ++i) {
        out.push_back(ranked[i].second);
    }
    return out;
}

std::map<std::string, std::vector<Vec2i>> LevelGenerator::collectSpecialAreas(const TileGrid& g) {
    std::map<std::string, std::vector<Vec2i>> areas;
    const std::pair<const char*, TileType> groups[] = {
        {"secret", TileType::Secret},
        {"trap",   TileType::Trap},
        {"water",  TileType::Water},
    };
    for (const auto& grp : groups) {
        std::vector<Vec2i> pts = g.positionsOf(grp.second);
        if (!pts.empty()) areas[grp.first] = std::move(pts);
    }
    return areas;
}
