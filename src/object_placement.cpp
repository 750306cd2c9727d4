#include "object_placement.hpp"

#include <algorithm>

namespace {

struct BaseCount {
    ObjectType type;
    int minimum;
    double perWalkableTile;
};

constexpr BaseCount BASE_COUNTS[] = {
    {ObjectType::Enemy,      1, 0.05},
    {ObjectType::Item,       2, 0.08},
    {ObjectType::Trap,       1, 0.03},
    {ObjectType::Treasure,   1, 0.02},
    {ObjectType::Decoration, 3, 0.10},
};

struct GenreCountModifier {
    const char* genre;
    ObjectType type;
    double multiplier;
};

constexpr GenreCountModifier GENRE_COUNT_MODIFIERS[] = {
    {"cyberpunk", ObjectType::Enemy,    1.2},
    {"cyberpunk", ObjectType::Trap,     1.5},
    {"cyberpunk", ObjectType::Item,     1.1},
    {"horror",    ObjectType::Enemy,    0.8},
    {"horror",    ObjectType::Trap,     2.0},
    {"horror",    ObjectType::Item,     0.7},
    {"fantasy",   ObjectType::Treasure, 1.5},
    {"fantasy",   ObjectType::Enemy,    1.0},
    {"fantasy",   ObjectType::Item,     1.2},
};

PlacementRule makeRule(float wallDist, float sameTypeDist, float density, float clustering, float importance) {
    PlacementRule r;
    r.minDistanceFromWalls = wallDist;
    r.minDistanceFromSameType = sameTypeDist;
    r.densityPerArea = density;
    r.clusteringPreference = clustering;
    r.strategicImportance = importance;
    return r;
}

} // namespace

PlacementRules defaultPlacementRules() {
    PlacementRules rules;
    rules[ObjectType::Enemy]    = makeRule(1.5f, 4.0f, 0.05f, 0.3f, 1.0f);
    rules[ObjectType::Item]     = makeRule(1.0f, 3.0f, 0.08f, 0.1f, 0.7f);
    rules[ObjectType::Trap]     = makeRule(0.5f, 5.0f, 0.03f, 0.0f, 0.9f);
    rules[ObjectType::Treasure] = makeRule(1.0f, 8.0f, 0.02f, 0.0f, 1.0f);
    return rules;
}

double genreCountMultiplier(const std::string& genre, ObjectType type) {
    const std::string g = canonicalGenre(genre);
    for (const auto& m : GENRE_COUNT_MODIFIERS) {
        if (g == m.genre && type == m.type) return m.multiplier;
    }
    return 1.0;
}

ObjectPlacementEngine::ObjectPlacementEngine()
    : rules_(defaultPlacementRules()) {}

ObjectCounts ObjectPlacementEngine::computeObjectCounts(const GeneratedLevel& level,
                                                        const std::string& genre) const {
    const double area = static_cast<double>(level.tiles.countWalkable());

    ObjectCounts counts;
    for (const auto& b : BASE_COUNTS) {
        int n = std::max(b.minimum, static_cast<int>(area * b.perWalkableTile));
        const double m = genreCountMultiplier(genre, b.type);
        if (m != 1.0) n = std::max(1, static_cast<int>(n * m));
        counts[b.type] = n;
    }
    return counts;
}

std::vector<GameObject> ObjectPlacementEngine::placeObjects(
    const GeneratedLevel& level,
    const ScenarioInput& scenario,
    RNG& rng,
    const ObjectCounts* explicitCounts,
    PlacementStats* stats) const
{
    const ObjectCounts counts = (explicitCounts && !explicitCounts->empty())
        ? *explicitCounts
        : computeObjectCounts(level, scenario.genre);

    const PlacementContext ctx = buildPlacementContext(level, scenario.genre);
    return optimizer_.optimizePlacement(ctx, counts, rules_, rng, stats);
}
