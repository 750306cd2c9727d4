#include "placement_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace {

constexpr int WALL_SEARCH_RADIUS = 5;
constexpr float NO_WALL_DISTANCE = 5.0f;

constexpr float PATH_OPTIMAL = 3.0f;
constexpr float PATH_WIDTH = 2.0f;

constexpr float CLUSTER_FALLOFF = 10.0f;
constexpr float GOAL_FALLOFF = 10.0f;
constexpr float SPAWN_FALLOFF = 5.0f;

const char* const FEATURE_NAMES[PLACEMENT_FEATURE_COUNT] = {
    "distance_to_path",
    "difficulty_zone",
    "visibility",
    "clustering",
    "strategic_position",
};

float nearestDistance(Vec2i p, const std::vector<Vec2i>& pts) {
    float best = std::numeric_limits<float>::infinity();
    for (const Vec2i& q : pts) best = std::min(best, euclid(p, q));
    return best;
}

const char* const AI_TYPES[] = {"patrol", "guard", "aggressive"};
const char* const ITEM_TYPES[] = {"weapon", "armor", "consumable", "key"};
const char* const TRAP_TYPES[] = {"spike", "poison", "explosive", "alarm"};
const char* const TREASURE_TYPES[] = {"gold", "gems", "artifact"};

} // namespace

const char* placementFeatureName(PlacementFeature f) {
    const int i = static_cast<int>(f);
    if (i < 0 || i >= PLACEMENT_FEATURE_COUNT) return "unknown";
    return FEATURE_NAMES[i];
}

bool parsePlacementFeature(const std::string& s, PlacementFeature& out) {
    const std::string k = toLower(trim(s));
    for (int i = 0; i < PLACEMENT_FEATURE_COUNT; ++i) {
        if (k == FEATURE_NAMES[i]) {
            out = static_cast<PlacementFeature>(i);
            return true;
        }
    }
    return false;
}

float distanceToNearestWall(const TileGrid& g, Vec2i p) {
    float best = std::numeric_limits<float>::infinity();
    for (int dy = -WALL_SEARCH_RADIUS; dy <= WALL_SEARCH_RADIUS; ++dy) {
        for (int dx = -WALL_SEARCH_RADIUS; dx <= WALL_SEARCH_RADIUS; ++dx) {
            const int x = p.x + dx;
            const int y = p.y + dy;
            if (!g.isWall(x, y)) continue;
            best = std::min(best, euclid(p, Vec2i{x, y}));
        }
    }
    return std::isinf(best) ? NO_WALL_DISTANCE : best;
}

float pathDistanceScore(float distToPath) {
    return 1.0f / (1.0f + std::exp(std::fabs(distToPath - PATH_OPTIMAL) / PATH_WIDTH));
}

float clusteringScore(Vec2i p, const std::vector<GameObject>& placed, float preference) {
    if (placed.empty()) return 0.5f;

    float sum = 0.0f;
    for (const GameObject& o : placed) sum += euclid(p, o.pos);
    const float avg = sum / static_cast<float>(placed.size());
    const float m = std::min(avg / CLUSTER_FALLOFF, 1.0f);

    return preference * (1.0f - m) + (1.0f - preference) * m;
}

float strategicScore(Vec2i p, const GeneratedLevel& level, ObjectType type) {
    float s = 0.0f;

    if (!level.goalPoints.empty() && (type == ObjectType::Enemy || type == ObjectType::Trap)) {
        const float d = nearestDistance(p, level.goalPoints);
        s += (GOAL_FALLOFF - std::min(d, GOAL_FALLOFF)) / GOAL_FALLOFF;
    }

    if (!level.spawnPoints.empty() && (type == ObjectType::Item || type == ObjectType::Checkpoint)) {
        const float d = nearestDistance(p, level.spawnPoints);
        s += std::min(d / SPAWN_FALLOFF, 1.0f);
    }

    return s;
}

PlacementOptimizer::PlacementOptimizer()
    : weights_{{0.30f, 0.25f, 0.20f, 0.15f, 0.10f}} {}

std::array<float, PLACEMENT_FEATURE_COUNT> PlacementOptimizer::featureScores(
    const PlacementContext& ctx,
    Vec2i p,
    ObjectType type,
    const PlacementRule& rule,
    const std::vector<GameObject>& placed) const
{
    std::array<float, PLACEMENT_FEATURE_COUNT> f{};

    if (!ctx.playerPath.empty()) {
        f[static_cast<size_t>(PlacementFeature::DistanceToPath)] =
            pathDistanceScore(nearestDistance(p, ctx.playerPath));
    }

    if (ctx.difficulty.inBounds(p.x, p.y)) {
        const float v = ctx.difficulty.at(p.x, p.y);
        f[static_cast<size_t>(PlacementFeature::DifficultyZone)] =
            (type == ObjectType::Enemy) ? v : 1.0f - v;
    }

    if (ctx.visibility.inBounds(p.x, p.y)) {
        const float v = ctx.visibility.at(p.x, p.y);
        f[static_cast<size_t>(PlacementFeature::Visibility)] =
            (type == ObjectType::Trap) ? 1.0f - v : v;
    }

    f[static_cast<size_t>(PlacementFeature::Clustering)] =
        clusteringScore(p, placed, rule.clusteringPreference);

    f[static_cast<size_t>(PlacementFeature::StrategicPosition)] =
        strategicScore(p, ctx.level, type) * rule.strategicImportance;

    return f;
}

float PlacementOptimizer::score(const PlacementContext& ctx,
                                Vec2i p,
                                ObjectType type,
                                const PlacementRule& rule,
                                const std::vector<GameObject>& placed) const {
    const auto f = featureScores(ctx, p, type, rule, placed);
    float s = 0.0f;
    for (size_t i = 0; i < f.size(); ++i) s += weights_[i] * f[i];
    return s;
}

std::vector<Vec2i> PlacementOptimizer::candidatePositions(const GeneratedLevel& level,
                                                          const PlacementRule& rule) const {
    const TileGrid& g = level.tiles;
    std::vector<Vec2i> out;
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const TileType t = g.at(x, y);
            if (!isWalkableTile(t) || !rule.allowsTile(t)) continue;
            const Vec2i p{x, y};
            if (distanceToNearestWall(g, p) < rule.minDistanceFromWalls) continue;
            out.push_back(p);
        }
    }
    return out;
}

std::vector<GameObject> PlacementOptimizer::optimizePlacement(
    const PlacementContext& ctx,
    const ObjectCounts& counts,
    const PlacementRules& rules,
    RNG& rng,
    PlacementStats* stats) const
{
    std::vector<GameObject> placed;

    // std::map iterates in ObjectType order.
    for (const auto& kv : counts) {
        const ObjectType type = kv.first;
        const int want = kv.second;
        if (want <= 0) continue;

        const auto ruleIt = rules.find(type);
        const PlacementRule rule = (ruleIt != rules.end()) ? ruleIt->second : PlacementRule{};

        const std::vector<Vec2i> cands = candidatePositions(ctx.level, rule);

        std::vector<std::pair<float, Vec2i>> scored;
        scored.reserve(cands.size());
        for (const Vec2i& p : cands) {
            scored.push_back({score(ctx, p, type, rule, placed), p});
        }
        std::stable_sort(scored.begin(), scored.end(),
                         [](const std::pair<float, Vec2i>& a, const std::pair<float, Vec2i>& b) {
                             return a.first > b.first;
                         });

        std::vector<Vec2i> accepted;
        for (const auto& sp : scored) {
            if (static_cast<int>(accepted.size()) >= want) break;

            bool tooClose = false;
            for (const Vec2i& q : accepted) {
                if (euclid(sp.second, q) < rule.minDistanceFromSameType) {
                    tooClose = true;
                    break;
                }
            }
            if (!tooClose) accepted.push_back(sp.second);
        }

        for (size_t i = 0; i < accepted.size(); ++i) {
            GameObject o;
            o.id = std::string(objectTypeName(type)) + "_" + std::to_string(i + 1);
            o.type = type;
            o.pos = accepted[i];
            o.properties = objectProperties(type, ctx.genre, rng);
            o.rule = rule;
            placed.push_back(std::move(o));
        }

        if (stats) {
            PlacementTypeStats& ts = stats->perType[type];
            ts.requested += want;
            ts.candidates += static_cast<int>(cands.size());
            ts.placed += static_cast<int>(accepted.size());
        }
    }

    return placed;
}

std::map<std::string, PropertyValue> PlacementOptimizer::objectProperties(
    ObjectType type, const std::string& genre, RNG& rng)
{
    std::map<std::string, PropertyValue> props;
    props["genre"] = genre;

    switch (type) {
        case ObjectType::Enemy:
            props["health"] = rng.range(50, 150);
            props["damage"] = rng.range(10, 30);
            props["ai_type"] = std::string(rng.pick(AI_TYPES));
            props["detection_radius"] = rng.uniform(3.0f, 7.0f);
            break;
        case ObjectType::Item:
            props["item_type"] = std::string(rng.pick(ITEM_TYPES));
            props["value"] = rng.range(10, 100);
            props["stackable"] = rng.chance(0.5f);
            break;
        case ObjectType::Trap:
            props["trap_type"] = std::string(rng.pick(TRAP_TYPES));
            props["damage"] = rng.range(20, 50);
            props["detection_difficulty"] = rng.uniform(0.3f, 0.8f);
            break;
        case ObjectType::Treasure:
            props["treasure_type"] = std::string(rng.pick(TREASURE_TYPES));
            props["value"] = rng.range(100, 500);
            props["hidden"] = rng.chance(0.5f);
            break;
        default:
            break;
    }

    return props;
}
