#pragma once

#include "placement.hpp"
#include "rng.hpp"

#include <array>
#include <map>
#include <string>
#include <vector>

enum class PlacementFeature : uint8_t {
    DistanceToPath = 0,
    DifficultyZone,
    Visibility,
    Clustering,
    StrategicPosition,
};

constexpr int PLACEMENT_FEATURE_COUNT = 5;

// "distance_to_path", "difficulty_zone", ...
const char* placementFeatureName(PlacementFeature f);
bool parsePlacementFeature(const std::string& s, PlacementFeature& out);

// Euclidean distance to the nearest Wall inside the 11x11 window centered on
// p; 5.0 when the window holds no wall.
float distanceToNearestWall(const TileGrid& g, Vec2i p);

// Peaks at 3 tiles from the player path: 1 / (1 + exp(|d - 3| / 2)).
float pathDistanceScore(float distToPath);

// 0.5 with nothing placed; otherwise blends towards near (preference 1) or far
// (preference 0) from the mean distance to every placed object.
float clusteringScore(Vec2i p, const std::vector<GameObject>& placed, float preference);

// Goal proximity for Enemy/Trap, spawn distance for Item/Checkpoint, 0 otherwise.
// Not yet multiplied by the rule's strategic importance.
float strategicScore(Vec2i p, const GeneratedLevel& level, ObjectType type);

// Multi-feature weighted scorer + greedy spacing-constrained selection.
//
// Types are handled in ObjectType order. Every candidate of a type is scored
// against the objects placed for earlier types, candidates are stable-sorted
// by descending score, and accepted greedily while they keep
// minDistanceFromSameType from the accepted positions of the same type.
class PlacementOptimizer {
public:
    PlacementOptimizer();

    float weight(PlacementFeature f) const { return weights_[static_cast<size_t>(f)]; }
    void setWeight(PlacementFeature f, float w) { weights_[static_cast<size_t>(f)] = w; }

    // Unweighted per-feature scores in feature order. Features without a
    // signal (no player path) score 0.
    std::array<float, PLACEMENT_FEATURE_COUNT> featureScores(
        const PlacementContext& ctx,
        Vec2i p,
        ObjectType type,
        const PlacementRule& rule,
        const std::vector<GameObject>& placed) const;

    float score(const PlacementContext& ctx,
                Vec2i p,
                ObjectType type,
                const PlacementRule& rule,
                const std::vector<GameObject>& placed) const;

    // Row-major list of walkable tiles that pass the rule's tile and
    // wall-distance tests.
    std::vector<Vec2i> candidatePositions(const GeneratedLevel& level, const PlacementRule& rule) const;

    // Missing rules fall back to PlacementRule{}. Non-positive counts are skipped.
    std::vector<GameObject> optimizePlacement(
        const PlacementContext& ctx,
        const ObjectCounts& counts,
        const PlacementRules& rules,
        RNG& rng,
        PlacementStats* stats = nullptr) const;

    // Bounded random gameplay properties; every object carries "genre".
    static std::map<std::string, PropertyValue> objectProperties(
        ObjectType type, const std::string& genre, RNG& rng);

private:
    std::array<float, PLACEMENT_FEATURE_COUNT> weights_;
};
