#pragma once

#include "level.hpp"
#include "tile_grid.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

enum class ObjectType : uint8_t {
    Enemy = 0,
    Item,
    Treasure,
    Trap,
    Decoration,
    Interactive,
    QuestObject,
    Checkpoint,
    LightSource,
    Cover,
};

constexpr int OBJECT_TYPE_COUNT = 10;

// Stable lower-case ids ("enemy", "quest_object", ...), used for object ids,
// INI keys and serializer output.
const char* objectTypeName(ObjectType t);
bool parseObjectType(const std::string& s, ObjectType& out);

using PropertyValue = std::variant<int, float, bool, std::string>;

std::string propertyToString(const PropertyValue& v);

struct PlacementRule {
    float minDistanceFromWalls = 1.0f;
    float minDistanceFromSameType = 3.0f;
    // Carried for serializers and quality scoring; the optimizer does not enforce it.
    float maxDistanceFromSameType = 10.0f;
    // Empty means {Floor}.
    std::vector<TileType> preferredTiles;
    // Empty means {Wall, Water}.
    std::vector<TileType> forbiddenTiles;
    float densityPerArea = 0.1f;
    // 0 = spread out, 1 = bunch up.
    float clusteringPreference = 0.5f;
    float strategicImportance = 1.0f;

    // Tile-type part of the candidate test (wall distance is checked separately).
    bool allowsTile(TileType t) const;
};

struct GameObject {
    std::string id;
    ObjectType type = ObjectType::Decoration;
    Vec2i pos;
    std::map<std::string, PropertyValue> properties;
    float influenceRadius = 3.0f;
    // Snapshot of the rule the object was placed under.
    PlacementRule rule;
};

using ObjectCounts = std::map<ObjectType, int>;
using PlacementRules = std::map<ObjectType, PlacementRule>;

using LevelPath = std::vector<Vec2i>;

// Per-call analysis bundle. Built once by buildPlacementContext() and
// discarded when placement finishes.
struct PlacementContext {
    const GeneratedLevel& level;
    std::string genre;
    std::vector<LevelPath> paths;
    // First analyzed path; empty when no spawn reaches a goal.
    LevelPath playerPath;
    Field2D difficulty;
    Field2D visibility;
};

// Runs the path, difficulty and visibility analyzers once each.
PlacementContext buildPlacementContext(const GeneratedLevel& level, const std::string& genre);

struct PlacementTypeStats {
    int requested = 0;
    int candidates = 0;
    int placed = 0;
};

struct PlacementStats {
    std::map<ObjectType, PlacementTypeStats> perType;

    int totalRequested() const;
    int totalPlaced() const;
    // Objects that could not be placed because candidates or spacing ran out.
    int shortfall() const { return totalRequested() - totalPlaced(); }
};
