#include "placement.hpp"

#include "difficulty_zones.hpp"
#include "path_analyzer.hpp"
#include "visibility_map.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

const char* objectTypeName(ObjectType t) {
    switch (t) {
        case ObjectType::Enemy:       return "enemy";
        case ObjectType::Item:        return "item";
        case ObjectType::Treasure:    return "treasure";
        case ObjectType::Trap:        return "trap";
        case ObjectType::Decoration:  return "decoration";
        case ObjectType::Interactive: return "interactive";
        case ObjectType::QuestObject: return "quest_object";
        case ObjectType::Checkpoint:  return "checkpoint";
        case ObjectType::LightSource: return "light_source";
        case ObjectType::Cover:       return "cover";
    }
    return "unknown";
}

bool parseObjectType(const std::string& s, ObjectType& out) {
    const std::string k = toLower(trim(s));
    for (int i = 0; i < OBJECT_TYPE_COUNT; ++i) {
        const ObjectType t = static_cast<ObjectType>(i);
        if (k == objectTypeName(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

std::string propertyToString(const PropertyValue& v) {
    if (const int* i = std::get_if<int>(&v)) return std::to_string(*i);
    if (const bool* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const float* f = std::get_if<float>(&v)) {
        std::ostringstream ss;
        ss << *f;
        return ss.str();
    }
    return std::get<std::string>(v);
}

bool PlacementRule::allowsTile(TileType t) const {
    static const std::vector<TileType> defaultPreferred = {TileType::Floor};
    static const std::vector<TileType> defaultForbidden = {TileType::Wall, TileType::Water};

    const std::vector<TileType>& pref = preferredTiles.empty() ? defaultPreferred : preferredTiles;
    const std::vector<TileType>& forb = forbiddenTiles.empty() ? defaultForbidden : forbiddenTiles;

    if (std::find(forb.begin(), forb.end(), t) != forb.end()) return false;
    return std::find(pref.begin(), pref.end(), t) != pref.end();
}

PlacementContext buildPlacementContext(const GeneratedLevel& level, const std::string& genre) {
    std::vector<LevelPath> paths = findPlayerPaths(level);
    Field2D difficulty = analyzeDifficultyZones(level, paths);
    Field2D visibility = computeVisibilityMap(level, paths);
    LevelPath first = paths.empty() ? LevelPath{} : paths.front();

    return PlacementContext{level, canonicalGenre(genre), std::move(paths), std::move(first),
                            std::move(difficulty), std::move(visibility)};
}

int PlacementStats::totalRequested() const {
    int n = 0;
    for (const auto& kv : perType) n += kv.second.requested;
    return n;
}

int PlacementStats::totalPlaced() const {
    int n = 0;
    for (const auto& kv : perType) n += kv.second.placed;
    return n;
}
