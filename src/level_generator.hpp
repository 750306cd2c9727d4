#pragma once

#include "level.hpp"
#include "rng.hpp"

#include <map>
#include <string>
#include <vector>

// Generation-side genre table. Fields left at their "unset" values do not
// touch the config.
struct GenreLevelProfile {
    const char* genre = "";
    // < 0: unset
    float wallProbability = -1.0f;
    // 0: unset
    int corridorWidth = 0;
    // Scattered over Floor after generation, cycling through the list.
    std::vector<TileType> specialTiles;
};

const std::vector<GenreLevelProfile>& genreLevelProfiles();

// nullptr when the (canonicalized) genre has no profile.
const GenreLevelProfile* findGenreLevelProfile(const std::string& genre);

class LevelGenerator {
public:
    static constexpr int SPAWN_POINT_COUNT = 3;
    static constexpr int GOAL_POINT_COUNT = 2;
    static constexpr int MAX_SPECIAL_TILES = 5;

    // Genre table first, then cfg.genreModifiers. A modifier that does not
    // parse is a configuration error.
    static bool applyGenreModifiers(GenerationConfig& cfg, const std::string& genre,
                                    std::string* err = nullptr);

    // Seeds from config.seed, or from the clock when unset. The seed actually
    // used is recorded in out.metadata["seed"].
    bool generateLevel(const ScenarioInput& scenario,
                       const GenerationConfig& config,
                       GeneratedLevel& out,
                       std::string* err = nullptr) const;

    // Draws only from `rng` (config.seed is ignored). metadata["seed"] is the
    // RNG state on entry, so RNG(seed) replays the call.
    bool generateLevel(const ScenarioInput& scenario,
                       const GenerationConfig& config,
                       RNG& rng,
                       GeneratedLevel& out,
                       std::string* err = nullptr) const;

    // Returns a copy with min(floorCount / 10, 5) distinct Floor tiles
    // replaced by the genre's special tiles. Unchanged for genres without any.
    static TileGrid scatterSpecialTiles(const TileGrid& g, const std::vector<TileType>& special, RNG& rng);

    // Floor tiles closest to a grid corner.
    static std::vector<Vec2i> findSpawnPoints(const TileGrid& g);

    // Existing Goal tiles, else the Floor tiles farthest from every corner.
    static std::vector<Vec2i> findGoalPoints(const TileGrid& g);

    static std::map<std::string, std::vector<Vec2i>> collectSpecialAreas(const TileGrid& g);
};
