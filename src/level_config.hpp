#pragma once

#include "level.hpp"
#include "placement.hpp"

#include <map>
#include <string>

// Generation parameters by their external (INI / metadata) names:
//   width, height, algorithm, seed, wall_probability, iterations,
//   noise_scale, octaves, persistence, lacunarity, pattern_size,
//   room_count, corridor_width
//
// Values are parsed strictly; range checks are left to
// procgen::validateGenerationConfig.
bool applyConfigParam(GenerationConfig& cfg, const std::string& key, const std::string& value,
                      std::string* err = nullptr);

// Every generation parameter except seed and genre modifiers, formatted the
// way applyConfigParam reads them back.
std::map<std::string, std::string> configParams(const GenerationConfig& cfg);

struct LevelConfigFile {
    GenerationConfig generation;
    std::string genre;
    // Empty means "derive from walkable area".
    ObjectCounts objectCounts;
};

// INI-ish level config:
//   key = value           generation parameter (see applyConfigParam)
//   genre = horror        narrative genre
//   genre_<param> = value per-request override applied after the genre table
//   count_<type> = n      explicit object count (count_enemy, count_trap, ...)
//
// Comments start with # or ;. Bad lines are skipped and reported through
// outWarnings; numeric values are clamped to sane ranges.
// Returns false only if the file cannot be read.
bool loadLevelConfigIni(const std::string& path, LevelConfigFile& out,
                        std::string* err = nullptr, std::string* outWarnings = nullptr);

bool writeDefaultLevelConfig(const std::string& path, std::string* err = nullptr);
