#pragma once
#include "tile_grid.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct GenerationConfig {
    int width = 32;
    int height = 32;
    // cellular | perlin | maze | wfc | hybrid (see levelAlgorithmTags()).
    std::string algorithm = "wfc";
    // Unset: the generator picks one and records it in the level metadata.
    std::optional<uint32_t> seed;

    // Cellular automaton
    float wallProbability = 0.45f;
    int iterations = 5;

    // Noise terrain
    float noiseScale = 0.1f;
    int octaves = 4;
    float persistence = 0.5f;
    float lacunarity = 2.0f;

    // Pattern collapse (exemplar edge length; only 3x3 exemplars ship)
    int patternSize = 3;

    // Hybrid
    int roomCount = 5;
    int corridorWidth = 2;

    // Per-request overrides applied after the genre table.
    // Keys are the same as the INI keys (wall_probability, corridor_width, ...).
    std::map<std::string, std::string> genreModifiers;
};

// Only `genre` is read by the level/placement engine; the other fields belong
// to the narrative pipeline and are carried through untouched.
struct ScenarioInput {
    std::string genre;
    std::string hero;
    std::string goal;
    std::string language = "ru";
};

struct GeneratedLevel {
    TileGrid tiles;
    int width = 0;
    int height = 0;
    std::vector<Vec2i> spawnPoints;
    std::vector<Vec2i> goalPoints;
    // "secret" | "trap" | "water" -> coordinates (row-major). Empty groups are omitted.
    std::map<std::string, std::vector<Vec2i>> specialAreas;
    // algorithm, genre, seed, plus one entry per generation parameter.
    std::map<std::string, std::string> metadata;

    bool inBounds(const Vec2i& p) const { return tiles.inBounds(p); }
};

// Trims, lower-cases (ASCII and Cyrillic) and resolves aliases onto the canonical genre keys:
// "cyberpunk", "fantasy", "horror", "postapocalyptic". The Russian genre
// names used by the narrative pipeline are accepted as aliases.
// Unknown genres come back normalized but otherwise unchanged.
std::string canonicalGenre(const std::string& genre);

// gridToAscii with spawn points drawn as '@' and goal points as '>'.
std::string levelToAscii(const GeneratedLevel& level);
