#pragma once

#include "level.hpp"
#include "rng.hpp"
#include "tile_grid.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

// Base-layout generators.
//
// Every generator is a pure function of (config, rng): it allocates a fresh
// grid, never reads global state, and advances only the RNG it is handed.
// The same seed + config therefore always yields the same grid.
//
// Callers are expected to validate the config first (validateGenerationConfig);
// the generators themselves assume sane dimensions.

namespace procgen {

using LevelAlgorithmFn = std::function<TileGrid(const GenerationConfig& cfg, RNG& rng)>;

struct LevelAlgorithm {
    const char* tag = "";
    // Smallest requested size the generator can produce a meaningful grid for.
    int minWidth = 1;
    int minHeight = 1;
    LevelAlgorithmFn generate;
};

// Random Wall/Floor fill, smoothed with the 4-5 rule, outer ring forced to Wall.
TileGrid generateCellular(const GenerationConfig& cfg, RNG& rng);

// Fractal noise thresholded into Water / Floor / Obstacle / Wall.
TileGrid generateNoiseTerrain(const GenerationConfig& cfg, RNG& rng);

// Perfect maze (iterative backtracker). Even dimensions shrink by one so the
// grid has odd width and height.
TileGrid generateMaze(const GenerationConfig& cfg, RNG& rng);

// Exemplar-driven wave function collapse over Floor / Wall / Door.
TileGrid generatePatternCollapse(const GenerationConfig& cfg, RNG& rng);

// Cellular base + non-overlapping rooms + L corridors + noise obstacles.
TileGrid generateHybrid(const GenerationConfig& cfg, RNG& rng);

// Floor-carves an L-shaped corridor from a to b. Each leg is `width` tiles
// thick, centered on its axis (even widths lean towards +x / +y).
void carveLCorridor(TileGrid& g, Vec2i a, Vec2i b, int width, bool horizontalFirst);

// Tag -> generator table. Includes the aliases "noise" (perlin) and
// "pattern" (wfc).
const std::map<std::string, LevelAlgorithm>& levelAlgorithms();

// Canonical tags in a stable order (for help text and tests).
std::vector<std::string> levelAlgorithmTags();

// nullptr for unknown tags.
const LevelAlgorithm* findLevelAlgorithm(const std::string& tag);

// Rejects unknown algorithm tags, dimensions below the algorithm's minimum,
// and out-of-range parameters. Nothing is allocated.
bool validateGenerationConfig(const GenerationConfig& cfg, std::string* err = nullptr);

} // namespace procgen
