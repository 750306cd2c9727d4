#pragma once

#include "level.hpp"
#include "tile_grid.hpp"

#include <vector>

// Ray-cast sightline counter.
//
// From a single viewpoint: 72 rays (every 5 degrees), samples at distances
// 1..radius, each sample truncated toward zero. A ray stops at the grid edge
// or at the first Wall. Every visited sample increments its tile, so tiles
// crossed by several rays accumulate.
void castVisibilityRays(const TileGrid& g, Vec2i origin, int radius, Field2D& acc);

// Aggregates castVisibilityRays (radius 7) over every second waypoint of the
// first three paths, then max-normalizes into [0,1].
Field2D computeVisibilityMap(const GeneratedLevel& level,
                             const std::vector<std::vector<Vec2i>>& paths);
