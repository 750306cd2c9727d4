#pragma once

#include "level.hpp"
#include "tile_grid.hpp"

#include <vector>

// Per-tile challenge estimate in [0,1], computed over walkable tiles only.
//
// Three additive terms, then max-normalization:
//   - spawn distance: sum over spawns of min(dist / 10, 1)
//   - choke points:   (4 - n) / 4 when at most 3 of the 8 neighbors are walkable
//   - goal proximity: (5 - d) / 5 for every goal within radius 5
//
// `paths` is accepted for interface symmetry with the visibility analyzer and
// does not influence the result.
Field2D analyzeDifficultyZones(const GeneratedLevel& level,
                               const std::vector<std::vector<Vec2i>>& paths);
