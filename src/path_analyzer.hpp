#pragma once

#include "common.hpp"
#include "level.hpp"

#include <functional>
#include <vector>

// A* helpers for 8-way grid pathing.
//
// Conventions:
//   - passable(x,y) returns true if the tile can be entered. The start tile
//     is never tested; the goal tile is.
//   - Orthogonal steps cost 1, diagonal steps cost sqrt(2). Diagonals may
//     cut corners.
//   - The heuristic is Manhattan distance; open-set ties on f are broken by
//     insertion order (first pushed, first expanded).

using PassableFn = std::function<bool(int x, int y)>;

// Returns a path including {start, ..., goal}. Empty on failure.
std::vector<Vec2i> astarPath(
    int width,
    int height,
    Vec2i start,
    Vec2i goal,
    const PassableFn& passable);

// One path per (spawn, goal) pair, spawn-major, over walkable tiles.
// Pairs with no connection contribute nothing. Never mutates the level.
std::vector<std::vector<Vec2i>> findPlayerPaths(const GeneratedLevel& level);
