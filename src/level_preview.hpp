#pragma once

#include "common.hpp"
#include "level.hpp"
#include "placement.hpp"

#include <string>
#include <vector>

// BMP previews of generated levels (SDL2 surfaces; no window or renderer).

Color tilePreviewColor(TileType t);
Color objectPreviewColor(ObjectType t);

// One `scale` x `scale` block per tile; spawn and goal points are outlined
// on top of the tiles.
bool exportLevelPreviewBmp(const GeneratedLevel& level, const std::string& path,
                           std::string* err = nullptr, int scale = 10);

// Muted tile colors with one inset marker per object.
bool exportPlacementPreviewBmp(const GeneratedLevel& level,
                               const std::vector<GameObject>& objects,
                               const std::string& path,
                               std::string* err = nullptr,
                               int scale = 8);
