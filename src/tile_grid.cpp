#include "tile_grid.hpp"

#include <algorithm>

const char* tileTypeName(TileType t) {
    switch (t) {
        case TileType::Empty:    return "empty";
        case TileType::Wall:     return "wall";
        case TileType::Floor:    return "floor";
        case TileType::Door:     return "door";
        case TileType::Water:    return "water";
        case TileType::Obstacle: return "obstacle";
        case TileType::Spawn:    return "spawn";
        case TileType::Goal:     return "goal";
        case TileType::Secret:   return "secret";
        case TileType::Trap:     return "trap";
    }
    return "unknown";
}

char tileGlyph(TileType t) {
    switch (t) {
        case TileType::Empty:    return ' ';
        case TileType::Wall:     return '#';
        case TileType::Floor:    return '.';
        case TileType::Door:     return '+';
        case TileType::Water:    return '~';
        case TileType::Obstacle: return 'o';
        case TileType::Spawn:    return 'S';
        case TileType::Goal:     return 'G';
        case TileType::Secret:   return '?';
        case TileType::Trap:     return '^';
    }
    return '!';
}

TileGrid::TileGrid(int w, int h, TileType fillWith) : width(w), height(h) {
    if (width < 0) width = 0;
    if (height < 0) height = 0;
    tiles.assign(static_cast<size_t>(width * height), fillWith);
}

void TileGrid::fill(TileType t) {
    std::fill(tiles.begin(), tiles.end(), t);
}

void TileGrid::fillBorder(TileType t) {
    if (width <= 0 || height <= 0) return;
    for (int x = 0; x < width; ++x) {
        at(x, 0) = t;
        at(x, height - 1) = t;
    }
    for (int y = 0; y < height; ++y) {
        at(0, y) = t;
        at(width - 1, y) = t;
    }
}

int TileGrid::count(TileType t) const {
    return static_cast<int>(std::count(tiles.begin(), tiles.end(), t));
}

int TileGrid::countWalkable() const {
    return static_cast<int>(std::count_if(tiles.begin(), tiles.end(), isWalkableTile));
}

std::vector<Vec2i> TileGrid::positionsOf(TileType t) const {
    std::vector<Vec2i> out;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (at(x, y) == t) out.push_back({x, y});
        }
    }
    return out;
}

float Field2D::maxValue() const {
    if (values.empty()) return 0.0f;
    return *std::max_element(values.begin(), values.end());
}

bool Field2D::allZero() const {
    return std::all_of(values.begin(), values.end(), [](float v) { return v == 0.0f; });
}

void Field2D::normalizeByMax() {
    const float m = maxValue();
    if (!(m > 0.0f)) return;
    for (float& v : values) v /= m;
}

std::string gridToAscii(const TileGrid& g) {
    std::string out;
    out.reserve(static_cast<size_t>((g.width + 1) * g.height));
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) out.push_back(tileGlyph(g.at(x, y)));
        out.push_back('\n');
    }
    return out;
}
