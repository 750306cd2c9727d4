#pragma once
#include "common.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Numeric codes are shared with the external export serializers; append-only.
enum class TileType : uint8_t {
    Empty = 0,
    Wall,
    Floor,
    Door,
    Water,
    Obstacle,
    Spawn,
    Goal,
    Secret,
    Trap,
};

constexpr int TILE_TYPE_COUNT = 10;

const char* tileTypeName(TileType t);
char tileGlyph(TileType t);

// Tiles a character can stand on. Secret and Trap tiles are not walkable.
inline bool isWalkableTile(TileType t) {
    return t == TileType::Floor || t == TileType::Door || t == TileType::Spawn || t == TileType::Goal;
}

class TileGrid {
public:
    int width = 0;
    int height = 0;
    std::vector<TileType> tiles;

    TileGrid() = default;
    TileGrid(int w, int h, TileType fill = TileType::Empty);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }
    bool inBounds(const Vec2i& p) const { return inBounds(p.x, p.y); }

    TileType& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    TileType at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    // Out-of-bounds queries are answered as "not walkable" / "not wall".
    bool isWalkable(int x, int y) const { return inBounds(x, y) && isWalkableTile(at(x, y)); }
    bool isWall(int x, int y) const { return inBounds(x, y) && at(x, y) == TileType::Wall; }

    void fill(TileType t);
    void fillBorder(TileType t);

    int count(TileType t) const;
    int countWalkable() const;

    // Row-major (y, then x) list of every tile of the given type.
    std::vector<Vec2i> positionsOf(TileType t) const;

    bool operator==(const TileGrid& o) const {
        return width == o.width && height == o.height && tiles == o.tiles;
    }
    bool operator!=(const TileGrid& o) const { return !(*this == o); }
};

// Dense per-tile scalar field kept apart from the tile grid so analyses can be
// recomputed without touching level state.
struct Field2D {
    int width = 0;
    int height = 0;
    std::vector<float> values;

    Field2D() = default;
    Field2D(int w, int h, float v = 0.0f)
        : width(w), height(h), values(static_cast<size_t>(w > 0 && h > 0 ? w * h : 0), v) {}

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    float& at(int x, int y) { return values[static_cast<size_t>(y * width + x)]; }
    float at(int x, int y) const { return values[static_cast<size_t>(y * width + x)]; }

    bool empty() const { return values.empty(); }
    float maxValue() const;
    bool allZero() const;

    // Divides by the field maximum. An all-zero (or empty) field is left as-is.
    void normalizeByMax();
};

std::string gridToAscii(const TileGrid& g);
