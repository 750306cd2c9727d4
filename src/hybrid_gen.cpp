#include "level_algorithms.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace procgen {

namespace {

struct Room {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }
    int cx() const { return x + w / 2; }
    int cy() const { return y + h / 2; }

    // Rectangles separated by at least `gap` tiles do not overlap.
    bool overlaps(const Room& o, int gap) const {
        return x < o.x2() + gap && o.x < x2() + gap && y < o.y2() + gap && o.y < y2() + gap;
    }
};

constexpr int MIN_ROOM = 4;
constexpr int ROOM_ATTEMPTS_PER_ROOM = 20;

std::vector<Room> placeRooms(int width, int height, int roomCount, RNG& rng) {
    std::vector<Room> rooms;
    if (roomCount <= 0) return rooms;

    const int maxW = std::max(MIN_ROOM, width / 4);
    const int maxH = std::max(MIN_ROOM, height / 4);

    const int attempts = roomCount * ROOM_ATTEMPTS_PER_ROOM;
    for (int i = 0; i < attempts && static_cast<int>(rooms.size()) < roomCount; ++i) {
        Room r;
        r.w = rng.range(MIN_ROOM, maxW);
        r.h = rng.range(MIN_ROOM, maxH);
        // Keep one tile of border on every side.
        if (r.w > width - 2 || r.h > height - 2) continue;
        r.x = rng.range(1, width - r.w - 1);
        r.y = rng.range(1, height - r.h - 1);

        bool clash = false;
        for (const Room& o : rooms) {
            if (r.overlaps(o, 1)) {
                clash = true;
                break;
            }
        }
        if (!clash) rooms.push_back(r);
    }
    return rooms;
}

void carveRect(TileGrid& g, int x, int y, int w, int h) {
    for (int yy = y; yy < y + h; ++yy) {
        for (int xx = x; xx < x + w; ++xx) {
            if (!g.inBounds(xx, yy)) continue;
            g.at(xx, yy) = TileType::Floor;
        }
    }
}

// Corridor legs are `width` tiles thick, centered on the leg's axis.
void carveH(TileGrid& g, int x1, int x2, int y, int width) {
    const int lo = -(width - 1) / 2;
    carveRect(g, std::min(x1, x2), y + lo, std::abs(x2 - x1) + 1, width);
}

void carveV(TileGrid& g, int y1, int y2, int x, int width) {
    const int lo = -(width - 1) / 2;
    carveRect(g, x + lo, std::min(y1, y2), width, std::abs(y2 - y1) + 1);
}

void connectRooms(TileGrid& g, const Room& a, const Room& b, int corridorWidth, RNG& rng) {
    const bool horizontalFirst = rng.chance(0.5f);
    carveLCorridor(g, {a.cx(), a.cy()}, {b.cx(), b.cy()}, corridorWidth, horizontalFirst);
}

} // namespace

void carveLCorridor(TileGrid& g, Vec2i a, Vec2i b, int width, bool horizontalFirst) {
    if (horizontalFirst) {
        carveH(g, a.x, b.x, a.y, width);
        carveV(g, a.y, b.y, b.x, width);
    } else {
        carveV(g, a.y, b.y, a.x, width);
        carveH(g, a.x, b.x, b.y, width);
    }
}

TileGrid generateHybrid(const GenerationConfig& cfg, RNG& rng) {
    TileGrid g = generateCellular(cfg, rng);

    const std::vector<Room> rooms = placeRooms(g.width, g.height, cfg.roomCount, rng);
    for (const Room& r : rooms) {
        carveRect(g, r.x, r.y, r.w, r.h);
    }
    for (size_t i = 1; i < rooms.size(); ++i) {
        connectRooms(g, rooms[i - 1], rooms[i], cfg.corridorWidth, rng);
    }

    // Coarse detail layer: floor under a noise "obstacle" reading becomes rubble.
    GenerationConfig noiseCfg = cfg;
    noiseCfg.noiseScale = 0.2f;
    noiseCfg.octaves = 2;
    noiseCfg.persistence = 0.5f;
    noiseCfg.lacunarity = 2.0f;
    const TileGrid detail = generateNoiseTerrain(noiseCfg, rng);
    for (size_t i = 0; i < g.tiles.size(); ++i) {
        if (g.tiles[i] == TileType::Floor && detail.tiles[i] == TileType::Obstacle) {
            g.tiles[i] = TileType::Obstacle;
        }
    }

    // Corridors may touch the ring when they are wide.
    g.fillBorder(TileType::Wall);
    return g;
}

} // namespace procgen
