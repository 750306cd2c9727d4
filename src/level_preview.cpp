#include "level_preview.hpp"

#include "sdl.hpp"

#include <algorithm>

namespace {

// Owns an RGBA surface sized for a tile grid.
class PreviewSurface {
public:
    PreviewSurface(int w, int h)
        : surface_(SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32)) {}
    ~PreviewSurface() {
        if (surface_) SDL_FreeSurface(surface_);
    }

    PreviewSurface(const PreviewSurface&) = delete;
    PreviewSurface& operator=(const PreviewSurface&) = delete;

    SDL_Surface* get() const { return surface_; }

    void fillRect(int x, int y, int w, int h, const Color& c) {
        SDL_Rect r{x, y, w, h};
        SDL_FillRect(surface_, &r, SDL_MapRGBA(surface_->format, c.r, c.g, c.b, c.a));
    }

    void outlineRect(int x, int y, int w, int h, int t, const Color& c) {
        fillRect(x, y, w, t, c);
        fillRect(x, y + h - t, w, t, c);
        fillRect(x, y, t, h, c);
        fillRect(x + w - t, y, t, h, c);
    }

private:
    SDL_Surface* surface_ = nullptr;
};

Color muted(const Color& c) {
    return {static_cast<uint8_t>(c.r / 2 + 40),
            static_cast<uint8_t>(c.g / 2 + 40),
            static_cast<uint8_t>(c.b / 2 + 40),
            255};
}

bool checkExportArgs(const GeneratedLevel& level, int scale, std::string* err) {
    if (level.tiles.width <= 0 || level.tiles.height <= 0) {
        if (err) *err = "Level is empty";
        return false;
    }
    if (scale < 1) {
        if (err) *err = "Preview scale must be >= 1";
        return false;
    }
    return true;
}

bool saveSurface(const PreviewSurface& s, const std::string& path, std::string* err) {
    if (SDL_SaveBMP(s.get(), path.c_str()) != 0) {
        if (err) *err = "SDL_SaveBMP failed for " + path + ": " + SDL_GetError();
        return false;
    }
    return true;
}

void drawTiles(PreviewSurface& s, const TileGrid& g, int scale, bool dim) {
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const Color c = tilePreviewColor(g.at(x, y));
            s.fillRect(x * scale, y * scale, scale, scale, dim ? muted(c) : c);
        }
    }
}

} // namespace

Color tilePreviewColor(TileType t) {
    switch (t) {
        case TileType::Empty:    return {0, 0, 0, 255};
        case TileType::Wall:     return {128, 128, 128, 255};
        case TileType::Floor:    return {255, 255, 255, 255};
        case TileType::Door:     return {139, 69, 19, 255};
        case TileType::Water:    return {0, 0, 255, 255};
        case TileType::Obstacle: return {165, 42, 42, 255};
        case TileType::Spawn:    return {0, 255, 0, 255};
        case TileType::Goal:     return {255, 0, 0, 255};
        case TileType::Secret:   return {255, 0, 255, 255};
        case TileType::Trap:     return {255, 165, 0, 255};
    }
    return {0, 0, 0, 255};
}

Color objectPreviewColor(ObjectType t) {
    switch (t) {
        case ObjectType::Enemy:       return {220, 30, 30, 255};
        case ObjectType::Item:        return {30, 120, 255, 255};
        case ObjectType::Treasure:    return {255, 215, 0, 255};
        case ObjectType::Trap:        return {255, 120, 0, 255};
        case ObjectType::Decoration:  return {150, 90, 200, 255};
        case ObjectType::Interactive: return {0, 200, 200, 255};
        case ObjectType::QuestObject: return {255, 105, 180, 255};
        case ObjectType::Checkpoint:  return {0, 180, 0, 255};
        case ObjectType::LightSource: return {255, 255, 150, 255};
        case ObjectType::Cover:       return {100, 70, 40, 255};
    }
    return {255, 255, 255, 255};
}

bool exportLevelPreviewBmp(const GeneratedLevel& level, const std::string& path,
                           std::string* err, int scale) {
    if (!checkExportArgs(level, scale, err)) return false;

    const TileGrid& g = level.tiles;
    PreviewSurface s(g.width * scale, g.height * scale);
    if (!s.get()) {
        if (err) *err = std::string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError();
        return false;
    }

    drawTiles(s, g, scale, false);

    const int t = std::max(1, scale / 5);
    for (const Vec2i& p : level.spawnPoints) {
        if (level.inBounds(p)) s.outlineRect(p.x * scale, p.y * scale, scale, scale, t, tilePreviewColor(TileType::Spawn));
    }
    for (const Vec2i& p : level.goalPoints) {
        if (level.inBounds(p)) s.outlineRect(p.x * scale, p.y * scale, scale, scale, t, tilePreviewColor(TileType::Goal));
    }

    return saveSurface(s, path, err);
}

bool exportPlacementPreviewBmp(const GeneratedLevel& level,
                               const std::vector<GameObject>& objects,
                               const std::string& path,
                               std::string* err,
                               int scale) {
    if (!checkExportArgs(level, scale, err)) return false;

    const TileGrid& g = level.tiles;
    PreviewSurface s(g.width * scale, g.height * scale);
    if (!s.get()) {
        if (err) *err = std::string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError();
        return false;
    }

    drawTiles(s, g, scale, true);

    const int inset = std::max(1, scale / 4);
    for (const GameObject& o : objects) {
        if (!level.inBounds(o.pos)) continue;
        s.fillRect(o.pos.x * scale + inset, o.pos.y * scale + inset,
                   scale - 2 * inset, scale - 2 * inset, objectPreviewColor(o.type));
    }

    return saveSurface(s, path, err);
}
