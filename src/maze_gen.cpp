#include "level_algorithms.hpp"

#include <vector>

namespace procgen {

TileGrid generateMaze(const GenerationConfig& cfg, RNG& rng) {
    const int w = (cfg.width % 2 == 0) ? cfg.width - 1 : cfg.width;
    const int h = (cfg.height % 2 == 0) ? cfg.height - 1 : cfg.height;
    TileGrid g(w, h, TileType::Wall);

    // Cells live on odd coordinates; the even coordinates between two cells
    // are the walls that get knocked out.
    const int cellW = (w - 1) / 2;
    const int cellH = (h - 1) / 2;
    if (cellW <= 0 || cellH <= 0) return g;

    auto cellToPos = [&](int cx, int cy) -> Vec2i {
        return { 1 + cx * 2, 1 + cy * 2 };
    };
    auto cidx = [&](int cx, int cy) { return static_cast<size_t>(cy * cellW + cx); };

    std::vector<uint8_t> vis(static_cast<size_t>(cellW * cellH), 0);
    std::vector<Vec2i> stack;
    stack.reserve(static_cast<size_t>(cellW * cellH));

    const int startCx = rng.range(0, cellW - 1);
    const int startCy = rng.range(0, cellH - 1);
    stack.push_back({startCx, startCy});
    vis[cidx(startCx, startCy)] = 1;
    const Vec2i sp = cellToPos(startCx, startCy);
    g.at(sp.x, sp.y) = TileType::Floor;

    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};
    std::vector<Vec2i> neigh;
    neigh.reserve(4);

    while (!stack.empty()) {
        const Vec2i cur = stack.back();

        neigh.clear();
        for (const auto& dv : dirs) {
            const int nx = cur.x + dv[0];
            const int ny = cur.y + dv[1];
            if (nx < 0 || ny < 0 || nx >= cellW || ny >= cellH) continue;
            if (vis[cidx(nx, ny)] != 0) continue;
            neigh.push_back({nx, ny});
        }

        if (neigh.empty()) {
            stack.pop_back();
            continue;
        }

        const Vec2i nxt = neigh[static_cast<size_t>(rng.range(0, static_cast<int>(neigh.size()) - 1))];
        const Vec2i a = cellToPos(cur.x, cur.y);
        const Vec2i b = cellToPos(nxt.x, nxt.y);
        g.at((a.x + b.x) / 2, (a.y + b.y) / 2) = TileType::Floor;
        g.at(b.x, b.y) = TileType::Floor;
        vis[cidx(nxt.x, nxt.y)] = 1;
        stack.push_back(nxt);
    }

    return g;
}

} // namespace procgen
