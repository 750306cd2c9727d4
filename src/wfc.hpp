#pragma once

#include <algorithm>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>

#include "rng.hpp"

// ------------------------------------------------------------
// Minimal Wave Function Collapse (WFC) solver for tile grids.
//
// - Domains are stored as 32-bit bitmasks (nTiles must be <= 32).
// - Rules are per-tile, per-direction allowed-neighbor masks.
// - Greedy "lowest entropy" collapse + constraint propagation.
// - On a contradiction the attempt is abandoned and the solver restarts
//   from full domains with a fresh sub-stream.
//
// The lowest-entropy cell is tracked in an ordered set keyed by
// (entropy, per-attempt random rank), so each collapse costs O(log N)
// instead of a full grid scan.
// ------------------------------------------------------------

namespace wfc {

enum Dir : int {
    PosX = 0,
    NegX = 1,
    PosY = 2,
    NegY = 3,
};

constexpr int DIR_DX[4] = {1, -1, 0, 0};
constexpr int DIR_DY[4] = {0, 0, 1, -1};

inline int opposite(int dir) {
    return dir ^ 1;
}

inline int popcount32(uint32_t v) {
#if defined(__GNUG__) || defined(__clang__)
    return __builtin_popcount(v);
#else
    int c = 0;
    while (v) { v &= (v - 1u); ++c; }
    return c;
#endif
}

inline int ctz32(uint32_t v) {
#if defined(__GNUG__) || defined(__clang__)
    return (v == 0u) ? 32 : __builtin_ctz(v);
#else
    if (v == 0u) return 32;
    int n = 0;
    while ((v & 1u) == 0u) { v >>= 1u; ++n; }
    return n;
#endif
}

inline uint32_t allMask(int nTiles) {
    if (nTiles <= 0) return 0u;
    if (nTiles >= 32) return 0xFFFFFFFFu;
    return (1u << static_cast<uint32_t>(nTiles)) - 1u;
}

inline int pickWeightedFromMask(uint32_t mask, const std::vector<float>& weights, RNG& rng) {
    if (mask == 0u) return -1;

    float total = 0.0f;
    for (uint32_t m = mask; m != 0u; m &= (m - 1u)) {
        const size_t t = static_cast<size_t>(ctz32(m));
        total += (t < weights.size()) ? std::max(0.0f, weights[t]) : 1.0f;
    }

    // Degenerate weights: uniform over the mask.
    if (!(total > 0.0f)) {
        int pick = rng.range(0, popcount32(mask) - 1);
        for (uint32_t m = mask; m != 0u; m &= (m - 1u)) {
            if (pick-- == 0) return ctz32(m);
        }
        return ctz32(mask);
    }

    float r = rng.next01() * total;
    int last = -1;
    for (uint32_t m = mask; m != 0u; m &= (m - 1u)) {
        const int t = ctz32(m);
        last = t;
        const size_t ti = static_cast<size_t>(t);
        r -= (ti < weights.size()) ? std::max(0.0f, weights[ti]) : 1.0f;
        if (r <= 0.0f) return t;
    }
    return last;
}

inline uint32_t unionAllowed(uint32_t domain, const std::vector<uint32_t>& allowForDir) {
    uint32_t out = 0u;
    for (uint32_t m = domain; m != 0u; m &= (m - 1u)) {
        const size_t t = static_cast<size_t>(ctz32(m));
        if (t < allowForDir.size()) out |= allowForDir[t];
    }
    return out;
}

// Solve a WFC problem on a w*h grid.
//
// allow[dir][tile] is the mask of tiles permitted in the neighbor cell in
// direction `dir` (see Dir). weights[tile] biases collapse choices.
//
// Consumes exactly one draw from `rng` per attempt.
// Returns true if solved; outTiles receives per-cell tile ids, row-major.
inline bool solve(int w, int h,
                  int nTiles,
                  const std::vector<uint32_t> allow[4],
                  const std::vector<float>& weights,
                  RNG& rng,
                  std::vector<uint8_t>& outTiles,
                  int maxRestarts = 10) {
    if (w <= 0 || h <= 0) return false;
    if (nTiles <= 0 || nTiles > 32) return false;
    for (int dir = 0; dir < 4; ++dir) {
        if (allow[dir].size() != static_cast<size_t>(nTiles)) return false;
    }

    const size_t N = static_cast<size_t>(w * h);
    const uint32_t fullMask = allMask(nTiles);

    std::vector<uint32_t> dom(N, fullMask);
    std::vector<uint32_t> rank(N, 0u);
    std::set<std::pair<uint64_t, int>> open;
    std::vector<int> q;
    q.reserve(N);

    auto key = [&](size_t i) -> uint64_t {
        return (static_cast<uint64_t>(popcount32(dom[i])) << 32) | rank[i];
    };

    // Narrow cell i to newDom, keeping the open set in sync.
    auto narrow = [&](size_t i, uint32_t newDom) {
        const bool wasOpen = popcount32(dom[i]) > 1;
        if (wasOpen) open.erase({key(i), static_cast<int>(i)});
        dom[i] = newDom;
        if (popcount32(newDom) > 1) open.insert({key(i), static_cast<int>(i)});
    };

    auto propagate = [&]() -> bool {
        size_t head = 0;
        while (head < q.size()) {
            const int cur = q[head++];
            const int cx = cur % w;
            const int cy = cur / w;
            const uint32_t curDom = dom[static_cast<size_t>(cur)];
            if (curDom == 0u) return false;

            for (int dir = 0; dir < 4; ++dir) {
                const int nx = cx + DIR_DX[dir];
                const int ny = cy + DIR_DY[dir];
                if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;

                const size_t ni = static_cast<size_t>(ny * w + nx);
                const uint32_t oldDom = dom[ni];
                const uint32_t newDom = oldDom & unionAllowed(curDom, allow[dir]);
                if (newDom == 0u) return false;
                if (newDom != oldDom) {
                    narrow(ni, newDom);
                    q.push_back(static_cast<int>(ni));
                }
            }
        }
        q.clear();
        return true;
    };

    const int restartCap = std::max(0, maxRestarts);
    for (int attempt = 0; attempt <= restartCap; ++attempt) {
        RNG local(hashCombine(rng.nextU32(), "WFC_SOLVE"_tag));

        std::fill(dom.begin(), dom.end(), fullMask);
        open.clear();
        q.clear();
        for (size_t i = 0; i < N; ++i) {
            rank[i] = local.nextU32();
            if (popcount32(fullMask) > 1) open.insert({key(i), static_cast<int>(i)});
        }

        bool failed = false;
        while (!open.empty()) {
            const int cell = open.begin()->second;
            const size_t ci = static_cast<size_t>(cell);

            const int choice = pickWeightedFromMask(dom[ci], weights, local);
            if (choice < 0) {
                failed = true;
                break;
            }

            narrow(ci, 1u << static_cast<uint32_t>(choice));
            q.push_back(cell);
            if (!propagate()) {
                failed = true;
                break;
            }
        }
        if (failed) continue;

        outTiles.assign(N, 0);
        for (size_t i = 0; i < N; ++i) {
            outTiles[i] = static_cast<uint8_t>(std::min(ctz32(dom[i]), nTiles - 1));
        }
        return true;
    }

    return false;
}

} // namespace wfc
