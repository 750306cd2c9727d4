#pragma once

#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

// Deterministic coherent noise (hash-lattice value noise + fractal sum).
// Pure functions of (seed, x, y): no tables, no global state.

namespace procgen {

inline float lerp(float a, float b, float t) { return a + (b - a) * t; }

inline float smoothstep(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

inline uint32_t hashCoord(uint32_t seed, int x, int y) {
    uint32_t h = seed;
    h = hashCombine(h, static_cast<uint32_t>(x));
    h = hashCombine(h, static_cast<uint32_t>(y));
    return hash32(h);
}

// 2D value noise, smoothed, in [-1,1].
inline float valueNoise(uint32_t seed, float x, float y) {
    const int x0 = static_cast<int>(std::floor(x));
    const int y0 = static_cast<int>(std::floor(y));
    const int x1 = x0 + 1;
    const int y1 = y0 + 1;

    const float tx = smoothstep(x - static_cast<float>(x0));
    const float ty = smoothstep(y - static_cast<float>(y0));

    const float v00 = rand01(hashCoord(seed, x0, y0));
    const float v10 = rand01(hashCoord(seed, x1, y0));
    const float v01 = rand01(hashCoord(seed, x0, y1));
    const float v11 = rand01(hashCoord(seed, x1, y1));

    const float vx0 = lerp(v00, v10, tx);
    const float vx1 = lerp(v01, v11, tx);
    return lerp(vx0, vx1, ty) * 2.0f - 1.0f;
}

// Fractal Brownian motion in [-1,1].
//  - persistence: amplitude multiplier per octave
//  - lacunarity:  frequency multiplier per octave
// Each octave samples an independent lattice and a fixed sub-cell offset so
// integer sample coordinates do not land on lattice points.
inline float fbm(uint32_t seed, float x, float y, int octaves, float persistence, float lacunarity) {
    float sum = 0.0f;
    float amp = 1.0f;
    float freq = 1.0f;
    float norm = 0.0f;

    const int o = std::max(1, octaves);
    for (int i = 0; i < o; ++i) {
        const uint32_t s = hashCombine(seed, static_cast<uint32_t>(i) * 0x9E3779B9u);
        sum += valueNoise(s, x * freq + 0.37f, y * freq + 0.61f) * amp;
        norm += amp;
        amp *= persistence;
        freq *= lacunarity;
    }

    if (norm > 0.0f) sum /= norm;
    return std::clamp(sum, -1.0f, 1.0f);
}

} // namespace procgen
