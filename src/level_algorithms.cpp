#include "level_algorithms.hpp"

#include <sstream>

namespace procgen {

const std::map<std::string, LevelAlgorithm>& levelAlgorithms() {
    static const std::map<std::string, LevelAlgorithm> table = [] {
        std::map<std::string, LevelAlgorithm> t;
        t["cellular"] = {"cellular", 3, 3, generateCellular};
        t["perlin"]   = {"perlin",   1, 1, generateNoiseTerrain};
        t["maze"]     = {"maze",     3, 3, generateMaze};
        t["wfc"]      = {"wfc",      1, 1, generatePatternCollapse};
        t["hybrid"]   = {"hybrid",   8, 8, generateHybrid};

        t["noise"]   = t["perlin"];
        t["pattern"] = t["wfc"];
        return t;
    }();
    return table;
}

std::vector<std::string> levelAlgorithmTags() {
    return {"cellular", "perlin", "maze", "wfc", "hybrid"};
}

const LevelAlgorithm* findLevelAlgorithm(const std::string& tag) {
    const auto& t = levelAlgorithms();
    auto it = t.find(tag);
    return it == t.end() ? nullptr : &it->second;
}

bool validateGenerationConfig(const GenerationConfig& cfg, std::string* err) {
    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    const LevelAlgorithm* algo = findLevelAlgorithm(cfg.algorithm);
    if (!algo) return fail("Unknown algorithm: '" + cfg.algorithm + "'");

    if (cfg.width <= 0 || cfg.height <= 0) {
        std::ostringstream ss;
        ss << "Level dimensions must be positive (got " << cfg.width << "x" << cfg.height << ")";
        return fail(ss.str());
    }
    if (cfg.width < algo->minWidth || cfg.height < algo->minHeight) {
        std::ostringstream ss;
        ss << "Algorithm '" << algo->tag << "' needs at least " << algo->minWidth << "x" << algo->minHeight
           << " (got " << cfg.width << "x" << cfg.height << ")";
        return fail(ss.str());
    }

    if (!(cfg.wallProbability >= 0.0f && cfg.wallProbability <= 1.0f)) return fail("wall_probability must be in [0,1]");
    if (cfg.iterations < 0) return fail("iterations must be >= 0");
    if (!(cfg.noiseScale > 0.0f)) return fail("noise_scale must be > 0");
    if (cfg.octaves < 1) return fail("octaves must be >= 1");
    if (!(cfg.persistence > 0.0f)) return fail("persistence must be > 0");
    if (!(cfg.lacunarity > 0.0f)) return fail("lacunarity must be > 0");
    if (cfg.roomCount < 0) return fail("room_count must be >= 0");
    if (cfg.corridorWidth < 1) return fail("corridor_width must be >= 1");
    if (cfg.patternSize != 3) return fail("pattern_size: only 3x3 exemplars are supported");

    return true;
}

} // namespace procgen
