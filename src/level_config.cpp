#include "level_config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace {

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(n);
    return true;
}

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string s = trim(v);
    if (s.empty() || s[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long n = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (n > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(n);
    return true;
}

bool parseFloat(const std::string& v, float& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const float f = std::strtof(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = f;
    return true;
}

std::string formatFloat(float f) {
    std::ostringstream ss;
    ss << f;
    return ss.str();
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

void clampForFile(GenerationConfig& c) {
    c.width = std::clamp(c.width, 1, 1024);
    c.height = std::clamp(c.height, 1, 1024);
    c.wallProbability = std::clamp(c.wallProbability, 0.0f, 1.0f);
    c.iterations = std::clamp(c.iterations, 0, 50);
    c.noiseScale = std::clamp(c.noiseScale, 0.001f, 10.0f);
    c.octaves = std::clamp(c.octaves, 1, 12);
    c.persistence = std::clamp(c.persistence, 0.01f, 1.0f);
    c.lacunarity = std::clamp(c.lacunarity, 1.0f, 8.0f);
    c.roomCount = std::clamp(c.roomCount, 0, 64);
    c.corridorWidth = std::clamp(c.corridorWidth, 1, 8);
}

const std::string COUNT_PREFIX = "count_";
const std::string GENRE_PREFIX = "genre_";

} // namespace

bool applyConfigParam(GenerationConfig& cfg, const std::string& key, const std::string& value,
                      std::string* err) {
    const std::string k = toLower(trim(key));
    const std::string v = trim(value);

    auto intParam = [&](int& dst) {
        int n = 0;
        if (!parseInt(v, n)) {
            setErr(err, "Bad integer for " + k + ": " + v);
            return false;
        }
        dst = n;
        return true;
    };
    auto floatParam = [&](float& dst) {
        float f = 0.0f;
        if (!parseFloat(v, f)) {
            setErr(err, "Bad number for " + k + ": " + v);
            return false;
        }
        dst = f;
        return true;
    };

    if (k == "width") return intParam(cfg.width);
    if (k == "height") return intParam(cfg.height);
    if (k == "iterations") return intParam(cfg.iterations);
    if (k == "octaves") return intParam(cfg.octaves);
    if (k == "pattern_size") return intParam(cfg.patternSize);
    if (k == "room_count") return intParam(cfg.roomCount);
    if (k == "corridor_width") return intParam(cfg.corridorWidth);
    if (k == "wall_probability") return floatParam(cfg.wallProbability);
    if (k == "noise_scale") return floatParam(cfg.noiseScale);
    if (k == "persistence") return floatParam(cfg.persistence);
    if (k == "lacunarity") return floatParam(cfg.lacunarity);

    if (k == "algorithm") {
        if (v.empty()) {
            setErr(err, "Empty algorithm");
            return false;
        }
        cfg.algorithm = toLower(v);
        return true;
    }

    if (k == "seed") {
        uint32_t s = 0;
        if (!parseU32(v, s)) {
            setErr(err, "Bad seed: " + v);
            return false;
        }
        cfg.seed = s;
        return true;
    }

    setErr(err, "Unknown generation parameter: " + k);
    return false;
}

std::map<std::string, std::string> configParams(const GenerationConfig& cfg) {
    std::map<std::string, std::string> m;
    m["width"] = std::to_string(cfg.width);
    m["height"] = std::to_string(cfg.height);
    m["algorithm"] = cfg.algorithm;
    m["wall_probability"] = formatFloat(cfg.wallProbability);
    m["iterations"] = std::to_string(cfg.iterations);
    m["noise_scale"] = formatFloat(cfg.noiseScale);
    m["octaves"] = std::to_string(cfg.octaves);
    m["persistence"] = formatFloat(cfg.persistence);
    m["lacunarity"] = formatFloat(cfg.lacunarity);
    m["pattern_size"] = std::to_string(cfg.patternSize);
    m["room_count"] = std::to_string(cfg.roomCount);
    m["corridor_width"] = std::to_string(cfg.corridorWidth);
    return m;
}

bool loadLevelConfigIni(const std::string& path, LevelConfigFile& out,
                        std::string* err, std::string* outWarnings) {
    out = LevelConfigFile{};

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        setErr(err, "Could not open level config: " + path);
        return false;
    }

    std::string warnings;
    int warnCount = 0;

    std::string line;
    for (int lineNo = 1; std::getline(f, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);

        // Strip comments (# or ;)
        const size_t hash = line.find('#');
        const size_t semi = line.find(';');
        const size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                                    semi == std::string::npos ? line.size() : semi);
        line = trim(line.substr(0, cut));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));
        if (key.empty()) {
            appendWarning(warnings, lineNo, "Empty key", warnCount);
            continue;
        }

        if (key == "genre") {
            out.genre = val;
            continue;
        }

        if (key.compare(0, COUNT_PREFIX.size(), COUNT_PREFIX) == 0) {
            ObjectType t = ObjectType::Enemy;
            if (!parseObjectType(key.substr(COUNT_PREFIX.size()), t)) {
                appendWarning(warnings, lineNo, "Unknown object type: " + key.substr(COUNT_PREFIX.size()), warnCount);
                continue;
            }
            int n = 0;
            if (!parseInt(val, n)) {
                appendWarning(warnings, lineNo, "Bad count for " + key + ": " + val, warnCount);
                continue;
            }
            out.objectCounts[t] = std::clamp(n, 0, 10000);
            continue;
        }

        if (key.compare(0, GENRE_PREFIX.size(), GENRE_PREFIX) == 0) {
            const std::string param = key.substr(GENRE_PREFIX.size());
            GenerationConfig probe;
            std::string perr;
            if (!applyConfigParam(probe, param, val, &perr)) {
                appendWarning(warnings, lineNo, perr, warnCount);
                continue;
            }
            out.generation.genreModifiers[param] = val;
            continue;
        }

        std::string perr;
        if (!applyConfigParam(out.generation, key, val, &perr)) {
            appendWarning(warnings, lineNo, perr, warnCount);
        }
    }

    clampForFile(out.generation);

    if (outWarnings) *outWarnings = warnings;
    return true;
}

bool writeDefaultLevelConfig(const std::string& path, std::string* err) {
    std::ofstream f(path);
    if (!f) {
        setErr(err, "Could not write level config: " + path);
        return false;
    }

    f << R"INI(# LevelForge level config
#
# Lines are: key = value
# Comments start with # or ;

# Narrative genre: cyberpunk | fantasy | horror | postapocalyptic
genre = fantasy

# Layout
# algorithm: cellular | perlin | maze | wfc | hybrid
algorithm = wfc
width = 32
height = 32
# seed = 12345

# Cellular automaton
wall_probability = 0.45
iterations = 5

# Noise terrain
noise_scale = 0.1
octaves = 4
persistence = 0.5
lacunarity = 2.0

# Pattern collapse (only 3 is supported)
pattern_size = 3

# Hybrid
room_count = 5
corridor_width = 2

# Overrides applied after the genre table, e.g.
# genre_wall_probability = 0.5

# Explicit object counts. Leave all unset to derive them from walkable area.
# count_enemy = 6
# count_item = 8
# count_trap = 3
# count_treasure = 2
# count_decoration = 10
)INI";

    if (!f) {
        setErr(err, "Failed while writing level config: " + path);
        return false;
    }
    return true;
}
