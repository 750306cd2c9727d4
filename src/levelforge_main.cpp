#include "level.hpp"
#include "level_config.hpp"
#include "level_generator.hpp"
#include "level_preview.hpp"
#include "object_placement.hpp"
#include "version.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --algorithm <tag>            cellular | perlin | maze | wfc | hybrid. Default: wfc.\n"
        << "  --width <n>                  Level width in tiles. Default: 32.\n"
        << "  --height <n>                 Level height in tiles. Default: 32.\n"
        << "  --seed <n>                   RNG seed (default: time based, printed).\n"
        << "  --genre <name>               cyberpunk | fantasy | horror | postapocalyptic.\n"
        << "  --config <path>              Level config INI (command line flags win).\n"
        << "  --objects                    Place objects and print placement stats.\n"
        << "  --bmp <path>                 Write a level preview BMP.\n"
        << "  --placement-bmp <path>       Write a placement preview BMP (implies --objects).\n"
        << "  --ascii                      Print the level as ASCII.\n"
        << "  --write-default-config <path> Write a commented default level config and exit.\n"
        << "  --version                    Print version.\n"
        << "  --help                       Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static void printLevelSummary(const GeneratedLevel& lvl) {
    std::cout << "Level " << lvl.width << "x" << lvl.height
              << " algorithm=" << lvl.metadata.at("algorithm")
              << " genre=" << lvl.metadata.at("genre")
              << " seed=" << lvl.metadata.at("seed") << "\n";
    std::cout << "  walkable: " << lvl.tiles.countWalkable() << "\n";

    std::cout << "  spawn:";
    for (const Vec2i& p : lvl.spawnPoints) std::cout << " (" << p.x << "," << p.y << ")";
    std::cout << "\n  goal:";
    for (const Vec2i& p : lvl.goalPoints) std::cout << " (" << p.x << "," << p.y << ")";
    std::cout << "\n";

    for (const auto& kv : lvl.specialAreas) {
        std::cout << "  " << kv.first << ": " << kv.second.size() << "\n";
    }
}

static void printPlacementSummary(const std::vector<GameObject>& objects, const PlacementStats& stats) {
    std::cout << "Objects: " << stats.totalPlaced() << " placed of " << stats.totalRequested() << " requested\n";
    for (const auto& kv : stats.perType) {
        std::cout << "  " << objectTypeName(kv.first)
                  << ": " << kv.second.placed << "/" << kv.second.requested
                  << " (" << kv.second.candidates << " candidates)\n";
    }
    for (const GameObject& o : objects) {
        std::cout << "  " << o.id << " @ (" << o.pos.x << "," << o.pos.y << ")";
        for (const auto& p : o.properties) {
            std::cout << " " << p.first << "=" << propertyToString(p.second);
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::string genre;
    bool genreSet = false;
    std::string bmpPath;
    std::string placementBmpPath;
    bool placeObjects = false;
    bool ascii = false;

    // Generation flags, applied on top of the config file in command line order.
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << LEVELFORGE_APPNAME << " " << LEVELFORGE_VERSION << "\n";
            return 0;
        } else if (a == "--algorithm" || a == "--width" || a == "--height" || a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a value\n";
                return 2;
            }
            overrides.push_back({a.substr(2), v});
        } else if (a == "--genre") {
            if (!argValue(i, argc, argv, genre)) {
                std::cerr << "--genre requires a value\n";
                return 2;
            }
            genreSet = true;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--objects") {
            placeObjects = true;
        } else if (a == "--bmp") {
            if (!argValue(i, argc, argv, bmpPath)) {
                std::cerr << "--bmp requires a path\n";
                return 2;
            }
        } else if (a == "--placement-bmp") {
            if (!argValue(i, argc, argv, placementBmpPath)) {
                std::cerr << "--placement-bmp requires a path\n";
                return 2;
            }
            placeObjects = true;
        } else if (a == "--ascii") {
            ascii = true;
        } else if (a == "--write-default-config") {
            std::string path;
            if (!argValue(i, argc, argv, path)) {
                std::cerr << "--write-default-config requires a path\n";
                return 2;
            }
            std::string err;
            if (!writeDefaultLevelConfig(path, &err)) {
                std::cerr << err << "\n";
                return 1;
            }
            std::cout << "Wrote " << path << "\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    LevelConfigFile file;
    if (!configPath.empty()) {
        std::string err;
        std::string warnings;
        if (!loadLevelConfigIni(configPath, file, &err, &warnings)) {
            std::cerr << err << "\n";
            return 1;
        }
        if (!warnings.empty()) {
            std::cerr << "Warnings in " << configPath << ":\n" << warnings;
        }
    }

    GenerationConfig cfg = file.generation;
    for (const auto& kv : overrides) {
        std::string err;
        if (!applyConfigParam(cfg, kv.first, kv.second, &err)) {
            std::cerr << "Invalid --" << kv.first << ": " << err << "\n";
            return 2;
        }
    }

    ScenarioInput scenario;
    scenario.genre = genreSet ? genre : file.genre;

    LevelGenerator generator;
    GeneratedLevel level;
    std::string err;
    if (!generator.generateLevel(scenario, cfg, level, &err)) {
        std::cerr << "Level generation failed: " << err << "\n";
        return 1;
    }

    printLevelSummary(level);
    if (ascii) std::cout << levelToAscii(level);

    if (!bmpPath.empty()) {
        if (!exportLevelPreviewBmp(level, bmpPath, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        std::cout << "Wrote " << bmpPath << "\n";
    }

    if (placeObjects) {
        // Placement draws from its own stream so the layout does not shift it.
        RNG rng(hashCombine(static_cast<uint32_t>(std::stoul(level.metadata.at("seed"))), "PLACEMENT"_tag));
        ObjectPlacementEngine engine;
        PlacementStats stats;
        const std::vector<GameObject> objects =
            engine.placeObjects(level, scenario, rng, &file.objectCounts, &stats);
        printPlacementSummary(objects, stats);

        if (!placementBmpPath.empty()) {
            if (!exportPlacementPreviewBmp(level, objects, placementBmpPath, &err)) {
                std::cerr << err << "\n";
                return 1;
            }
            std::cout << "Wrote " << placementBmpPath << "\n";
        }
    }

    return 0;
}
