#include "difficulty_zones.hpp"
#include "level.hpp"
#include "level_algorithms.hpp"
#include "level_config.hpp"
#include "level_generator.hpp"
#include "level_preview.hpp"
#include "noise.hpp"
#include "object_placement.hpp"
#include "path_analyzer.hpp"
#include "placement_optimizer.hpp"
#include "rng.hpp"
#include "visibility_map.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <queue>
#include <set>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

GenerationConfig makeConfig(const std::string& algorithm, int w, int h, uint32_t seed) {
    GenerationConfig cfg;
    cfg.algorithm = algorithm;
    cfg.width = w;
    cfg.height = h;
    cfg.seed = seed;
    return cfg;
}

bool borderIsWall(const TileGrid& g) {
    for (int x = 0; x < g.width; ++x) {
        if (g.at(x, 0) != TileType::Wall || g.at(x, g.height - 1) != TileType::Wall) return false;
    }
    for (int y = 0; y < g.height; ++y) {
        if (g.at(0, y) != TileType::Wall || g.at(g.width - 1, y) != TileType::Wall) return false;
    }
    return true;
}

// Three 3x3 floor rooms sealed from each other: walls on rows 0/4 and
// columns 0/4/8/12. Only the room centers are >= 1.5 from a wall.
GeneratedLevel makeThreeRoomLevel() {
    GeneratedLevel lvl;
    lvl.tiles = TileGrid(13, 5, TileType::Floor);
    for (int x = 0; x < 13; ++x) {
        lvl.tiles.at(x, 0) = TileType::Wall;
        lvl.tiles.at(x, 4) = TileType::Wall;
    }
    for (int y = 0; y < 5; ++y) {
        for (int x : {0, 4, 8, 12}) lvl.tiles.at(x, y) = TileType::Wall;
    }
    lvl.width = 13;
    lvl.height = 5;
    lvl.spawnPoints = {{2, 2}};
    lvl.goalPoints = {{10, 2}};
    return lvl;
}

// Open room of size w x h surrounded by a wall ring.
GeneratedLevel makeOpenLevel(int w, int h) {
    GeneratedLevel lvl;
    lvl.tiles = TileGrid(w, h, TileType::Floor);
    lvl.tiles.fillBorder(TileType::Wall);
    lvl.width = w;
    lvl.height = h;
    lvl.spawnPoints = LevelGenerator::findSpawnPoints(lvl.tiles);
    lvl.goalPoints = LevelGenerator::findGoalPoints(lvl.tiles);
    return lvl;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_generation_deterministic() {
    for (const std::string& tag : procgen::levelAlgorithmTags()) {
        const GenerationConfig cfg = makeConfig(tag, 24, 20, 99u);
        const procgen::LevelAlgorithm* algo = procgen::findLevelAlgorithm(tag);
        expect(algo != nullptr, "Missing algorithm " + tag);
        if (!algo) continue;

        RNG a(99u);
        RNG b(99u);
        const TileGrid ga = algo->generate(cfg, a);
        const TileGrid gb = algo->generate(cfg, b);
        expect(ga == gb, "Same seed should give identical grids for " + tag);
    }
}

void test_border_invariant() {
    for (const std::string tag : {"cellular", "hybrid", "maze"}) {
        for (uint32_t seed = 1; seed <= 5; ++seed) {
            const GenerationConfig cfg = makeConfig(tag, 30, 22, seed);
            RNG rng(seed);
            const TileGrid g = procgen::findLevelAlgorithm(tag)->generate(cfg, rng);
            expect(borderIsWall(g), "Outer ring should be Wall for " + tag + " seed " + std::to_string(seed));
        }
    }
}

void test_maze_is_spanning_tree() {
    LevelGenerator gen;
    GeneratedLevel lvl;
    std::string err;
    const bool ok = gen.generateLevel(ScenarioInput{}, makeConfig("maze", 20, 20, 7u), lvl, &err);
    expect(ok, "Maze generation failed: " + err);
    if (!ok) return;

    const TileGrid& g = lvl.tiles;
    expect(g.width == 19 && g.height == 19, "Maze should shrink 20x20 to 19x19");
    expect(lvl.width == 19 && lvl.height == 19, "Level dimensions should follow the maze grid");
    expect(borderIsWall(g), "Maze border should be Wall");

    // Every odd cell is carved.
    for (int y = 1; y < g.height; y += 2) {
        for (int x = 1; x < g.width; x += 2) {
            expect(g.at(x, y) == TileType::Floor, "Maze cell not carved");
        }
    }

    // Connected and acyclic: one component and edges == nodes - 1.
    int nodes = 0;
    int edges = 0;
    Vec2i start{-1, -1};
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (g.at(x, y) != TileType::Floor) continue;
            ++nodes;
            if (start.x < 0) start = {x, y};
            if (x + 1 < g.width && g.at(x + 1, y) == TileType::Floor) ++edges;
            if (y + 1 < g.height && g.at(x, y + 1) == TileType::Floor) ++edges;
        }
    }
    expect(edges == nodes - 1, "Maze floor graph should be a tree");

    std::vector<uint8_t> seen(static_cast<size_t>(g.width * g.height), 0);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * g.width + x); };
    std::queue<Vec2i> q;
    q.push(start);
    seen[idx(start.x, start.y)] = 1;
    int reached = 1;
    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};
    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop();
        for (const auto& d : dirs) {
            const int nx = p.x + d[0];
            const int ny = p.y + d[1];
            if (!g.inBounds(nx, ny) || g.at(nx, ny) != TileType::Floor) continue;
            if (seen[idx(nx, ny)]) continue;
            seen[idx(nx, ny)] = 1;
            ++reached;
            q.push({nx, ny});
        }
    }
    expect(reached == nodes, "Every maze cell should be reachable");
    expect(lvl.metadata.at("algorithm") == "maze", "Metadata algorithm");
    expect(lvl.metadata.at("seed") == "7", "Metadata seed");
}

void test_cellular_seeds() {
    GenerationConfig cfg = makeConfig("cellular", 32, 32, 1u);
    cfg.wallProbability = 0.45f;
    cfg.iterations = 5;

    LevelGenerator gen;
    GeneratedLevel a;
    GeneratedLevel b;
    GeneratedLevel c;
    expect(gen.generateLevel(ScenarioInput{}, cfg, a), "Cellular seed 1 failed");
    expect(gen.generateLevel(ScenarioInput{}, cfg, b), "Cellular seed 1 (again) failed");
    cfg.seed = 2u;
    expect(gen.generateLevel(ScenarioInput{}, cfg, c), "Cellular seed 2 failed");

    expect(a.tiles == b.tiles, "Cellular: same seed should match");
    expect(a.tiles != c.tiles, "Cellular: different seeds should differ");
    expect(a.spawnPoints == b.spawnPoints, "Cellular: same spawn points");
}

void test_bounds_invariant() {
    LevelGenerator gen;
    const char* genres[] = {"", "cyberpunk", "fantasy", "horror", "postapocalyptic"};
    for (const std::string& tag : procgen::levelAlgorithmTags()) {
        for (const char* genre : genres) {
            ScenarioInput sc;
            sc.genre = genre;
            GeneratedLevel lvl;
            std::string err;
            const bool ok = gen.generateLevel(sc, makeConfig(tag, 28, 24, 4242u), lvl, &err);
            expect(ok, "Generation failed for " + tag + ": " + err);
            if (!ok) continue;

            const std::string what = tag + "/" + genre;
            expect(lvl.width == lvl.tiles.width && lvl.height == lvl.tiles.height, "Level size mismatch " + what);
            expect(!lvl.spawnPoints.empty(), "No spawn points " + what);
            expect(!lvl.goalPoints.empty(), "No goal points " + what);
            expect(static_cast<int>(lvl.spawnPoints.size()) <= LevelGenerator::SPAWN_POINT_COUNT, "Too many spawns " + what);
            for (const Vec2i& p : lvl.spawnPoints) expect(lvl.inBounds(p), "Spawn out of bounds " + what);
            for (const Vec2i& p : lvl.goalPoints) expect(lvl.inBounds(p), "Goal out of bounds " + what);
            for (const auto& kv : lvl.specialAreas) {
                expect(!kv.second.empty(), "Empty special area listed " + what);
                for (const Vec2i& p : kv.second) expect(lvl.inBounds(p), "Special area out of bounds " + what);
            }
            expect(lvl.metadata.count("algorithm") == 1 && lvl.metadata.count("seed") == 1 &&
                   lvl.metadata.count("genre") == 1 && lvl.metadata.count("wall_probability") == 1,
                   "Metadata incomplete " + what);
        }
    }
}

void test_config_errors() {
    LevelGenerator gen;
    GeneratedLevel lvl;
    std::string err;

    expect(!gen.generateLevel(ScenarioInput{}, makeConfig("spiral", 20, 20, 1u), lvl, &err),
           "Unknown algorithm should be rejected");
    expect(err.find("spiral") != std::string::npos, "Unknown algorithm error should name the tag");

    err.clear();
    expect(!gen.generateLevel(ScenarioInput{}, makeConfig("cellular", 0, 20, 1u), lvl, &err),
           "Zero width should be rejected");
    expect(!err.empty(), "Zero width should report an error");

    err.clear();
    expect(!gen.generateLevel(ScenarioInput{}, makeConfig("wfc", 10, -3, 1u), lvl, &err),
           "Negative height should be rejected");

    GenerationConfig bad = makeConfig("cellular", 20, 20, 1u);
    bad.genreModifiers["room_count"] = "lots";
    expect(!gen.generateLevel(ScenarioInput{}, bad, lvl, &err), "Unparsable genre modifier should be rejected");

    expect(procgen::findLevelAlgorithm("noise") != nullptr, "'noise' alias");
    expect(procgen::findLevelAlgorithm("pattern") != nullptr, "'pattern' alias");
}

void test_genre_modifiers() {
    GenerationConfig cfg;
    std::string err;
    expect(LevelGenerator::applyGenreModifiers(cfg, "horror", &err), "Horror modifiers failed");
    expect(std::fabs(cfg.wallProbability - 0.6f) < 1e-6f, "Horror wall probability");
    expect(cfg.corridorWidth == 1, "Horror corridor width");

    GenerationConfig ru;
    expect(LevelGenerator::applyGenreModifiers(ru, " киберпанк ", &err), "Russian alias failed");
    expect(std::fabs(ru.wallProbability - 0.3f) < 1e-6f, "Russian alias should use the cyberpunk table");
    expect(canonicalGenre("киберпанк") == "cyberpunk", "Russian cyberpunk alias");
    expect(canonicalGenre(" Fantasy ") == "fantasy", "Genre normalization");
    expect(canonicalGenre("Хоррор") == "horror", "Cyrillic capitals are folded");
    expect(canonicalGenre("ПОСТАПОКАЛИПСИС") == "postapocalyptic", "Cyrillic upper case is folded");
    expect(canonicalGenre("ЁЛКА") == "ёлка", "Yo is folded");

    GenerationConfig cap;
    expect(LevelGenerator::applyGenreModifiers(cap, "Хоррор", &err), "Capitalized Russian genre failed");
    expect(std::fabs(cap.wallProbability - 0.6f) < 1e-6f, "Capitalized Russian genre should use the horror table");

    GenerationConfig over;
    over.genreModifiers["wall_probability"] = "0.5";
    expect(LevelGenerator::applyGenreModifiers(over, "cyberpunk", &err), "Override modifiers failed");
    expect(std::fabs(over.wallProbability - 0.5f) < 1e-6f, "Per-request override should win over the genre table");

    GenerationConfig unknown;
    const float before = unknown.wallProbability;
    expect(LevelGenerator::applyGenreModifiers(unknown, "western", &err), "Unknown genre is not an error");
    expect(unknown.wallProbability == before, "Unknown genre should not touch the config");
}

void test_special_tiles_scatter() {
    TileGrid g(10, 10, TileType::Floor);
    RNG rng(5u);
    const TileGrid out = LevelGenerator::scatterSpecialTiles(g, {TileType::Trap, TileType::Secret}, rng);

    expect(g.count(TileType::Floor) == 100, "Scatter must not modify its input");
    expect(out.count(TileType::Trap) == 3, "100 floor tiles -> 3 traps (cycling)");
    expect(out.count(TileType::Secret) == 2, "100 floor tiles -> 2 secrets (cycling)");

    TileGrid small(3, 3, TileType::Floor);
    const TileGrid same = LevelGenerator::scatterSpecialTiles(small, {TileType::Trap}, rng);
    expect(same == small, "Fewer than 10 floor tiles -> no special tiles");
}

void test_spawn_goal_ranking() {
    TileGrid g(5, 5, TileType::Floor);
    const std::vector<Vec2i> spawns = LevelGenerator::findSpawnPoints(g);
    expect(spawns.size() == 3, "Three spawn points");
    if (spawns.size() == 3) {
        expect(spawns[0] == Vec2i{0, 0} && spawns[1] == Vec2i{4, 0} && spawns[2] == Vec2i{0, 4},
               "Spawn ties should follow row-major order");
    }

    const std::vector<Vec2i> goals = LevelGenerator::findGoalPoints(g);
    expect(goals.size() == 2, "Two goal points");
    if (goals.size() == 2) {
        expect(goals[0] == Vec2i{2, 2}, "Farthest-from-corner tile first");
        expect(goals[1] == Vec2i{2, 1}, "Goal ties should follow row-major order");
    }

    g.at(3, 1) = TileType::Goal;
    const std::vector<Vec2i> marked = LevelGenerator::findGoalPoints(g);
    expect(marked.size() == 1 && marked[0] == Vec2i{3, 1}, "Existing Goal tiles win");

    TileGrid walls(6, 4, TileType::Wall);
    const std::vector<Vec2i> fs = LevelGenerator::findSpawnPoints(walls);
    const std::vector<Vec2i> fg = LevelGenerator::findGoalPoints(walls);
    expect(fs.size() == 1 && fs[0] == Vec2i{1, 1}, "Spawn fallback (1,1)");
    expect(fg.size() == 1 && fg[0] == Vec2i{4, 2}, "Goal fallback (w-2,h-2)");

    TileGrid tiny(1, 1, TileType::Wall);
    const std::vector<Vec2i> tg = LevelGenerator::findGoalPoints(tiny);
    expect(tg.size() == 1 && tiny.inBounds(tg[0]), "Fallback is clamped into bounds");
}

void test_pattern_collapse_assigns_every_cell() {
    const GenerationConfig cfg = makeConfig("wfc", 32, 32, 11u);
    RNG rng(11u);
    const TileGrid g = procgen::generatePatternCollapse(cfg, rng);
    expect(g.width == 32 && g.height == 32, "Pattern collapse size");

    bool allKnown = true;
    for (TileType t : g.tiles) {
        if (t != TileType::Floor && t != TileType::Wall && t != TileType::Door) allKnown = false;
    }
    expect(allKnown, "Pattern collapse should only emit Floor/Wall/Door");
    expect(g.count(TileType::Floor) > 0, "Pattern collapse should produce some floor");
}

void test_noise_terrain_thresholds() {
    GenerationConfig cfg = makeConfig("perlin", 30, 24, 17u);
    cfg.noiseScale = 0.15f;

    RNG rng(17u);
    RNG replay = rng;
    const TileGrid g = procgen::generateNoiseTerrain(cfg, rng);
    const uint32_t seed = hashCombine(replay.nextU32(), "NOISE_TERRAIN"_tag);

    int kinds[TILE_TYPE_COUNT] = {};
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const float n = procgen::fbm(seed,
                                         static_cast<float>(x) * cfg.noiseScale,
                                         static_cast<float>(y) * cfg.noiseScale,
                                         cfg.octaves, cfg.persistence, cfg.lacunarity);
            TileType want = TileType::Wall;
            if (n < -0.3f) want = TileType::Water;
            else if (n < 0.0f) want = TileType::Floor;
            else if (n < 0.3f) want = TileType::Obstacle;

            const TileType got = g.at(x, y);
            expect(got == want, "Noise terrain threshold mismatch at (" +
                   std::to_string(x) + "," + std::to_string(y) + ")");
            ++kinds[static_cast<int>(got)];
        }
    }

    expect(kinds[static_cast<int>(TileType::Empty)] == 0, "Noise terrain leaves no Empty tiles");
    expect(kinds[static_cast<int>(TileType::Floor)] > 0, "Noise terrain should produce some floor");
}

void test_hybrid_rooms_connected() {
    GenerationConfig cfg = makeConfig("hybrid", 48, 36, 31u);
    cfg.wallProbability = 1.0f;
    cfg.roomCount = 4;
    cfg.corridorWidth = 1;

    RNG rng(31u);
    const TileGrid g = procgen::generateHybrid(cfg, rng);
    expect(borderIsWall(g), "Hybrid border should be Wall");

    // With a solid cellular base every open tile comes from a room or corridor.
    int open = 0;
    Vec2i start{-1, -1};
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const TileType t = g.at(x, y);
            expect(t == TileType::Wall || t == TileType::Floor || t == TileType::Obstacle,
                   "Hybrid on a solid base should only hold Wall/Floor/Obstacle");
            if (t == TileType::Wall) continue;
            ++open;
            if (start.x < 0) start = {x, y};
        }
    }
    expect(open >= 32, "At least two 4x4 rooms should be carved");
    if (open == 0) return;

    // Rooms are chained by corridors, so the carved area is one 4-connected region.
    std::vector<uint8_t> seen(static_cast<size_t>(g.width * g.height), 0);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * g.width + x); };
    std::queue<Vec2i> q;
    q.push(start);
    seen[idx(start.x, start.y)] = 1;
    int reached = 1;
    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};
    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop();
        for (const auto& d : dirs) {
            const int nx = p.x + d[0];
            const int ny = p.y + d[1];
            if (!g.inBounds(nx, ny) || g.at(nx, ny) == TileType::Wall) continue;
            if (seen[idx(nx, ny)]) continue;
            seen[idx(nx, ny)] = 1;
            ++reached;
            q.push({nx, ny});
        }
    }
    expect(reached == open, "Hybrid rooms should all be connected");
}

void test_corridor_width() {
    auto thickness = [](const TileGrid& g, int x) {
        int n = 0;
        for (int y = 0; y < g.height; ++y) {
            if (g.at(x, y) == TileType::Floor) ++n;
        }
        return n;
    };

    TileGrid g(20, 20, TileType::Wall);
    procgen::carveLCorridor(g, {3, 10}, {15, 10}, 3, true);
    expect(thickness(g, 8) == 3, "Corridor width 3 should carve a 3-tile leg");
    expect(g.at(8, 9) == TileType::Floor && g.at(8, 10) == TileType::Floor && g.at(8, 11) == TileType::Floor,
           "Width 3 leg is centered on its axis");
    expect(g.at(8, 8) == TileType::Wall && g.at(8, 12) == TileType::Wall, "Width 3 leg stays 3 tiles thick");

    TileGrid one(20, 20, TileType::Wall);
    procgen::carveLCorridor(one, {3, 10}, {15, 10}, 1, true);
    expect(thickness(one, 8) == 1, "Corridor width 1 should carve a single-tile leg");

    TileGrid bent(20, 20, TileType::Wall);
    procgen::carveLCorridor(bent, {3, 4}, {12, 15}, 2, false);
    expect(bent.at(3, 10) == TileType::Floor && bent.at(4, 10) == TileType::Floor &&
           bent.at(2, 10) == TileType::Wall && bent.at(5, 10) == TileType::Wall,
           "Vertical leg is 2 tiles thick");
    expect(bent.at(12, 15) == TileType::Floor, "Corridor reaches its end point");
}

void test_preview_export() {
    namespace fs = std::filesystem;
    const fs::path levelPath = fs::temp_directory_path() / "levelforge_preview_test.bmp";
    const fs::path placePath = fs::temp_directory_path() / "levelforge_placement_test.bmp";

    const GeneratedLevel lvl = makeThreeRoomLevel();
    std::string err;
    expect(exportLevelPreviewBmp(lvl, levelPath.string(), &err), "Level preview export failed: " + err);

    std::error_code ec;
    expect(fs::exists(levelPath, ec), "Level preview file missing");
    // 13x5 tiles at scale 10: at least 130x50 pixels of 24/32-bit data.
    expect(fs::file_size(levelPath, ec) > 130u * 50u * 3u, "Level preview file too small");

    GameObject enemy;
    enemy.id = "enemy_1";
    enemy.type = ObjectType::Enemy;
    enemy.pos = {2, 2};
    const std::vector<GameObject> objs = {enemy};
    expect(exportPlacementPreviewBmp(lvl, objs, placePath.string(), &err), "Placement preview export failed: " + err);
    expect(fs::exists(placePath, ec) && fs::file_size(placePath, ec) > 0u, "Placement preview file missing or empty");

    GeneratedLevel empty;
    err.clear();
    expect(!exportLevelPreviewBmp(empty, levelPath.string(), &err), "Empty level should not export");
    expect(!err.empty(), "Empty level export should report an error");

    fs::remove(levelPath, ec);
    fs::remove(placePath, ec);
}

void test_candidates_walkable_only() {
    GeneratedLevel lvl = makeOpenLevel(22, 22);
    for (int i = 0; i < 5; ++i) lvl.tiles.at(4 + 3 * i, 10) = TileType::Obstacle;
    lvl.tiles.at(6, 6) = TileType::Trap;
    lvl.tiles.at(7, 6) = TileType::Secret;

    PlacementRule rule;
    rule.preferredTiles = {TileType::Obstacle, TileType::Trap, TileType::Secret};
    rule.minDistanceFromWalls = 0.0f;

    PlacementOptimizer opt;
    expect(opt.candidatePositions(lvl, rule).empty(), "Non-walkable tiles are never candidates");

    PlacementRule floorRule;
    floorRule.minDistanceFromWalls = 0.0f;
    const std::vector<Vec2i> floor = opt.candidatePositions(lvl, floorRule);
    expect(static_cast<int>(floor.size()) == lvl.tiles.count(TileType::Floor), "Every floor tile is a default candidate");
    for (const Vec2i& p : floor) {
        expect(lvl.tiles.isWalkable(p.x, p.y), "Candidate on a non-walkable tile");
    }
}

void test_astar() {
    TileGrid open(5, 5, TileType::Floor);
    auto passOpen = [&](int x, int y) { return open.isWalkable(x, y); };

    const std::vector<Vec2i> diag = astarPath(5, 5, {0, 0}, {4, 4}, passOpen);
    expect(diag.size() == 5, "Open grid diagonal should take 5 nodes");
    if (!diag.empty()) {
        expect(diag.front() == Vec2i{0, 0} && diag.back() == Vec2i{4, 4}, "Path endpoints included");
    }

    const std::vector<Vec2i> self = astarPath(5, 5, {2, 2}, {2, 2}, passOpen);
    expect(self.size() == 1 && self[0] == Vec2i{2, 2}, "start == goal gives a single node");

    // Wall column with one gap at the bottom.
    TileGrid g(7, 5, TileType::Floor);
    for (int y = 0; y < 4; ++y) g.at(3, y) = TileType::Wall;
    auto pass = [&](int x, int y) { return g.isWalkable(x, y); };
    const std::vector<Vec2i> p = astarPath(7, 5, {0, 0}, {6, 0}, pass);
    expect(!p.empty(), "Path around the wall should exist");
    for (size_t i = 0; i < p.size(); ++i) {
        expect(g.isWalkable(p[i].x, p[i].y), "Path tiles must be walkable");
        if (i > 0) {
            const int dx = std::abs(p[i].x - p[i - 1].x);
            const int dy = std::abs(p[i].y - p[i - 1].y);
            expect(dx <= 1 && dy <= 1 && (dx + dy) > 0, "Path steps must be 8-adjacent");
        }
    }

    g.at(3, 4) = TileType::Wall;
    expect(astarPath(7, 5, {0, 0}, {6, 0}, pass).empty(), "Sealed wall should give no path");
    expect(astarPath(7, 5, {0, 0}, {3, 2}, pass).empty(), "Unwalkable goal should give no path");

    GeneratedLevel lvl = makeThreeRoomLevel();
    expect(findPlayerPaths(lvl).empty(), "Sealed rooms give no player paths");

    GeneratedLevel openLvl = makeOpenLevel(12, 10);
    const auto paths = findPlayerPaths(openLvl);
    expect(paths.size() == openLvl.spawnPoints.size() * openLvl.goalPoints.size(),
           "One path per connected spawn/goal pair");
}

void test_fields_normalized() {
    LevelGenerator gen;
    GeneratedLevel lvl;
    expect(gen.generateLevel(ScenarioInput{}, makeConfig("hybrid", 40, 30, 3u), lvl), "Hybrid generation failed");

    const auto paths = findPlayerPaths(lvl);
    const Field2D diff = analyzeDifficultyZones(lvl, paths);
    const Field2D vis = computeVisibilityMap(lvl, paths);

    expect(diff.width == lvl.width && diff.height == lvl.height, "Difficulty field size");
    expect(vis.width == lvl.width && vis.height == lvl.height, "Visibility field size");

    bool inRange = true;
    for (float v : diff.values) inRange = inRange && v >= 0.0f && v <= 1.0f;
    for (float v : vis.values) inRange = inRange && v >= 0.0f && v <= 1.0f;
    expect(inRange, "Fields should be in [0,1]");

    if (lvl.tiles.countWalkable() > 0) {
        expect(std::fabs(diff.maxValue() - 1.0f) < 1e-5f, "Difficulty max should normalize to 1");
    }
    if (!paths.empty()) {
        expect(std::fabs(vis.maxValue() - 1.0f) < 1e-5f, "Visibility max should normalize to 1");
    }

    for (int y = 0; y < lvl.height; ++y) {
        for (int x = 0; x < lvl.width; ++x) {
            if (!lvl.tiles.isWalkable(x, y)) {
                expect(diff.at(x, y) == 0.0f, "Difficulty only on walkable tiles");
            }
        }
    }

    // No signal: no paths -> no sightlines; no walkable tiles -> no difficulty.
    GeneratedLevel sealed = makeThreeRoomLevel();
    expect(computeVisibilityMap(sealed, findPlayerPaths(sealed)).allZero(), "No paths -> all-zero visibility");

    GeneratedLevel solid;
    solid.tiles = TileGrid(8, 8, TileType::Wall);
    solid.width = 8;
    solid.height = 8;
    solid.spawnPoints = {{1, 1}};
    solid.goalPoints = {{6, 6}};
    expect(analyzeDifficultyZones(solid, {}).allZero(), "No walkable tiles -> all-zero difficulty");
}

void test_visibility_rays() {
    TileGrid g(15, 15, TileType::Floor);
    Field2D acc(15, 15, 0.0f);
    castVisibilityRays(g, {7, 7}, 7, acc);
    expect(acc.at(8, 7) > 0.0f, "Ray east should reach the next tile");
    expect(acc.at(14, 7) > 0.0f, "Ray east should reach distance 7");

    TileGrid walled(15, 15, TileType::Floor);
    for (int y = 0; y < 15; ++y) walled.at(9, y) = TileType::Wall;
    Field2D acc2(15, 15, 0.0f);
    castVisibilityRays(walled, {7, 7}, 7, acc2);
    expect(acc2.at(9, 7) == 0.0f, "Wall tiles are not counted");
    expect(acc2.at(11, 7) == 0.0f, "Rays stop at the first wall");
}

void test_optimizer_features() {
    expect(std::fabs(pathDistanceScore(3.0f) - 0.5f) < 1e-6f, "Path score peaks at distance 3");
    expect(pathDistanceScore(0.0f) < pathDistanceScore(3.0f), "Path score lower on the path");

    std::vector<GameObject> none;
    expect(clusteringScore({0, 0}, none, 0.9f) == 0.5f, "Clustering is neutral with nothing placed");

    GameObject near;
    near.pos = {1, 0};
    std::vector<GameObject> placed = {near};
    expect(clusteringScore({0, 0}, placed, 1.0f) > clusteringScore({0, 0}, placed, 0.0f),
           "Clustering preference 1 favors close objects");

    TileGrid g(11, 11, TileType::Floor);
    expect(distanceToNearestWall(g, {5, 5}) == 5.0f, "No wall in window -> 5.0");
    g.at(5, 7) = TileType::Wall;
    expect(std::fabs(distanceToNearestWall(g, {5, 5}) - 2.0f) < 1e-6f, "Nearest wall distance");

    PlacementOptimizer opt;
    expect(std::fabs(opt.weight(PlacementFeature::DistanceToPath) - 0.30f) < 1e-6f, "distance_to_path weight");
    expect(std::fabs(opt.weight(PlacementFeature::StrategicPosition) - 0.10f) < 1e-6f, "strategic_position weight");
    PlacementFeature f = PlacementFeature::Visibility;
    expect(parsePlacementFeature("clustering", f) && f == PlacementFeature::Clustering, "Feature names parse");
}

void test_limited_candidates() {
    const GeneratedLevel lvl = makeThreeRoomLevel();
    ObjectPlacementEngine engine;
    ScenarioInput sc;
    sc.genre = "fantasy";

    ObjectCounts counts;
    counts[ObjectType::Enemy] = 5;
    PlacementStats stats;
    RNG rng(8u);
    const std::vector<GameObject> objs = engine.placeObjects(lvl, sc, rng, &counts, &stats);

    expect(objs.size() == 3, "Only three spacing-compatible Enemy candidates exist");
    expect(stats.perType[ObjectType::Enemy].requested == 5, "Stats requested");
    expect(stats.perType[ObjectType::Enemy].placed == 3, "Stats placed");
    expect(stats.shortfall() == 2, "Shortfall reported in stats");

    std::set<int> xs;
    for (const GameObject& o : objs) {
        expect(o.type == ObjectType::Enemy, "Only enemies requested");
        expect(o.pos.y == 2, "Enemy at a room center row");
        xs.insert(o.pos.x);
        expect(std::get<std::string>(o.properties.at("genre")) == "fantasy", "Objects carry the genre");
        const int hp = std::get<int>(o.properties.at("health"));
        expect(hp >= 50 && hp <= 150, "Enemy health in range");
    }
    expect(xs == std::set<int>({2, 6, 10}), "Enemies at the three room centers");
    for (size_t i = 0; i < objs.size(); ++i) {
        expect(objs[i].id == "enemy_" + std::to_string(i + 1), "Object ids count from 1 per type");
    }
}

void test_placement_spacing_and_legality() {
    LevelGenerator gen;
    GeneratedLevel lvl;
    ScenarioInput sc;
    sc.genre = "cyberpunk";
    expect(gen.generateLevel(sc, makeConfig("hybrid", 48, 36, 21u), lvl), "Hybrid generation failed");

    ObjectPlacementEngine engine;
    PlacementStats stats;
    RNG rng(21u);
    const std::vector<GameObject> objs = engine.placeObjects(lvl, sc, rng, nullptr, &stats);

    expect(!objs.empty(), "Derived counts should place something");
    expect(static_cast<int>(objs.size()) == stats.totalPlaced(), "Stats match output");

    for (size_t i = 0; i < objs.size(); ++i) {
        const GameObject& a = objs[i];
        const TileType t = lvl.tiles.at(a.pos.x, a.pos.y);
        expect(a.rule.allowsTile(t), "Object on a disallowed tile: " + a.id);
        expect(t != TileType::Wall && t != TileType::Water, "Object on a forbidden tile: " + a.id);
        expect(distanceToNearestWall(lvl.tiles, a.pos) >= a.rule.minDistanceFromWalls, "Object too close to a wall: " + a.id);

        for (size_t j = i + 1; j < objs.size(); ++j) {
            const GameObject& b = objs[j];
            if (a.type != b.type) continue;
            expect(euclid(a.pos, b.pos) >= a.rule.minDistanceFromSameType,
                   "Same-type spacing violated: " + a.id + " / " + b.id);
        }
    }

    // Same seed, same placement.
    RNG rng2(21u);
    const std::vector<GameObject> again = engine.placeObjects(lvl, sc, rng2);
    expect(again.size() == objs.size(), "Placement determinism (count)");
    for (size_t i = 0; i < again.size() && i < objs.size(); ++i) {
        expect(again[i].id == objs[i].id && again[i].pos == objs[i].pos, "Placement determinism (positions)");
    }
}

void test_genre_counts() {
    // 20x20 open interior: 400 walkable tiles.
    const GeneratedLevel lvl = makeOpenLevel(22, 22);
    expect(lvl.tiles.countWalkable() == 400, "Open level walkable area");

    ObjectPlacementEngine engine;
    const ObjectCounts base = engine.computeObjectCounts(lvl, "");
    const ObjectCounts horror = engine.computeObjectCounts(lvl, "horror");
    const ObjectCounts ru = engine.computeObjectCounts(lvl, "хоррор");

    expect(base.at(ObjectType::Enemy) == 20, "Base enemy count");
    expect(base.at(ObjectType::Trap) == 12, "Base trap count");
    expect(base.at(ObjectType::Item) == 32, "Base item count");
    expect(base.at(ObjectType::Decoration) == 40, "Base decoration count");
    expect(horror.at(ObjectType::Enemy) == 16, "Horror enemy count");
    expect(horror.at(ObjectType::Trap) == 24, "Horror trap count");
    expect(horror.at(ObjectType::Trap) > base.at(ObjectType::Trap), "Horror has more traps");
    expect(horror.at(ObjectType::Enemy) < base.at(ObjectType::Enemy), "Horror has fewer enemies");
    expect(ru == horror, "Russian genre name maps to the same table");
    expect(engine.computeObjectCounts(lvl, "Хоррор") == horror, "Capitalized Russian genre name maps to the same table");
    expect(engine.computeObjectCounts(lvl, "ХОРРОР") == horror, "Upper-case Russian genre name maps to the same table");

    const GeneratedLevel tiny = makeOpenLevel(4, 4);
    const ObjectCounts few = engine.computeObjectCounts(tiny, "horror");
    expect(few.at(ObjectType::Item) == 1, "Genre scaling never drops below 1");
    expect(few.at(ObjectType::Decoration) == 3, "Decoration minimum");
}

void test_level_config_ini() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "levelforge_config_test.ini";

    {
        std::ofstream out(path);
        out << "# test config\n";
        out << "algorithm = hybrid\n";
        out << "width = 40 ; trailing comment\n";
        out << "wall_probability = 2.0\n";
        out << "seed = 77\n";
        out << "genre = horror\n";
        out << "genre_corridor_width = 3\n";
        out << "count_enemy = 4\n";
        out << "count_dragon = 2\n";
        out << "bogus = 1\n";
        out << "not a pair\n";
    }

    LevelConfigFile cfg;
    std::string err;
    std::string warnings;
    expect(loadLevelConfigIni(path.string(), cfg, &err, &warnings), "Level config load failed: " + err);
    expect(cfg.generation.algorithm == "hybrid", "INI algorithm");
    expect(cfg.generation.width == 40, "INI width");
    expect(cfg.generation.wallProbability == 1.0f, "INI values are clamped");
    expect(cfg.generation.seed && *cfg.generation.seed == 77u, "INI seed");
    expect(cfg.genre == "horror", "INI genre");
    expect(cfg.generation.genreModifiers.count("corridor_width") == 1, "INI genre override");
    expect(cfg.objectCounts.size() == 1 && cfg.objectCounts.at(ObjectType::Enemy) == 4, "INI object counts");
    expect(warnings.find("Line 9") != std::string::npos, "Unknown object type warned");
    expect(warnings.find("Line 10") != std::string::npos, "Unknown key warned");
    expect(warnings.find("Line 11") != std::string::npos, "Malformed line warned");

    // The per-request override beats the horror table (corridor_width 1).
    GenerationConfig g = cfg.generation;
    expect(LevelGenerator::applyGenreModifiers(g, cfg.genre, &err), "Apply INI overrides");
    expect(g.corridorWidth == 3, "INI override applied after the genre table");

    std::error_code ec;
    fs::remove(path, ec);

    LevelConfigFile missing;
    expect(!loadLevelConfigIni((fs::temp_directory_path() / "levelforge_no_such_file.ini").string(), missing, &err),
           "Missing file should fail");

    const fs::path defPath = fs::temp_directory_path() / "levelforge_default_test.ini";
    expect(writeDefaultLevelConfig(defPath.string(), &err), "Write default config");
    LevelConfigFile def;
    warnings.clear();
    expect(loadLevelConfigIni(defPath.string(), def, &err, &warnings), "Reload default config");
    expect(warnings.empty(), "Default config should load without warnings");
    expect(def.generation.algorithm == "wfc" && def.generation.width == 32, "Default config values");
    expect(def.objectCounts.empty(), "Default config derives object counts");
    fs::remove(defPath, ec);
}

void test_config_params_roundtrip() {
    GenerationConfig cfg;
    cfg.wallProbability = 0.35f;
    cfg.roomCount = 9;
    const auto params = configParams(cfg);

    GenerationConfig back;
    std::string err;
    for (const auto& kv : params) {
        expect(applyConfigParam(back, kv.first, kv.second, &err), "configParams key should parse: " + kv.first);
    }
    expect(back.roomCount == 9 && std::fabs(back.wallProbability - 0.35f) < 1e-6f, "configParams values");
    expect(!applyConfigParam(back, "width", "wide", &err), "Bad integer rejected");
    expect(!applyConfigParam(back, "depth", "3", &err), "Unknown key rejected");
}

void test_level_ascii() {
    const GeneratedLevel lvl = makeThreeRoomLevel();
    const std::string s = levelToAscii(lvl);
    expect(s.size() == static_cast<size_t>((lvl.width + 1) * lvl.height), "ASCII size");
    expect(s[static_cast<size_t>(2 * (lvl.width + 1) + 2)] == '@', "Spawn marker");
    expect(s[static_cast<size_t>(2 * (lvl.width + 1) + 10)] == '>', "Goal marker");
    expect(s[0] == '#', "Wall glyph");
}

} // namespace

int main() {
    std::cout << "Running LevelForge tests...\n";

    test_rng_reproducible();
    test_generation_deterministic();
    test_border_invariant();
    test_maze_is_spanning_tree();
    test_cellular_seeds();
    test_bounds_invariant();
    test_config_errors();
    test_genre_modifiers();
    test_special_tiles_scatter();
    test_spawn_goal_ranking();
    test_pattern_collapse_assigns_every_cell();

    test_noise_terrain_thresholds();
    test_hybrid_rooms_connected();
    test_corridor_width();

    test_astar();
    test_fields_normalized();
    test_visibility_rays();
    test_optimizer_features();
    test_limited_candidates();
    test_placement_spacing_and_legality();
    test_candidates_walkable_only();
    test_genre_counts();

    test_level_config_ini();
    test_config_params_roundtrip();
    test_level_ascii();
    test_preview_export();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
