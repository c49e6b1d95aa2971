// tests/test_pathfinder.cpp
// A* search, neighbour rules and path smoothing on small tile grids

#include <catch2/catch.hpp>

#include <cmath>
#include <cstdlib>

#include "Pathfinder.h"
#include "TileGrid.h"

namespace {

constexpr float SQRT2 = 1.41421356f;

void block(TileGrid& grid, int x, int y) {
    grid.setTileType(x, y, TileType::Building);
}

// every step is one of the 8 moves, stays on walkable cells and never cuts a corner
void requireValidPath(const TileGrid& grid, const std::vector<GridCell>& path,
                      const GridCell& start, const GridCell& goal) {
    REQUIRE_FALSE(path.empty());
    REQUIRE(path.front() == start);
    REQUIRE(path.back() == goal);

    for (size_t i = 0; i < path.size(); i++) {
        REQUIRE(grid.isWalkable(path[i]));
        if (i == 0) continue;

        int dx = path[i].x - path[i - 1].x;
        int dy = path[i].y - path[i - 1].y;
        REQUIRE(std::abs(dx) <= 1);
        REQUIRE(std::abs(dy) <= 1);
        REQUIRE((dx != 0 || dy != 0));

        if (dx != 0 && dy != 0) {
            REQUIRE(grid.isWalkable(GridCell{path[i - 1].x + dx, path[i - 1].y}));
            REQUIRE(grid.isWalkable(GridCell{path[i - 1].x, path[i - 1].y + dy}));
        }
    }
}

} // namespace

// ============================================================================
// Search
// ============================================================================

TEST_CASE("Pathfinder finds a straight line on open ground", "[pathfinder]") {
    TileGrid grid(8, 4);
    Pathfinder pathfinder(grid);

    auto path = pathfinder.findPath({0, 1}, {7, 1});
    REQUIRE(path.has_value());
    REQUIRE(path->size() == 8);
    requireValidPath(grid, *path, {0, 1}, {7, 1});
    REQUIRE(pathfinder.pathLength(*path) == Approx(7.0f));
}

TEST_CASE("Pathfinder paths are optimal on open terrain", "[pathfinder]") {
    TileGrid grid(20, 10);
    Pathfinder pathfinder(grid);

    SECTION("pure diagonal") {
        PathResult result = pathfinder.findPathDetailed({0, 0}, {9, 9});
        REQUIRE(result.found);
        REQUIRE(result.path.size() == 10);
        REQUIRE(result.pathLength == Approx(9.0f * SQRT2));
    }

    SECTION("diagonal run plus cardinal remainder") {
        PathResult result = pathfinder.findPathDetailed({0, 0}, {19, 7});
        REQUIRE(result.found);
        requireValidPath(grid, result.path, {0, 0}, {19, 7});
        REQUIRE(result.pathLength == Approx(12.0f + 7.0f * SQRT2));
        REQUIRE(result.pathLength == Approx(pathfinder.octileDistance({0, 0}, {19, 7})));
    }
}

TEST_CASE("Pathfinder goes around a wall through its only gap", "[pathfinder]") {
    TileGrid grid(10, 10);
    for (int y = 0; y < 9; y++) {
        block(grid, 5, y);
    }

    Pathfinder pathfinder(grid);
    auto path = pathfinder.findPath({0, 0}, {9, 0});
    REQUIRE(path.has_value());
    requireValidPath(grid, *path, {0, 0}, {9, 0});

    bool usedGap = false;
    for (const GridCell& cell : *path) {
        if (cell.x == 5) {
            REQUIRE(cell.y == 9);
            usedGap = true;
        }
    }
    REQUIRE(usedGap);
}

TEST_CASE("Pathfinder reports a walled off goal as unreachable", "[pathfinder]") {
    TileGrid grid(10, 10);
    for (int y = 4; y <= 6; y++) {
        for (int x = 4; x <= 6; x++) {
            if (x != 5 || y != 5) block(grid, x, y);
        }
    }

    Pathfinder pathfinder(grid);
    REQUIRE_FALSE(pathfinder.findPath({0, 0}, {5, 5}).has_value());

    PathResult result = pathfinder.findPathDetailed({0, 0}, {5, 5});
    REQUIRE_FALSE(result.found);
    REQUIRE_FALSE(result.iterationLimitHit);
    REQUIRE(result.path.empty());
    // every reachable cell outside the ring was expanded once
    REQUIRE(result.nodesExpanded == 100 - 9);
}

TEST_CASE("Pathfinder never cuts corners", "[pathfinder]") {
    TileGrid grid(4, 4);
    Pathfinder pathfinder(grid);

    SECTION("both flanking cells blocked leaves no way through") {
        block(grid, 1, 0);
        block(grid, 0, 1);
        REQUIRE_FALSE(pathfinder.findPath({0, 0}, {1, 1}).has_value());
    }

    SECTION("one flanking cell blocked forces the cardinal detour") {
        block(grid, 1, 0);
        auto path = pathfinder.findPath({0, 0}, {1, 1});
        REQUIRE(path.has_value());
        REQUIRE(path->size() == 3);
        REQUIRE((*path)[1] == GridCell{0, 1});
        REQUIRE(pathfinder.pathLength(*path) == Approx(2.0f));
    }
}

TEST_CASE("Pathfinder endpoint edge cases", "[pathfinder]") {
    TileGrid grid(5, 5);
    Pathfinder pathfinder(grid);

    SECTION("start equals goal") {
        auto path = pathfinder.findPath({2, 2}, {2, 2});
        REQUIRE(path.has_value());
        REQUIRE(path->size() == 1);
        REQUIRE(path->front() == GridCell{2, 2});
    }

    SECTION("blocked start") {
        block(grid, 0, 0);
        REQUIRE_FALSE(pathfinder.findPath({0, 0}, {4, 4}).has_value());
    }

    SECTION("blocked goal") {
        block(grid, 4, 4);
        PathResult result = pathfinder.findPathDetailed({0, 0}, {4, 4});
        REQUIRE_FALSE(result.found);
        REQUIRE(result.nodesExpanded == 0);
    }

    SECTION("occupied goal") {
        grid.setOccupied(4, 4, true);
        REQUIRE_FALSE(pathfinder.findPath({0, 0}, {4, 4}).has_value());
    }

    SECTION("goal outside the grid") {
        REQUIRE_FALSE(pathfinder.findPath({0, 0}, {5, 2}).has_value());
        REQUIRE_FALSE(pathfinder.findPath({0, 0}, {-1, 0}).has_value());
    }
}

TEST_CASE("Pathfinder gives up at the expansion ceiling", "[pathfinder]") {
    TileGrid grid(50, 50);

    Pathfinder limited(grid, 5);
    PathResult result = limited.findPathDetailed({0, 0}, {49, 49});
    REQUIRE_FALSE(result.found);
    REQUIRE(result.iterationLimitHit);
    REQUIRE(result.nodesExpanded == 5);
    REQUIRE_FALSE(limited.findPath({0, 0}, {49, 49}).has_value());

    Pathfinder unlimited(grid);
    REQUIRE(unlimited.getMaxIterations() == Pathfinder::DEFAULT_MAX_ITERATIONS);
    result = unlimited.findPathDetailed({0, 0}, {49, 49});
    REQUIRE(result.found);
    REQUIRE_FALSE(result.iterationLimitHit);
}

TEST_CASE("Pathfinder with the manhattan heuristic still finds valid paths", "[pathfinder]") {
    TileGrid grid(12, 12);
    for (int y = 2; y < 12; y++) {
        block(grid, 6, y);
    }

    Pathfinder octile(grid);
    Pathfinder manhattan(grid, Pathfinder::DEFAULT_MAX_ITERATIONS, Heuristic::Manhattan);
    REQUIRE(manhattan.getHeuristic() == Heuristic::Manhattan);
    REQUIRE(manhattan.heuristic({0, 0}, {3, 4}) == Approx(7.0f));

    PathResult best = octile.findPathDetailed({0, 11}, {11, 11});
    PathResult greedy = manhattan.findPathDetailed({0, 11}, {11, 11});
    REQUIRE(best.found);
    REQUIRE(greedy.found);
    requireValidPath(grid, greedy.path, {0, 11}, {11, 11});
    REQUIRE(greedy.pathLength >= best.pathLength - 1e-4f);
}

TEST_CASE("Pathfinder breaks ties the same way every time", "[pathfinder]") {
    TileGrid grid(16, 16);
    block(grid, 7, 7);
    block(grid, 8, 8);
    Pathfinder pathfinder(grid);

    auto first = pathfinder.findPath({0, 0}, {15, 15});
    auto second = pathfinder.findPath({0, 0}, {15, 15});
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == *second);

    // lower h wins among equal f, which keeps a straight run straight
    auto straight = pathfinder.findPath({0, 0}, {3, 0});
    REQUIRE(straight.has_value());
    REQUIRE(*straight == std::vector<GridCell>{{0, 0}, {1, 0}, {2, 0}, {3, 0}});
}

// ============================================================================
// Neighbours and heuristics
// ============================================================================

TEST_CASE("Pathfinder neighbour generation", "[pathfinder]") {
    TileGrid grid(5, 5);
    Pathfinder pathfinder(grid);

    REQUIRE(pathfinder.getNeighbors({2, 2}).size() == 8);
    REQUIRE(pathfinder.getNeighbors({0, 0}).size() == 3);

    // blocking east also removes both eastern diagonals
    block(grid, 3, 2);
    REQUIRE(pathfinder.getNeighbors({2, 2}).size() == 5);
}

TEST_CASE("Pathfinder distance functions", "[pathfinder]") {
    TileGrid grid(2, 2);
    Pathfinder pathfinder(grid);

    REQUIRE(pathfinder.octileDistance({0, 0}, {3, 4}) == Approx(4.0f + 3.0f * (SQRT2 - 1.0f)));
    REQUIRE(pathfinder.manhattanDistance({0, 0}, {3, 4}) == Approx(7.0f));
    REQUIRE(pathfinder.euclideanDistance({0, 0}, {3, 4}) == Approx(5.0f));
    REQUIRE(pathfinder.heuristic({0, 0}, {3, 4}) == Approx(pathfinder.octileDistance({0, 0}, {3, 4})));
    REQUIRE(pathfinder.pathLength({}) == 0.0f);
}

// ============================================================================
// Smoothing
// ============================================================================

TEST_CASE("Pathfinder line of sight", "[pathfinder][smoothing]") {
    TileGrid grid(10, 10);
    Pathfinder pathfinder(grid);

    REQUIRE(pathfinder.lineOfSight({0, 0}, {9, 9}));
    REQUIRE(pathfinder.lineOfSight({0, 0}, {9, 3}));

    block(grid, 5, 5);
    REQUIRE_FALSE(pathfinder.lineOfSight({0, 0}, {9, 9}));
    REQUIRE_FALSE(pathfinder.lineOfSight({5, 5}, {9, 9}));  // blocked endpoint
    REQUIRE(pathfinder.lineOfSight({0, 9}, {9, 9}));
}

TEST_CASE("Pathfinder line of sight never squeezes between blocked corners", "[pathfinder][smoothing]") {
    TileGrid grid(6, 6);
    Pathfinder pathfinder(grid);
    block(grid, 2, 1);
    block(grid, 1, 2);

    REQUIRE_FALSE(pathfinder.lineOfSight({1, 1}, {2, 2}));
    REQUIRE_FALSE(pathfinder.lineOfSight({0, 0}, {3, 3}));

    SECTION("a single blocked flank is enough to break the sightline") {
        TileGrid openGrid(6, 6);
        Pathfinder openPathfinder(openGrid);
        REQUIRE(openPathfinder.lineOfSight({1, 1}, {2, 2}));
        block(openGrid, 2, 1);
        REQUIRE_FALSE(openPathfinder.lineOfSight({1, 1}, {2, 2}));
    }

    SECTION("smoothed paths keep to moves the search allows") {
        auto path = pathfinder.findPath({0, 0}, {3, 3});
        REQUIRE(path.has_value());
        requireValidPath(grid, *path, {0, 0}, {3, 3});

        auto smoothed = pathfinder.smoothPath(*path);
        REQUIRE(smoothed.size() >= 3);
        REQUIRE(smoothed.front() == GridCell{0, 0});
        REQUIRE(smoothed.back() == GridCell{3, 3});
        for (size_t i = 1; i < smoothed.size(); i++) {
            REQUIRE(pathfinder.lineOfSight(smoothed[i - 1], smoothed[i]));
        }
    }
}

TEST_CASE("Pathfinder smoothing", "[pathfinder][smoothing]") {
    TileGrid grid(12, 12);
    Pathfinder pathfinder(grid);

    SECTION("open ground collapses to the endpoints") {
        auto path = pathfinder.findPath({0, 0}, {9, 9});
        REQUIRE(path.has_value());
        auto smoothed = pathfinder.smoothPath(*path);
        REQUIRE(smoothed == std::vector<GridCell>{{0, 0}, {9, 9}});
    }

    SECTION("short paths are returned as is") {
        std::vector<GridCell> two{{0, 0}, {1, 1}};
        REQUIRE(pathfinder.smoothPath(two) == two);
        REQUIRE(pathfinder.smoothPath({}).empty());
    }

    SECTION("smoothed waypoints keep line of sight and smoothing is idempotent") {
        for (int y = 0; y < 9; y++) block(grid, 4, y);
        for (int y = 3; y < 12; y++) block(grid, 8, y);

        auto path = pathfinder.findPath({0, 0}, {11, 11});
        REQUIRE(path.has_value());

        auto smoothed = pathfinder.smoothPath(*path);
        REQUIRE(smoothed.size() >= 3);
        REQUIRE(smoothed.size() < path->size());
        REQUIRE(smoothed.front() == path->front());
        REQUIRE(smoothed.back() == path->back());
        for (size_t i = 1; i < smoothed.size(); i++) {
            REQUIRE(pathfinder.lineOfSight(smoothed[i - 1], smoothed[i]));
        }

        REQUIRE(pathfinder.smoothPath(smoothed) == smoothed);
    }
}
