#pragma once
#include <vector>
#include <optional>
#include <cmath>
#include "GridAdapter.h"

// distance estimate used to order the A* frontier
enum class Heuristic {
    Octile,     // exact on an empty 8-connected grid, default
    Manhattan   // |dx| + |dy|, cheaper but can overshoot diagonal cost
};

// result of a pathfinding operation
struct PathResult {
    std::vector<GridCell> path;          // the path from start to goal (inclusive)
    int nodesExpanded = 0;               // number of nodes expanded during search
    double computeTimeMs = 0.0;          // time taken to compute path in milliseconds
    bool found = false;                  // whether a path was found
    bool iterationLimitHit = false;      // search gave up at the expansion ceiling
    float pathLength = 0.0f;             // weighted path length in grid cells
};

// weighted 8-directional A* over a GridAdapter.
// holds no state between calls: every search builds its own node table and
// drops it on return, so one pathfinder can serve any number of robots
class Pathfinder {
public:
    static constexpr int DEFAULT_MAX_ITERATIONS = 1000;
    static constexpr float CARDINAL_COST = 1.0f;
    static constexpr float DIAGONAL_COST = 1.41421356f;

    explicit Pathfinder(const GridAdapter& grid,
                        int maxIterations = DEFAULT_MAX_ITERATIONS,
                        Heuristic heuristic = Heuristic::Octile);

    // returns nothing when either endpoint is blocked, the goal is walled off,
    // or the expansion ceiling is reached before the goal is popped
    std::optional<std::vector<GridCell>> findPath(const GridCell& start, const GridCell& goal) const;
    // same search, with timing and expansion counts for diagnostics
    PathResult findPathDetailed(const GridCell& start, const GridCell& goal) const;

    // drops waypoints that are visible from an earlier kept waypoint
    std::vector<GridCell> smoothPath(const std::vector<GridCell>& path) const;

    // utility
    bool lineOfSight(const GridCell& a, const GridCell& b) const;
    std::vector<GridCell> getNeighbors(const GridCell& cell) const;
    float heuristic(const GridCell& a, const GridCell& b) const;
    float octileDistance(const GridCell& a, const GridCell& b) const;
    float manhattanDistance(const GridCell& a, const GridCell& b) const;
    float euclideanDistance(const GridCell& a, const GridCell& b) const;
    float pathLength(const std::vector<GridCell>& path) const;

    int getMaxIterations() const { return maxIterations_; }
    void setMaxIterations(int maxIterations) { maxIterations_ = maxIterations; }
    Heuristic getHeuristic() const { return heuristic_; }
    void setHeuristic(Heuristic heuristic) { heuristic_ = heuristic; }
    const GridAdapter& getGrid() const { return grid_; }

private:
    // one entry in the per-call node table. parent is an index into the same
    // table (-1 for the start node), never a pointer
    struct SearchNode {
        GridCell cell;
        int parent;
        float g;  // cost from start
        float h;  // estimate to goal
        float f;  // g + h
    };

    std::vector<GridCell> reconstructPath(const std::vector<SearchNode>& nodes, int goalIndex) const;

    const GridAdapter& grid_;
    int maxIterations_;
    Heuristic heuristic_;
};
