#include "Pathfinder.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <queue>
#include <unordered_map>
#include <unordered_set>

Pathfinder::Pathfinder(const GridAdapter& grid, int maxIterations, Heuristic heuristic)
    : grid_(grid), maxIterations_(maxIterations), heuristic_(heuristic) {}

float Pathfinder::heuristic(const GridCell& a, const GridCell& b) const {
    return heuristic_ == Heuristic::Manhattan ? manhattanDistance(a, b) : octileDistance(a, b);
}

float Pathfinder::octileDistance(const GridCell& a, const GridCell& b) const {
    // octile distance: straight diagonal run plus the cardinal remainder
    int dx = std::abs(a.x - b.x);
    int dy = std::abs(a.y - b.y);
    return static_cast<float>(std::max(dx, dy)) + (DIAGONAL_COST - CARDINAL_COST) * static_cast<float>(std::min(dx, dy));
}

float Pathfinder::manhattanDistance(const GridCell& a, const GridCell& b) const {
    return static_cast<float>(std::abs(a.x - b.x) + std::abs(a.y - b.y));
}

float Pathfinder::euclideanDistance(const GridCell& a, const GridCell& b) const {
    float dx = static_cast<float>(a.x - b.x);
    float dy = static_cast<float>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

std::vector<GridCell> Pathfinder::getNeighbors(const GridCell& cell) const {
    std::vector<GridCell> neighbors;
    neighbors.reserve(8);  // max 8 directions

    // direction offsets: first 4 are cardinal (N, E, S, W). and next 4 are diagonals
    const int dx[] = {0, 1, 0, -1, 1, 1, -1, -1};
    const int dy[] = {-1, 0, 1, 0, -1, 1, 1, -1};

    for (int i = 0; i < 8; i++) {
        GridCell next{cell.x + dx[i], cell.y + dy[i]};
        if (!grid_.isWalkable(next)) continue;

        // for diagonal moves (indices 4-7) both orthogonal cells next to the move
        // must be walkable, otherwise the robot would clip a blocked corner
        if (i >= 4) {
            bool canPassX = grid_.isWalkable(GridCell{cell.x + dx[i], cell.y});
            bool canPassY = grid_.isWalkable(GridCell{cell.x, cell.y + dy[i]});
            if (!canPassX || !canPassY) continue;
        }
        neighbors.push_back(next);
    }

    return neighbors;
}

std::vector<GridCell> Pathfinder::reconstructPath(const std::vector<SearchNode>& nodes, int goalIndex) const {
    std::vector<GridCell> path;

    // walk parent indices from the goal back to the start
    for (int index = goalIndex; index >= 0; index = nodes[index].parent) {
        path.push_back(nodes[index].cell);
    }

    // collected goal first
    std::reverse(path.begin(), path.end());
    return path;
}

float Pathfinder::pathLength(const std::vector<GridCell>& path) const {
    float length = 0.0f;
    for (size_t i = 1; i < path.size(); i++) {
        length += euclideanDistance(path[i - 1], path[i]);
    }
    return length;
}

std::optional<std::vector<GridCell>> Pathfinder::findPath(const GridCell& start, const GridCell& goal) const {
    PathResult result = findPathDetailed(start, goal);
    if (!result.found) {
        return std::nullopt;
    }
    return std::move(result.path);
}

// A* algorithm
PathResult Pathfinder::findPathDetailed(const GridCell& start, const GridCell& goal) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    PathResult result;

    if (!grid_.isWalkable(start) || !grid_.isWalkable(goal)) {
        return result;
    }

    if (start == goal) {
        result.found = true;
        result.path = {start};
        return result;
    }

    // frontier entry: lowest f first, lower h wins ties, then first pushed wins.
    // a cheaper rediscovery pushes a fresh entry and leaves the old one to be
    // skipped when it surfaces (its f no longer matches the node)
    struct OpenEntry {
        float f;
        float h;
        std::uint32_t order;
        int node;
    };
    struct OpenEntryAfter {
        bool operator()(const OpenEntry& a, const OpenEntry& b) const {
            if (a.f != b.f) return a.f > b.f;
            if (a.h != b.h) return a.h > b.h;
            return a.order > b.order;
        }
    };

    std::vector<SearchNode> nodes;                                 // node table for this call
    std::unordered_map<GridCell, int, GridCellHash> openIndex;     // open cell -> node index
    std::unordered_set<GridCell, GridCellHash> closed;             // expanded cells, never reopened
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntryAfter> frontier;
    std::uint32_t pushOrder = 0;

    nodes.reserve(256);
    float startH = heuristic(start, goal);
    nodes.push_back({start, -1, 0.0f, startH, startH});
    openIndex[start] = 0;
    frontier.push({startH, startH, pushOrder++, 0});

    // expand the cheapest open cell until the goal comes off the frontier
    while (!frontier.empty()) {
        if (result.nodesExpanded >= maxIterations_) {
            // ceiling reached, treated exactly like an unreachable goal
            result.iterationLimitHit = true;
            break;
        }

        OpenEntry entry = frontier.top();
        frontier.pop();
        if (entry.f != nodes[entry.node].f) continue;  // stale
        GridCell current = nodes[entry.node].cell;
        if (closed.count(current)) continue;

        openIndex.erase(current);
        closed.insert(current);
        result.nodesExpanded++;

        if (current == goal) {
            result.found = true;
            result.path = reconstructPath(nodes, entry.node);
            result.pathLength = pathLength(result.path);
            break;
        }

        float currentG = nodes[entry.node].g;
        for (const GridCell& neighbor : getNeighbors(current)) {
            if (closed.count(neighbor)) continue;

            bool diagonal = neighbor.x != current.x && neighbor.y != current.y;
            float tentativeG = currentG + (diagonal ? DIAGONAL_COST : CARDINAL_COST);

            auto it = openIndex.find(neighbor);
            if (it != openIndex.end()) {
                // already open, only take the cheaper route
                SearchNode& open = nodes[it->second];
                if (tentativeG < open.g) {
                    open.g = tentativeG;
                    open.f = open.g + open.h;
                    open.parent = entry.node;
                    frontier.push({open.f, open.h, pushOrder++, it->second});
                }
            } else {
                float h = heuristic(neighbor, goal);
                int index = static_cast<int>(nodes.size());
                nodes.push_back({neighbor, entry.node, tentativeG, h, tentativeG + h});
                openIndex.emplace(neighbor, index);
                frontier.push({tentativeG + h, h, pushOrder++, index});
            }
        }
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}

// simplify path by removing unnecessary waypoints using line of sight checks.
// from each kept waypoint we look for the furthest later waypoint that is still
// visible, searching backward from the end so as many points as possible are skipped
std::vector<GridCell> Pathfinder::smoothPath(const std::vector<GridCell>& path) const {
    if (path.size() <= 2) return path;

    std::vector<GridCell> smoothed;
    smoothed.push_back(path[0]);  // always keep start.

    size_t current = 0;
    while (current < path.size() - 1) {
        size_t next = current + 1;
        for (size_t candidate = path.size() - 1; candidate > current + 1; candidate--) {
            if (lineOfSight(path[current], path[candidate])) {
                next = candidate;
                break;
            }
        }
        smoothed.push_back(path[next]);
        current = next;
    }

    return smoothed;
}

bool Pathfinder::lineOfSight(const GridCell& a, const GridCell& b) const {
    // Bresenham walk from a to b, both endpoints included. any cell that
    // cannot be walked on breaks the sightline, and a diagonal step needs
    // both flanking cells open, same rule as getNeighbors
    GridCell cell = a;
    int spanX = std::abs(b.x - a.x);
    int spanY = std::abs(b.y - a.y);
    int stepX = (a.x < b.x) ? 1 : -1;
    int stepY = (a.y < b.y) ? 1 : -1;
    int error = spanX - spanY;

    for (;;) {
        if (!grid_.isWalkable(cell)) return false;
        if (cell == b) return true;

        int doubled = 2 * error;
        bool moveX = doubled > -spanY;
        bool moveY = doubled < spanX;
        if (moveX && moveY) {
            if (!grid_.isWalkable(GridCell{cell.x + stepX, cell.y}) ||
                !grid_.isWalkable(GridCell{cell.x, cell.y + stepY})) {
                return false;
            }
        }
        if (moveX) {
            error -= spanY;
            cell.x += stepX;
        }
        if (moveY) {
            error += spanX;
            cell.y += stepY;
        }
    }
}
