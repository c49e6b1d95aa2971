#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <functional>

// grid cell coordinates
struct GridCell {
    int x, y;

    bool operator==(const GridCell& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const GridCell& other) const {
        return !(*this == other);
    }

    bool operator<(const GridCell& other) const {
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

// hash function for GridCell (for use in unordered_map/set)
struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int>()(cell.x) ^ (std::hash<int>()(cell.y) << 16);
    }
};

// read only view of the world grid that the pathfinder and the robots navigate.
// walkability must not change while a tick is running; whoever mutates the
// grid (construction, deconstruction) does it between ticks
class GridAdapter {
public:
    virtual ~GridAdapter() = default;

    // true iff the cell is in bounds, not a blocking tile and not occupied
    virtual bool isWalkable(const GridCell& cell) const = 0;

    virtual GridCell worldToGrid(float worldX, float worldY) const = 0;
    // centre of the cell in world pixels
    virtual sf::Vector2f gridToWorld(const GridCell& cell) const = 0;

    virtual int getCellSize() const = 0;
    virtual int getGridWidth() const = 0;
    virtual int getGridHeight() const = 0;

    GridCell worldToGrid(const sf::Vector2f& position) const {
        return worldToGrid(position.x, position.y);
    }
};
