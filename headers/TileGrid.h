#pragma once
#include <cstdint>
#include <vector>
#include "GridAdapter.h"

enum class TileType : std::uint8_t {
    Empty,
    Landfill,
    Grass,
    Dirt,
    RoadDirt,
    RoadTar,
    RoadAsphalt,
    Factory,   // blocks movement
    Building,  // blocks movement
    Water      // blocks movement
};

// rectangle of tiles in grid coordinates
struct TileRect {
    int x, y;           // top left corner
    int width, height;  // size in tiles

    bool contains(int gx, int gy) const {
        return gx >= x && gx < x + width && gy >= y && gy < y + height;
    }
};

// what createTestWorld() laid down, so the host knows where to dock and seed
struct WorldLayout {
    GridCell factoryDock;   // walkable cell next to the factory where robots unload
    TileRect factory;
    TileRect landfill;
    TileRect city;
};

// tile based world grid: every tile has a type and an occupancy flag.
// factory, building and water tiles never let robots through; occupied tiles
// (construction sites and other static obstacles) block until cleared
class TileGrid : public GridAdapter {
public:
    TileGrid(int gridWidth, int gridHeight, int cellSize = 32);

    // grid management
    void resize(int gridWidth, int gridHeight);
    int getCellSize() const override { return cellSize_; }
    int getGridWidth() const override { return gridWidth_; }
    int getGridHeight() const override { return gridHeight_; }
    int getWorldWidth() const { return gridWidth_ * cellSize_; }
    int getWorldHeight() const { return gridHeight_ * cellSize_; }

    // tile management
    void setTileType(int gridX, int gridY, TileType type);
    TileType getTileType(int gridX, int gridY) const;
    void fillRect(const TileRect& rect, TileType type);
    void fill(TileType type);

    // occupancy (static obstacles layered on top of the tile type)
    void setOccupied(int gridX, int gridY, bool occupied);
    void setOccupied(const TileRect& rect, bool occupied);
    bool isOccupied(int gridX, int gridY) const;
    void clearOccupancy();

    bool inBounds(int gridX, int gridY) const;
    bool isWalkable(int gridX, int gridY) const;
    bool isWalkable(const GridCell& cell) const override;
    int countWalkable() const;

    static bool isBlockingType(TileType type);

    // coordinate conversion
    using GridAdapter::worldToGrid;
    GridCell worldToGrid(float worldX, float worldY) const override;
    sf::Vector2f gridToWorld(const GridCell& cell) const override;
    sf::Vector2f gridToWorld(int gridX, int gridY) const;

    // factory in the middle, landfill to the left, a small city block to the right.
    // the layout scales with the grid so small test grids still get all three zones
    WorldLayout createTestWorld(unsigned seed);

private:
    int gridWidth_, gridHeight_;  // grid dimensions in tiles
    int cellSize_;                // size of each tile in pixels

    std::vector<TileType> tiles_;
    std::vector<bool> occupied_;

    int getIndex(int x, int y) const { return y * gridWidth_ + x; }
};
