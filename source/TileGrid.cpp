#include "TileGrid.h"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

TileGrid::TileGrid(int gridWidth, int gridHeight, int cellSize)
    : gridWidth_(0), gridHeight_(0), cellSize_(cellSize) {
    if (cellSize <= 0) {
        throw std::invalid_argument("TileGrid: cell size must be positive");
    }
    resize(gridWidth, gridHeight);
}

void TileGrid::resize(int gridWidth, int gridHeight) {
    if (gridWidth <= 0 || gridHeight <= 0) {
        throw std::invalid_argument("TileGrid: grid dimensions must be positive");
    }
    gridWidth_ = gridWidth;
    gridHeight_ = gridHeight;
    tiles_.assign(static_cast<size_t>(gridWidth_) * gridHeight_, TileType::Grass);
    occupied_.assign(static_cast<size_t>(gridWidth_) * gridHeight_, false);
}

void TileGrid::setTileType(int gridX, int gridY, TileType type) {
    if (!inBounds(gridX, gridY)) return;
    tiles_[getIndex(gridX, gridY)] = type;
}

TileType TileGrid::getTileType(int gridX, int gridY) const {
    if (!inBounds(gridX, gridY)) return TileType::Empty;
    return tiles_[getIndex(gridX, gridY)];
}

void TileGrid::fillRect(const TileRect& rect, TileType type) {
    // clip to the grid so callers can hand over rectangles that hang off the edge
    int x0 = std::max(0, rect.x);
    int y0 = std::max(0, rect.y);
    int x1 = std::min(gridWidth_, rect.x + rect.width);
    int y1 = std::min(gridHeight_, rect.y + rect.height);
    for (int y = y0; y < y1; y++) {
        for (int x = x0; x < x1; x++) {
            tiles_[getIndex(x, y)] = type;
        }
    }
}

void TileGrid::fill(TileType type) {
    std::fill(tiles_.begin(), tiles_.end(), type);
}

void TileGrid::setOccupied(int gridX, int gridY, bool occupied) {
    if (!inBounds(gridX, gridY)) return;
    occupied_[getIndex(gridX, gridY)] = occupied;
}

void TileGrid::setOccupied(const TileRect& rect, bool occupied) {
    for (int y = rect.y; y < rect.y + rect.height; y++) {
        for (int x = rect.x; x < rect.x + rect.width; x++) {
            setOccupied(x, y, occupied);
        }
    }
}

bool TileGrid::isOccupied(int gridX, int gridY) const {
    if (!inBounds(gridX, gridY)) return false;
    return occupied_[getIndex(gridX, gridY)];
}

void TileGrid::clearOccupancy() {
    std::fill(occupied_.begin(), occupied_.end(), false);
}

bool TileGrid::inBounds(int gridX, int gridY) const {
    return gridX >= 0 && gridX < gridWidth_ && gridY >= 0 && gridY < gridHeight_;
}

bool TileGrid::isBlockingType(TileType type) {
    switch (type) {
        case TileType::Factory:
        case TileType::Building:
        case TileType::Water:
            return true;
        default:
            return false;
    }
}

bool TileGrid::isWalkable(int gridX, int gridY) const {
    if (!inBounds(gridX, gridY)) return false;
    int index = getIndex(gridX, gridY);
    return !isBlockingType(tiles_[index]) && !occupied_[index];
}

bool TileGrid::isWalkable(const GridCell& cell) const {
    return isWalkable(cell.x, cell.y);
}

int TileGrid::countWalkable() const {
    int count = 0;
    for (int y = 0; y < gridHeight_; y++) {
        for (int x = 0; x < gridWidth_; x++) {
            if (isWalkable(x, y)) count++;
        }
    }
    return count;
}

GridCell TileGrid::worldToGrid(float worldX, float worldY) const {
    // floor so positions left of / above the origin land in negative cells instead of cell 0
    return {static_cast<int>(std::floor(worldX / cellSize_)),
            static_cast<int>(std::floor(worldY / cellSize_))};
}

sf::Vector2f TileGrid::gridToWorld(const GridCell& cell) const {
    return gridToWorld(cell.x, cell.y);
}

sf::Vector2f TileGrid::gridToWorld(int gridX, int gridY) const {
    return {(gridX + 0.5f) * cellSize_, (gridY + 0.5f) * cellSize_};
}

WorldLayout TileGrid::createTestWorld(unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> prob(0.0f, 1.0f);

    fill(TileType::Grass);
    clearOccupancy();

    WorldLayout layout{};
    int centerX = gridWidth_ / 2;
    int centerY = gridHeight_ / 2;

    // factory block (5x5) in the middle of a grass clearing
    layout.factory = {centerX - 2, centerY - 2, 5, 5};
    fillRect(layout.factory, TileType::Factory);

    // dirt road leading west out of the factory, robots dock at its end
    for (int x = centerX - 10; x < centerX - 2; x++) {
        setTileType(x, centerY, TileType::RoadDirt);
    }
    layout.factoryDock = {std::max(0, centerX - 3), centerY};

    // landfill to the west, mostly landfill tiles with some bare dirt
    int landfillX = std::max(1, gridWidth_ / 12);
    int landfillWidth = std::max(2, gridWidth_ / 4);
    int landfillY = gridHeight_ / 5;
    int landfillHeight = std::max(2, gridHeight_ * 2 / 5);
    landfillWidth = std::min(landfillWidth, layout.factory.x - 1 - landfillX);
    layout.landfill = {landfillX, landfillY, std::max(1, landfillWidth), landfillHeight};
    for (int y = layout.landfill.y; y < layout.landfill.y + layout.landfill.height; y++) {
        for (int x = layout.landfill.x; x < layout.landfill.x + layout.landfill.width; x++) {
            setTileType(x, y, prob(gen) < 0.8f ? TileType::Landfill : TileType::Dirt);
        }
    }

    // city block to the east: a road lattice with buildings in between
    int cityX = layout.factory.x + layout.factory.width + std::max(2, gridWidth_ / 8);
    int cityWidth = std::max(0, gridWidth_ - gridWidth_ / 8 - cityX);
    layout.city = {cityX, gridHeight_ / 5, cityWidth, gridHeight_ * 3 / 5};
    for (int y = layout.city.y; y < layout.city.y + layout.city.height; y++) {
        for (int x = layout.city.x; x < layout.city.x + layout.city.width; x++) {
            if (x % 8 == 0 || x % 8 == 7 || y % 8 == 0 || y % 8 == 7) {
                setTileType(x, y, TileType::RoadTar);
            } else if (prob(gen) < 0.6f) {
                setTileType(x, y, TileType::Building);
            }
        }
    }

    return layout;
}
