#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "GridAdapter.h"
#include "Inventory.h"
#include "TargetRegistry.h"

// task state of a robot, exactly one per tick
enum class RobotState
{
    Idle,
    MovingToTarget,
    PerformingAction,
    ReturningToBase,
    Unloading
};

constexpr int ROBOT_STATE_COUNT = 5;

const char *robotStateName(RobotState state);

// what the robot is currently working towards
struct TargetTask
{
    TargetRef target;
};

struct BaseTask
{
    GridCell base;
};

using RobotTask = std::variant<std::monostate, TargetTask, BaseTask>;

// collector robot. position is in world pixels, the path is in grid cells.
// the robot borrows the grid and the registry every tick, it owns neither
struct Robot
{
public:
    int id = -1;

    // movement
    sf::Vector2f position;
    sf::Vector2f velocity; // pixels per second, zero when standing
    float angle = 0.0f;    // heading in radians
    float speed = 100.0f;  // pixels per second

    // task
    RobotState state = RobotState::Idle;
    RobotTask task;

    // path following
    std::vector<GridCell> currentPath; // waypoints from pathfinder
    size_t pathIndex = 0;              // next waypoint; == size() means exhausted

    // inventory
    Inventory inventory;
    float currentLoad = 0.0f; // kg
    float maxCapacity = 100.0f;

    // power
    float powerCapacity = 1000.0f;
    float currentPower = 1000.0f;
    float powerDrainRate = 1.0f; // units per second when moving

    // statistics
    float distanceTravelled = 0.0f; // pixels
    int tripsCompleted = 0;

    Robot(float x, float y, int robotId = -1);

    // inventory, load never exceeds capacity
    float addMaterial(const std::string &material, float quantity);
    Inventory emptyInventory();
    bool isFull() const { return currentLoad >= maxCapacity; }
    float availableSpace() const { return maxCapacity - currentLoad; }

    // power
    void recharge() { currentPower = powerCapacity; }
    float getPowerPercent() const { return 100.0f * currentPower / powerCapacity; }

    // task
    bool hasTask() const { return !std::holds_alternative<std::monostate>(task); }

    // path following
    void setPath(std::vector<GridCell> path);
    void clearPath();
    bool hasPath() const { return !currentPath.empty(); }
    bool isPathExhausted() const { return pathIndex >= currentPath.size(); }
    float getPathProgress() const;

    // straight line step toward a world point, capped at the remaining distance.
    // returns true when the point has been reached
    bool moveTowards(const sf::Vector2f &point, float dt);

    // moves toward the next unconsumed waypoint centre for one tick.
    // returns true once every waypoint has been consumed
    bool followPath(const GridAdapter &grid, float dt, float waypointTolerance);

    float distanceTo(const sf::Vector2f &point) const;
};
