#include "Robot.h"
#include <algorithm>
#include <cmath>

const char *robotStateName(RobotState state)
{
    switch (state)
    {
    case RobotState::Idle:
        return "Idle";
    case RobotState::MovingToTarget:
        return "MovingToTarget";
    case RobotState::PerformingAction:
        return "PerformingAction";
    case RobotState::ReturningToBase:
        return "ReturningToBase";
    case RobotState::Unloading:
        return "Unloading";
    default:
        return "Unknown";
    }
}

Robot::Robot(float x, float y, int robotId)
    : id(robotId), position(x, y), velocity(0.0f, 0.0f)
{
}

float Robot::addMaterial(const std::string &material, float quantity)
{
    float space = availableSpace();
    float amount = std::min(quantity, space);
    if (amount <= 0.0f)
        return 0.0f;

    inventory.materials[material] += amount;
    // land exactly on capacity so isFull() does not depend on float rounding
    currentLoad = (amount >= space) ? maxCapacity : currentLoad + amount;
    return amount;
}

Inventory Robot::emptyInventory()
{
    Inventory materials = inventory;
    inventory.clear();
    currentLoad = 0.0f;
    return materials;
}

float Robot::distanceTo(const sf::Vector2f &point) const
{
    float dx = point.x - position.x;
    float dy = point.y - position.y;
    return std::sqrt(dx * dx + dy * dy);
}


// path following
void Robot::setPath(std::vector<GridCell> path) {
    currentPath = std::move(path);
    pathIndex = 0;
}

void Robot::clearPath() {
    currentPath.clear();
    pathIndex = 0;
    velocity = sf::Vector2f(0.0f, 0.0f);
}

float Robot::getPathProgress() const {
    if (currentPath.empty()) return 0.0f;
    return static_cast<float>(pathIndex) / static_cast<float>(currentPath.size());
}

bool Robot::moveTowards(const sf::Vector2f& point, float dt) {
    velocity = sf::Vector2f(0.0f, 0.0f);

    float dx = point.x - position.x;
    float dy = point.y - position.y;
    float distance = std::sqrt(dx * dx + dy * dy);
    if (distance <= 0.0f) {
        return true;
    }
    if (dt <= 0.0f) {
        return false;
    }

    float dirX = dx / distance;
    float dirY = dy / distance;

    // face movement direction
    angle = std::atan2(dirY, dirX);

    // never overshoot the point
    float step = std::min(speed * dt, distance);
    position.x += dirX * step;
    position.y += dirY * step;

    velocity.x = dirX * speed;
    velocity.y = dirY * speed;
    distanceTravelled += step;

    currentPower = std::max(0.0f, currentPower - powerDrainRate * dt);
    return step >= distance;
}

bool Robot::followPath(const GridAdapter& grid, float dt, float waypointTolerance) {
    velocity = sf::Vector2f(0.0f, 0.0f);
    if (isPathExhausted()) {
        return true;
    }

    // gets current target waypoint
    sf::Vector2f target = grid.gridToWorld(currentPath[pathIndex]);

    // on the waypoint: consume it and aim at the next one in the same tick
    if (distanceTo(target) <= waypointTolerance) {
        pathIndex++;
        if (isPathExhausted()) {
            return true;
        }
        target = grid.gridToWorld(currentPath[pathIndex]);
    }

    moveTowards(target, dt);
    return false;
}
