#include "RobotController.h"
#include <iostream>
#include <utility>

RobotController::RobotController(Robot robot, const SimulationSettings& settings)
    : robot_(std::move(robot)), settings_(settings), action_(&RobotController::collectAction) {
}

void RobotController::setBase(const GridCell& base, BaseSink& sink) {
    base_ = base;
    sink_ = &sink;
}

void RobotController::clearBase() {
    base_.reset();
    sink_ = nullptr;
}

void RobotController::setActionCallback(ActionCallback action) {
    action_ = action ? std::move(action) : ActionCallback(&RobotController::collectAction);
}

RobotController::ActionOutcome RobotController::collectAction(Robot& robot, const TargetRef& target,
                                                              TargetRegistry& registry) {
    if (!registry.isStillValid(target)) {
        return ActionOutcome::TargetLost;
    }

    CollectResult collected = registry.collect(target, robot.availableSpace());
    if (collected.amount > 0.0f) {
        robot.addMaterial(collected.material, collected.amount);
    }
    return ActionOutcome::Completed;
}

void RobotController::tick(float dt, const GridAdapter& grid, TargetRegistry& registry) {
    switch (robot_.state) {
        case RobotState::Idle:
            updateIdle(grid, registry);
            break;
        case RobotState::MovingToTarget:
            updateMovingToTarget(dt, grid, registry);
            break;
        case RobotState::PerformingAction:
            updatePerformingAction(grid, registry);
            break;
        case RobotState::ReturningToBase:
            updateReturningToBase(dt, grid);
            break;
        case RobotState::Unloading:
            updateUnloading();
            break;
    }
}

int RobotController::transitionCount(RobotState from, RobotState to) const {
    return transitions_[static_cast<int>(from)][static_cast<int>(to)];
}

int RobotController::totalTransitions() const {
    int total = 0;
    for (const auto& row : transitions_) {
        for (int count : row) {
            total += count;
        }
    }
    return total;
}

// state handlers
void RobotController::updateIdle(const GridAdapter& grid, TargetRegistry& registry) {
    robot_.velocity = sf::Vector2f(0.0f, 0.0f);

    if (base_ && robot_.isFull()) {
        beginReturnToBase(grid, "inventory full");
        return;
    }
    if (base_ && isLowPower()) {
        beginReturnToBase(grid, "low power");
        return;
    }
    // full with nowhere to unload
    if (robot_.isFull()) {
        return;
    }

    std::optional<TargetRef> target = registry.findNearestEligible(robot_.position, settings_.searchRadius);
    if (!target) {
        return;
    }
    std::optional<sf::Vector2f> targetPos = registry.targetPosition(*target);
    if (!targetPos) {
        return;
    }

    // unreachable targets are dropped for this tick, the next tick searches again
    if (!planPathTo(grid, grid.worldToGrid(*targetPos))) {
        return;
    }

    robot_.task = TargetTask{*target};
    changeState(RobotState::MovingToTarget, "target found");
}

void RobotController::updateMovingToTarget(float dt, const GridAdapter& grid, TargetRegistry& registry) {
    const TargetTask* task = std::get_if<TargetTask>(&robot_.task);
    if (!task || !registry.isStillValid(task->target)) {
        abandonTask("target gone");
        return;
    }
    std::optional<sf::Vector2f> targetPos = registry.targetPosition(task->target);
    if (!targetPos) {
        abandonTask("target gone");
        return;
    }

    if (base_ && isLowPower()) {
        beginReturnToBase(grid, "low power");
        return;
    }

    if (robot_.distanceTo(*targetPos) <= settings_.actionRadius) {
        robot_.clearPath();
        changeState(RobotState::PerformingAction, "target in reach");
        return;
    }

    if (!advanceTowards(grid, *targetPos, dt)) {
        abandonTask("target unreachable");
    }
}

void RobotController::updatePerformingAction(const GridAdapter& grid, TargetRegistry& registry) {
    robot_.velocity = sf::Vector2f(0.0f, 0.0f);

    const TargetTask* task = std::get_if<TargetTask>(&robot_.task);
    if (!task || !registry.isStillValid(task->target)) {
        abandonTask("target gone");
        return;
    }

    switch (action_(robot_, task->target, registry)) {
        case ActionOutcome::InProgress:
            break;
        case ActionOutcome::TargetLost:
            abandonTask("target lost");
            break;
        case ActionOutcome::Completed:
            if (base_ && robot_.isFull()) {
                beginReturnToBase(grid, "inventory full");
            } else {
                abandonTask("action complete");
            }
            break;
    }
}

void RobotController::updateReturningToBase(float dt, const GridAdapter& grid) {
    const BaseTask* task = std::get_if<BaseTask>(&robot_.task);
    if (!task) {
        abandonTask("no base");
        return;
    }

    sf::Vector2f basePos = grid.gridToWorld(task->base);
    if (robot_.distanceTo(basePos) <= settings_.baseArrivalRadius) {
        beginUnloading();
        return;
    }

    // a base that cannot be reached now is retried next tick
    if (!advanceTowards(grid, basePos, dt) && settings_.logTransitions) {
        std::cout << "Robot " << robot_.id << ": no route to base, retrying" << std::endl;
    }
}

void RobotController::updateUnloading() {
    robot_.task = std::monostate{};
    changeState(RobotState::Idle, "unloaded");
}

// helpers
bool RobotController::planPathTo(const GridAdapter& grid, const GridCell& goal) {
    Pathfinder pathfinder(grid, settings_.maxSearchIterations, settings_.heuristic);
    lastPlan_ = pathfinder.findPathDetailed(startCell(grid), goal);

    stats_.pathsPlanned++;
    stats_.nodesExpanded += lastPlan_.nodesExpanded;
    stats_.searchTimeMs += lastPlan_.computeTimeMs;

    if (!lastPlan_.found) {
        stats_.pathsFailed++;
        if (lastPlan_.iterationLimitHit) {
            stats_.iterationLimitHits++;
        }
        robot_.clearPath();
        return false;
    }

    robot_.setPath(settings_.smoothPaths ? pathfinder.smoothPath(lastPlan_.path) : lastPlan_.path);
    return true;
}

// the robot's own cell, or the closest open neighbour when the robot is
// clipping a corner or stands on a tile that was blocked under it
GridCell RobotController::startCell(const GridAdapter& grid) const {
    GridCell cell = grid.worldToGrid(robot_.position);
    if (grid.isWalkable(cell)) {
        return cell;
    }

    GridCell best = cell;
    float bestDistance = 0.0f;
    for (int dy = -1; dy <= 1; dy++) {
        for (int dx = -1; dx <= 1; dx++) {
            GridCell next{cell.x + dx, cell.y + dy};
            if ((dx == 0 && dy == 0) || !grid.isWalkable(next)) continue;

            float distance = robot_.distanceTo(grid.gridToWorld(next));
            if (best == cell || distance < bestDistance) {
                best = next;
                bestDistance = distance;
            }
        }
    }
    return best;
}

// follows the current path, replanning once it is used up. inside the goal
// cell the robot heads straight for the point instead of the cell centre
bool RobotController::advanceTowards(const GridAdapter& grid, const sf::Vector2f& point, float dt) {
    GridCell goal = grid.worldToGrid(point);

    if (robot_.isPathExhausted()) {
        if (grid.worldToGrid(robot_.position) == goal) {
            robot_.moveTowards(point, dt);
            return true;
        }
        if (!planPathTo(grid, goal)) {
            return false;
        }
    }

    robot_.followPath(grid, dt, settings_.waypointTolerance);
    return true;
}

bool RobotController::isLowPower() const {
    return settings_.lowPowerThreshold > 0.0f && robot_.currentPower <= settings_.lowPowerThreshold;
}

void RobotController::changeState(RobotState next, const char* reason) {
    RobotState previous = robot_.state;
    transitions_[static_cast<int>(previous)][static_cast<int>(next)]++;
    lastReason_ = reason;
    robot_.state = next;

    if (settings_.logTransitions) {
        std::cout << "Robot " << robot_.id << ": " << robotStateName(previous) << " -> "
                  << robotStateName(next) << " (" << reason << ")" << std::endl;
    }
}

void RobotController::abandonTask(const char* reason) {
    robot_.task = std::monostate{};
    robot_.clearPath();
    changeState(RobotState::Idle, reason);
}

void RobotController::beginReturnToBase(const GridAdapter& grid, const char* reason) {
    robot_.task = BaseTask{*base_};
    robot_.clearPath();
    changeState(RobotState::ReturningToBase, reason);

    // failure leaves the path empty, updateReturningToBase replans next tick
    if (!planPathTo(grid, *base_) && settings_.logTransitions) {
        std::cout << "Robot " << robot_.id << ": no route to base, retrying" << std::endl;
    }
}

void RobotController::beginUnloading() {
    robot_.clearPath();
    changeState(RobotState::Unloading, "arrived at base");

    Inventory load = robot_.emptyInventory();
    float kg = load.total();
    if (sink_) {
        sink_->deposit(load);
    }
    if (kg > 0.0f) {
        robot_.tripsCompleted++;
        deliveredKg_ += kg;
    }
    robot_.recharge();
}
