#pragma once
#include <array>
#include <functional>
#include <optional>
#include <string>
#include "BaseSink.h"
#include "GridAdapter.h"
#include "Pathfinder.h"
#include "Robot.h"
#include "SimulationSettings.h"
#include "TargetRegistry.h"

// per robot planning counters
struct PlanningStats {
    int pathsPlanned = 0;
    int pathsFailed = 0;
    int iterationLimitHits = 0;
    long long nodesExpanded = 0;
    double searchTimeMs = 0.0;
};

// drives one robot through seek, approach, act, return and unload.
// the grid and the registry are borrowed for the duration of a tick only
class RobotController {
public:
    enum class ActionOutcome {
        InProgress, // keep acting next tick
        Completed,
        TargetLost
    };

    using ActionCallback = std::function<ActionOutcome(Robot&, const TargetRef&, TargetRegistry&)>;

    RobotController(Robot robot, const SimulationSettings& settings);

    // base cell the robot unloads at; the sink must outlive the controller
    void setBase(const GridCell& base, BaseSink& sink);
    void clearBase();
    bool hasBase() const { return base_.has_value(); }
    const std::optional<GridCell>& getBase() const { return base_; }

    // what happens while PerformingAction, defaults to collectAction
    void setActionCallback(ActionCallback action);
    // takes as much as fits from the target into the inventory
    static ActionOutcome collectAction(Robot& robot, const TargetRef& target, TargetRegistry& registry);

    // evaluates the current state once, at most one planning pass per state
    void tick(float dt, const GridAdapter& grid, TargetRegistry& registry);

    Robot& getRobot() { return robot_; }
    const Robot& getRobot() const { return robot_; }
    RobotState getState() const { return robot_.state; }
    const SimulationSettings& getSettings() const { return settings_; }

    // diagnostics
    const PlanningStats& getStats() const { return stats_; }
    const PathResult& lastPlan() const { return lastPlan_; } // unsmoothed
    int transitionCount(RobotState from, RobotState to) const;
    int totalTransitions() const;
    const std::string& lastTransitionReason() const { return lastReason_; }
    float getDeliveredKg() const { return deliveredKg_; }

private:
    Robot robot_;
    SimulationSettings settings_;

    std::optional<GridCell> base_;
    BaseSink* sink_ = nullptr;
    ActionCallback action_;

    PlanningStats stats_;
    PathResult lastPlan_;
    std::array<std::array<int, ROBOT_STATE_COUNT>, ROBOT_STATE_COUNT> transitions_{};
    std::string lastReason_;
    float deliveredKg_ = 0.0f;

    // state handlers
    void updateIdle(const GridAdapter& grid, TargetRegistry& registry);
    void updateMovingToTarget(float dt, const GridAdapter& grid, TargetRegistry& registry);
    void updatePerformingAction(const GridAdapter& grid, TargetRegistry& registry);
    void updateReturningToBase(float dt, const GridAdapter& grid);
    void updateUnloading();

    // helpers
    bool planPathTo(const GridAdapter& grid, const GridCell& goal);
    GridCell startCell(const GridAdapter& grid) const;
    bool advanceTowards(const GridAdapter& grid, const sf::Vector2f& point, float dt);
    bool isLowPower() const;
    void changeState(RobotState next, const char* reason);
    void abandonTask(const char* reason);
    void beginReturnToBase(const GridAdapter& grid, const char* reason);
    void beginUnloading();
};
