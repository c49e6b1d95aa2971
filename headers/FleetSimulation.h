#pragma once
#include <SFML/System/Clock.hpp>
#include <SFML/System/Vector2.hpp>
#include <array>
#include <cstdint>
#include <random>
#include <vector>
#include "CollectibleRegistry.h"
#include "MaterialStockpile.h"
#include "RobotController.h"
#include "SimulationSettings.h"
#include "TileGrid.h"

// fleet wide totals, summed over every controller
struct FleetStats
{
    int robots = 0;
    std::array<int, ROBOT_STATE_COUNT> robotsInState{};

    // pathfinding
    int pathsPlanned = 0;
    int pathsFailed = 0;
    int iterationLimitHits = 0;
    long long nodesExpanded = 0;
    double searchTimeMs = 0.0;

    // work done
    int transitions = 0;
    int tripsCompleted = 0;
    float distanceTravelled = 0.0f; // pixels
    float deliveredKg = 0.0f;

    double averageSearchTimeMs() const { return pathsPlanned > 0 ? searchTimeMs / pathsPlanned : 0.0; }
};

// the demo world: a tile grid with a factory, a landfill full of collectibles
// and a fleet of robots hauling material to the factory dock
class FleetSimulation
{
public:
    explicit FleetSimulation(const SimulationSettings &settings, unsigned seed = 1);
    ~FleetSimulation() = default;

    // controllers point at the stockpile, so the simulation stays put
    FleetSimulation(const FleetSimulation &) = delete;
    FleetSimulation &operator=(const FleetSimulation &) = delete;

    // core simulation methods
    void update(float deltaTime);
    void reset();

    // robot management
    void spawnRobots(int count);
    RobotController &addRobot(const sf::Vector2f &position);
    int getRobotCount() const { return static_cast<int>(controllers_.size()); }
    std::vector<RobotController> &getControllers() { return controllers_; }
    const std::vector<RobotController> &getControllers() const { return controllers_; }

    // seeds the landfill with fresh collectibles, returns how many were placed
    int refillLandfill();
    int getRefillCount() const { return refillCount_; }

    // world access
    TileGrid &getGrid() { return grid_; }
    const TileGrid &getGrid() const { return grid_; }
    CollectibleRegistry &getRegistry() { return registry_; }
    const CollectibleRegistry &getRegistry() const { return registry_; }
    const MaterialStockpile &getStockpile() const { return stockpile_; }
    const WorldLayout &getLayout() const { return layout_; }
    const SimulationSettings &getSettings() const { return settings_; }

    // performance tracking
    std::uint64_t getTickCount() const { return tickCount_; }
    double getSimulatedSeconds() const { return simulatedSeconds_; }
    float getLastUpdateTime() const { return lastUpdateTime_; } // milliseconds

    FleetStats collectStats() const;
    void printStatistics() const;

private:
    SimulationSettings settings_;
    unsigned seed_;
    std::mt19937 rng_;

    TileGrid grid_;
    WorldLayout layout_{};
    CollectibleRegistry registry_;
    MaterialStockpile stockpile_;
    std::vector<RobotController> controllers_;

    int refillCount_ = 0;
    std::uint64_t tickCount_ = 0;
    double simulatedSeconds_ = 0.0;

    // performance tracking
    float lastUpdateTime_ = 0.0f;
    sf::Clock updateTimer_;

    void buildWorld();
};
