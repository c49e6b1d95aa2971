#include "FleetSimulation.h"
#include <iomanip>
#include <iostream>
#include <utility>

namespace
{
    const char *const MATERIALS[] = {"plastic", "metal", "glass", "rubber", "paper", "electronic"};
    constexpr int MATERIAL_COUNT = sizeof(MATERIALS) / sizeof(MATERIALS[0]);

    SimulationSettings validated(SimulationSettings settings)
    {
        settings.validateAndClamp();
        return settings;
    }
}

FleetSimulation::FleetSimulation(const SimulationSettings &settings, unsigned seed)
    : settings_(validated(settings)), seed_(seed), rng_(seed),
      grid_(settings_.gridWidth, settings_.gridHeight, settings_.tileSize)
{
    buildWorld();

    std::cout << "FleetSimulation initialized:" << std::endl;
    std::cout << "  Grid: " << grid_.getGridWidth() << "x" << grid_.getGridHeight()
              << " tiles of " << grid_.getCellSize() << "px (" << grid_.countWalkable() << " walkable)" << std::endl;
    std::cout << "  Dock: (" << layout_.factoryDock.x << ", " << layout_.factoryDock.y << ")" << std::endl;
    std::cout << "  Robots: " << controllers_.size() << std::endl;
    std::cout << "  Collectibles: " << registry_.size() << std::endl;
    std::cout << "  Heuristic: " << SimulationSettings::heuristicName(settings_.heuristic) << std::endl;
}

void FleetSimulation::buildWorld()
{
    layout_ = grid_.createTestWorld(seed_);
    spawnRobots(settings_.robotCount);
    refillLandfill();
}

void FleetSimulation::update(float deltaTime)
{
    updateTimer_.restart();

    // landfill ran dry, dump a new load
    if (registry_.empty())
    {
        refillLandfill();
    }

    // robots run one after the other, in spawn order
    for (auto &controller : controllers_)
    {
        controller.tick(deltaTime, grid_, registry_);
    }

    tickCount_++;
    simulatedSeconds_ += deltaTime;
    lastUpdateTime_ = updateTimer_.getElapsedTime().asMicroseconds() / 1000.0f;
}

void FleetSimulation::reset()
{
    controllers_.clear();
    registry_.clear();
    stockpile_.clear();
    rng_.seed(seed_);
    refillCount_ = 0;
    tickCount_ = 0;
    simulatedSeconds_ = 0.0;

    buildWorld();
    std::cout << "Simulation reset with " << controllers_.size() << " robots" << std::endl;
}

void FleetSimulation::spawnRobots(int count)
{
    sf::Vector2f dock = grid_.gridToWorld(layout_.factoryDock);
    for (int i = 0; i < count; i++)
    {
        addRobot(dock);
    }
}

RobotController &FleetSimulation::addRobot(const sf::Vector2f &position)
{
    Robot robot(position.x, position.y, static_cast<int>(controllers_.size()));
    robot.speed = settings_.robotSpeed;
    robot.maxCapacity = settings_.robotCapacity;
    robot.powerCapacity = settings_.powerCapacity;
    robot.currentPower = settings_.powerCapacity;
    robot.powerDrainRate = settings_.powerDrainRate;

    controllers_.emplace_back(std::move(robot), settings_);
    RobotController &controller = controllers_.back();
    controller.setBase(layout_.factoryDock, stockpile_);
    return controller;
}

int FleetSimulation::refillLandfill()
{
    const TileRect &landfill = layout_.landfill;
    if (landfill.width <= 0 || landfill.height <= 0)
    {
        return 0;
    }

    std::uniform_int_distribution<int> cellX(landfill.x, landfill.x + landfill.width - 1);
    std::uniform_int_distribution<int> cellY(landfill.y, landfill.y + landfill.height - 1);
    std::uniform_real_distribution<float> offset(0.1f, 0.9f);
    std::uniform_real_distribution<float> kg(settings_.collectibleMinKg, settings_.collectibleMaxKg);
    std::uniform_int_distribution<int> material(0, MATERIAL_COUNT - 1);

    float tile = static_cast<float>(grid_.getCellSize());
    int placed = 0;
    int attempts = settings_.collectiblesPerRefill * 10;
    while (placed < settings_.collectiblesPerRefill && attempts-- > 0)
    {
        int x = cellX(rng_);
        int y = cellY(rng_);
        if (!grid_.isWalkable(x, y))
        {
            continue;
        }

        registry_.add((x + offset(rng_)) * tile, (y + offset(rng_)) * tile,
                      MATERIALS[material(rng_)], kg(rng_));
        placed++;
    }

    if (placed < settings_.collectiblesPerRefill)
    {
        std::cerr << "Warning: landfill only had room for " << placed << " of "
                  << settings_.collectiblesPerRefill << " collectibles" << std::endl;
    }
    refillCount_++;
    return placed;
}

FleetStats FleetSimulation::collectStats() const
{
    FleetStats stats;
    stats.robots = static_cast<int>(controllers_.size());

    for (const auto &controller : controllers_)
    {
        const Robot &robot = controller.getRobot();
        const PlanningStats &planning = controller.getStats();

        stats.robotsInState[static_cast<int>(robot.state)]++;
        stats.pathsPlanned += planning.pathsPlanned;
        stats.pathsFailed += planning.pathsFailed;
        stats.iterationLimitHits += planning.iterationLimitHits;
        stats.nodesExpanded += planning.nodesExpanded;
        stats.searchTimeMs += planning.searchTimeMs;
        stats.transitions += controller.totalTransitions();
        stats.tripsCompleted += robot.tripsCompleted;
        stats.distanceTravelled += robot.distanceTravelled;
        stats.deliveredKg += controller.getDeliveredKg();
    }
    return stats;
}

void FleetSimulation::printStatistics() const
{
    FleetStats stats = collectStats();

    std::cout << "=== Fleet Statistics ===" << std::endl;
    std::cout << "Ticks: " << tickCount_ << " (" << std::fixed << std::setprecision(1)
              << simulatedSeconds_ << "s simulated)" << std::endl;
    std::cout << "Robots: " << stats.robots << std::endl;
    for (int s = 0; s < ROBOT_STATE_COUNT; s++)
    {
        std::cout << "  " << std::setw(18) << std::left << robotStateName(static_cast<RobotState>(s))
                  << stats.robotsInState[s] << std::endl;
    }
    std::cout << "Paths planned: " << stats.pathsPlanned << " (failed " << stats.pathsFailed
              << ", iteration limit " << stats.iterationLimitHits << ")" << std::endl;
    std::cout << "Nodes expanded: " << stats.nodesExpanded << std::endl;
    std::cout << "Search time: " << std::setprecision(3) << stats.searchTimeMs << " ms total, "
              << stats.averageSearchTimeMs() << " ms average" << std::endl;
    std::cout << "State transitions: " << stats.transitions << std::endl;
    std::cout << "Trips completed: " << stats.tripsCompleted << std::endl;
    std::cout << "Distance travelled: " << std::setprecision(0) << stats.distanceTravelled << " px" << std::endl;
    std::cout << "Delivered: " << std::setprecision(1) << stats.deliveredKg << " kg" << std::endl;
    std::cout << "Landfill refills: " << refillCount_ << std::endl;
}
