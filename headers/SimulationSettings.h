#pragma once
#include <string>
#include "Pathfinder.h"

class SimulationSettings
{
public:
    static constexpr int MIN_GRID_WIDTH = 16;
    static constexpr int MIN_GRID_HEIGHT = 12;
    static constexpr float MAX_LOW_POWER_FRACTION = 0.9f;

    // world grid
    int gridWidth = 64;  // tiles
    int gridHeight = 48; // tiles
    int tileSize = 32;   // pixels per tile

    // pathfinding
    int maxSearchIterations = Pathfinder::DEFAULT_MAX_ITERATIONS; // A* expansion ceiling per search
    Heuristic heuristic = Heuristic::Octile;
    bool smoothPaths = true; // line of sight smoothing of every planned path

    // robots
    int robotCount = 3;
    float robotSpeed = 100.0f;     // pixels per second
    float robotCapacity = 100.0f;  // kg
    float powerCapacity = 1000.0f; // units
    float powerDrainRate = 1.0f;   // units per second while moving
    float lowPowerThreshold = 100.0f; // head home at or below this (0 disables)

    // task behaviour distances (pixels)
    float searchRadius = 800.0f;      // how far an idle robot looks for work
    float actionRadius = 40.0f;       // collection reach
    float baseArrivalRadius = 16.0f;  // counts as docked
    float waypointTolerance = 2.0f;   // counts as on a waypoint

    // demo world seeding
    int collectiblesPerRefill = 40;
    float collectibleMinKg = 5.0f;
    float collectibleMaxKg = 60.0f;

    // host loop
    int tickRate = 60; // simulation ticks per second
    bool logTransitions = false;

    static const char *heuristicName(Heuristic h)
    {
        switch (h)
        {
        case Heuristic::Octile:
            return "Octile";
        case Heuristic::Manhattan:
            return "Manhattan";
        default:
            return "Unknown";
        }
    }

    float tickSeconds() const { return 1.0f / static_cast<float>(tickRate); }

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();
};
