#include "SimulationSettings.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

bool SimulationSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# RoboHaul Simulation Settings\n";
    file << "gridWidth=" << gridWidth << "\n";
    file << "gridHeight=" << gridHeight << "\n";
    file << "tileSize=" << tileSize << "\n";
    file << "maxSearchIterations=" << maxSearchIterations << "\n";
    file << "heuristic=" << static_cast<int>(heuristic) << "\n";
    file << "smoothPaths=" << (smoothPaths ? 1 : 0) << "\n";
    file << "robotCount=" << robotCount << "\n";
    file << "robotSpeed=" << robotSpeed << "\n";
    file << "robotCapacity=" << robotCapacity << "\n";
    file << "powerCapacity=" << powerCapacity << "\n";
    file << "powerDrainRate=" << powerDrainRate << "\n";
    file << "lowPowerThreshold=" << lowPowerThreshold << "\n";
    file << "searchRadius=" << searchRadius << "\n";
    file << "actionRadius=" << actionRadius << "\n";
    file << "baseArrivalRadius=" << baseArrivalRadius << "\n";
    file << "waypointTolerance=" << waypointTolerance << "\n";
    file << "collectiblesPerRefill=" << collectiblesPerRefill << "\n";
    file << "collectibleMinKg=" << collectibleMinKg << "\n";
    file << "collectibleMaxKg=" << collectibleMaxKg << "\n";
    file << "tickRate=" << tickRate << "\n";
    file << "logTransitions=" << (logTransitions ? 1 : 0) << "\n";

    return true;
}

bool SimulationSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            if (key == "gridWidth")
                gridWidth = std::stoi(value);
            else if (key == "gridHeight")
                gridHeight = std::stoi(value);
            else if (key == "tileSize")
                tileSize = std::stoi(value);
            else if (key == "maxSearchIterations")
                maxSearchIterations = std::stoi(value);
            else if (key == "heuristic")
                heuristic = std::stoi(value) == static_cast<int>(Heuristic::Manhattan) ? Heuristic::Manhattan : Heuristic::Octile;
            else if (key == "smoothPaths")
                smoothPaths = (std::stoi(value) != 0);
            else if (key == "robotCount")
                robotCount = std::stoi(value);
            else if (key == "robotSpeed")
                robotSpeed = std::stof(value);
            else if (key == "robotCapacity")
                robotCapacity = std::stof(value);
            else if (key == "powerCapacity")
                powerCapacity = std::stof(value);
            else if (key == "powerDrainRate")
                powerDrainRate = std::stof(value);
            else if (key == "lowPowerThreshold")
                lowPowerThreshold = std::stof(value);
            else if (key == "searchRadius")
                searchRadius = std::stof(value);
            else if (key == "actionRadius")
                actionRadius = std::stof(value);
            else if (key == "baseArrivalRadius")
                baseArrivalRadius = std::stof(value);
            else if (key == "waypointTolerance")
                waypointTolerance = std::stof(value);
            else if (key == "collectiblesPerRefill")
                collectiblesPerRefill = std::stoi(value);
            else if (key == "collectibleMinKg")
                collectibleMinKg = std::stof(value);
            else if (key == "collectibleMaxKg")
                collectibleMaxKg = std::stof(value);
            else if (key == "tickRate")
                tickRate = std::stoi(value);
            else if (key == "logTransitions")
                logTransitions = (std::stoi(value) != 0);
        }
        catch (const std::logic_error &e)
        {
            // stoi/stof throw invalid_argument or out_of_range, both logic_errors
            std::cerr << "Warning: " << filename << ":" << lineNumber << ": bad value for "
                      << key << " (" << e.what() << "), keeping the previous value" << std::endl;
        }
    }

    validateAndClamp();
    return true;
}

void SimulationSettings::validateAndClamp()
{
    // smallest grid the demo world fits in with the dock outside the factory
    gridWidth = std::clamp(gridWidth, MIN_GRID_WIDTH, 4096);
    gridHeight = std::clamp(gridHeight, MIN_GRID_HEIGHT, 4096);
    tileSize = std::clamp(tileSize, 1, 256);
    maxSearchIterations = std::clamp(maxSearchIterations, 1, 10000000);
    robotCount = std::clamp(robotCount, 0, 10000);
    robotSpeed = std::clamp(robotSpeed, 1.0f, 10000.0f);
    robotCapacity = std::max(1.0f, robotCapacity);
    powerCapacity = std::max(1.0f, powerCapacity);
    powerDrainRate = std::max(0.0f, powerDrainRate);
    // a fresh charge has to leave the robot above the threshold
    lowPowerThreshold = std::clamp(lowPowerThreshold, 0.0f, powerCapacity * MAX_LOW_POWER_FRACTION);
    searchRadius = std::clamp(searchRadius, 0.0f, 1000000.0f);
    actionRadius = std::max(0.0f, actionRadius);
    baseArrivalRadius = std::max(0.0f, baseArrivalRadius);
    waypointTolerance = std::clamp(waypointTolerance, 0.01f, static_cast<float>(tileSize));
    collectiblesPerRefill = std::clamp(collectiblesPerRefill, 0, 100000);
    collectibleMinKg = std::max(0.1f, collectibleMinKg);
    collectibleMaxKg = std::max(collectibleMinKg, collectibleMaxKg);
    tickRate = std::clamp(tickRate, 1, 1000);
}
