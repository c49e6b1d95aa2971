/********************************************************
 *  description:    headless robohaul runner. spawns the demo
 *  :               world, hauls landfill to the factory for a
 *  :               fixed amount of simulated time, prints stats
 *  build/run:      cmake --build build && ./build/robohaul
 ***********************************************************/

#include <SFML/System.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "SimulationSettings.h"
#include "FleetSimulation.h"

// how often the progress line is printed, in simulated seconds
const float REPORT_INTERVAL = 10.0f;

void printUsage(const char *program)
{
    std::cout << "Usage: " << program << " [settings file] [options]" << std::endl;
    std::cout << "  --seconds <s>            simulated time to run (default 120)" << std::endl;
    std::cout << "  --seed <n>               world and landfill seed (default 1)" << std::endl;
    std::cout << "  --write-defaults <file>  write the default settings and exit" << std::endl;
    std::cout << "  --log-transitions        print every robot state change" << std::endl;
}

void printProgress(const FleetSimulation &simulation)
{
    FleetStats stats = simulation.collectStats();
    std::cout << std::fixed << std::setprecision(1)
              << "[" << std::setw(7) << simulation.getSimulatedSeconds() << "s] "
              << "trips: " << stats.tripsCompleted
              << " | delivered: " << stats.deliveredKg << " kg"
              << " | paths: " << stats.pathsPlanned << " (" << stats.pathsFailed << " failed)"
              << " | landfill: " << simulation.getRegistry().size()
              << " | last update: " << std::setprecision(3) << simulation.getLastUpdateTime() << " ms"
              << std::endl;
}

int main(int argc, char *argv[])
{
    SimulationSettings settings;
    float simulatedSeconds = 120.0f;
    unsigned seed = 1;
    bool logTransitions = false;

    try
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;

            if (arg == "--help" || arg == "-h")
            {
                printUsage(argv[0]);
                return 0;
            }
            else if (arg == "--write-defaults" && hasValue)
            {
                SimulationSettings defaults;
                if (!defaults.saveToFile(argv[++i]))
                    return 1;
                std::cout << "Default settings written to " << argv[i] << std::endl;
                return 0;
            }
            else if (arg == "--seconds" && hasValue)
            {
                simulatedSeconds = std::stof(argv[++i]);
            }
            else if (arg == "--seed" && hasValue)
            {
                seed = static_cast<unsigned>(std::stoul(argv[++i]));
            }
            else if (arg == "--log-transitions")
            {
                logTransitions = true;
            }
            else if (!arg.empty() && arg[0] == '-')
            {
                std::cerr << "Error: unknown or incomplete option " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            else if (!settings.loadFromFile(arg))
            {
                return 1;
            }
        }
    }
    catch (const std::logic_error &e)
    {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (logTransitions)
        settings.logTransitions = true;
    if (simulatedSeconds <= 0.0f)
    {
        std::cerr << "Warning: --seconds must be positive, running the default 120s" << std::endl;
        simulatedSeconds = 120.0f;
    }

    FleetSimulation simulation(settings, seed);

    // fixed step so runs with the same seed are repeatable
    const float dt = simulation.getSettings().tickSeconds();
    const std::uint64_t totalTicks = static_cast<std::uint64_t>(std::llround(simulatedSeconds / dt));
    const std::uint64_t reportEvery = std::max<std::uint64_t>(
        1, static_cast<std::uint64_t>(std::llround(REPORT_INTERVAL / dt)));

    std::cout << "Running " << totalTicks << " ticks at " << simulation.getSettings().tickRate << " Hz" << std::endl;

    sf::Clock clock;
    for (std::uint64_t tick = 1; tick <= totalTicks; tick++)
    {
        simulation.update(dt);
        if (tick % reportEvery == 0)
        {
            printProgress(simulation);
        }
    }
    float wallSeconds = clock.getElapsedTime().asSeconds();

    std::cout << std::endl;
    simulation.printStatistics();
    simulation.getStockpile().printStatistics();
    simulation.getRegistry().printStatistics();
    std::cout << "Wall time: " << std::fixed << std::setprecision(3) << wallSeconds << "s ("
              << std::setprecision(1) << (wallSeconds > 0.0f ? simulatedSeconds / wallSeconds : 0.0f)
              << "x real time)" << std::endl;

    return 0;
}
