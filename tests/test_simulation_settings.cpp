// tests/test_simulation_settings.cpp
// Settings file round trip, malformed input and value clamping

#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "SimulationSettings.h"

namespace {

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

void writeFile(const std::string& path, const std::string& contents) {
    std::ofstream file(path);
    file << contents;
}

} // namespace

TEST_CASE("SimulationSettings defaults", "[settings]") {
    SimulationSettings settings;
    REQUIRE(settings.maxSearchIterations == 1000);
    REQUIRE(settings.heuristic == Heuristic::Octile);
    REQUIRE(settings.smoothPaths);
    REQUIRE(settings.tickSeconds() == Approx(1.0f / 60.0f));
    REQUIRE(std::string(SimulationSettings::heuristicName(Heuristic::Manhattan)) == "Manhattan");
}

TEST_CASE("SimulationSettings save and load round trip", "[settings]") {
    std::string path = tempPath("robohaul_settings_roundtrip.cfg");

    SimulationSettings saved;
    saved.gridWidth = 40;
    saved.maxSearchIterations = 2500;
    saved.heuristic = Heuristic::Manhattan;
    saved.smoothPaths = false;
    saved.robotSpeed = 75.5f;
    saved.lowPowerThreshold = 250.0f;
    saved.logTransitions = true;
    REQUIRE(saved.saveToFile(path));

    SimulationSettings loaded;
    REQUIRE(loaded.loadFromFile(path));
    REQUIRE(loaded.gridWidth == 40);
    REQUIRE(loaded.maxSearchIterations == 2500);
    REQUIRE(loaded.heuristic == Heuristic::Manhattan);
    REQUIRE_FALSE(loaded.smoothPaths);
    REQUIRE(loaded.robotSpeed == Approx(75.5f));
    REQUIRE(loaded.lowPowerThreshold == Approx(250.0f));
    REQUIRE(loaded.logTransitions);
    REQUIRE(loaded.robotCount == saved.robotCount);

    std::remove(path.c_str());
}

TEST_CASE("SimulationSettings skips bad lines and keeps going", "[settings]") {
    std::string path = tempPath("robohaul_settings_bad.cfg");
    writeFile(path,
              "# comment line\n"
              "\n"
              "robotSpeed=fast\n"
              "no equals sign here\n"
              "someFutureKey=3\n"
              "robotCount=7\n"
              "tickRate=99999999999999999999\n");

    SimulationSettings settings;
    REQUIRE(settings.loadFromFile(path));
    REQUIRE(settings.robotSpeed == Approx(100.0f));
    REQUIRE(settings.robotCount == 7);
    REQUIRE(settings.tickRate == 60);

    std::remove(path.c_str());
}

TEST_CASE("SimulationSettings loading a missing file fails", "[settings]") {
    SimulationSettings settings;
    REQUIRE_FALSE(settings.loadFromFile(tempPath("robohaul_no_such_file.cfg")));
    REQUIRE(settings.robotCount == 3);
}

TEST_CASE("SimulationSettings clamps out of range values", "[settings]") {
    SimulationSettings settings;
    settings.gridWidth = 1;
    settings.robotCount = -5;
    settings.maxSearchIterations = 0;
    settings.waypointTolerance = 0.0f;
    settings.powerCapacity = 500.0f;
    settings.lowPowerThreshold = 900.0f;
    settings.collectibleMinKg = 20.0f;
    settings.collectibleMaxKg = 10.0f;
    settings.tickRate = 0;

    settings.validateAndClamp();
    REQUIRE(settings.gridWidth == SimulationSettings::MIN_GRID_WIDTH);
    REQUIRE(settings.robotCount == 0);
    REQUIRE(settings.maxSearchIterations == 1);
    REQUIRE(settings.waypointTolerance > 0.0f);
    REQUIRE(settings.lowPowerThreshold == Approx(450.0f));
    REQUIRE(settings.collectibleMaxKg == Approx(20.0f));
    REQUIRE(settings.tickRate == 1);
}

TEST_CASE("SimulationSettings keeps the low power threshold under a full charge", "[settings][power]") {
    SimulationSettings settings;
    settings.powerCapacity = 200.0f;
    settings.lowPowerThreshold = 200.0f;

    settings.validateAndClamp();
    REQUIRE(settings.lowPowerThreshold < settings.powerCapacity);
    REQUIRE(settings.lowPowerThreshold == Approx(180.0f));

    SECTION("zero still disables the check") {
        settings.lowPowerThreshold = 0.0f;
        settings.validateAndClamp();
        REQUIRE(settings.lowPowerThreshold == 0.0f);
    }
}
