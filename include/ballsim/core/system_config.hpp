#pragma once

#include <vector>
#include "ballsim/systems/systems.hpp"

/**
 * @struct SystemConfig
 * @brief Holds all system configuration parameters for the simulation.
 *
 * Universe and window extents are in render units (pixels); PixelsPerMeter
 * maps world positions into that space.
 */
struct SystemConfig {
    double UniverseWidth;
    double UniverseHeight;
    double WindowWidth;
    double WindowHeight;
    double PixelsPerMeter;

    double Gravity;
    double FrictionCoeff;
    bool PairwiseAttraction;

    double RestSpeedThreshold;
    double RestFloorEpsilon;

    std::vector<Systems::SystemType> activeSystems;

    /**
     * @brief Builds a configuration from SimulatorConstants defaults
     */
    SystemConfig();

    bool isActive(Systems::SystemType type) const;
};
