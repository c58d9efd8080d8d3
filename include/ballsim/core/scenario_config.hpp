/**
 * @file scenario_config.hpp
 * @brief Configuration for a simulation scenario.
 */

#pragma once

#include "ballsim/core/system_config.hpp"

/**
 * @brief Physical constants and body population of a scenario.
 *
 * systemConfig is handed to the integrator unchanged. The remaining fields
 * describe the bodies the scenario spawns.
 */
struct ScenarioConfig {
    SystemConfig systemConfig;

    int BodyCount = 0;
    double BodyMassMin = 1.0;
    double BodyMassMax = 1.0;
    double BodyRadius = 10.0;
    double InitialSpeed = 0.0;   // per-axis velocity is drawn from [-InitialSpeed, InitialSpeed)

    // Seed for the scenario's random generator; 0 seeds from the clock.
    unsigned int Seed = 0;
};
