#ifndef BALLSIM_SIMULATOR_CONSTANTS_HPP
#define BALLSIM_SIMULATOR_CONSTANTS_HPP

#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The scenarios the host can load.
     */
    enum class SimulationType {
        RANDOM_BALLS,
        HEAD_ON_COLLISION,
        BALL_RAIN
    };

    // Render-space extents (pixels)
    extern const double UniverseWidth;
    extern const double UniverseHeight;
    extern const double WindowWidth;
    extern const double WindowHeight;

    // Ratio pixels/meter
    extern const double PixelsPerMeter;

    extern const double Gravity;
    extern const double FrictionCoeff;

    extern const double RestSpeedThreshold;
    extern const double RestFloorEpsilon;

    // Host loop
    extern const unsigned int StepsPerSecond;
    extern const double MaxFrameSeconds;

    double metersToPixels(double meters, double pixelsPerMeter);

    std::vector<SimulationType> getAllScenarios();
    std::string getScenarioName(SimulationType scenario);
}

#endif // BALLSIM_SIMULATOR_CONSTANTS_HPP
