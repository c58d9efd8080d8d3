#include "ballsim/core/constants.hpp"
#include "ballsim/core/system_config.hpp"

#include <algorithm>

namespace SimulatorConstants {

    const double UniverseWidth  = 200.0;
    const double UniverseHeight = 200.0;
    const double WindowWidth    = 800.0;
    const double WindowHeight   = 400.0;

    const double PixelsPerMeter = 2.0;

    const double Gravity       = -9.81;
    const double FrictionCoeff = 0.5;

    const double RestSpeedThreshold = 1.0;
    const double RestFloorEpsilon   = 1.0;

    const unsigned int StepsPerSecond = 60;
    const double MaxFrameSeconds      = 0.1;

    double metersToPixels(double meters, double pixelsPerMeter) {
        return meters * pixelsPerMeter;
    }

    std::vector<SimulationType> getAllScenarios() {
        return {
            SimulationType::RANDOM_BALLS,
            SimulationType::HEAD_ON_COLLISION,
            SimulationType::BALL_RAIN
        };
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::RANDOM_BALLS:      return "RANDOM_BALLS";
            case SimulationType::HEAD_ON_COLLISION: return "HEAD_ON_COLLISION";
            case SimulationType::BALL_RAIN:         return "BALL_RAIN";
            default: return "UNKNOWN";
        }
    }

} // namespace SimulatorConstants

SystemConfig::SystemConfig()
    : UniverseWidth(SimulatorConstants::UniverseWidth)
    , UniverseHeight(SimulatorConstants::UniverseHeight)
    , WindowWidth(SimulatorConstants::WindowWidth)
    , WindowHeight(SimulatorConstants::WindowHeight)
    , PixelsPerMeter(SimulatorConstants::PixelsPerMeter)
    , Gravity(SimulatorConstants::Gravity)
    , FrictionCoeff(SimulatorConstants::FrictionCoeff)
    , PairwiseAttraction(true)
    , RestSpeedThreshold(SimulatorConstants::RestSpeedThreshold)
    , RestFloorEpsilon(SimulatorConstants::RestFloorEpsilon)
    , activeSystems{
          Systems::SystemType::FORCE_INTEGRATION,
          Systems::SystemType::BODY_COLLISION,
          Systems::SystemType::BOUNDARY
      }
{
}

bool SystemConfig::isActive(Systems::SystemType type) const {
    return std::find(activeSystems.begin(), activeSystems.end(), type) != activeSystems.end();
}
