#ifndef BALLSIM_I_SCENARIO_HPP
#define BALLSIM_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "ballsim/core/scenario_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning ScenarioConfig
 *  - createEntities() that spawns all bodies
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns scenario configuration (universe extents, body count, etc.)
     */
    virtual ScenarioConfig getConfig() const = 0;

    /**
     * @brief Creates scenario-specific bodies in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;
};

#endif // BALLSIM_I_SCENARIO_HPP
