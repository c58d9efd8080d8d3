/**
 * @file simulator.hpp
 * @brief Owns the body registry, the integrator and the loaded scenario.
 */

#pragma once

#include <memory>
#include <vector>
#include <entt/entt.hpp>
#include "ballsim/core/i_scenario.hpp"
#include "ballsim/core/system_config.hpp"
#include "ballsim/systems/body_integrator.hpp"

/**
 * @class ECSSimulator
 * @brief Main simulator that manages an ECS registry and scenario lifecycle.
 */
class ECSSimulator {
public:
    ECSSimulator();
    ~ECSSimulator();

    /**
     * @brief Takes ownership of a scenario; call reset() to spawn its bodies.
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Clears the registry and re-creates the loaded scenario's bodies,
     *        keeping the current time scale.
     */
    void reset();

    /**
     * @brief Replaces the integrator configuration
     */
    void applyConfig(const SystemConfig& cfg);

    /**
     * @brief Advances all bodies by dt seconds
     * @return Entities removed during the tick
     */
    std::vector<entt::entity> tick(double dt);

    void setTimeScale(double multiplier);

    entt::registry& getRegistry();
    const entt::registry& getRegistry() const;

    const SystemConfig& getConfig() const;

    /**
     * @brief Number of entities that are simulated bodies
     */
    std::size_t bodyCount() const;

    /**
     * @brief Total entities removed since the last reset()
     */
    std::size_t despawnedCount() const { return totalDespawned; }

private:
    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    Systems::BodyIntegrator integrator;
    std::size_t totalDespawned = 0;
};
