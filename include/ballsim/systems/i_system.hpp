/**
 * @file i_system.hpp
 * @brief Interface for the ECS systems that make up a simulation tick
 */

#pragma once

#include <entt/entt.hpp>
#include "ballsim/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * A system reads and mutates the registry for one tick. Systems that look at
 * other bodies read Components::TickSnapshot instead of the live registry.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

} // namespace Systems
