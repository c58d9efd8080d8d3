#pragma once

/**
 * @brief Defines available ECS systems for the body simulation.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The passes of a tick that a scenario can switch on or off.
 *
 * The snapshot and rest detection always run. The entries listed here are
 * the optional ones, executed in declaration order.
 */
enum class SystemType {
    FORCE_INTEGRATION,
    BODY_COLLISION,
    BOUNDARY,
};

} // namespace Systems
