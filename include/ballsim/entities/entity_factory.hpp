#pragma once

#include <entt/entt.hpp>
#include "ballsim/components/basic.hpp"

namespace Entities {

/**
 * Factory for the bodies the integrator simulates.
 *
 * Every body gets Position, Velocity, Acceleration, Mass, Radius, Fixed and
 * Color, which is the full component set the systems expect.
 */
class EntityFactory {
public:
    /**
     * Creates a free body with zero external acceleration.
     *
     * @param registry The entity registry
     * @param position Initial world position
     * @param velocity Initial velocity
     * @param mass Mass, must be > 0
     * @param radius Radius ("size"), must be > 0
     * @param color Fill colour used by the renderer
     * @return The created entity
     * @throws std::invalid_argument if mass or radius is not strictly positive
     */
    static entt::entity createBody(
        entt::registry& registry,
        const Components::Position& position,
        const Components::Velocity& velocity = Components::Velocity(),
        double mass = 1.0,
        double radius = 10.0,
        const Components::Color& color = Components::Color()
    );
};

} // namespace Entities
