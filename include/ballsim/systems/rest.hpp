/**
 * @file rest.hpp
 * @brief System that freezes slow bodies lying on the floor
 *
 * A free body whose speed is below RestSpeedThreshold and whose lower edge
 * (position.y - radius/2) is within RestFloorEpsilon of the floor becomes
 * fixed, with its velocity zeroed. The floor is the bottom window edge,
 * -WindowHeight/2. The transition is one-way.
 *
 * Required components:
 * - Position (to read)
 * - Velocity (to read/zero)
 * - Radius (to read)
 * - Fixed (to set)
 */

#ifndef BALLSIM_REST_SYSTEM_HPP
#define BALLSIM_REST_SYSTEM_HPP

#include <entt/entt.hpp>
#include "ballsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class RestSystem
 * @brief Marks bodies that came to rest near the floor as fixed
 */
class RestSystem : public ISystem {
public:
    RestSystem() = default;
    ~RestSystem() override = default;

    void update(entt::registry &registry) override;

    /**
     * @brief Floor height that rest detection compares position.y against
     */
    double floorY() const;
};

} // namespace Systems

#endif
