/**
 * @file body_collision.hpp
 * @brief Circle-circle overlap detection and impulse response
 *
 * Each free body is tested against every other body of the tick snapshot.
 * On overlap the body receives the elastic-style impulse
 *   j = 2 * dot(v_self - v_other, n) / (m_self + m_other)
 *   v_self -= n * j * m_other
 * and is pushed back along -n by half the penetration depth. Only the body
 * being updated changes here: its partner gets its own, independent update
 * from the same snapshot. Pairs whose distance rounds to zero have no
 * contact normal and are skipped.
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Mass, Radius, Fixed (to read)
 */

#ifndef BALLSIM_BODY_COLLISION_SYSTEM_HPP
#define BALLSIM_BODY_COLLISION_SYSTEM_HPP

#include <vector>
#include <entt/entt.hpp>
#include "ballsim/components/sim.hpp"
#include "ballsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class BodyCollisionSystem
 * @brief Resolves overlaps between bodies against the tick snapshot
 */
class BodyCollisionSystem : public ISystem {
public:
    BodyCollisionSystem() = default;
    ~BodyCollisionSystem() override = default;

    void update(entt::registry &registry) override;

    /**
     * @brief Applies every contact of one body, updating it in place
     * @return Number of overlapping partners found
     */
    static int resolve(Components::BodyState &self,
                       const std::vector<Components::BodyState> &others);
};

} // namespace Systems

#endif
