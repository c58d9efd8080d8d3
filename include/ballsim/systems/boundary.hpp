/**
 * @file boundary.hpp
 * @brief System for the universe and window boundaries
 *
 * This system handles, in render space (position * PixelsPerMeter):
 * - Destroying bodies that leave the universe box centred at the origin
 * - Bouncing bodies off the window edges: the outward velocity component is
 *   negated and the position clamped to the edge, one axis at a time
 *
 * Destroyed entities are recorded so the host can drop anything it keeps for
 * them (see getDespawned()).
 *
 * Required components:
 * - Position, Velocity (to read/modify)
 * - Radius, Fixed (to read)
 */

#ifndef BALLSIM_BOUNDARY_SYSTEM_HPP
#define BALLSIM_BOUNDARY_SYSTEM_HPP

#include <vector>
#include <entt/entt.hpp>
#include "ballsim/math/vector_math.hpp"
#include "ballsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class BoundarySystem
 * @brief Despawns escaped bodies and reflects bodies off the window edges
 *
 * Skips fixed bodies.
 */
class BoundarySystem : public ISystem {
public:
    BoundarySystem() = default;
    ~BoundarySystem() override = default;

    void update(entt::registry &registry) override;

    /**
     * @brief Entities destroyed by the last update()
     */
    const std::vector<entt::entity>& getDespawned() const { return despawned; }

    /**
     * @brief True if a body with the given render-space translation and
     *        radius lies outside the universe box
     */
    bool isOutsideUniverse(const Position &translation, double radius) const;

    /**
     * @brief Reflects and clamps against the window edges
     * @return true if any axis bounced
     */
    bool bounce(Position &pos, Vector &vel, double radius) const;

private:
    std::vector<entt::entity> despawned;
};

} // namespace Systems

#endif
