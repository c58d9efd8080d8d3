/**
 * @file force_integration.hpp
 * @brief Force accumulation and semi-implicit Euler integration
 *
 * For every free body the system builds an acceleration from:
 * - the body's own constant Acceleration component
 * - inverse-square attraction towards every other body in the tick snapshot
 *   (distances measured in render units, i.e. divided by PixelsPerMeter)
 * - gravity, scaled by the body's mass
 * - linear friction, -FrictionCoeff * velocity
 *
 * and then advances velocity and position over the tick:
 *   v += a * dt;  p += v * dt
 *
 * Attraction is accumulated before gravity and friction. A partner is skipped
 * when it shares the body's position, when their distance rounds to zero, or
 * when the resulting force is not finite. The attraction is not softened, so
 * very close pairs can still produce very large accelerations.
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Mass, Fixed (to read)
 *
 * Optional components:
 * - Acceleration (constant external term)
 */

#ifndef BALLSIM_FORCE_INTEGRATION_SYSTEM_HPP
#define BALLSIM_FORCE_INTEGRATION_SYSTEM_HPP

#include <vector>
#include <entt/entt.hpp>
#include "ballsim/components/sim.hpp"
#include "ballsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class ForceIntegrationSystem
 * @brief Accumulates forces and integrates every non-fixed body
 */
class ForceIntegrationSystem : public ISystem {
public:
    ForceIntegrationSystem() = default;
    ~ForceIntegrationSystem() override = default;

    void update(entt::registry &registry) override;

    /**
     * @brief Acceleration of one body for the current tick
     *
     * @param self Tick-start state of the body being updated
     * @param external The body's constant external acceleration
     * @param others Snapshot of all bodies, may include self
     */
    Vector computeAcceleration(const Components::BodyState &self,
                               const Vector &external,
                               const std::vector<Components::BodyState> &others) const;

private:
    Vector attraction(const Components::BodyState &self,
                      const std::vector<Components::BodyState> &others) const;
};

} // namespace Systems

#endif
