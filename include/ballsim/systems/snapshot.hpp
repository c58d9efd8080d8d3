/**
 * @file snapshot.hpp
 * @brief System that freezes every body's state at the start of a tick
 *
 * Required components:
 * - Position, Velocity, Mass, Radius (copied)
 * - Fixed (membership only; fixed bodies are copied too)
 *
 * Writes Components::TickSnapshot on the simulator-state entity.
 */

#ifndef BALLSIM_SNAPSHOT_SYSTEM_HPP
#define BALLSIM_SNAPSHOT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "ballsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class SnapshotSystem
 * @brief Copies all live bodies into the tick snapshot, in registry order
 */
class SnapshotSystem : public ISystem {
public:
    SnapshotSystem() = default;
    ~SnapshotSystem() override = default;

    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif
