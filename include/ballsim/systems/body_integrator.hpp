/**
 * @file body_integrator.hpp
 * @brief One physics tick over all live bodies
 *
 * A tick runs, in order:
 * 1. SnapshotSystem           freeze every body's tick-start state
 * 2. RestSystem               fix slow bodies lying on the floor
 * 3. ForceIntegrationSystem   forces, then v += a*dt, p += v*dt
 * 4. BodyCollisionSystem      impulses and separation against the snapshot
 * 5. BoundarySystem           despawn outside the universe, bounce off walls
 *
 * Steps 3 to 5 can be switched off through SystemConfig::activeSystems.
 * Every pass reads other bodies only through the snapshot and writes only the
 * body it is visiting, so the per-pass ordering gives the same result as
 * running all passes body by body.
 */

#ifndef BALLSIM_BODY_INTEGRATOR_HPP
#define BALLSIM_BODY_INTEGRATOR_HPP

#include <memory>
#include <vector>
#include <entt/entt.hpp>
#include "ballsim/core/system_config.hpp"
#include "ballsim/systems/boundary.hpp"
#include "ballsim/systems/i_system.hpp"

namespace Systems {

/**
 * @class BodyIntegrator
 * @brief Runs the ordered systems of one tick and reports removed bodies
 */
class BodyIntegrator {
public:
    explicit BodyIntegrator(const SystemConfig& config = SystemConfig());

    /**
     * @brief Advances every live body by dt seconds
     *
     * Creates the simulator-state entity if the registry has none.
     *
     * @param registry Registry owning the bodies, mutated in place
     * @param dt Elapsed seconds since the previous tick, must be >= 0
     * @return Entities destroyed during this tick
     * @throws std::invalid_argument if dt is negative or not finite
     */
    std::vector<entt::entity> step(entt::registry& registry, double dt);

    /**
     * @brief Replaces the configuration and rebuilds the system list
     */
    void setSystemConfig(const SystemConfig& config);

    const SystemConfig& getSystemConfig() const { return config; }

private:
    void createSystems();

    SystemConfig config;
    std::vector<std::unique_ptr<ISystem>> systems;
    BoundarySystem* boundarySystem = nullptr;
};

/**
 * @brief Returns the simulator-state entity, creating it if needed
 */
entt::entity ensureSimulatorState(entt::registry& registry);

} // namespace Systems

#endif
