#include "ballsim/systems/body_integrator.hpp"

#include <sstream>
#include <stdexcept>

#include "ballsim/components/sim.hpp"
#include "ballsim/core/debug.hpp"
#include "ballsim/core/profile.hpp"
#include "ballsim/math/vector_math.hpp"
#include "ballsim/systems/body_collision.hpp"
#include "ballsim/systems/force_integration.hpp"
#include "ballsim/systems/rest.hpp"
#include "ballsim/systems/snapshot.hpp"

namespace Systems {

entt::entity ensureSimulatorState(entt::registry& registry) {
    auto view = registry.view<Components::SimulatorState>();
    if (!view.empty()) {
        auto entity = view.front();
        if (!registry.all_of<Components::TickSnapshot>(entity)) {
            registry.emplace<Components::TickSnapshot>(entity);
        }
        return entity;
    }

    auto entity = registry.create();
    registry.emplace<Components::SimulatorState>(entity);
    registry.emplace<Components::TickSnapshot>(entity);
    return entity;
}

BodyIntegrator::BodyIntegrator(const SystemConfig& cfg)
    : config(cfg)
{
    createSystems();
}

void BodyIntegrator::setSystemConfig(const SystemConfig& cfg) {
    config = cfg;
    createSystems();
}

void BodyIntegrator::createSystems() {
    systems.clear();
    boundarySystem = nullptr;

    systems.push_back(std::make_unique<SnapshotSystem>());
    systems.push_back(std::make_unique<RestSystem>());

    if (config.isActive(SystemType::FORCE_INTEGRATION)) {
        systems.push_back(std::make_unique<ForceIntegrationSystem>());
    }
    if (config.isActive(SystemType::BODY_COLLISION)) {
        systems.push_back(std::make_unique<BodyCollisionSystem>());
    }
    if (config.isActive(SystemType::BOUNDARY)) {
        auto boundary = std::make_unique<BoundarySystem>();
        boundarySystem = boundary.get();
        systems.push_back(std::move(boundary));
    }

    for (auto& system : systems) {
        system->setSystemConfig(config);
    }
}

std::vector<entt::entity> BodyIntegrator::step(entt::registry& registry, double dt) {
    PROFILE_SCOPE("BodyIntegrator::step");

    if (!isFinite(dt) || dt < 0.0) {
        std::ostringstream msg;
        msg << "BodyIntegrator::step: dt must be a finite, non-negative number of seconds (got " << dt << ")";
        throw std::invalid_argument(msg.str());
    }

    auto stateEntity = ensureSimulatorState(registry);
    registry.get<Components::SimulatorState>(stateEntity).frameSeconds = dt;

    DebugStats::reset();
    for (auto& system : systems) {
        system->update(registry);
    }
    DebugStats::printTickStats();

    if (boundarySystem == nullptr) {
        return {};
    }
    return boundarySystem->getDespawned();
}

} // namespace Systems
