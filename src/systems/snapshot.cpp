#include "ballsim/systems/snapshot.hpp"
#include "ballsim/components/basic.hpp"
#include "ballsim/components/sim.hpp"
#include "ballsim/core/profile.hpp"

namespace Systems {

void SnapshotSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("SnapshotSystem");

    auto &snapshot = registry.get<Components::TickSnapshot>(
        registry.view<Components::TickSnapshot>().front()
    );
    snapshot.bodies.clear();

    // Same component set as the passes that move bodies; fixed bodies are included.
    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::Mass, Components::Radius, Components::Fixed>();
    for (auto entity : view) {
        const auto &[pos, vel, mass, radius] = view.get<Components::Position, Components::Velocity,
                                                        Components::Mass, Components::Radius>(entity);
        Components::BodyState state;
        state.entity = entity;
        state.position = pos;
        state.velocity = vel;
        state.mass = mass.value;
        state.radius = radius.value;
        snapshot.bodies.push_back(state);
    }
}

} // namespace Systems
