#include "ballsim/systems/rest.hpp"
#include "ballsim/components/basic.hpp"
#include "ballsim/core/debug.hpp"
#include "ballsim/core/profile.hpp"

namespace Systems {

double RestSystem::floorY() const {
    return -sysConfig.WindowHeight / 2.0;
}

void RestSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("RestSystem");

    const double floor = floorY();

    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::Radius, Components::Fixed>();
    for (auto [entity, pos, vel, radius, fixed] : view.each()) {
        if (fixed.value) {
            continue;
        }

        if (vel.length() < sysConfig.RestSpeedThreshold &&
            pos.y - radius.value / 2.0 < floor + sysConfig.RestFloorEpsilon)
        {
            fixed.value = true;
            vel = Components::Velocity(0.0, 0.0);
            DebugStats::countRest();
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Body " << static_cast<unsigned>(entt::to_integral(entity))
                      << " came to rest at (" << pos.x << ", " << pos.y << ")\n");
        }
    }
}

} // namespace Systems
