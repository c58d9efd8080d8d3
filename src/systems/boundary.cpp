#include "ballsim/systems/boundary.hpp"
#include "ballsim/components/basic.hpp"
#include "ballsim/core/debug.hpp"
#include "ballsim/core/profile.hpp"

namespace Systems {

bool BoundarySystem::isOutsideUniverse(const Position &translation, double radius) const {
    const double halfW = sysConfig.UniverseWidth / 2.0;
    const double halfH = sysConfig.UniverseHeight / 2.0;
    const double halfR = radius / 2.0;

    return translation.x - halfR > halfW
        || translation.x + halfR < -halfW
        || translation.y - halfR > halfH
        || translation.y + halfR < -halfH;
}

bool BoundarySystem::bounce(Position &pos, Vector &vel, double radius) const {
    const double halfW = sysConfig.WindowWidth / 2.0;
    const double halfH = sysConfig.WindowHeight / 2.0;
    const double halfR = radius / 2.0;

    Position const translation = pos * sysConfig.PixelsPerMeter;
    bool bounced = false;

    // Left / right walls
    if (translation.x - halfR < -halfW && vel.x < 0.0) {
        vel.x = -vel.x;
        pos.x = -halfW + halfR;
        bounced = true;
    }
    else if (translation.x + halfR > halfW && vel.x > 0.0) {
        vel.x = -vel.x;
        pos.x = halfW - halfR;
        bounced = true;
    }

    // Floor / ceiling
    if (translation.y - halfR < -halfH && vel.y < 0.0) {
        vel.y = -vel.y;
        pos.y = -halfH + halfR;
        bounced = true;
    }
    else if (translation.y + halfR > halfH && vel.y > 0.0) {
        vel.y = -vel.y;
        pos.y = halfH - halfR;
        bounced = true;
    }

    return bounced;
}

void BoundarySystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BoundarySystem");

    despawned.clear();

    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::Radius, Components::Fixed>();
    for (auto &&[entity, pos, vel, radius, fixed] : view.each()) {
        if (fixed.value) {
            continue;
        }

        if (isOutsideUniverse(pos * sysConfig.PixelsPerMeter, radius.value)) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "Despawn " << static_cast<unsigned>(entt::to_integral(entity)) << "\n");
            despawned.push_back(entity);
            continue;
        }

        if (bounce(pos, vel, radius.value)) {
            DebugStats::countBounce();
        }
    }

    // Destroyed after the loop: the view must not change while iterating.
    for (auto entity : despawned) {
        registry.destroy(entity);
        DebugStats::countDespawn();
    }
}

} // namespace Systems
