/**
 * @file force_integration.cpp
 * @brief Implementation of force accumulation and integration
 */

#include "ballsim/systems/force_integration.hpp"
#include "ballsim/components/basic.hpp"
#include "ballsim/components/sim.hpp"
#include "ballsim/core/profile.hpp"

namespace Systems {

Vector ForceIntegrationSystem::attraction(const Components::BodyState &self,
                                          const std::vector<Components::BodyState> &others) const
{
    Vector acc;
    for (const auto &other : others) {
        if (other.entity == self.entity || other.position == self.position) {
            continue;
        }

        double const distance = self.position.dist(other.position) / sysConfig.PixelsPerMeter;
        double const distanceSq = distance * distance;
        // Distinct positions can still be too close for the distance to be representable.
        if (distanceSq == 0.0) {
            continue;
        }

        Vector const normal = (other.position - self.position).normalized();
        Vector const force = normal * (self.mass * other.mass / distanceSq);
        if (!isFinite(force.x) || !isFinite(force.y)) {
            continue;
        }
        acc += force / self.mass;
    }
    return acc;
}

Vector ForceIntegrationSystem::computeAcceleration(const Components::BodyState &self,
                                                   const Vector &external,
                                                   const std::vector<Components::BodyState> &others) const
{
    Vector acc = external;

    if (sysConfig.PairwiseAttraction) {
        acc += attraction(self, others);
    }

    // Weight enters the acceleration scaled by mass: heavier bodies fall faster.
    Vector const weight = Vector(0.0, sysConfig.Gravity) * self.mass;
    Vector const friction = self.velocity * -sysConfig.FrictionCoeff;

    acc += weight;
    acc += friction;
    return acc;
}

void ForceIntegrationSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("ForceIntegrationSystem");

    auto stateEntity = registry.view<Components::SimulatorState>().front();
    const auto &state = registry.get<Components::SimulatorState>(stateEntity);
    const auto &snapshot = registry.get<Components::TickSnapshot>(stateEntity);

    double const dt = state.frameSeconds *
                      state.baseTimeAcceleration *
                      state.timeScale;

    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::Mass, Components::Fixed>();
    for (auto [entity, pos, vel, mass, fixed] : view.each()) {
        if (fixed.value) {
            continue;
        }

        Components::BodyState self;
        self.entity = entity;
        self.position = pos;
        self.velocity = vel;
        self.mass = mass.value;

        Vector external;
        if (const auto *acc = registry.try_get<Components::Acceleration>(entity)) {
            external = Vector(acc->x, acc->y);
        }

        Vector const acceleration = computeAcceleration(self, external, snapshot.bodies);

        vel += acceleration * dt;
        pos += vel * dt;
    }
}

} // namespace Systems
