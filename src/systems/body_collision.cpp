#include "ballsim/systems/body_collision.hpp"
#include "ballsim/components/basic.hpp"
#include "ballsim/components/sim.hpp"
#include "ballsim/core/debug.hpp"
#include "ballsim/core/profile.hpp"

namespace Systems {

int BodyCollisionSystem::resolve(Components::BodyState &self,
                                 const std::vector<Components::BodyState> &others)
{
    int contacts = 0;
    for (const auto &other : others) {
        if (other.entity == self.entity || other.position == self.position) {
            continue;
        }

        double const distance = self.position.dist(other.position);
        if (distance == 0.0 || distance >= self.radius + other.radius) {
            continue;
        }

        Vector const normal = (other.position - self.position).normalized();
        Vector const relativeVel = self.velocity - other.velocity;
        double const impulse = 2.0 * relativeVel.dotProduct(normal) / (self.mass + other.mass);
        self.velocity -= normal * (impulse * other.mass);

        double const penetration = self.radius + other.radius - distance;
        self.position -= normal * (penetration / 2.0);
        contacts++;
    }
    return contacts;
}

void BodyCollisionSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BodyCollisionSystem");

    const auto &snapshot = registry.get<Components::TickSnapshot>(
        registry.view<Components::TickSnapshot>().front()
    );

    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::Mass, Components::Radius, Components::Fixed>();
    for (auto [entity, pos, vel, mass, radius, fixed] : view.each()) {
        if (fixed.value) {
            continue;
        }

        Components::BodyState self;
        self.entity = entity;
        self.position = pos;
        self.velocity = vel;
        self.mass = mass.value;
        self.radius = radius.value;

        int const contacts = resolve(self, snapshot.bodies);
        if (contacts == 0) {
            continue;
        }

        pos = self.position;
        vel = self.velocity;
        DebugStats::countCollisions(contacts);
    }
}

} // namespace Systems
