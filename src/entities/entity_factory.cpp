#include "ballsim/entities/entity_factory.hpp"

#include <sstream>
#include <stdexcept>

namespace Entities {

entt::entity EntityFactory::createBody(
    entt::registry& registry,
    const Components::Position& position,
    const Components::Velocity& velocity,
    double mass,
    double radius,
    const Components::Color& color)
{
    if (!(mass > 0.0) || !isFinite(mass)) {
        std::ostringstream msg;
        msg << "EntityFactory::createBody: mass must be positive (got " << mass << ")";
        throw std::invalid_argument(msg.str());
    }
    if (!(radius > 0.0) || !isFinite(radius)) {
        std::ostringstream msg;
        msg << "EntityFactory::createBody: radius must be positive (got " << radius << ")";
        throw std::invalid_argument(msg.str());
    }

    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Velocity>(entity, velocity);
    registry.emplace<Components::Acceleration>(entity, 0.0, 0.0);
    registry.emplace<Components::Mass>(entity, mass);
    registry.emplace<Components::Radius>(entity, radius);
    registry.emplace<Components::Fixed>(entity, false);
    registry.emplace<Components::Color>(entity, color);
    return entity;
}

} // namespace Entities
