#include <iostream>

#include "ballsim/scenarios/head_on_collision.hpp"
#include "ballsim/entities/entity_factory.hpp"

ScenarioConfig HeadOnCollisionScenario::getConfig() const {
    ScenarioConfig cfg;

    cfg.systemConfig.Gravity = 0.0;
    cfg.systemConfig.FrictionCoeff = 0.0;
    cfg.systemConfig.PairwiseAttraction = false;

    cfg.BodyCount = 2;
    cfg.BodyMassMin = 1.0;
    cfg.BodyMassMax = 1.0;
    cfg.BodyRadius = 10.0;
    cfg.InitialSpeed = 10.0;

    return cfg;
}

void HeadOnCollisionScenario::createEntities(entt::registry &registry) const {
    std::cout << "Creating Head-On Collision scenario...\n";

    ScenarioConfig const cfg = getConfig();

    Entities::EntityFactory::createBody(registry,
                                        Components::Position(-20.0, 0.0),
                                        Components::Velocity(cfg.InitialSpeed, 0.0),
                                        cfg.BodyMassMin, cfg.BodyRadius,
                                        Components::Color(0, 255, 0));
    Entities::EntityFactory::createBody(registry,
                                        Components::Position(20.0, 0.0),
                                        Components::Velocity(-cfg.InitialSpeed, 0.0),
                                        cfg.BodyMassMax, cfg.BodyRadius,
                                        Components::Color(0, 160, 255));
}
