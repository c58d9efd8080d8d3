/**
 * @file random_balls.cpp
 * @brief Start-up population: a hundred green balls scattered over the universe.
 *
 * Positions are drawn uniformly from the universe extents, each velocity
 * component from [-InitialSpeed, InitialSpeed) and masses from
 * [BodyMassMin, BodyMassMax). With the default extents many balls start
 * outside the universe box and are removed on the first tick.
 */

#include <ctime>
#include <iostream>
#include <random>

#include "ballsim/scenarios/random_balls.hpp"
#include "ballsim/entities/entity_factory.hpp"

ScenarioConfig RandomBallsScenario::getConfig() const {
    ScenarioConfig cfg;

    cfg.BodyCount = 100;
    cfg.BodyMassMin = 0.5;
    cfg.BodyMassMax = 2.0;
    cfg.BodyRadius = 10.0;
    cfg.InitialSpeed = 1.0;
    cfg.Seed = seed;

    return cfg;
}

void RandomBallsScenario::createEntities(entt::registry &registry) const {
    std::cout << "Creating Random Balls scenario...\n";

    ScenarioConfig const cfg = getConfig();
    const SystemConfig &sys = cfg.systemConfig;

    unsigned int const spawnSeed = cfg.Seed != 0 ? cfg.Seed : static_cast<unsigned int>(time(nullptr));
    std::default_random_engine generator{spawnSeed};
    std::uniform_real_distribution<double> unit(-0.5, 0.5);
    std::uniform_real_distribution<double> massDist(cfg.BodyMassMin, cfg.BodyMassMax);

    for (int i = 0; i < cfg.BodyCount; ++i) {
        Components::Position const pos(unit(generator) * sys.UniverseWidth,
                                       unit(generator) * sys.UniverseHeight);
        Components::Velocity const vel(unit(generator) * 2.0 * cfg.InitialSpeed,
                                       unit(generator) * 2.0 * cfg.InitialSpeed);

        Entities::EntityFactory::createBody(registry, pos, vel, massDist(generator),
                                            cfg.BodyRadius, Components::Color(0, 255, 0));
    }

    std::cout << "...Created " << cfg.BodyCount << " balls.\n";
}
