/**
 * @file ball_rain.cpp
 * @brief Grid of balls dropped into a universe larger than the window.
 *
 * One world unit maps to one pixel here, so the window edges, the bounce
 * clamp and the rest floor all line up on screen.
 */

#include <ctime>
#include <iostream>
#include <random>

#include "ballsim/scenarios/ball_rain.hpp"
#include "ballsim/entities/entity_factory.hpp"

ScenarioConfig BallRainScenario::getConfig() const {
    ScenarioConfig cfg;

    cfg.systemConfig.PixelsPerMeter = 1.0;
    cfg.systemConfig.UniverseWidth = 1000.0;
    cfg.systemConfig.UniverseHeight = 600.0;

    cfg.BodyCount = 40;
    cfg.BodyMassMin = 0.5;
    cfg.BodyMassMax = 2.0;
    cfg.BodyRadius = 10.0;
    cfg.InitialSpeed = 20.0;
    cfg.Seed = seed;

    return cfg;
}

void BallRainScenario::createEntities(entt::registry &registry) const {
    std::cout << "Creating Ball Rain scenario...\n";

    ScenarioConfig const cfg = getConfig();
    const SystemConfig &sys = cfg.systemConfig;

    unsigned int const spawnSeed = cfg.Seed != 0 ? cfg.Seed : static_cast<unsigned int>(time(nullptr));
    std::default_random_engine generator{spawnSeed};
    std::uniform_real_distribution<double> massDist(cfg.BodyMassMin, cfg.BodyMassMax);
    std::uniform_real_distribution<double> speedDist(-cfg.InitialSpeed, cfg.InitialSpeed);

    const int columns = 10;
    const int rows = cfg.BodyCount / columns;
    const double spacing = 4.0 * cfg.BodyRadius;

    // Top rows sit just under the ceiling, columns centred on the origin
    const double left = -(columns - 1) * spacing / 2.0;
    const double top = sys.WindowHeight / 2.0 - 2.0 * cfg.BodyRadius;

    int created = 0;
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < columns; ++col) {
            Components::Position const pos(left + col * spacing, top - row * spacing);
            Components::Velocity const vel(speedDist(generator), 0.0);

            auto const shade = static_cast<uint8_t>(255 - 30 * row);
            Entities::EntityFactory::createBody(registry, pos, vel, massDist(generator),
                                                cfg.BodyRadius, Components::Color(0, shade, 255));
            created++;
        }
    }

    std::cout << "...Created " << created << " falling balls.\n";
}
