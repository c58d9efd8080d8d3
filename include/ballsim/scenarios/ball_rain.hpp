#ifndef BALLSIM_BALL_RAIN_SCENARIO_HPP
#define BALLSIM_BALL_RAIN_SCENARIO_HPP

#include "ballsim/core/i_scenario.hpp"
#include <entt/entt.hpp>

/**
 * @class BallRainScenario
 *
 * A grid of balls falls inside an enlarged universe, bounces off the window edges and settles on the floor.
 */
class BallRainScenario : public IScenario {
public:
    /**
     * @param seed Seed for the spawn generator; 0 seeds from the clock
     */
    explicit BallRainScenario(unsigned int seed = 0) : seed(seed) {}
    ~BallRainScenario() override = default;

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

private:
    unsigned int seed;
};

#endif // BALLSIM_BALL_RAIN_SCENARIO_HPP
