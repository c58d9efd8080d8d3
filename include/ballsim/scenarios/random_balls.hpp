#ifndef BALLSIM_RANDOM_BALLS_SCENARIO_HPP
#define BALLSIM_RANDOM_BALLS_SCENARIO_HPP

#include "ballsim/core/i_scenario.hpp"
#include <entt/entt.hpp>

/**
 * @class RandomBallsScenario
 *
 * Scatters a hundred balls of random mass across the universe box with small random velocities.
 */
class RandomBallsScenario : public IScenario {
public:
    /**
     * @param seed Seed for the spawn generator; 0 seeds from the clock
     */
    explicit RandomBallsScenario(unsigned int seed = 0) : seed(seed) {}
    ~RandomBallsScenario() override = default;

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

private:
    unsigned int seed;
};

#endif // BALLSIM_RANDOM_BALLS_SCENARIO_HPP
