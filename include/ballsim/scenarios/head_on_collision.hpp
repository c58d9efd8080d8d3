#ifndef BALLSIM_HEAD_ON_COLLISION_SCENARIO_HPP
#define BALLSIM_HEAD_ON_COLLISION_SCENARIO_HPP

#include "ballsim/core/i_scenario.hpp"
#include <entt/entt.hpp>

/**
 * @class HeadOnCollisionScenario
 *
 * Two equal balls fly straight at each other with gravity, friction and attraction switched off.
 */
class HeadOnCollisionScenario : public IScenario {
public:
    HeadOnCollisionScenario() = default;
    ~HeadOnCollisionScenario() override = default;

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;
};

#endif // BALLSIM_HEAD_ON_COLLISION_SCENARIO_HPP
