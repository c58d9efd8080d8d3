#include <cmath>
#include <memory>
#include <vector>
#include <gtest/gtest.h>
#include "ballsim/components/basic.hpp"
#include "ballsim/components/sim.hpp"
#include "ballsim/core/constants.hpp"
#include "ballsim/core/scenario_manager.hpp"
#include "ballsim/core/simulator.hpp"
#include "ballsim/scenarios/ball_rain.hpp"
#include "ballsim/scenarios/random_balls.hpp"

using SimulatorConstants::SimulationType;

class SimulatorTest : public ::testing::Test {
protected:
    ECSSimulator simulator;
    ScenarioManager scenarioManager;

    static constexpr unsigned int kSeed = 1234;

    void load(SimulationType type) {
        load(scenarioManager.createScenario(type));
    }

    void load(std::unique_ptr<IScenario> scenario) {
        simulator.loadScenario(std::move(scenario));
        simulator.reset();
    }

    std::vector<Components::Position> positions() const {
        std::vector<Components::Position> out;
        for (auto [entity, pos] : simulator.getRegistry().view<const Components::Position>().each()) {
            out.push_back(pos);
        }
        return out;
    }

    void run(int ticks) {
        for (int i = 0; i < ticks; ++i) {
            simulator.tick(1.0 / SimulatorConstants::StepsPerSecond);
        }
    }
};

TEST_F(SimulatorTest, ScenarioListCoversAllTypes) {
    scenarioManager.buildScenarioList();
    EXPECT_EQ(scenarioManager.getScenarioList().size(),
              SimulatorConstants::getAllScenarios().size());

    scenarioManager.setCurrentScenario(SimulationType::BALL_RAIN);
    EXPECT_EQ(scenarioManager.getCurrentScenario(), SimulationType::BALL_RAIN);
}

TEST_F(SimulatorTest, EmptySimulatorTicks) {
    EXPECT_EQ(simulator.bodyCount(), 0u);
    EXPECT_TRUE(simulator.tick(0.1).empty());
}

TEST_F(SimulatorTest, RandomBallsSpawnsHundredBodies) {
    load(std::make_unique<RandomBallsScenario>(kSeed));
    EXPECT_EQ(simulator.bodyCount(), 100u);
    EXPECT_EQ(simulator.despawnedCount(), 0u);

    // Bodies outside the universe box go on the first tick
    auto removed = simulator.tick(0.0);
    EXPECT_EQ(simulator.bodyCount() + removed.size(), 100u);
    EXPECT_EQ(simulator.despawnedCount(), removed.size());
}

TEST_F(SimulatorTest, HeadOnBodiesBounceApartAndLeave) {
    load(SimulationType::HEAD_ON_COLLISION);
    ASSERT_EQ(simulator.bodyCount(), 2u);
    EXPECT_DOUBLE_EQ(simulator.getConfig().Gravity, 0.0);
    EXPECT_FALSE(simulator.getConfig().PairwiseAttraction);

    auto& registry = simulator.getRegistry();
    entt::entity left = entt::null;
    for (auto [entity, pos] : registry.view<Components::Position>().each()) {
        if (pos.x < 0.0) {
            left = entity;
        }
    }
    ASSERT_TRUE(left != entt::null);
    EXPECT_GT(registry.get<Components::Velocity>(left).x, 0.0);

    // Contact after about one second, then they fly apart
    run(120);
    ASSERT_EQ(simulator.bodyCount(), 2u);
    EXPECT_NEAR(registry.get<Components::Velocity>(left).x, -10.0, 1e-9);

    run(600);
    EXPECT_EQ(simulator.bodyCount(), 0u);
    EXPECT_EQ(simulator.despawnedCount(), 2u);
}

TEST_F(SimulatorTest, ResetRestoresScenarioAndKeepsTimeScale) {
    load(SimulationType::HEAD_ON_COLLISION);
    simulator.setTimeScale(2.0);
    run(720);
    EXPECT_EQ(simulator.bodyCount(), 0u);

    simulator.reset();
    EXPECT_EQ(simulator.bodyCount(), 2u);
    EXPECT_EQ(simulator.despawnedCount(), 0u);

    const auto& registry = simulator.getRegistry();
    auto stateView = registry.view<const Components::SimulatorState>();
    ASSERT_EQ(stateView.size(), 1u);
    EXPECT_DOUBLE_EQ(registry.get<Components::SimulatorState>(stateView.front()).timeScale, 2.0);
}

TEST_F(SimulatorTest, SeededScenarioIsReproducible) {
    load(std::make_unique<RandomBallsScenario>(kSeed));
    auto first = positions();

    load(std::make_unique<RandomBallsScenario>(kSeed));
    auto second = positions();

    ASSERT_EQ(first.size(), 100u);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i], second[i]);
    }
}

TEST_F(SimulatorTest, BallRainStaysFinite) {
    load(std::make_unique<BallRainScenario>(kSeed));
    ASSERT_EQ(simulator.bodyCount(), 40u);
    EXPECT_DOUBLE_EQ(simulator.getConfig().PixelsPerMeter, 1.0);

    run(600);

    const auto& registry = simulator.getRegistry();
    for (auto [entity, pos, vel] :
         registry.view<const Components::Position, const Components::Velocity>().each()) {
        EXPECT_TRUE(std::isfinite(pos.x));
        EXPECT_TRUE(std::isfinite(pos.y));
        EXPECT_TRUE(std::isfinite(vel.x));
        EXPECT_TRUE(std::isfinite(vel.y));
    }
}

TEST_F(SimulatorTest, NegativeTimestepThrows) {
    load(SimulationType::HEAD_ON_COLLISION);
    EXPECT_THROW(simulator.tick(-1.0), std::invalid_argument);
}
