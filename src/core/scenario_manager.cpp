/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include "ballsim/core/scenario_manager.hpp"
#include "ballsim/scenarios/ball_rain.hpp"
#include "ballsim/scenarios/head_on_collision.hpp"
#include "ballsim/scenarios/random_balls.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : SimulatorConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, SimulatorConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setCurrentScenario(SimulatorConstants::SimulationType scenario) {
  currentScenario = scenario;
}

SimulatorConstants::SimulationType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    SimulatorConstants::SimulationType scenarioType) const {
  switch (scenarioType) {
    case SimulatorConstants::SimulationType::RANDOM_BALLS:
      return std::make_unique<RandomBallsScenario>();

    case SimulatorConstants::SimulationType::HEAD_ON_COLLISION:
      return std::make_unique<HeadOnCollisionScenario>();

    case SimulatorConstants::SimulationType::BALL_RAIN:
      return std::make_unique<BallRainScenario>();

    default:
      return std::make_unique<RandomBallsScenario>();
  }
}
