/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "ballsim/core/simulator.hpp"

#include <iostream>
#include <iterator>
#include <memory>

#include "ballsim/components/basic.hpp"
#include "ballsim/components/sim.hpp"
#include "ballsim/core/profile.hpp"

ECSSimulator::ECSSimulator() {
  Systems::ensureSimulatorState(registry);
}

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  scenarioPtr = std::move(scenario);
  if (scenarioPtr) {
    applyConfig(scenarioPtr->getConfig().systemConfig);
  }
}

void ECSSimulator::applyConfig(const SystemConfig& cfg) {
  integrator.setSystemConfig(cfg);
}

void ECSSimulator::reset() {
  Components::SimulatorState savedState;

  auto stateView = registry.view<Components::SimulatorState>();
  if (!stateView.empty()) {
    savedState = registry.get<Components::SimulatorState>(stateView.front());
  }

  registry.clear();
  totalDespawned = 0;

  auto stateEntity = Systems::ensureSimulatorState(registry);
  registry.replace<Components::SimulatorState>(stateEntity, savedState);

  if (scenarioPtr) {
    scenarioPtr->createEntities(registry);
  }

  std::cout << "ECSSimulator::reset() " << bodyCount() << " bodies" << std::endl;
}

std::vector<entt::entity> ECSSimulator::tick(double dt) {
  PROFILE_SCOPE("ECSSimulator::tick");

  auto removed = integrator.step(registry, dt);
  totalDespawned += removed.size();
  return removed;
}

void ECSSimulator::setTimeScale(double multiplier) {
  auto stateEntity = Systems::ensureSimulatorState(registry);
  registry.get<Components::SimulatorState>(stateEntity).timeScale = multiplier;
}

entt::registry& ECSSimulator::getRegistry() {
  return registry;
}

const entt::registry& ECSSimulator::getRegistry() const {
  return registry;
}

const SystemConfig& ECSSimulator::getConfig() const {
  return integrator.getSystemConfig();
}

std::size_t ECSSimulator::bodyCount() const {
  auto view = registry.view<const Components::Position, const Components::Radius>();
  return static_cast<std::size_t>(std::distance(view.begin(), view.end()));
}
