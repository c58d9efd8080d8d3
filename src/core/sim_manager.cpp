/**
 * @fileoverview sim_manager.cpp
 * @brief Implementation of SimManager.
 */

#include <algorithm>
#include <iostream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "ballsim/core/profile.hpp"
#include "ballsim/core/sim_manager.hpp"

namespace {

const char* stateName(const SimulationController& controller) {
  switch (controller.getState()) {
    case SimulationController::State::Running:
      return "running";
    case SimulationController::State::SteppingForward:
      return "stepping";
    case SimulationController::State::Paused:
    default:
      return "paused";
  }
}

}  // namespace

SimManager::SimManager()
    : renderer(static_cast<unsigned int>(SimulatorConstants::WindowWidth),
               static_cast<unsigned int>(SimulatorConstants::WindowHeight))
    , simulator()
    , scenarioManager()
    , controller()
    , running(true)
    , statsAccumulator(sf::Time::Zero)
    , timeSinceLastProfilerPrint(sf::Time::Zero)
    , frameCount(0)
    , actualFPS(0.0f)
{
}

bool SimManager::init() {
  if (!renderer.init()) {
    std::cerr << "Renderer initialization failed." << std::endl;
    return false;
  }
  renderer.getWindow().setFramerateLimit(SimulatorConstants::StepsPerSecond);

  scenarioManager.buildScenarioList();
  std::cout << "Scenarios:";
  for (const auto& [type, name] : scenarioManager.getScenarioList()) {
    std::cout << " " << name;
  }
  std::cout << std::endl;

  selectScenario(SimulatorConstants::SimulationType::RANDOM_BALLS);
  return true;
}

void SimManager::run() {
  sf::Clock frameClock;

  while (running && renderer.getWindow().isOpen()) {
    sf::Time const frameTime = frameClock.restart();
    statsAccumulator += frameTime;
    timeSinceLastProfilerPrint += frameTime;

    if (!handleEvents()) {
      break;
    }

    // Frame delta, capped at MaxFrameSeconds
    double const dt = std::min(static_cast<double>(frameTime.asSeconds()),
                               SimulatorConstants::MaxFrameSeconds);
    tick(dt);
    render();
    frameCount++;

    if (statsAccumulator >= statsUpdateInterval) {
      float const elapsedSeconds = statsAccumulator.asSeconds();
      actualFPS = (elapsedSeconds > 0) ? static_cast<float>(frameCount) / elapsedSeconds : 0.0f;
      renderer.renderStatus(actualFPS, simulator.bodyCount(), stateName(controller));
      frameCount = 0;
      statsAccumulator = sf::Time::Zero;
    }

    if (timeSinceLastProfilerPrint >= profilerPrintInterval) {
      Profiling::Profiler::printStats();
      Profiling::Profiler::reset();
      timeSinceLastProfilerPrint = sf::Time::Zero;
    }
  }

  renderer.getWindow().close();
}

bool SimManager::handleEvents() {
  sf::RenderWindow& window = renderer.getWindow();

  sf::Event event;
  while (window.pollEvent(event)) {
    if (event.type == sf::Event::Closed) {
      running = false;
    } else if (event.type == sf::Event::KeyPressed) {
      switch (event.key.code) {
        case sf::Keyboard::Escape:
          running = false;
          break;
        case sf::Keyboard::P:
          controller.togglePause();
          break;
        case sf::Keyboard::Space:
          controller.stepForward(1);
          break;
        case sf::Keyboard::N:
          controller.stepForward(10);
          break;
        case sf::Keyboard::R:
          resetSimulator();
          break;
        case sf::Keyboard::Num1:
          selectScenario(SimulatorConstants::SimulationType::RANDOM_BALLS);
          break;
        case sf::Keyboard::Num2:
          selectScenario(SimulatorConstants::SimulationType::HEAD_ON_COLLISION);
          break;
        case sf::Keyboard::Num3:
          selectScenario(SimulatorConstants::SimulationType::BALL_RAIN);
          break;
        default:
          break;
      }
    }
  }

  return running;
}

void SimManager::tick(double dt) {
  PROFILE_SCOPE("SimManager::tick");

  if (!controller.shouldStep()) {
    return;
  }

  auto removed = simulator.tick(dt);
  if (!removed.empty()) {
    std::cout << "Despawned " << removed.size() << " bodies ("
              << simulator.bodyCount() << " left)" << std::endl;
  }
}

void SimManager::render() {
  renderer.clear();
  renderer.renderBodies(simulator.getRegistry(), simulator.getConfig());
  renderer.present();
}

void SimManager::resetSimulator() {
  simulator.reset();
  controller.resume();
}

void SimManager::selectScenario(SimulatorConstants::SimulationType scenario) {
  std::cout << "Loading scenario " << SimulatorConstants::getScenarioName(scenario) << std::endl;
  scenarioManager.setCurrentScenario(scenario);
  simulator.loadScenario(scenarioManager.createScenario(scenario));
  resetSimulator();
}
