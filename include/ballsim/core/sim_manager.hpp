/**
 * @fileoverview sim_manager.hpp
 * @brief Host loop: window events, run/pause control, ticking and drawing.
 */

#pragma once

#include <SFML/System/Time.hpp>

#include "ballsim/core/constants.hpp"
#include "ballsim/core/scenario_manager.hpp"
#include "ballsim/core/simulation_controller.hpp"
#include "ballsim/core/simulator.hpp"
#include "ballsim/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Orchestrates the main loop, owns subsystems, and manages scenario selection.
 *
 * Keys: Escape quits, P toggles pause, Space steps one frame while paused,
 * N steps ten frames while paused, R resets, 1-3 select a scenario.
 */
class SimManager {
 public:
  SimManager();

  /**
   * @brief Opens the window and loads the initial scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the simulation by dt seconds if the controller allows it.
   */
  void tick(double dt);

  void render();

  void resetSimulator();

  /**
   * @brief Loads a scenario and restarts the simulation with it.
   */
  void selectScenario(SimulatorConstants::SimulationType scenario);

 private:
  Renderer renderer;
  ECSSimulator simulator;
  ScenarioManager scenarioManager;
  SimulationController controller;

  bool running;

  // Stats shown in the title bar
  sf::Time statsAccumulator;
  sf::Time timeSinceLastProfilerPrint;
  int frameCount;
  float actualFPS;

  const sf::Time statsUpdateInterval = sf::seconds(0.5f);
  const sf::Time profilerPrintInterval = sf::seconds(10.f);
};
