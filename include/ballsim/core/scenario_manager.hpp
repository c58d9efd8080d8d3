/**
 * @fileoverview scenario_manager.hpp
 * @brief Catalog of available scenarios and a factory to create them.
 */

#ifndef BALLSIM_SCENARIO_MANAGER_HPP
#define BALLSIM_SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ballsim/core/constants.hpp"
#include "ballsim/core/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Keeps the scenario list and the current selection.
 */
class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
  getScenarioList() const;

  void setCurrentScenario(SimulatorConstants::SimulationType scenario);

  SimulatorConstants::SimulationType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   * @param scenarioType The chosen scenario type.
   * @return A unique_ptr to a newly constructed scenario.
   */
  std::unique_ptr<IScenario> createScenario(
      SimulatorConstants::SimulationType scenarioType) const;

 private:
  std::vector<std::pair<SimulatorConstants::SimulationType, std::string>> scenarioList;
  SimulatorConstants::SimulationType currentScenario =
      SimulatorConstants::SimulationType::RANDOM_BALLS;
};

#endif  // BALLSIM_SCENARIO_MANAGER_HPP
