/**
 * @file simulation_controller.hpp
 * @brief Run / pause / frame-step state of the host loop
 */

#pragma once

/**
 * @class SimulationController
 * @brief Decides, once per host tick, whether the integrator runs
 *
 * States:
 * - Running: every tick steps
 * - Paused: no tick steps
 * - SteppingForward(n): the next n ticks step, then the controller is Paused
 *
 * The physics core never sees this state; the host consults shouldStep()
 * before calling the integrator.
 */
class SimulationController {
 public:
  enum class State {
    Running,
    Paused,
    SteppingForward
  };

  SimulationController() = default;

  /**
   * @brief Consumes one tick of the current state.
   * @return true if the integrator should run for this tick.
   */
  bool shouldStep();

  void pause();
  void resume();
  void togglePause();

  /**
   * @brief Requests frame-by-frame stepping while paused.
   *
   * Frames add up if stepping is already in progress. Ignored while running.
   *
   * @param frames Number of ticks to run, must be positive
   * @return true if the request was accepted
   */
  bool stepForward(int frames = 1);

  State getState() const { return state; }
  int getFramesRemaining() const { return framesRemaining; }
  bool isPaused() const { return state != State::Running; }

 private:
  State state = State::Running;
  int framesRemaining = 0;
};
