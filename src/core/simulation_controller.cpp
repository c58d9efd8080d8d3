/**
 * @file simulation_controller.cpp
 * @brief Implementation of SimulationController.
 */

#include "ballsim/core/simulation_controller.hpp"

bool SimulationController::shouldStep() {
  switch (state) {
    case State::Running:
      return true;

    case State::SteppingForward:
      --framesRemaining;
      if (framesRemaining <= 0) {
        framesRemaining = 0;
        state = State::Paused;
      }
      return true;

    case State::Paused:
    default:
      return false;
  }
}

void SimulationController::pause() {
  state = State::Paused;
  framesRemaining = 0;
}

void SimulationController::resume() {
  state = State::Running;
  framesRemaining = 0;
}

void SimulationController::togglePause() {
  if (state == State::Running) {
    pause();
  } else {
    resume();
  }
}

bool SimulationController::stepForward(int frames) {
  if (frames <= 0 || state == State::Running) {
    return false;
  }
  framesRemaining += frames;
  state = State::SteppingForward;
  return true;
}
