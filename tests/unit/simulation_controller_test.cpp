#include <gtest/gtest.h>
#include "ballsim/core/simulation_controller.hpp"

TEST(SimulationControllerTest, StartsRunning) {
    SimulationController controller;
    EXPECT_EQ(controller.getState(), SimulationController::State::Running);
    EXPECT_FALSE(controller.isPaused());
    EXPECT_TRUE(controller.shouldStep());
    EXPECT_TRUE(controller.shouldStep());
}

TEST(SimulationControllerTest, PausedDoesNotStep) {
    SimulationController controller;
    controller.pause();
    EXPECT_TRUE(controller.isPaused());
    EXPECT_FALSE(controller.shouldStep());
    EXPECT_FALSE(controller.shouldStep());

    controller.resume();
    EXPECT_TRUE(controller.shouldStep());
}

TEST(SimulationControllerTest, TogglePause) {
    SimulationController controller;
    controller.togglePause();
    EXPECT_EQ(controller.getState(), SimulationController::State::Paused);
    controller.togglePause();
    EXPECT_EQ(controller.getState(), SimulationController::State::Running);
}

TEST(SimulationControllerTest, StepForwardRunsRequestedFrames) {
    SimulationController controller;
    controller.pause();

    EXPECT_TRUE(controller.stepForward(2));
    EXPECT_EQ(controller.getState(), SimulationController::State::SteppingForward);
    EXPECT_EQ(controller.getFramesRemaining(), 2);

    EXPECT_TRUE(controller.shouldStep());
    EXPECT_TRUE(controller.shouldStep());
    EXPECT_FALSE(controller.shouldStep());
    EXPECT_EQ(controller.getState(), SimulationController::State::Paused);
    EXPECT_EQ(controller.getFramesRemaining(), 0);
}

TEST(SimulationControllerTest, StepForwardRequestsAccumulate) {
    SimulationController controller;
    controller.pause();
    controller.stepForward(1);
    controller.stepForward(3);
    EXPECT_EQ(controller.getFramesRemaining(), 4);
}

TEST(SimulationControllerTest, StepForwardIgnoredWhileRunningOrInvalid) {
    SimulationController controller;
    EXPECT_FALSE(controller.stepForward(1));
    EXPECT_EQ(controller.getState(), SimulationController::State::Running);

    controller.pause();
    EXPECT_FALSE(controller.stepForward(0));
    EXPECT_FALSE(controller.stepForward(-2));
    EXPECT_EQ(controller.getState(), SimulationController::State::Paused);
}

TEST(SimulationControllerTest, ResumeCancelsPendingSteps) {
    SimulationController controller;
    controller.pause();
    controller.stepForward(5);
    controller.resume();
    EXPECT_EQ(controller.getFramesRemaining(), 0);
    EXPECT_EQ(controller.getState(), SimulationController::State::Running);
}
