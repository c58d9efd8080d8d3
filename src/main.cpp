/**
 * @file main.cpp
 * @brief Entry point: opens the window and runs the simulation loop.
 */

#include <cstdlib>
#include <exception>
#include <iostream>

#include "ballsim/core/profile.hpp"
#include "ballsim/core/sim_manager.hpp"

int main() {
    try {
        SimManager simManager;
        if (!simManager.init()) {
            return EXIT_FAILURE;
        }

        {
            PROFILE_SCOPE("main");
            simManager.run();
        }

        Profiling::Profiler::printStats();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
