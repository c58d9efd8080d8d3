#pragma once

#include <vector>
#include <entt/entt.hpp>
#include "ballsim/math/vector_math.hpp"

namespace Components {
    /**
     * @brief Tick-wide timing state, held by a single entity in the registry
     *
     * frameSeconds is the host's elapsed time for the current tick. Systems
     * integrate over frameSeconds * baseTimeAcceleration * timeScale.
     */
    struct SimulatorState {
        double baseTimeAcceleration = 1.0;
        double timeScale = 1.0;
        double frameSeconds = 0.0;

        SimulatorState(double bta = 1.0, double ts = 1.0)
            : baseTimeAcceleration(bta)
            , timeScale(ts) {}
    };

    /**
     * @brief Tick-start copy of one body
     */
    struct BodyState {
        entt::entity entity = entt::null;
        ::Position position;
        ::Vector velocity;
        double mass = 1.0;
        double radius = 1.0;
    };

    /**
     * @brief Frozen state of every live body, taken before any body is mutated
     *
     * Every pairwise computation of a tick reads this list and never the
     * registry, so results do not depend on iteration order. Lives on the
     * same entity as SimulatorState.
     */
    struct TickSnapshot {
        std::vector<BodyState> bodies;
    };
}
