#ifndef BALLSIM_COMPONENTS_BASIC_HPP
#define BALLSIM_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "ballsim/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // World-space location and linear velocity of a body
    using Position = ::Position;
    using Velocity = ::Vector;

    /**
     * @brief Caller-supplied constant acceleration added every tick
     *
     * Distinct from the acceleration the integrator computes per step.
     */
    struct Acceleration {
        double x = 0.0;
        double y = 0.0;

        Acceleration(double x = 0.0, double y = 0.0) : x(x), y(y) {}
    };

    struct Mass {
        double value = 1.0;

        explicit Mass(double v = 1.0) : value(v) {}
    };

    // Collision and boundary geometry, also the drawn circle radius
    struct Radius {
        double value = 10.0;

        explicit Radius(double v = 10.0) : value(v) {}
    };

    /**
     * @brief Set once a body comes to rest on the floor
     *
     * A fixed body is never integrated, collided or bounced again, but it is
     * still seen by the other bodies. The flag never reverts inside the core.
     */
    struct Fixed {
        bool value = false;

        explicit Fixed(bool v = false) : value(v) {}
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 0, uint8_t g = 255, uint8_t b = 0)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif
