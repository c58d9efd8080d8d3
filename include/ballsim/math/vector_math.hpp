/**
 * @file vector_math.hpp
 * @brief 2D vector and position primitives used by the body integrator
 *
 * The simulation is planar, so only x and y are stored. Position is a point in
 * world space, Vector is a displacement, velocity or acceleration. The two
 * convert into each other freely.
 */

#ifndef BALLSIM_VECTOR_MATH_HPP
#define BALLSIM_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Checks that a value is neither NaN nor infinite
 */
bool isFinite(double value);

/**
 * @brief A point in 2D world space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    Position(double x, double y);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Vector& v) const;

    /**
     * @brief Displacement from b to this position
     */
    Vector operator-(const Position& b) const;

    Position operator*(double scalar) const;

    /**
     * @brief Exact component-wise comparison
     *
     * Used to detect coincident bodies, so no tolerance is applied.
     */
    bool operator==(const Position& p) const;
    bool operator!=(const Position& p) const;

    /**
     * @brief Euclidean distance to another position
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);
};

/**
 * @brief A 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    Vector(double x, double y);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Dot product with another vector
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns the unit vector in the same direction
     *
     * A zero-length vector has no direction and is returned unchanged.
     */
    Vector normalized() const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

#endif
