#ifndef BREPKIT_MATH_VEC2_HPP
#define BREPKIT_MATH_VEC2_HPP

#include "vec3.hpp"
#include <cmath>

namespace brepkit {

// Point in 2D sketch coordinates
struct Point2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Point2() = default;
    constexpr Point2(double x_, double y_) : x(x_), y(y_) {}

    double distance_to(const Point2& other) const {
        return std::sqrt(distance_squared_to(other));
    }

    constexpr double distance_squared_to(const Point2& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return dx * dx + dy * dy;
    }

    constexpr Point2 lerp(const Point2& other, double t) const {
        return {x + (other.x - x) * t, y + (other.y - y) * t};
    }

    constexpr Point2 midpoint(const Point2& other) const {
        return lerp(other, 0.5);
    }

    bool approx_eq(const Point2& other, double tolerance = TOLERANCE) const {
        return distance_squared_to(other) < tolerance * tolerance;
    }

    constexpr bool operator==(const Point2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point2& other) const {
        return !(*this == other);
    }
};

}  // namespace brepkit

#endif // BREPKIT_MATH_VEC2_HPP
