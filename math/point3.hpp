#ifndef BREPKIT_MATH_POINT3_HPP
#define BREPKIT_MATH_POINT3_HPP

#include "vec3.hpp"

namespace brepkit {

// Position in 3D space. Differences of points are Vector3.
struct Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Point3() = default;
    constexpr Point3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr Vector3 operator-(const Point3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Point3 operator+(const Vector3& v) const {
        return {x + v.x, y + v.y, z + v.z};
    }

    constexpr Point3 operator-(const Vector3& v) const {
        return {x - v.x, y - v.y, z - v.z};
    }

    constexpr Point3& operator+=(const Vector3& v) {
        x += v.x; y += v.y; z += v.z;
        return *this;
    }

    constexpr Vector3 to_vector() const {
        return {x, y, z};
    }

    double distance_to(const Point3& other) const {
        return (*this - other).length();
    }

    constexpr double distance_squared_to(const Point3& other) const {
        return (*this - other).length_squared();
    }

    bool approx_eq(const Point3& other, double tolerance = TOLERANCE) const {
        return distance_squared_to(other) < tolerance * tolerance;
    }

    constexpr Point3 lerp(const Point3& other, double t) const {
        return {x + (other.x - x) * t, y + (other.y - y) * t, z + (other.z - z) * t};
    }

    constexpr Point3 midpoint(const Point3& other) const {
        return lerp(other, 0.5);
    }

    constexpr bool operator==(const Point3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Point3& other) const {
        return !(*this == other);
    }
};

namespace point3 {
    constexpr Point3 origin() { return {0.0, 0.0, 0.0}; }
}

}  // namespace brepkit

#endif // BREPKIT_MATH_POINT3_HPP
