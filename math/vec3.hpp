#ifndef BREPKIT_MATH_VEC3_HPP
#define BREPKIT_MATH_VEC3_HPP

#include <cmath>
#include <cstddef>
#include <optional>

namespace brepkit {

// Tolerance for geometric comparisons (1 micrometer when working in mm)
constexpr double TOLERANCE = 1e-6;

// Free direction / displacement in 3D
struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vector3() = default;
    constexpr Vector3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vector3 operator+(const Vector3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vector3 operator-(const Vector3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vector3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vector3 operator-() const {
        return {-x, -y, -z};
    }

    // Compound assignment
    constexpr Vector3& operator+=(const Vector3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vector3& operator-=(const Vector3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    constexpr Vector3& operator*=(double scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    constexpr Vector3& operator/=(double scalar) {
        x /= scalar; y /= scalar; z /= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vector3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    constexpr Vector3 cross(const Vector3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    // Magnitude
    double length() const {
        return std::sqrt(length_squared());
    }

    // Normalized vector (zero vector stays zero)
    Vector3 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0, 0.0};
    }

    // Normalized vector, or nullopt when the length is below TOLERANCE
    std::optional<Vector3> try_normalize() const {
        double len = length();
        if (len < TOLERANCE) {
            return std::nullopt;
        }
        return *this / len;
    }

    // Unsigned angle to another vector in radians
    double angle(const Vector3& other) const {
        double denom = length() * other.length();
        if (denom < TOLERANCE * TOLERANCE) {
            return 0.0;
        }
        double c = dot(other) / denom;
        if (c > 1.0) c = 1.0;
        if (c < -1.0) c = -1.0;
        return std::acos(c);
    }

    // Component of this vector along other
    Vector3 project_onto(const Vector3& other) const {
        double denom = other.length_squared();
        if (denom < TOLERANCE * TOLERANCE) {
            return {0.0, 0.0, 0.0};
        }
        return other * (dot(other) / denom);
    }

    // Comparison within tolerance
    bool approx_eq(const Vector3& other, double tolerance = TOLERANCE) const {
        return (*this - other).length_squared() < tolerance * tolerance;
    }

    // Comparison (exact)
    constexpr bool operator==(const Vector3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vector3& other) const {
        return !(*this == other);
    }

    // Array access
    constexpr double& operator[](size_t i) {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }

    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

// Scalar * Vector3
constexpr Vector3 operator*(double scalar, const Vector3& v) {
    return v * scalar;
}

// Common constants
namespace vec3 {
    constexpr Vector3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vector3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vector3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vector3 unit_z() { return {0.0, 0.0, 1.0}; }
    constexpr Vector3 neg_x() { return {-1.0, 0.0, 0.0}; }
    constexpr Vector3 neg_y() { return {0.0, -1.0, 0.0}; }
    constexpr Vector3 neg_z() { return {0.0, 0.0, -1.0}; }
}

}  // namespace brepkit

#endif // BREPKIT_MATH_VEC3_HPP
