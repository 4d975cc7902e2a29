#include "surface_type.hpp"
#include <cmath>
#include <type_traits>

namespace brepkit {

Vector3 surface_normal_at(const SurfaceType& surface, const Point3& point) {
    return std::visit([&point](auto&& s) -> Vector3 {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, surface::Planar>) {
            return s.normal.normalized();
        } else if constexpr (std::is_same_v<T, surface::Spherical>) {
            auto radial = (point - s.center).try_normalize();
            return radial ? *radial : vec3::unit_z();
        } else {
            // Tilt the radial direction toward the apex by the half angle
            Vector3 axis = s.axis.normalized();
            Vector3 v = point - s.apex;
            auto radial = (v - axis * v.dot(axis)).try_normalize();
            if (!radial) {
                return axis;
            }
            return (*radial * std::cos(s.half_angle) +
                    axis * std::sin(s.half_angle)).normalized();
        }
    }, surface);
}

const char* surface_type_name(const SurfaceType& surface) {
    return std::visit([](auto&& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, surface::Planar>) return "planar";
        else if constexpr (std::is_same_v<T, surface::Spherical>) return "spherical";
        else return "conical";
    }, surface);
}

bool is_exact_surface(const SurfaceType& surface) {
    return std::holds_alternative<surface::Planar>(surface);
}

}  // namespace brepkit
