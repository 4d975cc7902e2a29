#include "pattern.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <type_traits>

namespace brepkit {

namespace {

Vector3 axis_or_z(const Vector3& v) {
    auto n = v.try_normalize();
    return n ? *n : vec3::unit_z();
}

// Rodrigues rotation of a direction about a unit axis
Vector3 rotate_vector(const Vector3& v, const Vector3& k, double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    return v * c + k.cross(v) * s + k * (k.dot(v) * (1.0 - c));
}

// Apply a point map and a direction map to every vertex and face surface
template <typename PointMap, typename VectorMap>
Solid map_solid(const Solid& input, PointMap map_point, VectorMap map_vector) {
    Solid solid = input;

    for (size_t i = 0; i < solid.vertex_count(); ++i) {
        Vertex* v = solid.vertex(VertexId(static_cast<uint32_t>(i)));
        v->point = map_point(v->point);
    }

    for (size_t i = 0; i < solid.face_count(); ++i) {
        Face* f = solid.face(FaceId(static_cast<uint32_t>(i)));
        std::visit([&](auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, surface::Planar>) {
                s.normal = map_vector(s.normal);
            } else if constexpr (std::is_same_v<T, surface::Spherical>) {
                s.center = map_point(s.center);
            } else {
                s.apex = map_point(s.apex);
                s.axis = map_vector(s.axis);
            }
        }, f->surface);
    }

    return solid;
}

}  // namespace

Solid translate_solid(const Solid& solid, const Vector3& offset) {
    return map_solid(solid,
                     [&offset](const Point3& p) { return p + offset; },
                     [](const Vector3& v) { return v; });
}

Solid rotate_solid(const Solid& solid, const Vector3& axis, const Point3& center, double angle) {
    Vector3 k = axis_or_z(axis);
    return map_solid(solid,
                     [&](const Point3& p) { return center + rotate_vector(p - center, k, angle); },
                     [&](const Vector3& v) { return rotate_vector(v, k, angle); });
}

std::vector<Solid> linear_pattern(const Solid& solid, const Vector3& direction,
                                  uint32_t count, double spacing) {
    count = std::max(count, 1u);
    Vector3 dir = axis_or_z(direction);

    std::vector<Solid> copies;
    copies.reserve(count);
    copies.push_back(solid);
    for (uint32_t i = 1; i < count; ++i) {
        copies.push_back(translate_solid(solid, dir * (spacing * static_cast<double>(i))));
    }

    logging::get_logger()->trace("linear_pattern: {} copies, spacing {}", count, spacing);
    return copies;
}

std::vector<Solid> circular_pattern(const Solid& solid, const Vector3& axis,
                                    const Point3& center, uint32_t count) {
    count = std::max(count, 1u);
    double step = 2.0 * std::numbers::pi / static_cast<double>(count);

    std::vector<Solid> copies;
    copies.reserve(count);
    copies.push_back(solid);
    for (uint32_t i = 1; i < count; ++i) {
        copies.push_back(rotate_solid(solid, axis, center, step * static_cast<double>(i)));
    }

    logging::get_logger()->trace("circular_pattern: {} copies", count);
    return copies;
}

}  // namespace brepkit
