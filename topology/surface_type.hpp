#ifndef BREPKIT_TOPOLOGY_SURFACE_TYPE_HPP
#define BREPKIT_TOPOLOGY_SURFACE_TYPE_HPP

#include <math/point3.hpp>
#include <math/vec3.hpp>
#include <variant>

namespace brepkit {
namespace surface {

// Flat plane; the only surface the kernel represents exactly
struct Planar {
    Vector3 normal;
};

// Sphere metadata for a faceted face
struct Spherical {
    Point3 center;
    double radius = 0.0;
};

// Cone metadata for a faceted face.
// axis points from the base toward the apex.
struct Conical {
    Point3 apex;
    Vector3 axis;
    double half_angle = 0.0;
};

}  // namespace surface

// Supporting surface of a face. Spherical and Conical faces are still bounded
// by straight-edge loops; the curvature is descriptive only.
using SurfaceType = std::variant<surface::Planar, surface::Spherical, surface::Conical>;

// Outward unit normal of the underlying surface at a point
Vector3 surface_normal_at(const SurfaceType& surface, const Point3& point);

// "planar", "spherical" or "conical"
const char* surface_type_name(const SurfaceType& surface);

// True when the face geometry is exactly its polygon (planar)
bool is_exact_surface(const SurfaceType& surface);

}  // namespace brepkit

#endif // BREPKIT_TOPOLOGY_SURFACE_TYPE_HPP
