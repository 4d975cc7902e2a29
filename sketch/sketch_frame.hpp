#ifndef BREPKIT_SKETCH_FRAME_HPP
#define BREPKIT_SKETCH_FRAME_HPP

#include <math/point3.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <topology/solid.hpp>
#include <optional>

namespace brepkit {

// Orthonormal frame that maps sketch (u, v) coordinates into world space.
// normal = u_axis x v_axis.
struct SketchCoordinateFrame {
    Point3 origin;
    Vector3 normal = vec3::unit_z();
    Vector3 u_axis = vec3::unit_x();
    Vector3 v_axis = vec3::unit_y();

    // Frame on the plane through origin with the given normal.
    // u_axis is derived from world X (or world Y when the normal is closer
    // to X). nullopt for a zero-length normal.
    static std::optional<SketchCoordinateFrame> from_origin_normal(const Point3& origin,
                                                                   const Vector3& normal);

    // Frame on a planar face: origin at the first loop vertex, u along the
    // first loop edge, normal from the first three vertices.
    // nullopt if the loop does not resolve to 3 vertices or they are collinear.
    static std::optional<SketchCoordinateFrame> from_face(const Face& face, const Solid& solid);

    Point3 to_3d(const Point2& p) const;
    Point2 from_3d(const Point3& p) const;

    // Closest point on the frame plane
    Point3 project(const Point3& p) const;

    // Signed distance from the plane along normal
    double distance_to_plane(const Point3& p) const;
};

}  // namespace brepkit

#endif // BREPKIT_SKETCH_FRAME_HPP
