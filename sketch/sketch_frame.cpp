#include "sketch_frame.hpp"
#include <cmath>

namespace brepkit {

std::optional<SketchCoordinateFrame> SketchCoordinateFrame::from_origin_normal(
    const Point3& origin, const Vector3& normal) {
    auto n = normal.try_normalize();
    if (!n) {
        return std::nullopt;
    }

    // Pick the world axis least aligned with the normal
    Vector3 reference = std::abs(n->x) <= std::abs(n->y) ? vec3::unit_x() : vec3::unit_y();
    auto u = (reference - *n * reference.dot(*n)).try_normalize();
    if (!u) {
        return std::nullopt;
    }

    SketchCoordinateFrame frame;
    frame.origin = origin;
    frame.normal = *n;
    frame.u_axis = *u;
    frame.v_axis = n->cross(*u);
    return frame;
}

std::optional<SketchCoordinateFrame> SketchCoordinateFrame::from_face(const Face& face,
                                                                      const Solid& solid) {
    auto loop = solid.loop_vertices(face.outer_loop);
    if (!loop || loop->size() < 3) {
        return std::nullopt;
    }

    const Vertex* v0 = solid.vertex((*loop)[0]);
    const Vertex* v1 = solid.vertex((*loop)[1]);
    const Vertex* v2 = solid.vertex((*loop)[2]);
    if (!v0 || !v1 || !v2) {
        return std::nullopt;
    }

    Vector3 e1 = v1->point - v0->point;
    Vector3 e2 = v2->point - v0->point;

    auto u = e1.try_normalize();
    auto n = e1.cross(e2).try_normalize();
    if (!u || !n) {
        return std::nullopt;
    }

    SketchCoordinateFrame frame;
    frame.origin = v0->point;
    frame.normal = *n;
    frame.u_axis = *u;
    frame.v_axis = n->cross(*u);
    return frame;
}

Point3 SketchCoordinateFrame::to_3d(const Point2& p) const {
    return origin + u_axis * p.x + v_axis * p.y;
}

Point2 SketchCoordinateFrame::from_3d(const Point3& p) const {
    Vector3 d = p - origin;
    return {d.dot(u_axis), d.dot(v_axis)};
}

Point3 SketchCoordinateFrame::project(const Point3& p) const {
    return p - normal * distance_to_plane(p);
}

double SketchCoordinateFrame::distance_to_plane(const Point3& p) const {
    return (p - origin).dot(normal);
}

}  // namespace brepkit
