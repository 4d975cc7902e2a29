#ifndef BREPKIT_SKETCH_GEOMETRY_HPP
#define BREPKIT_SKETCH_GEOMETRY_HPP

#include <math/vec2.hpp>
#include <optional>

namespace brepkit {

// Center of the circle through three points; nullopt when they are
// (nearly) collinear
std::optional<Point2> circumcenter(const Point2& p1, const Point2& p2, const Point2& p3);

// Twice the signed area of triangle abc. Positive when a -> b -> c turns
// counter-clockwise, negative when clockwise, zero when collinear.
double orient2d(const Point2& a, const Point2& b, const Point2& c);

}  // namespace brepkit

#endif // BREPKIT_SKETCH_GEOMETRY_HPP
