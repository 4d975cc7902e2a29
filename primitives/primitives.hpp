#ifndef BREPKIT_PRIMITIVES_HPP
#define BREPKIT_PRIMITIVES_HPP

#include <math/point3.hpp>
#include <topology/solid.hpp>
#include <cstdint>

namespace brepkit {

// Primitive solid generators.
//
// Each returns a Solid with one closed shell holding every face. Face loops
// wind counter-clockwise seen from outside the solid, so every edge is walked
// once forward and once reversed. Curved shapes are approximated by flat
// facets. Sizes are used as given; segment counts are clamped to the
// smallest count that still encloses a volume. Results are not validated;
// call Solid::validate() if needed.

// Axis-aligned box centered at the origin (width along X, depth along Y,
// height along Z)
Solid make_box(double width, double depth, double height);
Solid make_box_at(const Point3& center, double width, double depth, double height);

// Cylinder along Z centered at the origin; segments >= 3
Solid make_cylinder(double radius, double height, uint32_t segments);
Solid make_cylinder_at(const Point3& center, double radius, double height, uint32_t segments);

// Sphere centered at the origin; u_segments (longitude) >= 4,
// v_segments (latitude) >= 2
Solid make_sphere(double radius, uint32_t u_segments, uint32_t v_segments);
Solid make_sphere_at(const Point3& center, double radius, uint32_t u_segments, uint32_t v_segments);

// Cone along Z with its base disc at the origin and apex `height` above it;
// segments >= 3
Solid make_cone(double base_radius, double height, uint32_t segments);
Solid make_cone_at(const Point3& base_center, double base_radius, double height, uint32_t segments);

}  // namespace brepkit

#endif // BREPKIT_PRIMITIVES_HPP
