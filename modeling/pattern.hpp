#ifndef BREPKIT_MODELING_PATTERN_HPP
#define BREPKIT_MODELING_PATTERN_HPP

#include <math/point3.hpp>
#include <math/vec3.hpp>
#include <topology/solid.hpp>
#include <cstdint>
#include <vector>

namespace brepkit {

// Copy of the solid moved by offset. Vertex points and surface
// metadata move together; topology is unchanged.
Solid translate_solid(const Solid& solid, const Vector3& offset);

// Copy of the solid rotated by angle (radians, right-handed) about the
// line through center along axis. A zero axis falls back to +Z.
Solid rotate_solid(const Solid& solid, const Vector3& axis, const Point3& center, double angle);

// count copies spaced along direction; copy i is offset by i * spacing.
// The first copy is the unmoved input. count is clamped to at least 1 and a
// zero direction falls back to +Z.
std::vector<Solid> linear_pattern(const Solid& solid, const Vector3& direction,
                                  uint32_t count, double spacing);

// count copies spread evenly over a full turn about the axis through center.
// The first copy is the unmoved input; count is clamped to at least 1.
std::vector<Solid> circular_pattern(const Solid& solid, const Vector3& axis,
                                    const Point3& center, uint32_t count);

}  // namespace brepkit

#endif // BREPKIT_MODELING_PATTERN_HPP
