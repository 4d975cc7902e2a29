#ifndef BREPKIT_MODELING_EXTRUDE_HPP
#define BREPKIT_MODELING_EXTRUDE_HPP

#include <sketch/sketch.hpp>
#include <topology/solid.hpp>
#include <optional>
#include <vector>

namespace brepkit {

struct ExtrudeParams {
    double distance = 50.0;    // Along the sketch normal; negative extrudes the other way
    bool symmetric = false;    // Split the distance evenly on both sides of the plane
};

// First closed chain of Line entities, as the points met walking it.
// Lines are joined through shared point handles in either direction;
// other entity kinds are ignored. nullopt when no chain closes.
std::optional<std::vector<SketchPointId>> find_closed_profile(const Sketch& sketch);

// Prism from the first closed line profile of the sketch, swept along the
// sketch plane normal. The result has one closed shell: a bottom cap, a top
// cap and one side face per profile edge, all wound counter-clockwise seen
// from outside.
// nullopt when there is no closed profile, the profile has zero area, or
// the distance is below TOLERANCE.
std::optional<Solid> extrude_sketch(const Sketch& sketch, const ExtrudeParams& params = {});

}  // namespace brepkit

#endif // BREPKIT_MODELING_EXTRUDE_HPP
