#ifndef BREPKIT_PRIMITIVE_SPEC_HPP
#define BREPKIT_PRIMITIVE_SPEC_HPP

#include <math/point3.hpp>
#include <topology/solid.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace brepkit {

enum class PrimitiveKind {
    Box,
    Cylinder,
    Sphere,
    Cone
};

const char* primitive_kind_name(PrimitiveKind kind);
std::optional<PrimitiveKind> parse_primitive_kind(const std::string& name);

// Largest segment count accepted from configuration files
constexpr uint32_t MAX_PRIMITIVE_SEGMENTS = 4096;

// Parameters for one generator call. Fields a kind does not use are ignored.
// For a cone, center is the center of the base disc.
struct PrimitiveSpec {
    PrimitiveKind kind = PrimitiveKind::Box;
    Point3 center;
    double width = 1.0;
    double depth = 1.0;
    double height = 1.0;
    double radius = 0.5;
    uint32_t segments = 16;
    uint32_t u_segments = 16;
    uint32_t v_segments = 8;
};

// Run the generator named by spec.kind
Solid build_primitive(const PrimitiveSpec& spec);

}  // namespace brepkit

#endif // BREPKIT_PRIMITIVE_SPEC_HPP
