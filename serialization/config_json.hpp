#ifndef BREPKIT_SERIALIZATION_CONFIG_JSON_HPP
#define BREPKIT_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <primitives/primitive_spec.hpp>
#include <step/step_export.hpp>
#include "design_json.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace brepkit {

// StepExportOptions serialization
inline void to_json(nlohmann::json& j, const StepExportOptions& options) {
    j = {
        {"product_name", options.product_name},
        {"include_pmi", options.include_pmi}
    };
}

inline void from_json(const nlohmann::json& j, StepExportOptions& options) {
    StepExportOptions defaults;
    options.product_name = j.value("product_name", defaults.product_name);
    options.include_pmi = j.value("include_pmi", defaults.include_pmi);
}

// PrimitiveKind serialization
inline void to_json(nlohmann::json& j, const PrimitiveKind& kind) {
    j = primitive_kind_name(kind);
}

inline void from_json(const nlohmann::json& j, PrimitiveKind& kind) {
    std::string name = j.get<std::string>();
    auto parsed = parse_primitive_kind(name);
    if (!parsed) {
        throw std::runtime_error("Unknown primitive kind: " + name);
    }
    kind = *parsed;
}

// Segment count read as a signed value so that negative input is rejected
// instead of wrapping around
inline uint32_t read_segment_count(const nlohmann::json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    int64_t count = j[key].get<int64_t>();
    if (count <= 0) {
        throw std::runtime_error(std::string(key) + " must be positive");
    }
    if (count > static_cast<int64_t>(MAX_PRIMITIVE_SEGMENTS)) {
        throw std::runtime_error(std::string(key) + " must not exceed " +
                                 std::to_string(MAX_PRIMITIVE_SEGMENTS));
    }
    return static_cast<uint32_t>(count);
}

// PrimitiveSpec serialization
inline void to_json(nlohmann::json& j, const PrimitiveSpec& spec) {
    j = {
        {"kind", spec.kind},
        {"center", spec.center},
        {"width", spec.width},
        {"depth", spec.depth},
        {"height", spec.height},
        {"radius", spec.radius},
        {"segments", spec.segments},
        {"u_segments", spec.u_segments},
        {"v_segments", spec.v_segments}
    };
}

inline void from_json(const nlohmann::json& j, PrimitiveSpec& spec) {
    PrimitiveSpec defaults;
    if (!j.contains("kind")) {
        throw std::runtime_error("Primitive is missing 'kind'");
    }
    spec.kind = j["kind"].get<PrimitiveKind>();
    if (j.contains("center")) {
        spec.center = j["center"].get<Point3>();
    }
    spec.width = j.value("width", defaults.width);
    spec.depth = j.value("depth", defaults.depth);
    spec.height = j.value("height", defaults.height);
    spec.radius = j.value("radius", defaults.radius);
    spec.segments = read_segment_count(j, "segments", defaults.segments);
    spec.u_segments = read_segment_count(j, "u_segments", defaults.u_segments);
    spec.v_segments = read_segment_count(j, "v_segments", defaults.v_segments);
}

}  // namespace brepkit

#endif // BREPKIT_SERIALIZATION_CONFIG_JSON_HPP
