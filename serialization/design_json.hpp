#ifndef BREPKIT_SERIALIZATION_DESIGN_JSON_HPP
#define BREPKIT_SERIALIZATION_DESIGN_JSON_HPP

#include <nlohmann/json.hpp>
#include <design/crate_design.hpp>
#include <math/bounding_box.hpp>
#include <math/point3.hpp>
#include <math/vec3.hpp>
#include <stdexcept>
#include <string>

namespace brepkit {

// Point3 / Vector3 serialization as [x, y, z]
inline void to_json(nlohmann::json& j, const Point3& p) {
    j = nlohmann::json::array({p.x, p.y, p.z});
}

inline void from_json(const nlohmann::json& j, Point3& p) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Point must be an array of 3 numbers");
    }
    p.x = j[0].get<double>();
    p.y = j[1].get<double>();
    p.z = j[2].get<double>();
}

inline void to_json(nlohmann::json& j, const Vector3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vector3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Vector must be an array of 3 numbers");
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
    v.z = j[2].get<double>();
}

// BoundingBox serialization
inline void to_json(nlohmann::json& j, const BoundingBox& box) {
    j = {
        {"min", box.min},
        {"max", box.max}
    };
}

inline void from_json(const nlohmann::json& j, BoundingBox& box) {
    box.min = j.at("min").get<Point3>();
    box.max = j.at("max").get<Point3>();
}

// PartCategory serialization
inline void to_json(nlohmann::json& j, const PartCategory& category) {
    j = part_category_name(category);
}

inline void from_json(const nlohmann::json& j, PartCategory& category) {
    std::string name = j.get<std::string>();
    auto parsed = parse_part_category(name);
    if (!parsed) {
        throw std::runtime_error("Unknown part category: " + name);
    }
    category = *parsed;
}

// CratePart serialization
inline void to_json(nlohmann::json& j, const CratePart& part) {
    j = {
        {"id", part.id},
        {"name", part.name},
        {"category", part.category},
        {"bounds", part.bounds}
    };
    if (part.metadata) {
        j["metadata"] = *part.metadata;
    }
}

inline void from_json(const nlohmann::json& j, CratePart& part) {
    if (!j.contains("id")) {
        throw std::runtime_error("Crate part is missing 'id'");
    }
    part.id = j["id"].get<std::string>();
    part.name = j.value("name", part.id);
    part.category = j.value("category", PartCategory::Lumber);
    part.bounds = j.at("bounds").get<BoundingBox>();
    if (j.contains("metadata")) {
        part.metadata = j["metadata"].get<std::string>();
    }
}

// CrateDesign serialization
inline void to_json(nlohmann::json& j, const CrateDesign& design) {
    j["parts"] = design.parts;
}

inline void from_json(const nlohmann::json& j, CrateDesign& design) {
    design.parts = j.at("parts").get<std::vector<CratePart>>();
}

}  // namespace brepkit

#endif // BREPKIT_SERIALIZATION_DESIGN_JSON_HPP
