#ifndef BREPKIT_SERIALIZATION_SOLID_JSON_HPP
#define BREPKIT_SERIALIZATION_SOLID_JSON_HPP

#include <nlohmann/json.hpp>
#include <topology/solid.hpp>
#include <topology/surface_type.hpp>
#include "design_json.hpp"
#include <type_traits>

namespace brepkit {

// SurfaceType as {"type": ..., <parameters>}
inline nlohmann::json surface_to_json(const SurfaceType& surface_type) {
    nlohmann::json j;
    j["type"] = surface_type_name(surface_type);
    std::visit([&j](auto&& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, surface::Planar>) {
            j["normal"] = s.normal;
        } else if constexpr (std::is_same_v<T, surface::Spherical>) {
            j["center"] = s.center;
            j["radius"] = s.radius;
        } else if constexpr (std::is_same_v<T, surface::Conical>) {
            j["apex"] = s.apex;
            j["axis"] = s.axis;
            j["half_angle"] = s.half_angle;
        }
    }, surface_type);
    return j;
}

// Full topology dump; handles are written as plain integers
inline nlohmann::json solid_to_json(const Solid& solid) {
    nlohmann::json j;

    j["vertices"] = nlohmann::json::array();
    for (const auto& v : solid.vertices()) {
        j["vertices"].push_back({{"id", v.id.value}, {"point", v.point}});
    }

    j["edges"] = nlohmann::json::array();
    for (const auto& e : solid.edges()) {
        j["edges"].push_back({{"id", e.id.value}, {"start", e.start.value}, {"end", e.end.value}});
    }

    j["faces"] = nlohmann::json::array();
    for (const auto& f : solid.faces()) {
        nlohmann::json face;
        face["id"] = f.id.value;
        face["surface"] = surface_to_json(f.surface);
        face["loop"] = nlohmann::json::array();
        for (const auto& entry : f.outer_loop.entries) {
            face["loop"].push_back({{"edge", entry.edge.value}, {"forward", entry.forward}});
        }
        if (f.shell) {
            face["shell"] = f.shell->value;
        }
        j["faces"].push_back(face);
    }

    j["shells"] = nlohmann::json::array();
    for (const auto& s : solid.shells()) {
        nlohmann::json shell;
        shell["id"] = s.id.value;
        shell["is_closed"] = s.is_closed;
        shell["faces"] = nlohmann::json::array();
        for (FaceId fid : s.faces) {
            shell["faces"].push_back(fid.value);
        }
        j["shells"].push_back(shell);
    }

    return j;
}

// Counts and checks for the stats block of a command's output
inline nlohmann::json solid_stats_json(const Solid& solid) {
    ValidationResult validation = solid.validate();

    nlohmann::json closed = nlohmann::json::array();
    for (const auto& s : solid.shells()) {
        closed.push_back(solid.is_shell_closed(s.id));
    }

    nlohmann::json j = {
        {"vertices", solid.vertex_count()},
        {"edges", solid.edge_count()},
        {"faces", solid.face_count()},
        {"shells", solid.shell_count()},
        {"euler_characteristic", solid.euler_characteristic()},
        {"valid", validation.valid},
        {"errors", validation.errors},
        {"warnings", validation.warnings},
        {"shells_closed", closed}
    };
    if (!solid.empty()) {
        j["bounds"] = solid.bounding_box();
    }
    return j;
}

}  // namespace brepkit

#endif // BREPKIT_SERIALIZATION_SOLID_JSON_HPP
