#include "primitives.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace brepkit {

namespace {

constexpr uint32_t MIN_SEGMENTS = 3;
constexpr uint32_t MIN_SPHERE_U = 4;
constexpr uint32_t MIN_SPHERE_V = 2;

// Point on a circle of the given radius around center, in a plane of constant z
Point3 ring_point(const Point3& center, double radius, double z, uint32_t i, uint32_t count) {
    double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(count);
    return {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle), z};
}

// Add a face whose outer loop is the given entries
FaceId add_loop_face(Solid& solid, const SurfaceType& surface,
                     std::initializer_list<LoopEntry> entries) {
    FaceId f = solid.add_face(surface);
    Face* face = solid.face(f);
    for (const auto& entry : entries) {
        face->outer_loop.add_edge(entry.edge, entry.forward);
    }
    return f;
}

// Polygon cap over a ring of edges that run counter-clockwise seen from +Z.
// Walking them reversed in reverse order faces the cap toward -Z.
FaceId add_bottom_cap(Solid& solid, const std::vector<EdgeId>& ring) {
    FaceId f = solid.add_face(surface::Planar{vec3::neg_z()});
    Face* face = solid.face(f);
    for (auto it = ring.rbegin(); it != ring.rend(); ++it) {
        face->outer_loop.add_edge(*it, false);
    }
    return f;
}

FaceId add_top_cap(Solid& solid, const std::vector<EdgeId>& ring) {
    FaceId f = solid.add_face(surface::Planar{vec3::unit_z()});
    Face* face = solid.face(f);
    for (EdgeId e : ring) {
        face->outer_loop.add_edge(e, true);
    }
    return f;
}

// Ring of edges v[i] -> v[i+1], wrapping around
std::vector<EdgeId> add_ring_edges(Solid& solid, const std::vector<VertexId>& ring) {
    std::vector<EdgeId> edges;
    edges.reserve(ring.size());
    for (size_t i = 0; i < ring.size(); ++i) {
        edges.push_back(solid.add_edge(ring[i], ring[(i + 1) % ring.size()]));
    }
    return edges;
}

// One closed shell holding every face of the solid
void finish_closed_shell(Solid& solid) {
    ShellId shell = solid.add_shell();
    for (size_t i = 0; i < solid.face_count(); ++i) {
        solid.add_face_to_shell(shell, FaceId(static_cast<uint32_t>(i)));
    }
    solid.shell(shell)->is_closed = true;
}

}  // namespace

Solid make_box(double width, double depth, double height) {
    return make_box_at(point3::origin(), width, depth, height);
}

Solid make_box_at(const Point3& center, double width, double depth, double height) {
    Solid solid;

    double hw = width / 2.0;
    double hd = depth / 2.0;
    double hh = height / 2.0;

    // Bottom ring (z = -hh) then top ring (z = +hh), counter-clockwise from +Z
    const double xs[4] = {-hw, hw, hw, -hw};
    const double ys[4] = {-hd, -hd, hd, hd};
    std::vector<VertexId> bottom;
    std::vector<VertexId> top;
    for (int i = 0; i < 4; ++i) {
        bottom.push_back(solid.add_vertex({center.x + xs[i], center.y + ys[i], center.z - hh}));
    }
    for (int i = 0; i < 4; ++i) {
        top.push_back(solid.add_vertex({center.x + xs[i], center.y + ys[i], center.z + hh}));
    }

    std::vector<EdgeId> bottom_edges = add_ring_edges(solid, bottom);
    std::vector<EdgeId> top_edges = add_ring_edges(solid, top);
    std::vector<EdgeId> vertical;
    for (int i = 0; i < 4; ++i) {
        vertical.push_back(solid.add_edge(bottom[i], top[i]));
    }

    add_bottom_cap(solid, bottom_edges);
    add_top_cap(solid, top_edges);

    // Sides in ring order: front (-Y), right (+X), back (+Y), left (-X)
    const Vector3 side_normals[4] = {vec3::neg_y(), vec3::unit_x(), vec3::unit_y(), vec3::neg_x()};
    for (int i = 0; i < 4; ++i) {
        int next = (i + 1) % 4;
        add_loop_face(solid, surface::Planar{side_normals[i]}, {
            {bottom_edges[i], true},
            {vertical[next], true},
            {top_edges[i], false},
            {vertical[i], false},
        });
    }

    finish_closed_shell(solid);

    logging::get_logger()->trace("make_box: {} x {} x {} at ({}, {}, {})",
                                 width, depth, height, center.x, center.y, center.z);
    return solid;
}

Solid make_cylinder(double radius, double height, uint32_t segments) {
    return make_cylinder_at(point3::origin(), radius, height, segments);
}

Solid make_cylinder_at(const Point3& center, double radius, double height, uint32_t segments) {
    Solid solid;
    segments = std::max(segments, MIN_SEGMENTS);
    double hh = height / 2.0;

    std::vector<VertexId> bottom;
    std::vector<VertexId> top;
    bottom.reserve(segments);
    top.reserve(segments);
    for (uint32_t i = 0; i < segments; ++i) {
        bottom.push_back(solid.add_vertex(ring_point(center, radius, center.z - hh, i, segments)));
    }
    for (uint32_t i = 0; i < segments; ++i) {
        top.push_back(solid.add_vertex(ring_point(center, radius, center.z + hh, i, segments)));
    }

    std::vector<EdgeId> bottom_edges = add_ring_edges(solid, bottom);
    std::vector<EdgeId> top_edges = add_ring_edges(solid, top);
    std::vector<EdgeId> vertical;
    vertical.reserve(segments);
    for (uint32_t i = 0; i < segments; ++i) {
        vertical.push_back(solid.add_edge(bottom[i], top[i]));
    }

    add_bottom_cap(solid, bottom_edges);
    add_top_cap(solid, top_edges);

    // Lateral surface as planar quads with the radial normal at each facet midpoint
    for (uint32_t i = 0; i < segments; ++i) {
        uint32_t next = (i + 1) % segments;

        Point3 mid = solid.vertex(bottom[i])->point.midpoint(solid.vertex(bottom[next])->point);
        auto radial = Vector3(mid.x - center.x, mid.y - center.y, 0.0).try_normalize();
        Vector3 normal = radial ? *radial : vec3::unit_x();

        add_loop_face(solid, surface::Planar{normal}, {
            {bottom_edges[i], true},
            {vertical[next], true},
            {top_edges[i], false},
            {vertical[i], false},
        });
    }

    finish_closed_shell(solid);

    logging::get_logger()->trace("make_cylinder: r={} h={} segments={}", radius, height, segments);
    return solid;
}

Solid make_sphere(double radius, uint32_t u_segments, uint32_t v_segments) {
    return make_sphere_at(point3::origin(), radius, u_segments, v_segments);
}

Solid make_sphere_at(const Point3& center, double radius, uint32_t u_segments, uint32_t v_segments) {
    Solid solid;
    u_segments = std::max(u_segments, MIN_SPHERE_U);
    v_segments = std::max(v_segments, MIN_SPHERE_V);

    // Vertices: top pole, latitude rings from top to bottom, bottom pole
    VertexId top_pole = solid.add_vertex({center.x, center.y, center.z + radius});

    std::vector<std::vector<VertexId>> rings;
    rings.reserve(v_segments - 1);
    for (uint32_t j = 1; j < v_segments; ++j) {
        double phi = std::numbers::pi * static_cast<double>(j) / static_cast<double>(v_segments);
        double z = center.z + radius * std::cos(phi);
        double ring_radius = radius * std::sin(phi);

        std::vector<VertexId> ring;
        ring.reserve(u_segments);
        for (uint32_t i = 0; i < u_segments; ++i) {
            ring.push_back(solid.add_vertex(ring_point(center, ring_radius, z, i, u_segments)));
        }
        rings.push_back(std::move(ring));
    }

    VertexId bottom_pole = solid.add_vertex({center.x, center.y, center.z - radius});

    // Edges: latitude rings, then meridians running top to bottom
    std::vector<std::vector<EdgeId>> ring_edges;
    ring_edges.reserve(rings.size());
    for (const auto& ring : rings) {
        ring_edges.push_back(add_ring_edges(solid, ring));
    }

    std::vector<EdgeId> top_meridians;
    for (uint32_t i = 0; i < u_segments; ++i) {
        top_meridians.push_back(solid.add_edge(top_pole, rings.front()[i]));
    }

    // band_meridians[j][i]: rings[j][i] -> rings[j + 1][i]
    std::vector<std::vector<EdgeId>> band_meridians(rings.size() - 1);
    for (size_t j = 0; j + 1 < rings.size(); ++j) {
        for (uint32_t i = 0; i < u_segments; ++i) {
            band_meridians[j].push_back(solid.add_edge(rings[j][i], rings[j + 1][i]));
        }
    }

    std::vector<EdgeId> bottom_meridians;
    for (uint32_t i = 0; i < u_segments; ++i) {
        bottom_meridians.push_back(solid.add_edge(rings.back()[i], bottom_pole));
    }

    surface::Spherical sphere{center, radius};

    // Top cap triangles: pole -> ring[i] -> ring[i+1]
    for (uint32_t i = 0; i < u_segments; ++i) {
        uint32_t next = (i + 1) % u_segments;
        add_loop_face(solid, sphere, {
            {top_meridians[i], true},
            {ring_edges.front()[i], true},
            {top_meridians[next], false},
        });
    }

    // Bands: lower[i] -> lower[i+1] -> upper[i+1] -> upper[i]
    for (size_t j = 0; j + 1 < rings.size(); ++j) {
        for (uint32_t i = 0; i < u_segments; ++i) {
            uint32_t next = (i + 1) % u_segments;
            add_loop_face(solid, sphere, {
                {ring_edges[j + 1][i], true},
                {band_meridians[j][next], false},
                {ring_edges[j][i], false},
                {band_meridians[j][i], true},
            });
        }
    }

    // Bottom cap triangles: pole -> ring[i+1] -> ring[i]
    for (uint32_t i = 0; i < u_segments; ++i) {
        uint32_t next = (i + 1) % u_segments;
        add_loop_face(solid, sphere, {
            {bottom_meridians[next], false},
            {ring_edges.back()[i], false},
            {bottom_meridians[i], true},
        });
    }

    finish_closed_shell(solid);

    logging::get_logger()->trace("make_sphere: r={} u={} v={}", radius, u_segments, v_segments);
    return solid;
}

Solid make_cone(double base_radius, double height, uint32_t segments) {
    return make_cone_at(point3::origin(), base_radius, height, segments);
}

Solid make_cone_at(const Point3& base_center, double base_radius, double height, uint32_t segments) {
    Solid solid;
    segments = std::max(segments, MIN_SEGMENTS);

    Point3 apex_point{base_center.x, base_center.y, base_center.z + height};
    VertexId apex = solid.add_vertex(apex_point);

    std::vector<VertexId> base;
    base.reserve(segments);
    for (uint32_t i = 0; i < segments; ++i) {
        base.push_back(solid.add_vertex(ring_point(base_center, base_radius, base_center.z, i, segments)));
    }

    std::vector<EdgeId> base_edges = add_ring_edges(solid, base);
    std::vector<EdgeId> side_edges;
    side_edges.reserve(segments);
    for (VertexId v : base) {
        side_edges.push_back(solid.add_edge(apex, v));
    }

    add_bottom_cap(solid, base_edges);

    surface::Conical cone{apex_point, vec3::unit_z(), std::atan(base_radius / height)};

    // Side triangles: base[i] -> base[i+1] -> apex
    for (uint32_t i = 0; i < segments; ++i) {
        uint32_t next = (i + 1) % segments;
        add_loop_face(solid, cone, {
            {base_edges[i], true},
            {side_edges[next], false},
            {side_edges[i], true},
        });
    }

    finish_closed_shell(solid);

    logging::get_logger()->trace("make_cone: r={} h={} segments={}", base_radius, height, segments);
    return solid;
}

}  // namespace brepkit
