#include "extrude.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>

namespace brepkit {

namespace {

// Twice the signed area of the polygon; positive when counter-clockwise
double signed_area2(const std::vector<Point2>& polygon) {
    double sum = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Point2& a = polygon[i];
        const Point2& b = polygon[(i + 1) % polygon.size()];
        sum += a.x * b.y - b.x * a.y;
    }
    return sum;
}

// Walk lines from `first` until the chain returns to its start point
std::optional<std::vector<SketchPointId>> walk_chain(const std::vector<entity::Line>& lines,
                                                     size_t first) {
    std::vector<bool> used(lines.size(), false);
    used[first] = true;

    std::vector<SketchPointId> points = {lines[first].start};
    SketchPointId current = lines[first].end;

    while (current != points.front()) {
        points.push_back(current);

        bool advanced = false;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (used[i]) {
                continue;
            }
            if (lines[i].start == current) {
                current = lines[i].end;
            } else if (lines[i].end == current) {
                current = lines[i].start;
            } else {
                continue;
            }
            used[i] = true;
            advanced = true;
            break;
        }
        if (!advanced) {
            return std::nullopt;
        }
    }

    return points;
}

}  // namespace

std::optional<std::vector<SketchPointId>> find_closed_profile(const Sketch& sketch) {
    std::vector<entity::Line> lines;
    for (const auto& e : sketch.entities()) {
        if (const auto* line = std::get_if<entity::Line>(&e)) {
            if (line->start != line->end) {
                lines.push_back(*line);
            }
        }
    }

    for (size_t first = 0; first < lines.size(); ++first) {
        auto chain = walk_chain(lines, first);
        if (chain && chain->size() >= 3) {
            return chain;
        }
    }
    return std::nullopt;
}

std::optional<Solid> extrude_sketch(const Sketch& sketch, const ExtrudeParams& params) {
    auto log = logging::get_logger();

    if (std::abs(params.distance) < TOLERANCE) {
        log->debug("extrude_sketch: distance {} is too small", params.distance);
        return std::nullopt;
    }

    auto normal = sketch.plane().frame().normal.try_normalize();
    if (!normal) {
        log->debug("extrude_sketch: sketch plane has no normal");
        return std::nullopt;
    }

    auto profile_ids = find_closed_profile(sketch);
    if (!profile_ids) {
        log->debug("extrude_sketch: no closed line profile");
        return std::nullopt;
    }

    std::vector<Point2> profile;
    profile.reserve(profile_ids->size());
    for (SketchPointId id : *profile_ids) {
        profile.push_back(sketch.point(id)->position);
    }

    double area2 = signed_area2(profile);
    if (std::abs(area2) < TOLERANCE) {
        log->debug("extrude_sketch: profile encloses no area");
        return std::nullopt;
    }
    if (area2 < 0.0) {
        std::reverse(profile.begin(), profile.end());
    }

    double z_start = std::min(0.0, params.distance);
    double z_end = std::max(0.0, params.distance);
    if (params.symmetric) {
        z_start = -std::abs(params.distance) / 2.0;
        z_end = std::abs(params.distance) / 2.0;
    }

    Solid solid;
    size_t n = profile.size();

    std::vector<VertexId> bottom;
    std::vector<VertexId> top;
    std::vector<Point3> base;
    bottom.reserve(n);
    top.reserve(n);
    base.reserve(n);
    for (const Point2& p : profile) {
        base.push_back(sketch.to_3d_point(p));
    }
    for (const Point3& p : base) {
        bottom.push_back(solid.add_vertex(p + *normal * z_start));
    }
    for (const Point3& p : base) {
        top.push_back(solid.add_vertex(p + *normal * z_end));
    }

    std::vector<EdgeId> bottom_edges;
    std::vector<EdgeId> top_edges;
    std::vector<EdgeId> vertical;
    for (size_t i = 0; i < n; ++i) {
        bottom_edges.push_back(solid.add_edge(bottom[i], bottom[(i + 1) % n]));
    }
    for (size_t i = 0; i < n; ++i) {
        top_edges.push_back(solid.add_edge(top[i], top[(i + 1) % n]));
    }
    for (size_t i = 0; i < n; ++i) {
        vertical.push_back(solid.add_edge(bottom[i], top[i]));
    }

    // Profile runs counter-clockwise seen from +normal: the bottom cap walks
    // it backwards, the top cap forwards
    FaceId bottom_face = solid.add_face(surface::Planar{-*normal});
    for (size_t i = n; i-- > 0;) {
        solid.face(bottom_face)->outer_loop.add_edge(bottom_edges[i], false);
    }
    FaceId top_face = solid.add_face(surface::Planar{*normal});
    for (EdgeId e : top_edges) {
        solid.face(top_face)->outer_loop.add_edge(e, true);
    }

    for (size_t i = 0; i < n; ++i) {
        size_t next = (i + 1) % n;
        Vector3 outward = (base[next] - base[i]).cross(*normal).normalized();
        FaceId side = solid.add_face(surface::Planar{outward});
        Loop& loop = solid.face(side)->outer_loop;
        loop.add_edge(bottom_edges[i], true);
        loop.add_edge(vertical[next], true);
        loop.add_edge(top_edges[i], false);
        loop.add_edge(vertical[i], false);
    }

    ShellId shell = solid.add_shell();
    for (size_t i = 0; i < solid.face_count(); ++i) {
        solid.add_face_to_shell(shell, FaceId(static_cast<uint32_t>(i)));
    }
    solid.shell(shell)->is_closed = true;

    log->trace("extrude_sketch: {}-sided profile, z {} .. {}", n, z_start, z_end);
    return solid;
}

}  // namespace brepkit
