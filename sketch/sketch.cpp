#include "sketch.hpp"
#include <type_traits>

namespace brepkit {

namespace {

SketchCoordinateFrame world_frame(const Vector3& u, const Vector3& v) {
    SketchCoordinateFrame frame;
    frame.origin = point3::origin();
    frame.u_axis = u;
    frame.v_axis = v;
    frame.normal = u.cross(v);
    return frame;
}

}  // namespace

SketchPlane SketchPlane::xy() {
    return SketchPlane(Kind::XY, world_frame(vec3::unit_x(), vec3::unit_y()));
}

SketchPlane SketchPlane::yz() {
    return SketchPlane(Kind::YZ, world_frame(vec3::unit_y(), vec3::unit_z()));
}

// Normal is -Y so that (u, v, normal) stays right-handed
SketchPlane SketchPlane::xz() {
    return SketchPlane(Kind::XZ, world_frame(vec3::unit_x(), vec3::unit_z()));
}

SketchPlane SketchPlane::arbitrary(const SketchCoordinateFrame& frame) {
    return SketchPlane(Kind::Arbitrary, frame);
}

const char* sketch_plane_name(SketchPlane::Kind kind) {
    switch (kind) {
        case SketchPlane::Kind::XY: return "XY";
        case SketchPlane::Kind::YZ: return "YZ";
        case SketchPlane::Kind::XZ: return "XZ";
        case SketchPlane::Kind::Arbitrary: return "arbitrary";
    }
    return "unknown";
}

SketchEntityId entity_id(const SketchEntity& e) {
    return std::visit([](auto&& arg) { return arg.id; }, e);
}

bool entity_uses_point(const SketchEntity& e, SketchPointId point) {
    return std::visit([point](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, entity::Line>) {
            return arg.start == point || arg.end == point;
        } else if constexpr (std::is_same_v<T, entity::Arc>) {
            return arg.center == point || arg.start == point || arg.end == point;
        } else if constexpr (std::is_same_v<T, entity::Circle>) {
            return arg.center == point;
        } else {
            return arg.point == point;
        }
    }, e);
}

SketchPointId Sketch::add_point(const Point2& position, bool construction) {
    SketchPointId id(static_cast<uint32_t>(points_.size()));
    points_.push_back(SketchPoint{id, position, construction});
    return id;
}

std::optional<SketchEntityId> Sketch::add_line(SketchPointId start, SketchPointId end) {
    if (!has_point(start) || !has_point(end)) {
        return std::nullopt;
    }
    SketchEntityId id = next_entity_id();
    entities_.push_back(entity::Line{id, start, end});
    return id;
}

std::optional<SketchEntityId> Sketch::add_arc(SketchPointId center, SketchPointId start,
                                              SketchPointId end, double radius, bool ccw) {
    if (!has_point(center) || !has_point(start) || !has_point(end)) {
        return std::nullopt;
    }
    SketchEntityId id = next_entity_id();
    entities_.push_back(entity::Arc{id, center, start, end, radius, ccw});
    return id;
}

std::optional<SketchEntityId> Sketch::add_circle(SketchPointId center, double radius) {
    if (!has_point(center)) {
        return std::nullopt;
    }
    SketchEntityId id = next_entity_id();
    entities_.push_back(entity::Circle{id, center, radius});
    return id;
}

std::optional<SketchEntityId> Sketch::add_point_entity(SketchPointId point) {
    if (!has_point(point)) {
        return std::nullopt;
    }
    SketchEntityId id = next_entity_id();
    entities_.push_back(entity::Point{id, point});
    return id;
}

const SketchPoint* Sketch::point(SketchPointId id) const {
    return has_point(id) ? &points_[id.value] : nullptr;
}

SketchPoint* Sketch::point(SketchPointId id) {
    return has_point(id) ? &points_[id.value] : nullptr;
}

const SketchEntity* Sketch::entity(SketchEntityId id) const {
    return id.value < entities_.size() ? &entities_[id.value] : nullptr;
}

std::vector<SketchEntityId> Sketch::entities_with_point(SketchPointId id) const {
    std::vector<SketchEntityId> result;
    for (const auto& e : entities_) {
        if (entity_uses_point(e, id)) {
            result.push_back(entity_id(e));
        }
    }
    return result;
}

}  // namespace brepkit
