#ifndef BREPKIT_SKETCH_HPP
#define BREPKIT_SKETCH_HPP

#include "sketch_frame.hpp"
#include <math/point3.hpp>
#include <math/vec2.hpp>
#include <topology/topology_ids.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace brepkit {

using SketchPointId = Handle<struct SketchPointTag>;
using SketchEntityId = Handle<struct SketchEntityTag>;

// Plane a sketch lives on: one of the world planes or an arbitrary frame
class SketchPlane {
public:
    enum class Kind { XY, YZ, XZ, Arbitrary };

    static SketchPlane xy();
    static SketchPlane yz();
    static SketchPlane xz();
    static SketchPlane arbitrary(const SketchCoordinateFrame& frame);

    Kind kind() const { return kind_; }

    // XY: u=X v=Y, YZ: u=Y v=Z, XZ: u=X v=Z, all through the world origin
    const SketchCoordinateFrame& frame() const { return frame_; }

private:
    SketchPlane(Kind kind, const SketchCoordinateFrame& frame) : kind_(kind), frame_(frame) {}

    Kind kind_;
    SketchCoordinateFrame frame_;
};

const char* sketch_plane_name(SketchPlane::Kind kind);

struct SketchPoint {
    SketchPointId id;
    Point2 position;
    bool is_construction = false;    // Guide geometry, not part of a profile
};

namespace entity {

struct Line {
    SketchEntityId id;
    SketchPointId start;
    SketchPointId end;
};

struct Arc {
    SketchEntityId id;
    SketchPointId center;
    SketchPointId start;
    SketchPointId end;
    double radius = 0.0;
    bool ccw = true;    // Counter-clockwise from start to end in sketch coordinates
};

struct Circle {
    SketchEntityId id;
    SketchPointId center;
    double radius = 0.0;
};

struct Point {
    SketchEntityId id;
    SketchPointId point;
};

}  // namespace entity

using SketchEntity = std::variant<entity::Line, entity::Arc, entity::Circle, entity::Point>;

SketchEntityId entity_id(const SketchEntity& e);

// True if the entity references the point
bool entity_uses_point(const SketchEntity& e, SketchPointId point);

// 2D drawing on a plane. Points and entities are owned by the sketch and
// referenced by handle.
class Sketch {
public:
    explicit Sketch(const SketchPlane& plane) : plane_(plane) {}

    SketchPointId add_point(const Point2& position, bool construction = false);

    // Entity constructors return nullopt when a referenced point is unknown
    std::optional<SketchEntityId> add_line(SketchPointId start, SketchPointId end);
    std::optional<SketchEntityId> add_arc(SketchPointId center, SketchPointId start,
                                          SketchPointId end, double radius, bool ccw = true);
    std::optional<SketchEntityId> add_circle(SketchPointId center, double radius);
    std::optional<SketchEntityId> add_point_entity(SketchPointId point);

    const SketchPoint* point(SketchPointId id) const;
    SketchPoint* point(SketchPointId id);
    const SketchEntity* entity(SketchEntityId id) const;

    std::vector<SketchEntityId> entities_with_point(SketchPointId id) const;

    Point3 to_3d_point(const Point2& p) const { return plane_.frame().to_3d(p); }
    Point2 from_3d_point(const Point3& p) const { return plane_.frame().from_3d(p); }

    const SketchPlane& plane() const { return plane_; }
    const std::vector<SketchPoint>& points() const { return points_; }
    const std::vector<SketchEntity>& entities() const { return entities_; }

private:
    bool has_point(SketchPointId id) const { return id.value < points_.size(); }
    SketchEntityId next_entity_id() const {
        return SketchEntityId(static_cast<uint32_t>(entities_.size()));
    }

    SketchPlane plane_;
    std::vector<SketchPoint> points_;
    std::vector<SketchEntity> entities_;
};

}  // namespace brepkit

#endif // BREPKIT_SKETCH_HPP
