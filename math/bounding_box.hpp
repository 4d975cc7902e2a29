#ifndef BREPKIT_MATH_BOUNDING_BOX_HPP
#define BREPKIT_MATH_BOUNDING_BOX_HPP

#include "point3.hpp"
#include <algorithm>
#include <limits>

namespace brepkit {

// Axis-aligned bounding box.
// An empty box has min = +inf and max = -inf, so it is the identity for extend().
struct BoundingBox {
    Point3 min;
    Point3 max;

    constexpr BoundingBox() = default;
    constexpr BoundingBox(const Point3& min_, const Point3& max_) : min(min_), max(max_) {}

    static constexpr BoundingBox empty() {
        constexpr double inf = std::numeric_limits<double>::infinity();
        return {{inf, inf, inf}, {-inf, -inf, -inf}};
    }

    template <typename Range>
    static BoundingBox from_points(const Range& points) {
        BoundingBox box = empty();
        for (const Point3& p : points) {
            box.extend(p);
        }
        return box;
    }

    static BoundingBox merged(const BoundingBox& a, const BoundingBox& b) {
        BoundingBox box = a;
        box.extend(b);
        return box;
    }

    constexpr bool is_empty() const {
        return min.x > max.x || min.y > max.y || min.z > max.z;
    }

    void extend(const Point3& p) {
        min.x = std::min(min.x, p.x);
        min.y = std::min(min.y, p.y);
        min.z = std::min(min.z, p.z);
        max.x = std::max(max.x, p.x);
        max.y = std::max(max.y, p.y);
        max.z = std::max(max.z, p.z);
    }

    // Union with another box; extending by an empty box is a no-op
    void extend(const BoundingBox& other) {
        if (other.is_empty()) {
            return;
        }
        extend(other.min);
        extend(other.max);
    }

    // Extent along each axis (zero for an empty box)
    constexpr Vector3 size() const {
        if (is_empty()) {
            return {0.0, 0.0, 0.0};
        }
        return max - min;
    }

    constexpr Point3 center() const {
        return min.midpoint(max);
    }

    constexpr bool contains(const Point3& p) const {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y &&
               p.z >= min.z && p.z <= max.z;
    }
};

}  // namespace brepkit

#endif // BREPKIT_MATH_BOUNDING_BOX_HPP
