#include "sketch_geometry.hpp"
#include <cmath>

namespace brepkit {

namespace {
constexpr double COLLINEAR_EPSILON = 1e-8;
}

std::optional<Point2> circumcenter(const Point2& p1, const Point2& p2, const Point2& p3) {
    double d = 2.0 * (p1.x * (p2.y - p3.y) + p2.x * (p3.y - p1.y) + p3.x * (p1.y - p2.y));
    if (std::abs(d) < COLLINEAR_EPSILON) {
        return std::nullopt;
    }

    double s1 = p1.x * p1.x + p1.y * p1.y;
    double s2 = p2.x * p2.x + p2.y * p2.y;
    double s3 = p3.x * p3.x + p3.y * p3.y;

    double cx = (s1 * (p2.y - p3.y) + s2 * (p3.y - p1.y) + s3 * (p1.y - p2.y)) / d;
    double cy = (s1 * (p3.x - p2.x) + s2 * (p1.x - p3.x) + s3 * (p2.x - p1.x)) / d;
    return Point2{cx, cy};
}

double orient2d(const Point2& a, const Point2& b, const Point2& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

}  // namespace brepkit
