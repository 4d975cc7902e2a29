#include <gtest/gtest.h>
#include <sketch/sketch.hpp>
#include <sketch/sketch_geometry.hpp>
#include <variant>

using namespace brepkit;

TEST(SketchPlane, WorldPlaneMappings) {
    Sketch xy(SketchPlane::xy());
    EXPECT_TRUE(xy.to_3d_point({1.0, 2.0}).approx_eq(Point3(1.0, 2.0, 0.0)));

    Sketch yz(SketchPlane::yz());
    EXPECT_TRUE(yz.to_3d_point({1.0, 2.0}).approx_eq(Point3(0.0, 1.0, 2.0)));

    Sketch xz(SketchPlane::xz());
    EXPECT_TRUE(xz.to_3d_point({1.0, 2.0}).approx_eq(Point3(1.0, 0.0, 2.0)));
    EXPECT_TRUE(xz.plane().frame().normal.approx_eq(vec3::neg_y()));

    Point2 back = yz.from_3d_point({7.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(back.x, 3.0);
    EXPECT_DOUBLE_EQ(back.y, 4.0);
}

TEST(SketchPlane, ArbitraryUsesFrame) {
    auto frame = SketchCoordinateFrame::from_origin_normal({0.0, 0.0, 5.0}, vec3::unit_z());
    ASSERT_TRUE(frame.has_value());

    Sketch sketch(SketchPlane::arbitrary(*frame));
    EXPECT_EQ(sketch.plane().kind(), SketchPlane::Kind::Arbitrary);
    EXPECT_TRUE(sketch.to_3d_point({1.0, 1.0}).approx_eq(Point3(1.0, 1.0, 5.0)));
    EXPECT_STREQ(sketch_plane_name(sketch.plane().kind()), "arbitrary");
}

TEST(Sketch, AddPoints) {
    Sketch sketch(SketchPlane::xy());
    SketchPointId a = sketch.add_point({0.0, 0.0});
    SketchPointId b = sketch.add_point({3.0, 4.0}, true);

    EXPECT_EQ(a.value, 0u);
    EXPECT_EQ(b.value, 1u);
    ASSERT_NE(sketch.point(b), nullptr);
    EXPECT_TRUE(sketch.point(b)->is_construction);
    EXPECT_FALSE(sketch.point(a)->is_construction);
    EXPECT_EQ(sketch.point(SketchPointId(2)), nullptr);

    sketch.point(a)->position = {1.0, 1.0};
    EXPECT_DOUBLE_EQ(sketch.point(a)->position.x, 1.0);
}

TEST(Sketch, AddEntities) {
    Sketch sketch(SketchPlane::xy());
    SketchPointId a = sketch.add_point({0.0, 0.0});
    SketchPointId b = sketch.add_point({1.0, 0.0});
    SketchPointId c = sketch.add_point({0.0, 1.0});

    auto line = sketch.add_line(a, b);
    auto arc = sketch.add_arc(a, b, c, 1.0);
    auto circle = sketch.add_circle(c, 0.5);
    auto marker = sketch.add_point_entity(b);

    ASSERT_TRUE(line && arc && circle && marker);
    EXPECT_EQ(sketch.entities().size(), 4u);
    EXPECT_EQ(arc->value, 1u);

    const SketchEntity* e = sketch.entity(*arc);
    ASSERT_NE(e, nullptr);
    ASSERT_TRUE(std::holds_alternative<entity::Arc>(*e));
    EXPECT_TRUE(std::get<entity::Arc>(*e).ccw);
    EXPECT_EQ(entity_id(*e), *arc);
}

TEST(Sketch, UnknownPointRejectsEntity) {
    Sketch sketch(SketchPlane::xy());
    SketchPointId a = sketch.add_point({0.0, 0.0});
    SketchPointId missing(7);

    EXPECT_FALSE(sketch.add_line(a, missing).has_value());
    EXPECT_FALSE(sketch.add_arc(missing, a, a, 1.0).has_value());
    EXPECT_FALSE(sketch.add_circle(missing, 1.0).has_value());
    EXPECT_FALSE(sketch.add_point_entity(missing).has_value());
    EXPECT_TRUE(sketch.entities().empty());
}

TEST(Sketch, EntitiesWithPoint) {
    Sketch sketch(SketchPlane::xy());
    SketchPointId a = sketch.add_point({0.0, 0.0});
    SketchPointId b = sketch.add_point({1.0, 0.0});
    SketchPointId c = sketch.add_point({1.0, 1.0});

    auto ab = sketch.add_line(a, b);
    auto bc = sketch.add_line(b, c);
    auto circle = sketch.add_circle(a, 2.0);

    auto uses_a = sketch.entities_with_point(a);
    ASSERT_EQ(uses_a.size(), 2u);
    EXPECT_EQ(uses_a[0], *ab);
    EXPECT_EQ(uses_a[1], *circle);

    auto uses_b = sketch.entities_with_point(b);
    ASSERT_EQ(uses_b.size(), 2u);
    EXPECT_EQ(uses_b[1], *bc);

    EXPECT_TRUE(sketch.entities_with_point(SketchPointId(9)).empty());
}

TEST(SketchGeometry, CircumcenterRightTriangle) {
    auto c = circumcenter({0.0, 0.0}, {2.0, 0.0}, {0.0, 2.0});
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->x, 1.0, 1e-5);
    EXPECT_NEAR(c->y, 1.0, 1e-5);
}

TEST(SketchGeometry, CircumcenterIsEquidistant) {
    Point2 p1(-1.0, 3.0);
    Point2 p2(4.0, 0.5);
    Point2 p3(2.0, -2.0);
    auto c = circumcenter(p1, p2, p3);
    ASSERT_TRUE(c.has_value());
    double r = c->distance_to(p1);
    EXPECT_NEAR(c->distance_to(p2), r, 1e-9);
    EXPECT_NEAR(c->distance_to(p3), r, 1e-9);
}

TEST(SketchGeometry, CircumcenterCollinearIsNone) {
    EXPECT_FALSE(circumcenter({0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}).has_value());
    EXPECT_FALSE(circumcenter({0.0, 0.0}, {0.0, 0.0}, {1.0, 0.0}).has_value());
}

TEST(SketchGeometry, Orient2dSign) {
    Point2 a(0.0, 0.0);
    Point2 b(1.0, 0.0);
    Point2 c(1.0, 1.0);
    EXPECT_GT(orient2d(a, b, c), 0.0);
    EXPECT_LT(orient2d(a, c, b), 0.0);
    EXPECT_DOUBLE_EQ(orient2d(a, b, c), -orient2d(a, c, b));
    EXPECT_DOUBLE_EQ(orient2d(a, b, {2.0, 0.0}), 0.0);
}
