#include <gtest/gtest.h>
#include <primitives/primitives.hpp>
#include <primitives/primitive_spec.hpp>
#include <topology/surface_type.hpp>
#include <cmath>
#include <variant>
#include "test_helpers.hpp"

using namespace brepkit;

using test::expect_closed_single_shell;
using test::normals_point_outward;
using test::winding_matches_normals;

TEST(Primitives, BoxCounts) {
    Solid box = make_box(2.0, 3.0, 4.0);
    EXPECT_EQ(box.vertex_count(), 8u);
    EXPECT_EQ(box.edge_count(), 12u);
    EXPECT_EQ(box.face_count(), 6u);
    expect_closed_single_shell(box);
    EXPECT_TRUE(box.is_valid());
}

TEST(Primitives, BoxExtentsAndOrientation) {
    Solid box = make_box_at({1.0, 1.0, 1.0}, 2.0, 4.0, 6.0);
    BoundingBox bounds = box.bounding_box();
    EXPECT_TRUE(bounds.min.approx_eq(Point3(0.0, -1.0, -2.0)));
    EXPECT_TRUE(bounds.max.approx_eq(Point3(2.0, 3.0, 4.0)));

    EXPECT_TRUE(normals_point_outward(box, {1.0, 1.0, 1.0}));
    EXPECT_TRUE(winding_matches_normals(box));
}

TEST(Primitives, BoxFacesArePlanar) {
    Solid box = make_box(1.0, 1.0, 1.0);
    for (const auto& f : box.faces()) {
        EXPECT_TRUE(std::holds_alternative<surface::Planar>(f.surface));
        EXPECT_EQ(f.outer_loop.size(), 4u);
    }
}

TEST(Primitives, CylinderCounts) {
    for (uint32_t segments : {3u, 8u, 32u}) {
        Solid cyl = make_cylinder(1.0, 2.0, segments);
        EXPECT_EQ(cyl.vertex_count(), 2 * segments);
        EXPECT_EQ(cyl.edge_count(), 3 * segments);
        EXPECT_EQ(cyl.face_count(), segments + 2);
        expect_closed_single_shell(cyl);
    }
}

TEST(Primitives, CylinderSideNormalsAreRadial) {
    Solid cyl = make_cylinder_at({5.0, 0.0, 0.0}, 2.0, 1.0, 12);
    EXPECT_TRUE(normals_point_outward(cyl, {5.0, 0.0, 0.0}));
    EXPECT_TRUE(winding_matches_normals(cyl));

    // Faces 0 and 1 are the caps; the rest are side quads with no Z component
    for (size_t i = 2; i < cyl.face_count(); ++i) {
        const auto& planar = std::get<surface::Planar>(cyl.faces()[i].surface);
        EXPECT_NEAR(planar.normal.z, 0.0, 1e-12);
        EXPECT_NEAR(planar.normal.length(), 1.0, 1e-9);
    }
}

TEST(Primitives, CylinderClampsSegments) {
    Solid cyl = make_cylinder(1.0, 1.0, 1);
    EXPECT_EQ(cyl.vertex_count(), 6u);
    EXPECT_TRUE(cyl.is_valid());
}

TEST(Primitives, SphereCounts) {
    uint32_t u = 8;
    uint32_t v = 5;
    Solid sphere = make_sphere(1.0, u, v);
    EXPECT_EQ(sphere.vertex_count(), 2 + (v - 1) * u);
    EXPECT_EQ(sphere.edge_count(), (2 * v - 1) * u);
    EXPECT_EQ(sphere.face_count(), v * u);
    expect_closed_single_shell(sphere);
}

TEST(Primitives, SphereClampsSegments) {
    Solid sphere = make_sphere(1.0, 1, 1);
    // u = 4, v = 2: two poles and one ring
    EXPECT_EQ(sphere.vertex_count(), 6u);
    EXPECT_EQ(sphere.face_count(), 8u);
    expect_closed_single_shell(sphere);
}

TEST(Primitives, SphereVerticesLieOnSurface) {
    Point3 center(1.0, 2.0, 3.0);
    Solid sphere = make_sphere_at(center, 2.5, 10, 6);
    for (const auto& v : sphere.vertices()) {
        EXPECT_NEAR(v.point.distance_to(center), 2.5, 1e-9);
    }
    for (const auto& f : sphere.faces()) {
        EXPECT_TRUE(std::holds_alternative<surface::Spherical>(f.surface));
    }
    EXPECT_TRUE(normals_point_outward(sphere, center));
    EXPECT_TRUE(winding_matches_normals(sphere));
}

TEST(Primitives, ConeCounts) {
    for (uint32_t segments : {3u, 6u, 24u}) {
        Solid cone = make_cone(1.0, 2.0, segments);
        EXPECT_EQ(cone.vertex_count(), segments + 1);
        EXPECT_EQ(cone.edge_count(), 2 * segments);
        EXPECT_EQ(cone.face_count(), segments + 1);
        expect_closed_single_shell(cone);
    }
}

TEST(Primitives, ConeApexAndSurface) {
    Solid cone = make_cone_at({0.0, 0.0, 1.0}, 1.0, 3.0, 16);
    EXPECT_TRUE(cone.vertex(VertexId(0))->point.approx_eq(Point3(0.0, 0.0, 4.0)));

    const auto& side = std::get<surface::Conical>(cone.faces()[1].surface);
    EXPECT_TRUE(side.apex.approx_eq(Point3(0.0, 0.0, 4.0)));
    EXPECT_TRUE(side.axis.approx_eq(vec3::unit_z()));
    EXPECT_NEAR(side.half_angle, std::atan(1.0 / 3.0), 1e-12);

    EXPECT_TRUE(normals_point_outward(cone, {0.0, 0.0, 1.5}));
    EXPECT_TRUE(winding_matches_normals(cone));
}

TEST(PrimitiveSpec, BuildsRequestedKind) {
    PrimitiveSpec spec;
    spec.kind = PrimitiveKind::Cone;
    spec.radius = 2.0;
    spec.height = 1.0;
    spec.segments = 5;
    Solid cone = build_primitive(spec);
    EXPECT_EQ(cone.vertex_count(), 6u);

    spec.kind = PrimitiveKind::Box;
    EXPECT_EQ(build_primitive(spec).face_count(), 6u);
}

TEST(PrimitiveSpec, KindNamesRoundTrip) {
    for (PrimitiveKind kind : {PrimitiveKind::Box, PrimitiveKind::Cylinder,
                               PrimitiveKind::Sphere, PrimitiveKind::Cone}) {
        auto parsed = parse_primitive_kind(primitive_kind_name(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parse_primitive_kind("torus").has_value());
}
