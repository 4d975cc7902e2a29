#include <gtest/gtest.h>
#include <topology/solid.hpp>
#include <topology/surface_type.hpp>
#include "test_helpers.hpp"

using namespace brepkit;

TEST(Solid, HandlesStartAtZeroAndIncrease) {
    Solid solid;
    VertexId a = solid.add_vertex({0.0, 0.0, 0.0});
    VertexId b = solid.add_vertex({1.0, 0.0, 0.0});
    EXPECT_EQ(a.value, 0u);
    EXPECT_EQ(b.value, 1u);

    EdgeId e = solid.add_edge(a, b);
    EXPECT_EQ(e.value, 0u);

    FaceId f = solid.add_face(surface::Planar{vec3::unit_z()});
    ShellId s = solid.add_shell();
    EXPECT_EQ(f.value, 0u);
    EXPECT_EQ(s.value, 0u);

    EXPECT_EQ(solid.vertex_count(), 2u);
    EXPECT_EQ(solid.edge_count(), 1u);
    EXPECT_EQ(solid.face_count(), 1u);
    EXPECT_EQ(solid.shell_count(), 1u);
}

TEST(Solid, AddEdgeUpdatesVertexAdjacency) {
    Solid solid;
    VertexId a = solid.add_vertex({0.0, 0.0, 0.0});
    VertexId b = solid.add_vertex({1.0, 0.0, 0.0});
    VertexId c = solid.add_vertex({0.0, 1.0, 0.0});
    EdgeId ab = solid.add_edge(a, b);
    EdgeId ac = solid.add_edge(a, c);

    ASSERT_NE(solid.vertex(a), nullptr);
    EXPECT_EQ(solid.vertex(a)->edges.size(), 2u);
    EXPECT_EQ(solid.vertex(b)->edges.size(), 1u);
    EXPECT_EQ(solid.vertex(b)->edges[0], ab);
    EXPECT_EQ(solid.vertex(c)->edges[0], ac);
}

TEST(Solid, UnknownHandlesResolveToNull) {
    Solid solid;
    solid.add_vertex({0.0, 0.0, 0.0});

    EXPECT_EQ(solid.vertex(VertexId(5)), nullptr);
    EXPECT_EQ(solid.edge(EdgeId(0)), nullptr);
    EXPECT_EQ(solid.face(FaceId(0)), nullptr);
    EXPECT_EQ(solid.shell(ShellId(0)), nullptr);

    const Solid& cref = solid;
    EXPECT_NE(cref.vertex(VertexId(0)), nullptr);
    EXPECT_EQ(cref.vertex(VertexId(1)), nullptr);
}

TEST(Solid, AddFaceToShellSetsBackReference) {
    Solid solid;
    FaceId f = test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    ShellId s = solid.add_shell();

    EXPECT_TRUE(solid.add_face_to_shell(s, f));
    ASSERT_TRUE(solid.face(f)->shell.has_value());
    EXPECT_EQ(*solid.face(f)->shell, s);
    ASSERT_EQ(solid.shell(s)->faces.size(), 1u);
    EXPECT_EQ(solid.shell(s)->faces[0], f);

    EXPECT_FALSE(solid.add_face_to_shell(ShellId(9), f));
    EXPECT_FALSE(solid.add_face_to_shell(s, FaceId(9)));
}

TEST(Solid, LoopVerticesFollowDirectionFlags) {
    Solid solid;
    FaceId f = test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});

    auto verts = solid.loop_vertices(solid.face(f)->outer_loop);
    ASSERT_TRUE(verts.has_value());
    ASSERT_EQ(verts->size(), 3u);
    EXPECT_EQ((*verts)[0], VertexId(0));
    EXPECT_EQ((*verts)[1], VertexId(1));
    EXPECT_EQ((*verts)[2], VertexId(2));

    // Same edges walked backwards in reverse order
    Loop reversed;
    reversed.add_edge(EdgeId(2), false);
    reversed.add_edge(EdgeId(1), false);
    reversed.add_edge(EdgeId(0), false);
    auto back = solid.loop_vertices(reversed);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ((*back)[0], VertexId(0));
    EXPECT_EQ((*back)[1], VertexId(2));
    EXPECT_EQ((*back)[2], VertexId(1));
}

TEST(Solid, LoopVerticesRejectsBrokenChain) {
    Solid solid;
    test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});

    Loop broken;
    broken.add_edge(EdgeId(0), true);
    broken.add_edge(EdgeId(2), true);    // starts at v2, but v1 is current
    broken.add_edge(EdgeId(1), true);
    EXPECT_FALSE(solid.loop_vertices(broken).has_value());

    Loop open;
    open.add_edge(EdgeId(0), true);
    open.add_edge(EdgeId(1), true);
    EXPECT_FALSE(solid.loop_vertices(open).has_value());

    Loop unknown;
    unknown.add_edge(EdgeId(42), true);
    EXPECT_FALSE(solid.loop_vertices(unknown).has_value());
}

TEST(Solid, EmptySolidIsInvalid) {
    Solid solid;
    EXPECT_TRUE(solid.empty());
    ValidationResult result = solid.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errors.empty());
    EXPECT_FALSE(solid.is_valid());
}

TEST(Solid, OpenTriangleIsValidWithWarning) {
    Solid solid;
    test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});

    ValidationResult result = solid.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.warnings.size(), 1u);    // face belongs to no shell
}

TEST(Solid, BrokenLoopIsInvalid) {
    Solid solid;
    VertexId a = solid.add_vertex({0, 0, 0});
    VertexId b = solid.add_vertex({1, 0, 0});
    VertexId c = solid.add_vertex({0, 1, 0});
    EdgeId ab = solid.add_edge(a, b);
    solid.add_edge(b, c);
    EdgeId ca = solid.add_edge(c, a);

    FaceId f = solid.add_face(surface::Planar{vec3::unit_z()});
    solid.face(f)->outer_loop.add_edge(ab, true);
    solid.face(f)->outer_loop.add_edge(ca, true);    // gap: b -> c missing

    EXPECT_FALSE(solid.is_valid());
}

TEST(Solid, DanglingReferencesAreInvalid) {
    Solid solid;
    VertexId a = solid.add_vertex({0, 0, 0});
    solid.add_edge(a, VertexId(7));
    EXPECT_FALSE(solid.is_valid());

    Solid other;
    test::add_triangle(other, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    other.face(FaceId(0))->outer_loop.add_edge(EdgeId(99), true);
    EXPECT_FALSE(other.is_valid());
}

TEST(Solid, DegenerateEdgeIsInvalid) {
    Solid solid;
    VertexId a = solid.add_vertex({0, 0, 0});
    solid.add_edge(a, a);
    EXPECT_FALSE(solid.is_valid());
    EXPECT_EQ(solid.vertex(a)->edges.size(), 1u);
}

TEST(Solid, EmptyLoopIsInvalid) {
    Solid solid;
    solid.add_vertex({0, 0, 0});
    solid.add_face(surface::Planar{vec3::unit_z()});
    EXPECT_FALSE(solid.is_valid());
}

TEST(Solid, ClosedShellFlagChecksEuler) {
    Solid solid;
    FaceId f = test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    ShellId s = solid.add_shell();
    solid.add_face_to_shell(s, f);

    // V - E + F = 1 for a single triangle; fine while the shell is open
    EXPECT_TRUE(solid.is_valid());

    solid.shell(s)->is_closed = true;
    EXPECT_FALSE(solid.is_valid());
    EXPECT_FALSE(solid.is_shell_closed(s));
}

TEST(Solid, TwoSidedTriangleIsClosed) {
    Solid solid;
    FaceId front = test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    FaceId back = solid.add_face(surface::Planar{vec3::neg_z()});
    solid.face(back)->outer_loop.add_edge(EdgeId(2), false);
    solid.face(back)->outer_loop.add_edge(EdgeId(1), false);
    solid.face(back)->outer_loop.add_edge(EdgeId(0), false);

    ShellId s = solid.add_shell();
    solid.add_face_to_shell(s, front);
    solid.add_face_to_shell(s, back);
    solid.shell(s)->is_closed = true;

    // 3 - 3 + 2 = 2
    EXPECT_EQ(solid.euler_characteristic(), 2);
    EXPECT_TRUE(solid.is_shell_closed(s));
    EXPECT_TRUE(solid.is_valid());
}

TEST(Solid, BoundingBoxCoversVertices) {
    Solid solid;
    EXPECT_TRUE(solid.bounding_box().is_empty());

    test::add_triangle(solid, {-1, 0, 2}, {3, 1, 0}, {0, -2, 1});
    BoundingBox box = solid.bounding_box();
    EXPECT_EQ(box.min, Point3(-1, -2, 0));
    EXPECT_EQ(box.max, Point3(3, 1, 2));
}

TEST(SurfaceType, NormalsAndNames) {
    SurfaceType plane = surface::Planar{Vector3(0.0, 0.0, 2.0)};
    EXPECT_TRUE(surface_normal_at(plane, point3::origin()).approx_eq(vec3::unit_z()));
    EXPECT_STREQ(surface_type_name(plane), "planar");
    EXPECT_TRUE(is_exact_surface(plane));

    SurfaceType sphere = surface::Spherical{{1.0, 0.0, 0.0}, 2.0};
    EXPECT_TRUE(surface_normal_at(sphere, {1.0, 2.0, 0.0}).approx_eq(vec3::unit_y()));
    EXPECT_STREQ(surface_type_name(sphere), "spherical");
    EXPECT_FALSE(is_exact_surface(sphere));

    // 45 degree cone with apex at z=1: normal at the base rim tilts up
    SurfaceType cone = surface::Conical{{0.0, 0.0, 1.0}, vec3::unit_z(), 0.7853981633974483};
    Vector3 n = surface_normal_at(cone, {1.0, 0.0, 0.0});
    EXPECT_NEAR(n.x, 0.70710678, 1e-6);
    EXPECT_NEAR(n.z, 0.70710678, 1e-6);
    EXPECT_STREQ(surface_type_name(cone), "conical");
}
