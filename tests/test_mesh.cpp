#include <gtest/gtest.h>
#include <modeling/mesh.hpp>
#include <primitives/primitives.hpp>
#include <map>
#include "test_helpers.hpp"

using namespace brepkit;

namespace {

double triangle_area(const TriangleMesh& mesh, size_t t) {
    const auto& tri = mesh.triangles[t];
    const Point3& a = mesh.vertices[tri[0]];
    const Point3& b = mesh.vertices[tri[1]];
    const Point3& c = mesh.vertices[tri[2]];
    return (b - a).cross(c - a).length() / 2.0;
}

}  // namespace

TEST(Mesh, BoxFansIntoTwelveTriangles) {
    Solid box = make_box(1.0, 2.0, 3.0);
    TriangleMesh mesh = solid_to_mesh(box);

    EXPECT_EQ(mesh.triangle_count(), 12u);
    EXPECT_EQ(mesh.vertex_count(), 24u);
    EXPECT_EQ(mesh.normals.size(), mesh.triangle_count());
    EXPECT_EQ(mesh.triangle_faces.size(), mesh.triangle_count());

    std::map<uint32_t, int> per_face;
    for (FaceId f : mesh.triangle_faces) {
        per_face[f.value]++;
    }
    EXPECT_EQ(per_face.size(), 6u);
    for (const auto& [face, count] : per_face) {
        EXPECT_EQ(count, 2) << "face " << face;
    }

    double area = 0.0;
    for (size_t t = 0; t < mesh.triangle_count(); ++t) {
        area += triangle_area(mesh, t);
    }
    EXPECT_NEAR(area, 2.0 * (1.0 * 2.0 + 1.0 * 3.0 + 2.0 * 3.0), 1e-9);
}

TEST(Mesh, TrianglesFollowFaceOrientation) {
    Solid cyl = make_cylinder(1.0, 2.0, 8);
    TriangleMesh mesh = solid_to_mesh(cyl);

    // Two octagon caps (6 each) plus 8 quads
    EXPECT_EQ(mesh.triangle_count(), 6u + 6u + 16u);

    for (size_t t = 0; t < mesh.triangle_count(); ++t) {
        const auto& tri = mesh.triangles[t];
        ASSERT_LT(tri[0], mesh.vertex_count());
        ASSERT_LT(tri[1], mesh.vertex_count());
        ASSERT_LT(tri[2], mesh.vertex_count());

        const Point3& a = mesh.vertices[tri[0]];
        Vector3 winding = (mesh.vertices[tri[1]] - a).cross(mesh.vertices[tri[2]] - a);
        EXPECT_GT(winding.dot(mesh.normals[t]), 0.0);

        const Face* face = cyl.face(mesh.triangle_faces[t]);
        ASSERT_NE(face, nullptr);
        EXPECT_GT(mesh.normals[t].dot(surface_normal_at(face->surface, a)), 0.0);
    }
}

TEST(Mesh, SkipsUnresolvableFaces) {
    Solid solid;
    test::add_triangle(solid, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    solid.add_face(surface::Planar{vec3::unit_z()});    // No loop

    TriangleMesh mesh = solid_to_mesh(solid);
    EXPECT_EQ(mesh.triangle_count(), 1u);
    EXPECT_EQ(mesh.vertex_count(), 3u);
    EXPECT_TRUE(mesh.normals[0].approx_eq(vec3::unit_z()));

    EXPECT_EQ(solid_to_mesh(Solid{}).triangle_count(), 0u);
}

TEST(Mesh, ObjExport) {
    TriangleMesh mesh = solid_to_mesh(make_box(1.0, 1.0, 1.0));
    std::string obj = mesh.to_obj();

    EXPECT_EQ(test::count_occurrences(obj, "\nv "), 24u);
    EXPECT_EQ(test::count_occurrences(obj, "\nvn "), 12u);
    EXPECT_EQ(test::count_occurrences(obj, "\nf "), 12u);
    EXPECT_NE(obj.find("\nf 1//1 2//1 3//1\n"), std::string::npos);
    EXPECT_NE(obj.find("v -0.500000 -0.500000 -0.500000\n"), std::string::npos);
}
