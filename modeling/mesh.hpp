#ifndef BREPKIT_MODELING_MESH_HPP
#define BREPKIT_MODELING_MESH_HPP

#include <math/point3.hpp>
#include <math/vec3.hpp>
#include <topology/solid.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace brepkit {

// Flat-shaded triangle soup. Every face gets its own copy of its corner
// points, so vertices are not shared between faces.
struct TriangleMesh {
    std::vector<Point3> vertices;
    std::vector<std::array<uint32_t, 3>> triangles;    // Indices into vertices
    std::vector<Vector3> normals;                      // One per triangle
    std::vector<FaceId> triangle_faces;                // Source face of each triangle

    size_t vertex_count() const { return vertices.size(); }
    size_t triangle_count() const { return triangles.size(); }

    // Wavefront OBJ with one vn per triangle
    std::string to_obj() const;
};

// Fan-triangulate the outer loop of every face from its first vertex.
// Exact for convex faces. Faces whose loop does not resolve to at least
// three vertices are skipped.
TriangleMesh solid_to_mesh(const Solid& solid);

}  // namespace brepkit

#endif // BREPKIT_MODELING_MESH_HPP
