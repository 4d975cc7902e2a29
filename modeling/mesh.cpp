#include "mesh.hpp"
#include <common/logging.hpp>
#include <iomanip>
#include <sstream>

namespace brepkit {

namespace {

// Newell normal of a polygon; robust to a collinear first corner
Vector3 polygon_normal(const std::vector<Point3>& polygon) {
    Vector3 n;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Point3& a = polygon[i];
        const Point3& b = polygon[(i + 1) % polygon.size()];
        n.x += (a.y - b.y) * (a.z + b.z);
        n.y += (a.z - b.z) * (a.x + b.x);
        n.z += (a.x - b.x) * (a.y + b.y);
    }
    return n;
}

}  // namespace

TriangleMesh solid_to_mesh(const Solid& solid) {
    auto log = logging::get_logger();
    TriangleMesh mesh;

    for (const auto& face : solid.faces()) {
        auto ids = solid.loop_vertices(face.outer_loop);
        if (!ids || ids->size() < 3) {
            log->trace("solid_to_mesh: skipping face {}", face.id.value);
            continue;
        }

        std::vector<Point3> corners;
        corners.reserve(ids->size());
        for (VertexId vid : *ids) {
            corners.push_back(solid.vertex(vid)->point);
        }

        auto normal = polygon_normal(corners).try_normalize();
        Vector3 n = normal ? *normal : surface_normal_at(face.surface, corners.front());

        auto base = static_cast<uint32_t>(mesh.vertices.size());
        mesh.vertices.insert(mesh.vertices.end(), corners.begin(), corners.end());

        for (uint32_t i = 1; i + 1 < corners.size(); ++i) {
            mesh.triangles.push_back({base, base + i, base + i + 1});
            mesh.normals.push_back(n);
            mesh.triangle_faces.push_back(face.id);
        }
    }

    log->debug("solid_to_mesh: {} faces -> {} triangles",
               solid.face_count(), mesh.triangle_count());
    return mesh;
}

std::string TriangleMesh::to_obj() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    ss << "# brepkit OBJ Export\n";
    ss << "# Vertices: " << vertices.size() << "\n";
    ss << "# Triangles: " << triangles.size() << "\n\n";

    for (const auto& p : vertices) {
        ss << "v " << p.x << " " << p.y << " " << p.z << "\n";
    }
    for (const auto& n : normals) {
        ss << "vn " << n.x << " " << n.y << " " << n.z << "\n";
    }

    // OBJ indices are 1-based
    for (size_t t = 0; t < triangles.size(); ++t) {
        ss << "f";
        for (uint32_t idx : triangles[t]) {
            ss << " " << (idx + 1) << "//" << (t + 1);
        }
        ss << "\n";
    }

    return ss.str();
}

}  // namespace brepkit
