#ifndef BREPKIT_TOPOLOGY_SOLID_HPP
#define BREPKIT_TOPOLOGY_SOLID_HPP

#include "topology_ids.hpp"
#include "surface_type.hpp"
#include <math/bounding_box.hpp>
#include <math/point3.hpp>
#include <optional>
#include <string>
#include <vector>

namespace brepkit {

// Topological vertex: a point owned by one Solid
struct Vertex {
    VertexId id;
    Point3 point;
    std::vector<EdgeId> edges;    // Edges that start or end here
};

// Topological edge. Stored start -> end, but the direction a face walks it
// is recorded on the loop entry, never on the edge.
struct Edge {
    EdgeId id;
    VertexId start;
    VertexId end;
};

// One step around a loop: walk `edge` start->end when forward, end->start otherwise
struct LoopEntry {
    EdgeId edge;
    bool forward = true;
};

// Closed boundary of a face
struct Loop {
    std::vector<LoopEntry> entries;

    void add_edge(EdgeId edge, bool forward) {
        entries.push_back({edge, forward});
    }

    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }
};

// Bounded region of a surface. Holes (inner loops) are not modeled.
struct Face {
    FaceId id;
    SurfaceType surface;
    Loop outer_loop;
    std::optional<ShellId> shell;    // Owning shell, if assigned
};

// Set of faces. is_closed is declared by whoever builds the shell.
struct Shell {
    ShellId id;
    std::vector<FaceId> faces;
    bool is_closed = false;
};

// Result of Solid::validate()
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void add_warning(const std::string& msg) {
        warnings.push_back(msg);
    }

    void add_error(const std::string& msg) {
        errors.push_back(msg);
        valid = false;
    }
};

// Arena owning every vertex, edge, face and shell of one shape.
// Entities are referenced only by handle; handles are indices into this
// Solid and stay valid for its whole lifetime.
class Solid {
public:
    Solid() = default;

    VertexId add_vertex(const Point3& point);
    EdgeId add_edge(VertexId start, VertexId end);
    FaceId add_face(const SurfaceType& surface);
    ShellId add_shell();

    // Append a face to a shell and set the face's back-reference.
    // Returns false if either handle is unknown.
    bool add_face_to_shell(ShellId shell_id, FaceId face_id);

    // Lookup by handle; nullptr for an unknown id
    const Vertex* vertex(VertexId id) const;
    Vertex* vertex(VertexId id);
    const Edge* edge(EdgeId id) const;
    Edge* edge(EdgeId id);
    const Face* face(FaceId id) const;
    Face* face(FaceId id);
    const Shell* shell(ShellId id) const;
    Shell* shell(ShellId id);

    const std::vector<Vertex>& vertices() const { return vertices_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const std::vector<Face>& faces() const { return faces_; }
    const std::vector<Shell>& shells() const { return shells_; }

    size_t vertex_count() const { return vertices_.size(); }
    size_t edge_count() const { return edges_.size(); }
    size_t face_count() const { return faces_.size(); }
    size_t shell_count() const { return shells_.size(); }
    bool empty() const { return vertices_.empty(); }

    // Start vertex of each loop entry, honoring direction flags.
    // nullopt if an edge is unknown or the entries do not chain into a closed cycle.
    std::optional<std::vector<VertexId>> loop_vertices(const Loop& loop) const;

    // Box around all vertex points (BoundingBox::empty() when there are none)
    BoundingBox bounding_box() const;

    // V - E + F
    long euler_characteristic() const;

    // Structural sanity check. Catches dangling handles, broken loops and,
    // for solids whose shells are all closed, Euler characteristic mismatch.
    // Does not prove the shell is 2-manifold.
    ValidationResult validate() const;
    bool is_valid() const { return validate().valid; }

    // True when every edge used by the shell's faces is walked exactly twice,
    // once in each direction. Never updates Shell::is_closed.
    bool is_shell_closed(ShellId id) const;

private:
    std::vector<Vertex> vertices_;
    std::vector<Edge> edges_;
    std::vector<Face> faces_;
    std::vector<Shell> shells_;
};

}  // namespace brepkit

#endif // BREPKIT_TOPOLOGY_SOLID_HPP
