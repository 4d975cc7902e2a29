#include "solid.hpp"
#include <string>

namespace brepkit {

namespace {

template <typename T, typename Id>
T* lookup(std::vector<T>& items, Id id) {
    return id.value < items.size() ? &items[id.value] : nullptr;
}

template <typename T, typename Id>
const T* lookup(const std::vector<T>& items, Id id) {
    return id.value < items.size() ? &items[id.value] : nullptr;
}

std::string face_label(FaceId id) {
    return "face " + std::to_string(id.value);
}

}  // namespace

VertexId Solid::add_vertex(const Point3& point) {
    VertexId id(static_cast<uint32_t>(vertices_.size()));
    vertices_.push_back(Vertex{id, point, {}});
    return id;
}

EdgeId Solid::add_edge(VertexId start, VertexId end) {
    EdgeId id(static_cast<uint32_t>(edges_.size()));
    edges_.push_back(Edge{id, start, end});

    // Update vertex edge lists
    if (Vertex* v = vertex(start)) {
        v->edges.push_back(id);
    }
    if (end != start) {
        if (Vertex* v = vertex(end)) {
            v->edges.push_back(id);
        }
    }

    return id;
}

FaceId Solid::add_face(const SurfaceType& surface) {
    FaceId id(static_cast<uint32_t>(faces_.size()));
    faces_.push_back(Face{id, surface, Loop{}, std::nullopt});
    return id;
}

ShellId Solid::add_shell() {
    ShellId id(static_cast<uint32_t>(shells_.size()));
    shells_.push_back(Shell{id, {}, false});
    return id;
}

bool Solid::add_face_to_shell(ShellId shell_id, FaceId face_id) {
    Shell* s = shell(shell_id);
    Face* f = face(face_id);
    if (!s || !f) {
        return false;
    }
    s->faces.push_back(face_id);
    f->shell = shell_id;
    return true;
}

const Vertex* Solid::vertex(VertexId id) const { return lookup(vertices_, id); }
Vertex* Solid::vertex(VertexId id) { return lookup(vertices_, id); }
const Edge* Solid::edge(EdgeId id) const { return lookup(edges_, id); }
Edge* Solid::edge(EdgeId id) { return lookup(edges_, id); }
const Face* Solid::face(FaceId id) const { return lookup(faces_, id); }
Face* Solid::face(FaceId id) { return lookup(faces_, id); }
const Shell* Solid::shell(ShellId id) const { return lookup(shells_, id); }
Shell* Solid::shell(ShellId id) { return lookup(shells_, id); }

std::optional<std::vector<VertexId>> Solid::loop_vertices(const Loop& loop) const {
    if (loop.empty()) {
        return std::nullopt;
    }

    std::vector<VertexId> result;
    result.reserve(loop.size());

    std::optional<VertexId> previous_end;
    VertexId first_start;
    for (const LoopEntry& entry : loop.entries) {
        const Edge* e = edge(entry.edge);
        if (!e) {
            return std::nullopt;
        }
        VertexId from = entry.forward ? e->start : e->end;
        VertexId to = entry.forward ? e->end : e->start;

        if (previous_end) {
            if (*previous_end != from) {
                return std::nullopt;
            }
        } else {
            first_start = from;
        }
        result.push_back(from);
        previous_end = to;
    }

    // Loop must close back on its first vertex
    if (*previous_end != first_start) {
        return std::nullopt;
    }
    return result;
}

BoundingBox Solid::bounding_box() const {
    BoundingBox box = BoundingBox::empty();
    for (const auto& v : vertices_) {
        box.extend(v.point);
    }
    return box;
}

long Solid::euler_characteristic() const {
    return static_cast<long>(vertices_.size()) -
           static_cast<long>(edges_.size()) +
           static_cast<long>(faces_.size());
}

ValidationResult Solid::validate() const {
    ValidationResult result;

    if (vertices_.empty()) {
        result.add_error("solid has no vertices");
        return result;
    }

    // Edges must reference vertices of this solid
    for (const auto& e : edges_) {
        if (!vertex(e.start) || !vertex(e.end)) {
            result.add_error("edge " + std::to_string(e.id.value) +
                             " references an unknown vertex");
        } else if (e.start == e.end) {
            result.add_error("edge " + std::to_string(e.id.value) +
                             " starts and ends at the same vertex");
        }
    }

    // Face loops must reference known edges and chain into a closed cycle
    for (const auto& f : faces_) {
        if (f.outer_loop.empty()) {
            result.add_error(face_label(f.id) + " has an empty outer loop");
            continue;
        }

        bool edges_known = true;
        for (const auto& entry : f.outer_loop.entries) {
            if (!edge(entry.edge)) {
                result.add_error(face_label(f.id) + " references unknown edge " +
                                 std::to_string(entry.edge.value));
                edges_known = false;
            }
        }
        if (edges_known && !loop_vertices(f.outer_loop)) {
            result.add_error(face_label(f.id) + " outer loop is not a closed chain");
        }

        if (f.shell) {
            if (!shell(*f.shell)) {
                result.add_error(face_label(f.id) + " references unknown shell " +
                                 std::to_string(f.shell->value));
            }
        } else {
            result.add_warning(face_label(f.id) + " belongs to no shell");
        }
    }

    bool all_closed = !shells_.empty();
    for (const auto& s : shells_) {
        for (FaceId fid : s.faces) {
            if (!face(fid)) {
                result.add_error("shell " + std::to_string(s.id.value) +
                                 " references unknown face " + std::to_string(fid.value));
            }
        }
        if (!s.is_closed) {
            all_closed = false;
        }
    }

    // Each closed genus-0 shell contributes 2 to V - E + F
    if (all_closed) {
        long expected = 2 * static_cast<long>(shells_.size());
        long chi = euler_characteristic();
        if (chi != expected) {
            result.add_error("Euler characteristic " + std::to_string(chi) +
                             " does not match " + std::to_string(expected) +
                             " expected for " + std::to_string(shells_.size()) +
                             " closed shell(s)");
        }
    }

    return result;
}

bool Solid::is_shell_closed(ShellId id) const {
    const Shell* s = shell(id);
    if (!s || s->faces.empty()) {
        return false;
    }

    std::vector<int> forward_uses(edges_.size(), 0);
    std::vector<int> reverse_uses(edges_.size(), 0);

    for (FaceId fid : s->faces) {
        const Face* f = face(fid);
        if (!f) {
            return false;
        }
        for (const auto& entry : f->outer_loop.entries) {
            if (!edge(entry.edge)) {
                return false;
            }
            if (entry.forward) {
                ++forward_uses[entry.edge.value];
            } else {
                ++reverse_uses[entry.edge.value];
            }
        }
    }

    for (size_t i = 0; i < edges_.size(); ++i) {
        int total = forward_uses[i] + reverse_uses[i];
        if (total == 0) {
            continue;    // Edge not used by this shell
        }
        if (forward_uses[i] != 1 || reverse_uses[i] != 1) {
            return false;
        }
    }
    return true;
}

}  // namespace brepkit
