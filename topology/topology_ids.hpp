#ifndef BREPKIT_TOPOLOGY_IDS_HPP
#define BREPKIT_TOPOLOGY_IDS_HPP

#include <compare>
#include <cstdint>

namespace brepkit {

// Small integer handle into one Solid's arena.
// The tag keeps vertex, edge, face and shell handles from being mixed up.
// Handles do not record which Solid minted them.
template <typename Tag>
struct Handle {
    uint32_t value = 0;

    constexpr Handle() = default;
    constexpr explicit Handle(uint32_t v) : value(v) {}

    constexpr bool operator==(const Handle&) const = default;
    constexpr auto operator<=>(const Handle&) const = default;
};

using VertexId = Handle<struct VertexTag>;
using EdgeId = Handle<struct EdgeTag>;
using FaceId = Handle<struct FaceTag>;
using ShellId = Handle<struct ShellTag>;

}  // namespace brepkit

#endif // BREPKIT_TOPOLOGY_IDS_HPP
