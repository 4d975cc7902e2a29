#include "crate_design.hpp"
#include <algorithm>

namespace brepkit {

const char* part_category_name(PartCategory category) {
    switch (category) {
        case PartCategory::Lumber: return "lumber";
        case PartCategory::Plywood: return "plywood";
        case PartCategory::Hardware: return "hardware";
        case PartCategory::Decal: return "decal";
    }
    return "unknown";
}

std::optional<PartCategory> parse_part_category(const std::string& name) {
    if (name == "lumber") return PartCategory::Lumber;
    if (name == "plywood") return PartCategory::Plywood;
    if (name == "hardware") return PartCategory::Hardware;
    if (name == "decal") return PartCategory::Decal;
    return std::nullopt;
}

bool CratePart::is_solid(double min_size) const {
    Vector3 s = bounds.size();
    return s.x > min_size && s.y > min_size && s.z > min_size;
}

BoundingBox CrateDesign::bounds() const {
    BoundingBox box = BoundingBox::empty();
    for (const auto& part : parts) {
        box.extend(part.bounds);
    }
    return box;
}

const CratePart* CrateDesign::find_part(const std::string& id) const {
    auto it = std::find_if(parts.begin(), parts.end(),
                           [&id](const CratePart& p) { return p.id == id; });
    return it != parts.end() ? &*it : nullptr;
}

size_t CrateDesign::count(PartCategory category) const {
    return static_cast<size_t>(std::count_if(parts.begin(), parts.end(),
        [category](const CratePart& p) { return p.category == category; }));
}

}  // namespace brepkit
