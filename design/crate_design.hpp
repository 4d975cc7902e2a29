#ifndef BREPKIT_DESIGN_CRATE_DESIGN_HPP
#define BREPKIT_DESIGN_CRATE_DESIGN_HPP

#include <math/bounding_box.hpp>
#include <optional>
#include <string>
#include <vector>

namespace brepkit {

// What a part is made of; carried through to exports as a label only
enum class PartCategory {
    Lumber,
    Plywood,
    Hardware,
    Decal
};

// Lowercase name ("lumber", "plywood", "hardware", "decal")
const char* part_category_name(PartCategory category);

// Inverse of part_category_name; nullopt for an unknown name
std::optional<PartCategory> parse_part_category(const std::string& name);

// One positioned, box-shaped part
struct CratePart {
    std::string id;                     // Stable identifier, also the export sort key
    std::string name;                   // Display name
    PartCategory category = PartCategory::Lumber;
    BoundingBox bounds;                 // World frame, inches
    std::optional<std::string> metadata;

    // Every dimension strictly greater than min_size
    bool is_solid(double min_size) const;
};

// Parts list produced by the crate calculator
struct CrateDesign {
    std::vector<CratePart> parts;

    // Union of all part bounds (BoundingBox::empty() for no parts)
    BoundingBox bounds() const;

    const CratePart* find_part(const std::string& id) const;

    // Number of parts in a category
    size_t count(PartCategory category) const;
};

}  // namespace brepkit

#endif // BREPKIT_DESIGN_CRATE_DESIGN_HPP
