#ifndef BREPKIT_STEP_EXPORT_HPP
#define BREPKIT_STEP_EXPORT_HPP

#include <design/crate_design.hpp>
#include <string>

namespace brepkit {

struct StepExportOptions {
    std::string product_name = "AUTOCRATE CRATE ASSEMBLY";
    bool include_pmi = true;    // Overall bounding dimensions as PROPERTY_DEFINITIONs
};

// Parts with any dimension at or below this size (inches) are not exported
constexpr double STEP_MIN_PART_SIZE = 1e-6;

// Write a crate design as an AP242 Part-21 assembly in inches.
//
// Every part becomes its own component product holding a box-shaped
// MANIFOLD_SOLID_BREP in local coordinates, placed at the part's minimum
// corner. Parts are emitted in id order, so the output depends only on the
// set of parts, not on their order in the design. Degenerate parts are
// skipped; the result is always a complete file, possibly with no solids.
std::string export_step_ap242(const CrateDesign& design,
                              const StepExportOptions& options = StepExportOptions{});

}  // namespace brepkit

#endif // BREPKIT_STEP_EXPORT_HPP
