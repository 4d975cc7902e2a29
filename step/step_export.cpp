#include "step_export.hpp"
#include "step_writer.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <array>
#include <utility>
#include <vector>

namespace brepkit {

namespace {

using step::EntityId;
using step::StepHeader;
using step::StepWriter;

// Shared entities every part and the root assembly refer to
struct StepContexts {
    EntityId mechanical_context = 0;
    EntityId design_context = 0;
    EntityId length_unit = 0;
    EntityId geometric_context = 0;
    EntityId assembly_definition = 0;
    EntityId assembly_definition_shape = 0;
};

struct ProductDefinition {
    EntityId definition = 0;
    EntityId definition_shape = 0;
};

// Everything emitted for one exported part, kept for the assembly wiring
struct PartRecord {
    const CratePart* part = nullptr;
    ProductDefinition product;
    EntityId shape_representation = 0;
    EntityId local_placement = 0;
    EntityId global_placement = 0;
};

// Unit directions of the box faces
struct Directions {
    EntityId pos_x, pos_y, pos_z;
    EntityId neg_x, neg_y, neg_z;
};

class CrateStepExporter {
public:
    CrateStepExporter(const CrateDesign& design, const StepExportOptions& options)
        : design_(design), options_(options) {}

    std::string generate();

private:
    static StepHeader make_header();

    StepContexts create_contexts();
    ProductDefinition create_product(const CratePart& part, const StepContexts& ctx);
    EntityId create_box_solid(const std::string& name, double w, double l, double h);
    EntityId direction(double x, double y, double z);
    EntityId point(double x, double y, double z);
    EntityId axis2_placement(const std::string& label, const Point3& origin,
                             EntityId axis, EntityId ref_direction);
    void add_length_property(const std::string& label, double value, const StepContexts& ctx);

    const CrateDesign& design_;
    const StepExportOptions& options_;
    StepWriter writer_;
};

StepHeader CrateStepExporter::make_header() {
    StepHeader header;
    header.description = "AutoCrate crate model";
    header.file_name = "crate_model.step";
    // Fixed so repeated exports are byte-identical
    header.time_stamp = "1970-01-01T00:00:00Z";
    header.author = "AutoCrate";
    header.organization = "Antimony Labs";
    header.preprocessor_version = "brepkit STEP writer";
    header.originating_system = "brepkit";
    header.authorization = "";
    header.schema = "AP242_MANAGED_MODEL_BASED_3D_ENGINEERING_MIM_LATEST";
    return header;
}

EntityId CrateStepExporter::direction(double x, double y, double z) {
    return writer_.add("DIRECTION(''," + StepWriter::triple(x, y, z) + ")");
}

EntityId CrateStepExporter::point(double x, double y, double z) {
    return writer_.add("CARTESIAN_POINT(''," + StepWriter::triple(x, y, z) + ")");
}

EntityId CrateStepExporter::axis2_placement(const std::string& label, const Point3& origin,
                                            EntityId axis, EntityId ref_direction) {
    EntityId location = point(origin.x, origin.y, origin.z);
    return writer_.add("AXIS2_PLACEMENT_3D(" + StepWriter::str(label) + "," +
                       StepWriter::ref(location) + "," +
                       StepWriter::ref(axis) + "," +
                       StepWriter::ref(ref_direction) + ")");
}

StepContexts CrateStepExporter::create_contexts() {
    const std::string name = StepWriter::str(options_.product_name);
    StepContexts ctx;

    EntityId app = writer_.add("APPLICATION_CONTEXT('mechanical design')");
    std::string app_ref = StepWriter::ref(app);
    writer_.add("APPLICATION_PROTOCOL_DEFINITION('international standard',"
                "'ap242_managed_model_based_3d_engineering_mim_latest',2020," + app_ref + ")");
    ctx.mechanical_context = writer_.add("MECHANICAL_CONTEXT(''," + app_ref + ",'mechanical')");
    writer_.add("PRODUCT_CONTEXT(" + name + "," + app_ref + ",'design')");
    ctx.design_context = writer_.add("DESIGN_CONTEXT(" + name + "," + app_ref + ",'design')");

    EntityId plane_angle = writer_.add("(NAMED_UNIT(*)PLANE_ANGLE_UNIT()SI_UNIT($,.RADIAN.))");
    EntityId solid_angle = writer_.add("(NAMED_UNIT(*)SI_UNIT($,.STERADIAN.)SOLID_ANGLE_UNIT())");

    // Inch as a conversion-based unit: 1 in = 25.4 mm
    EntityId millimetre = writer_.add("(LENGTH_UNIT()NAMED_UNIT(*)SI_UNIT(.MILLI.,.METRE.))");
    EntityId inch_measure = writer_.add("LENGTH_MEASURE_WITH_UNIT(LENGTH_MEASURE(25.4)," +
                                        StepWriter::ref(millimetre) + ")");
    ctx.length_unit = writer_.add("(NAMED_UNIT(*)LENGTH_UNIT()CONVERSION_BASED_UNIT('INCH'," +
                                  StepWriter::ref(inch_measure) + "))");

    EntityId uncertainty = writer_.add("UNCERTAINTY_MEASURE_WITH_UNIT(LENGTH_MEASURE(0.01)," +
                                       StepWriter::ref(ctx.length_unit) +
                                       ",'distance accuracy','')");

    ctx.geometric_context = writer_.add(
        "(GEOMETRIC_REPRESENTATION_CONTEXT(3)"
        "GLOBAL_UNCERTAINTY_ASSIGNED_CONTEXT(" + StepWriter::list({uncertainty}) + ")"
        "GLOBAL_UNIT_ASSIGNED_CONTEXT(" +
        StepWriter::list({ctx.length_unit, plane_angle, solid_angle}) + ")"
        "REPRESENTATION_CONTEXT('','3D'))");

    // Root assembly product
    EntityId product = writer_.add("PRODUCT(" + name + "," + name + ",''," +
                                   StepWriter::list({ctx.mechanical_context}) + ")");
    EntityId formation = writer_.add("PRODUCT_DEFINITION_FORMATION('',''," +
                                     StepWriter::ref(product) + ")");
    ctx.assembly_definition = writer_.add("PRODUCT_DEFINITION('assembly',''," +
                                          StepWriter::ref(formation) + "," +
                                          StepWriter::ref(ctx.design_context) + ")");
    ctx.assembly_definition_shape = writer_.add("PRODUCT_DEFINITION_SHAPE('',''," +
                                                StepWriter::ref(ctx.assembly_definition) + ")");
    return ctx;
}

ProductDefinition CrateStepExporter::create_product(const CratePart& part,
                                                    const StepContexts& ctx) {
    ProductDefinition result;

    EntityId product = writer_.add("PRODUCT(" + StepWriter::str(part.id) + "," +
                                   StepWriter::str(part.name) + "," +
                                   StepWriter::str(part_category_name(part.category)) + "," +
                                   StepWriter::list({ctx.mechanical_context}) + ")");
    EntityId formation = writer_.add("PRODUCT_DEFINITION_FORMATION('',''," +
                                     StepWriter::ref(product) + ")");
    result.definition = writer_.add("PRODUCT_DEFINITION('design',''," +
                                    StepWriter::ref(formation) + "," +
                                    StepWriter::ref(ctx.design_context) + ")");
    result.definition_shape = writer_.add("PRODUCT_DEFINITION_SHAPE('',''," +
                                          StepWriter::ref(result.definition) + ")");
    return result;
}

// Box spanning (0,0,0)..(w,l,h) as a closed shell of six planar faces.
// Vertex numbering: p0..p3 counter-clockwise on z=0 starting at the origin,
// p4..p7 above them on z=h.
EntityId CrateStepExporter::create_box_solid(const std::string& name,
                                             double w, double l, double h) {
    const std::array<Point3, 8> corners = {{
        {0.0, 0.0, 0.0}, {w, 0.0, 0.0}, {w, l, 0.0}, {0.0, l, 0.0},
        {0.0, 0.0, h},   {w, 0.0, h},   {w, l, h},   {0.0, l, h},
    }};

    std::array<EntityId, 8> points{};
    std::array<EntityId, 8> vertices{};
    for (size_t i = 0; i < corners.size(); ++i) {
        points[i] = point(corners[i].x, corners[i].y, corners[i].z);
        vertices[i] = writer_.add("VERTEX_POINT(''," + StepWriter::ref(points[i]) + ")");
    }

    Directions dir;
    dir.pos_x = direction(1.0, 0.0, 0.0);
    dir.pos_y = direction(0.0, 1.0, 0.0);
    dir.pos_z = direction(0.0, 0.0, 1.0);
    dir.neg_x = direction(-1.0, 0.0, 0.0);
    dir.neg_y = direction(0.0, -1.0, 0.0);
    dir.neg_z = direction(0.0, 0.0, -1.0);

    // Straight edge from corner a to corner b along a positive axis
    struct EdgeSpec {
        int from;
        int to;
        EntityId direction;
        double length;
    };
    const std::array<EdgeSpec, 12> edge_specs = {{
        {0, 1, dir.pos_x, w}, {1, 2, dir.pos_y, l}, {3, 2, dir.pos_x, w}, {0, 3, dir.pos_y, l},
        {4, 5, dir.pos_x, w}, {5, 6, dir.pos_y, l}, {7, 6, dir.pos_x, w}, {4, 7, dir.pos_y, l},
        {0, 4, dir.pos_z, h}, {1, 5, dir.pos_z, h}, {2, 6, dir.pos_z, h}, {3, 7, dir.pos_z, h},
    }};

    std::array<EntityId, 12> edges{};
    for (size_t i = 0; i < edge_specs.size(); ++i) {
        const EdgeSpec& e = edge_specs[i];
        EntityId vec = writer_.add("VECTOR(''," + StepWriter::ref(e.direction) + "," +
                                   StepWriter::real(e.length) + ")");
        EntityId line = writer_.add("LINE(''," + StepWriter::ref(points[e.from]) + "," +
                                    StepWriter::ref(vec) + ")");
        edges[i] = writer_.add("EDGE_CURVE(''," + StepWriter::ref(vertices[e.from]) + "," +
                               StepWriter::ref(vertices[e.to]) + "," +
                               StepWriter::ref(line) + ",.T.)");
    }

    // Loops wind counter-clockwise seen from outside; every edge is used
    // once with each orientation across the six faces.
    struct FaceSpec {
        std::array<std::pair<int, bool>, 4> loop;
        Point3 center;
        EntityId normal;
        EntityId ref_direction;
    };
    const std::array<FaceSpec, 6> face_specs = {{
        // Bottom
        {{{{3, true}, {2, true}, {1, false}, {0, false}}},
         {w / 2.0, l / 2.0, 0.0}, dir.neg_z, dir.pos_x},
        // Top
        {{{{4, true}, {5, true}, {6, false}, {7, false}}},
         {w / 2.0, l / 2.0, h}, dir.pos_z, dir.pos_x},
        // Front
        {{{{0, true}, {9, true}, {4, false}, {8, false}}},
         {w / 2.0, 0.0, h / 2.0}, dir.neg_y, dir.pos_x},
        // Right
        {{{{1, true}, {10, true}, {5, false}, {9, false}}},
         {w, l / 2.0, h / 2.0}, dir.pos_x, dir.pos_y},
        // Back
        {{{{2, false}, {11, true}, {6, true}, {10, false}}},
         {w / 2.0, l, h / 2.0}, dir.pos_y, dir.pos_x},
        // Left
        {{{{3, false}, {8, true}, {7, true}, {11, false}}},
         {0.0, l / 2.0, h / 2.0}, dir.neg_x, dir.pos_y},
    }};

    std::vector<EntityId> faces;
    faces.reserve(face_specs.size());
    for (const FaceSpec& f : face_specs) {
        std::vector<EntityId> oriented;
        oriented.reserve(f.loop.size());
        for (const auto& [edge_index, forward] : f.loop) {
            oriented.push_back(writer_.add("ORIENTED_EDGE('',*,*," +
                                           StepWriter::ref(edges[edge_index]) + "," +
                                           StepWriter::logical(forward) + ")"));
        }

        EntityId placement = axis2_placement("", f.center, f.normal, f.ref_direction);
        EntityId plane = writer_.add("PLANE(''," + StepWriter::ref(placement) + ")");
        EntityId loop = writer_.add("EDGE_LOOP(''," + StepWriter::list(oriented) + ")");
        EntityId bound = writer_.add("FACE_OUTER_BOUND(''," + StepWriter::ref(loop) + ",.T.)");
        faces.push_back(writer_.add("ADVANCED_FACE(''," + StepWriter::list({bound}) + "," +
                                    StepWriter::ref(plane) + ",.T.)"));
    }

    EntityId shell = writer_.add("CLOSED_SHELL(''," + StepWriter::list(faces) + ")");
    return writer_.add("MANIFOLD_SOLID_BREP(" + StepWriter::str(name) + "," +
                       StepWriter::ref(shell) + ")");
}

void CrateStepExporter::add_length_property(const std::string& label, double value,
                                            const StepContexts& ctx) {
    const std::string quoted = StepWriter::str(label);

    EntityId measure = writer_.add("LENGTH_MEASURE_WITH_UNIT(LENGTH_MEASURE(" +
                                   StepWriter::real(value, 3) + ")," +
                                   StepWriter::ref(ctx.length_unit) + ")");
    EntityId item = writer_.add("MEASURE_REPRESENTATION_ITEM(" + quoted + "," +
                                StepWriter::ref(measure) + ")");
    EntityId rep = writer_.add("REPRESENTATION(" + quoted + "," + StepWriter::list({item}) + "," +
                               StepWriter::ref(ctx.geometric_context) + ")");
    EntityId prop = writer_.add("PROPERTY_DEFINITION(" + quoted + ",'product characteristic'," +
                                StepWriter::ref(ctx.assembly_definition) + ")");
    writer_.add("PROPERTY_DEFINITION_REPRESENTATION(" + StepWriter::ref(prop) + "," +
                StepWriter::ref(rep) + ")");
}

std::string CrateStepExporter::generate() {
    auto log = logging::get_logger();

    StepContexts ctx = create_contexts();

    // Emission order is id order, independent of the caller's ordering
    std::vector<const CratePart*> parts;
    parts.reserve(design_.parts.size());
    for (const auto& part : design_.parts) {
        parts.push_back(&part);
    }
    std::stable_sort(parts.begin(), parts.end(),
                     [](const CratePart* a, const CratePart* b) { return a->id < b->id; });

    std::vector<PartRecord> records;
    records.reserve(parts.size());
    BoundingBox exported_bounds = BoundingBox::empty();

    for (const CratePart* part : parts) {
        if (!part->is_solid(STEP_MIN_PART_SIZE)) {
            log->debug("STEP export: skipping degenerate part '{}'", part->id);
            continue;
        }

        Vector3 size = part->bounds.size();
        PartRecord record;
        record.part = part;

        EntityId solid = create_box_solid(part->name, size.x, size.y, size.z);
        record.product = create_product(*part, ctx);

        // Shared axis directions for both placements of this part
        EntityId z_axis = direction(0.0, 0.0, 1.0);
        EntityId x_axis = direction(1.0, 0.0, 0.0);
        record.local_placement = axis2_placement(part->id + "_LOCAL", point3::origin(),
                                                 z_axis, x_axis);
        record.global_placement = axis2_placement(part->id + "_PLACEMENT", part->bounds.min,
                                                  z_axis, x_axis);

        record.shape_representation = writer_.add(
            "ADVANCED_BREP_SHAPE_REPRESENTATION(" + StepWriter::str(part->id) + "," +
            StepWriter::list({solid, record.local_placement}) + "," +
            StepWriter::ref(ctx.geometric_context) + ")");
        writer_.add("SHAPE_DEFINITION_REPRESENTATION(" +
                    StepWriter::ref(record.product.definition_shape) + "," +
                    StepWriter::ref(record.shape_representation) + ")");

        exported_bounds.extend(part->bounds);
        records.push_back(record);
    }

    // Root shape representation holds one placement per component
    std::vector<EntityId> placements;
    placements.reserve(records.size());
    for (const auto& record : records) {
        placements.push_back(record.global_placement);
    }
    EntityId root_rep = writer_.add("SHAPE_REPRESENTATION(" +
                                    StepWriter::str(options_.product_name) + "," +
                                    StepWriter::list(placements) + "," +
                                    StepWriter::ref(ctx.geometric_context) + ")");
    writer_.add("SHAPE_DEFINITION_REPRESENTATION(" +
                StepWriter::ref(ctx.assembly_definition_shape) + "," +
                StepWriter::ref(root_rep) + ")");

    // Wire each component into the root assembly
    for (size_t i = 0; i < records.size(); ++i) {
        const PartRecord& record = records[i];
        const std::string id = StepWriter::str(record.part->id);

        EntityId transform = writer_.add("ITEM_DEFINED_TRANSFORMATION(" + id + ",''," +
                                         StepWriter::ref(record.local_placement) + "," +
                                         StepWriter::ref(record.global_placement) + ")");
        EntityId relationship = writer_.add(
            "(REPRESENTATION_RELATIONSHIP(" + id + ",''," +
            StepWriter::ref(record.shape_representation) + "," + StepWriter::ref(root_rep) + ")"
            "REPRESENTATION_RELATIONSHIP_WITH_TRANSFORMATION(" + StepWriter::ref(transform) + ")"
            "SHAPE_REPRESENTATION_RELATIONSHIP())");
        EntityId usage = writer_.add("NEXT_ASSEMBLY_USAGE_OCCURRENCE('NAUO_" + std::to_string(i + 1) +
                                     "'," + StepWriter::str(record.part->name) + ",''," +
                                     StepWriter::ref(ctx.assembly_definition) + "," +
                                     StepWriter::ref(record.product.definition) + ",$)");
        EntityId usage_shape = writer_.add("PRODUCT_DEFINITION_SHAPE('',''," +
                                           StepWriter::ref(usage) + ")");
        writer_.add("CONTEXT_DEPENDENT_SHAPE_REPRESENTATION(" + StepWriter::ref(relationship) + "," +
                    StepWriter::ref(usage_shape) + ")");
    }

    if (options_.include_pmi && !records.empty()) {
        Vector3 size = exported_bounds.size();
        add_length_property("overall_width_in", size.x, ctx);
        add_length_property("overall_length_in", size.y, ctx);
        add_length_property("overall_height_in", size.z, ctx);
    }

    log->debug("STEP export: {} of {} parts, {} entities",
               records.size(), design_.parts.size(), writer_.entity_count());

    return writer_.to_string(make_header());
}

}  // namespace

std::string export_step_ap242(const CrateDesign& design, const StepExportOptions& options) {
    return CrateStepExporter(design, options).generate();
}

}  // namespace brepkit
