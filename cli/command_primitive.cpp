#include "cli_common.hpp"
#include <primitives/primitive_spec.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/solid_json.hpp>
#include <iostream>

namespace brepkit::cli {

int command_primitive(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: brepkit primitive <primitive.json> [-o <solid.json>] [-v]\n";
            return ctx.help ? 0 : 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".solid.json", ctx.output_path);

        log->info("Building primitive from: {}", ctx.input_path);

        nlohmann::json config = json::read_json_file(ctx.input_path);
        PrimitiveSpec spec = config.get<PrimitiveSpec>();

        log->debug("Generating {}", primitive_kind_name(spec.kind));
        Solid solid = build_primitive(spec);

        ValidationResult validation = solid.validate();
        for (const auto& warning : validation.warnings) {
            log->warn("Validation warning: {}", warning);
        }
        for (const auto& error : validation.errors) {
            log->error("Validation error: {}", error);
        }

        json::SerializedData output;
        output.step = "primitive";
        output.timestamp = json::get_timestamp();
        output.source_file = ctx.input_path;
        output.config = spec;
        output.stats = solid_stats_json(solid);
        output.data = solid_to_json(solid);

        json::write_serialized(output_path, output);

        log->info("Wrote solid to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << solid.vertex_count() << " vertices, "
                  << solid.edge_count() << " edges, "
                  << solid.face_count() << " faces)\n";

        return validation.valid ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace brepkit::cli
