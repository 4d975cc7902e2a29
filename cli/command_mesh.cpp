#include "cli_common.hpp"
#include <modeling/mesh.hpp>
#include <primitives/primitive_spec.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <iostream>

namespace brepkit::cli {

int command_mesh(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: brepkit mesh <primitive.json> [-o <output.obj>] [-v]\n";
            return ctx.help ? 0 : 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".obj", ctx.output_path);

        log->info("Meshing primitive from: {}", ctx.input_path);

        PrimitiveSpec spec = json::read_json_file(ctx.input_path).get<PrimitiveSpec>();
        Solid solid = build_primitive(spec);

        log->debug("Triangulating {} faces", solid.face_count());
        TriangleMesh mesh = solid_to_mesh(solid);
        std::string obj = mesh.to_obj();

        json::write_text_file(output_path, obj);

        log->info("Wrote OBJ to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << mesh.triangle_count() << " triangles, "
                  << obj.size() << " bytes)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace brepkit::cli
