#include "cli_common.hpp"
#include <design/crate_design.hpp>
#include <step/step_export.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/design_json.hpp>
#include <serialization/config_json.hpp>
#include <iostream>

namespace brepkit::cli {

namespace {

void print_step_usage() {
    std::cerr << "Usage: brepkit step <design.json> [-o <output.step>] [-c <options.json>] [-v]\n";
    std::cerr << "\n";
    std::cerr << "Writes a crate design as an AP242 STEP assembly (inches).\n";
    std::cerr << "The design is either {\"parts\": [...]} or an envelope whose\n";
    std::cerr << "\"data\" member holds it.\n";
}

// Accept a bare design or one wrapped in a SerializedData envelope
CrateDesign load_design(const std::string& path) {
    nlohmann::json j = json::read_json_file(path);
    if (j.contains("parts")) {
        return j.get<CrateDesign>();
    }
    return json::SerializedData::from_json(j).data.get<CrateDesign>();
}

}  // namespace

int command_step(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            print_step_usage();
            return 0;
        }
        if (ctx.input_path.empty()) {
            print_step_usage();
            return 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".step", ctx.output_path);

        log->info("Exporting STEP from: {}", ctx.input_path);

        StepExportOptions options;
        if (ctx.config_path) {
            log->debug("Loading export options from {}", *ctx.config_path);
            options = json::read_json_file(*ctx.config_path).get<StepExportOptions>();
        }

        CrateDesign design = load_design(ctx.input_path);
        log->debug("Loaded {} parts", design.parts.size());

        std::string step = export_step_ap242(design, options);
        json::write_text_file(output_path, step);

        log->info("Wrote STEP to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << design.parts.size() << " parts, "
                  << step.size() << " bytes)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace brepkit::cli
