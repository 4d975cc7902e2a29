#include <cli/cli_common.hpp>
#include <common/logging.hpp>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  step <design.json> -o <out.step> [-c <options.json>]\n";
    std::cerr << "              Write a crate design as a STEP AP242 assembly\n";
    std::cerr << "  primitive <primitive.json> -o <solid.json>\n";
    std::cerr << "              Build a primitive solid and dump its topology\n";
    std::cerr << "  mesh <primitive.json> -o <out.obj>\n";
    std::cerr << "              Triangulate a primitive solid as Wavefront OBJ\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -v, --verbose   Debug logging\n";
    std::cerr << "  -h, --help      Show help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  BREPKIT_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "step") {
        return brepkit::cli::command_step(argc, argv);
    }
    if (command == "primitive") {
        return brepkit::cli::command_primitive(argc, argv);
    }
    if (command == "mesh") {
        return brepkit::cli::command_mesh(argc, argv);
    }

    brepkit::logging::get_logger()->error("Unknown command: {}", command);
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
