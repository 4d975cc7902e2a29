#ifndef BREPKIT_CLI_COMMON_HPP
#define BREPKIT_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace brepkit::cli {

// Arguments shared by every command
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;
};

// Parse arguments from argv[start_idx] on.
// Returns the context and the index of the first unprocessed argument.
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-o/--output requires an argument");
            }
            ctx.output_path = argv[i + 1];
            i += 2;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-c/--config requires an argument");
            }
            ctx.config_path = argv[i + 1];
            i += 2;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg.empty() || arg[0] != '-') {
            if (!ctx.input_path.empty()) {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
            ctx.input_path = arg;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// Output path from the input path with its extension replaced by suffix,
// unless one was given explicitly
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Only strip an extension that belongs to the file name
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    }
    return input + suffix;
}

int command_step(int argc, char** argv);
int command_primitive(int argc, char** argv);
int command_mesh(int argc, char** argv);

}  // namespace brepkit::cli

#endif // BREPKIT_CLI_COMMON_HPP
