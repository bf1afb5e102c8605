#ifndef SYMPARTS_CLI_COMMON_HPP
#define SYMPARTS_CLI_COMMON_HPP

#include "pipeline_config.hpp"
#include <binding/parameter_binder.hpp>
#include <common/logging.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace symparts::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::vector<std::string> input_paths;   // Every positional, for batch
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> params_path;
    bool strict = false;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument.
// Only commands that accept several inputs pass multiple_inputs.
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx,
                                                        bool multiple_inputs = false) {
    CommandContext ctx;
    int i = start_idx;

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-p" || arg == "--params") {
            if (i + 1 < argc) {
                ctx.params_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-p/--params requires an argument");
            }
        } else if (arg == "--strict") {
            ctx.strict = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty() || multiple_inputs) {
                if (ctx.input_path.empty()) {
                    ctx.input_path = arg;
                }
                ctx.input_paths.push_back(arg);
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    logging::set_verbose(ctx.verbose);
    return {ctx, i};
}

// Config file (if any) overlaid with command-line flags
inline PipelineConfig load_pipeline_config(const CommandContext& ctx) {
    PipelineConfig config;
    if (ctx.config_path) {
        config = json::read_json_file(*ctx.config_path).get<PipelineConfig>();
    }
    if (ctx.strict) {
        config.binding.strict = true;
    }
    return config;
}

// Parameter file (if any); an absent file binds nothing
inline ParameterMap load_parameters(const CommandContext& ctx) {
    if (!ctx.params_path) {
        return {};
    }
    return parameter_map_from_json(json::read_json_file(*ctx.params_path));
}

// Command function declarations
int command_validate(int argc, char** argv);
int command_params(int argc, char** argv);
int command_bind(int argc, char** argv);
int command_place(int argc, char** argv);
int command_batch(int argc, char** argv);
int command_properties(int argc, char** argv);

}  // namespace symparts::cli

#endif // SYMPARTS_CLI_COMMON_HPP
