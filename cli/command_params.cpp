#include "cli_common.hpp"
#include <serialization/assembly_graph_json.hpp>
#include <common/logging.hpp>

namespace symparts::cli {

int command_params(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.help) {
            std::cerr << "Usage: symparts params <assembly.json> [-o <params.json>]\n";
            std::cerr << "Lists the free parameters of an assembly, one per line.\n";
            std::cerr << "With -o, writes them as JSON instead.\n";
            return ctx.help ? 0 : 1;
        }

        AssemblyGraph graph = load_assembly_file(ctx.input_path);
        auto free_names = graph.free_parameter_names();
        log->debug("Assembly {} has {} free parameters", graph.name(), free_names.size());

        if (ctx.output_path.empty()) {
            for (const auto& name : free_names) {
                std::cout << name << "\n";
            }
            return 0;
        }

        auto data = json::SerializedData::stamped("free_parameters", ctx.input_path);
        data.data = free_names;
        data.stats = {
            {"part_count", graph.part_count()},
            {"free_parameters", free_names.size()}
        };
        json::write_serialized(ctx.output_path, data);

        log->info("Wrote {} free parameters to {}", free_names.size(), ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << free_names.size() << " parameters)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace symparts::cli
