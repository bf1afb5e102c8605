#include "cli_common.hpp"
#include <binding/parameter_binder.hpp>
#include <placement/placement_resolver.hpp>
#include <serialization/assembly_graph_json.hpp>
#include <serialization/placement_json.hpp>
#include <common/logging.hpp>

namespace symparts::cli {

int command_place(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty() || ctx.help) {
            std::cerr << "Usage: symparts place <assembly.json> -o <placements.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -p <params.json>  Bind parameters before placing\n";
            std::cerr << "  -c <config.json>  Pipeline configuration (traversal, binding)\n";
            std::cerr << "  --strict          Fail on parameters that match nothing\n";
            return ctx.help ? 0 : 1;
        }

        PipelineConfig config = load_pipeline_config(ctx);
        PartCatalog catalog = PartCatalog::with_builtin_shapes();
        AssemblyGraph graph = load_assembly_file(ctx.input_path, &catalog);
        ParameterMap params = load_parameters(ctx);

        log->info("Placing assembly {} ({} parts)", graph.name(), graph.part_count());
        ConcreteAssembly concrete = make_concrete(graph, params, catalog, config.binding, config.traversal);
        AssemblyBounds bounds = assembly_bounds(concrete.placements);

        auto data = json::SerializedData::stamped("placements", ctx.input_path);
        data.config = {
            {"pipeline", config},
            {"parameters", parameter_map_to_json(params)}
        };
        data.data = concrete.placements;
        data.data["bounds"] = bounds;
        data.stats = {
            {"part_count", concrete.placements.size()},
            {"root", concrete.placements.root}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote placements to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << concrete.placements.size() << " parts placed from "
                  << concrete.placements.root << ")\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace symparts::cli
