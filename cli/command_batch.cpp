#include "cli_common.hpp"
#include <binding/parameter_binder.hpp>
#include <placement/placement_resolver.hpp>
#include <serialization/assembly_graph_json.hpp>
#include <serialization/placement_json.hpp>
#include <common/logging.hpp>
#include <algorithm>

namespace symparts::cli {

int command_batch(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2, true);

        if (ctx.input_paths.empty() || ctx.output_path.empty() || ctx.help) {
            std::cerr << "Usage: symparts batch <assembly.json>... -o <placements.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -p <params.json>  Bind the same parameters into every assembly\n";
            std::cerr << "  -c <config.json>  Pipeline configuration (traversal, binding, num_threads)\n";
            std::cerr << "  --strict          Fail on parameters that match nothing\n";
            return ctx.help ? 0 : 1;
        }

        PipelineConfig config = load_pipeline_config(ctx);
        PartCatalog catalog = PartCatalog::with_builtin_shapes();
        ParameterMap params = load_parameters(ctx);

        // Load and bind errors stop the batch; placement errors are per assembly
        std::vector<AssemblyGraph> graphs;
        graphs.reserve(ctx.input_paths.size());
        for (const auto& path : ctx.input_paths) {
            AssemblyGraph graph = load_assembly_file(path, &catalog);
            graphs.push_back(ParameterBinder::bind(graph, params, config.binding));
        }

        log->info("Placing {} assemblies", graphs.size());
        PlacementResolver resolver(catalog, config.traversal);
        std::vector<PlacementOutcome> outcomes = resolver.resolve_batch(graphs, config.num_threads);

        nlohmann::json results = nlohmann::json::array();
        for (size_t i = 0; i < outcomes.size(); ++i) {
            nlohmann::json entry = outcomes[i];
            entry["source_file"] = ctx.input_paths[i];
            entry["name"] = graphs[i].name();
            results.push_back(entry);
        }

        size_t placed = static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                          [](const PlacementOutcome& o) { return o.ok(); }));

        auto data = json::SerializedData::stamped("batch_placements");
        data.config = {
            {"pipeline", config},
            {"parameters", parameter_map_to_json(params)}
        };
        data.data = {{"assemblies", results}};
        data.stats = {
            {"assembly_count", outcomes.size()},
            {"placed", placed},
            {"failed", outcomes.size() - placed}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote batch placements to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << placed << " of "
                  << outcomes.size() << " assemblies placed)\n";
        return placed == outcomes.size() ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace symparts::cli
