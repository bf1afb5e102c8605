#include "cli_common.hpp"
#include <binding/parameter_binder.hpp>
#include <properties/property_aggregator.hpp>
#include <serialization/assembly_graph_json.hpp>
#include <serialization/properties_json.hpp>
#include <common/logging.hpp>

namespace symparts::cli {

int command_properties(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty() || ctx.help) {
            std::cerr << "Usage: symparts properties <assembly.json> -o <properties.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -p <params.json>  Bind parameters before aggregating\n";
            std::cerr << "  -c <config.json>  Pipeline configuration (traversal, include_parts)\n";
            std::cerr << "  --strict          Fail on parameters that match nothing\n";
            std::cerr << "\n";
            std::cerr << "Totals depending on a free parameter are written as null.\n";
            return ctx.help ? 0 : 1;
        }

        PipelineConfig config = load_pipeline_config(ctx);
        PartCatalog catalog = PartCatalog::with_builtin_shapes();
        AssemblyGraph graph = load_assembly_file(ctx.input_path, &catalog);
        ParameterMap params = load_parameters(ctx);

        AssemblyGraph bound = ParameterBinder::bind(graph, params, config.binding);
        PropertyAggregator aggregator(catalog, config.traversal);
        PropertyReport report = aggregator.aggregate(bound);

        auto data = json::SerializedData::stamped("properties", ctx.input_path);
        data.config = {
            {"pipeline", config},
            {"parameters", parameter_map_to_json(params)}
        };
        data.data = property_report_to_json(report, config.include_parts);
        data.stats = {
            {"part_count", bound.part_count()},
            {"free_parameters", bound.free_parameter_names().size()},
            {"mass_resolved", report.mass.is_resolved()}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote properties to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path;
        if (report.mass.value) {
            std::cerr << " (total mass " << *report.mass.value << " kg)\n";
        } else {
            std::cerr << " (mass unresolved for " << report.mass.unresolved_parts.size() << " parts)\n";
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace symparts::cli
