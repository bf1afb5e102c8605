#include "cli_common.hpp"
#include <binding/parameter_binder.hpp>
#include <serialization/assembly_graph_json.hpp>
#include <common/logging.hpp>

namespace symparts::cli {

int command_bind(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || !ctx.params_path || ctx.output_path.empty() || ctx.help) {
            std::cerr << "Usage: symparts bind <assembly.json> -p <params.json> -o <out.json> [--strict]\n";
            std::cerr << "Options:\n";
            std::cerr << "  --strict        Fail if a parameter matches nothing in the assembly\n";
            std::cerr << "  -c <config>     Pipeline configuration (binding.strict)\n";
            return ctx.help ? 0 : 1;
        }

        PipelineConfig config = load_pipeline_config(ctx);
        AssemblyGraph graph = load_assembly_file(ctx.input_path);
        ParameterMap params = load_parameters(ctx);

        log->info("Binding {} parameters into {}", params.size(), graph.name());
        AssemblyGraph bound = ParameterBinder::bind(graph, params, config.binding);

        // The bound document stays a plain assembly so it can be fed back in
        save_assembly_file(ctx.output_path, bound);

        auto remaining = bound.free_parameter_names();
        log->info("Wrote bound assembly to {} ({} free parameters remain)",
                  ctx.output_path, remaining.size());
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << remaining.size() << " free parameters remain)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace symparts::cli
