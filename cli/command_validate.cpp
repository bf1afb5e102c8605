#include "cli_common.hpp"
#include <serialization/assembly_graph_json.hpp>
#include <shapes/part_catalog.hpp>
#include <common/logging.hpp>

namespace symparts::cli {

int command_validate(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.help) {
            std::cerr << "Usage: symparts validate <assembly.json> [-v]\n";
            std::cerr << "Loads the assembly and checks every part against the shape catalog.\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Validating assembly: {}", ctx.input_path);

        PartCatalog catalog = PartCatalog::with_builtin_shapes();
        AssemblyGraph graph = load_assembly_file(ctx.input_path, &catalog);

        auto free_names = graph.free_parameter_names();
        std::cout << "Assembly \"" << graph.name() << "\": "
                  << graph.part_count() << " parts, "
                  << graph.attachment_count() << " attachments, "
                  << graph.connection_count() << " connections, "
                  << free_names.size() << " free parameters\n";

        log->info("Assembly {} is valid", graph.name());
        return 0;

    } catch (const AssemblyError& e) {
        log->error("{}: {}", e.kind(), e.what());
        std::cerr << "Invalid: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace symparts::cli
