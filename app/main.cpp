#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Resolves symbolic parametric assemblies of mechanical parts.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  validate     Load an assembly and check it against the shape catalog\n";
    std::cerr << "  params       List the free parameters of an assembly\n";
    std::cerr << "  bind         Substitute parameter values and write the bound assembly\n";
    std::cerr << "  place        Resolve the absolute placement of every part\n";
    std::cerr << "  batch        Place several assemblies in parallel\n";
    std::cerr << "  properties   Compute volumes, mass and centers of gravity/buoyancy\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -o, --output <file>   Output file\n";
    std::cerr << "  -c, --config <file>   Pipeline configuration JSON\n";
    std::cerr << "  -p, --params <file>   Parameter values JSON (name -> number)\n";
    std::cerr << "  --strict              Reject parameters that match nothing\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  SYMPARTS_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "validate") return symparts::cli::command_validate(argc, argv);
    if (command == "params") return symparts::cli::command_params(argc, argv);
    if (command == "bind") return symparts::cli::command_bind(argc, argv);
    if (command == "place") return symparts::cli::command_place(argc, argv);
    if (command == "batch") return symparts::cli::command_batch(argc, argv);
    if (command == "properties") return symparts::cli::command_properties(argc, argv);

    auto log = symparts::logging::get_logger();
    log->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
