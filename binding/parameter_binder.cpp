#include "parameter_binder.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>

namespace symparts {

std::vector<std::string> ParameterBinder::unmatched_keys(const AssemblyGraph& graph,
                                                         const ParameterMap& params) {
    std::set<std::string> free_names = graph.free_parameter_names();
    std::vector<std::string> unmatched;
    for (const auto& [name, value] : params) {
        if (free_names.count(name) == 0) {
            unmatched.push_back(name);
        }
    }
    return unmatched;
}

AssemblyGraph ParameterBinder::bind(const AssemblyGraph& graph,
                                    const ParameterMap& params,
                                    const BindOptions& options) {
    auto log = logging::get_logger();

    std::vector<std::string> unmatched = unmatched_keys(graph, params);
    if (options.strict && !unmatched.empty()) {
        throw UnknownParameterError(unmatched.front());
    }
    for (const auto& name : unmatched) {
        log->debug("Ignoring parameter \"{}\": not a free parameter of \"{}\"", name, graph.name());
    }

    AssemblyGraph bound = graph;
    std::size_t substitutions = 0;
    for (const auto& [name, value] : params) {
        substitutions += bound.bind(name, value);
    }
    for (const auto& part : bound.parts()) {
        part.check_material_density();
    }

    log->debug("Bound {} of {} parameters into \"{}\" ({} substitutions, {} still free)",
               params.size() - unmatched.size(), params.size(), graph.name(),
               substitutions, bound.free_parameter_names().size());
    return bound;
}

ConcreteAssembly make_concrete(const AssemblyGraph& graph,
                               const ParameterMap& params,
                               const PartCatalog& catalog,
                               const BindOptions& options,
                               TraversalOrder order) {
    AssemblyGraph bound = ParameterBinder::bind(graph, params, options);
    PlacementResolver resolver(catalog, order);
    PlacementMap placements = resolver.resolve(bound);
    return ConcreteAssembly{std::move(bound), std::move(placements)};
}

}  // namespace symparts
