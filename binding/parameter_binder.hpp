#ifndef SYMPARTS_BINDING_PARAMETER_BINDER_HPP
#define SYMPARTS_BINDING_PARAMETER_BINDER_HPP

#include <assembly/assembly_graph.hpp>
#include <placement/placement_resolver.hpp>
#include <map>
#include <string>
#include <vector>

namespace symparts {

// Free parameter name -> concrete value
using ParameterMap = std::map<std::string, double>;

struct BindOptions {
    // Reject keys that match no free parameter of the graph
    bool strict = false;
};

// Substitutes free parameters with concrete values. Never mutates its input.
class ParameterBinder {
public:
    // New graph with every Symbol named in params replaced by its value.
    // Strict mode throws UnknownParameterError before substituting anything.
    // A density bound to a negative value throws MalformedDocumentError.
    static AssemblyGraph bind(const AssemblyGraph& graph,
                              const ParameterMap& params,
                              const BindOptions& options = {});

    // Keys of params that name no free parameter of graph
    static std::vector<std::string> unmatched_keys(const AssemblyGraph& graph,
                                                   const ParameterMap& params);
};

// Bound graph together with its resolved placements
struct ConcreteAssembly {
    AssemblyGraph graph;
    PlacementMap placements;
};

// Bind params, then resolve placements of the bound graph
ConcreteAssembly make_concrete(const AssemblyGraph& graph,
                               const ParameterMap& params,
                               const PartCatalog& catalog,
                               const BindOptions& options = {},
                               TraversalOrder order = TraversalOrder::BreadthFirst);

}  // namespace symparts

#endif // SYMPARTS_BINDING_PARAMETER_BINDER_HPP
