#ifndef SYMPARTS_PROPERTIES_PROPERTY_AGGREGATOR_HPP
#define SYMPARTS_PROPERTIES_PROPERTY_AGGREGATOR_HPP

#include <assembly/assembly_graph.hpp>
#include <math/vec3.hpp>
#include <placement/placement_resolver.hpp>
#include <shapes/part_catalog.hpp>
#include <optional>
#include <string>
#include <vector>

namespace symparts {

// Assembly total that stays unresolved while any contributing part is
template <typename T>
struct Aggregate {
    std::optional<T> value;
    std::vector<std::string> unresolved_parts;   // Sorted by name

    bool is_resolved() const { return value.has_value(); }
};

// Per-part derived values; an empty optional marks an unresolved input
struct PartProperties {
    std::string name;
    std::string type;
    bool is_exposed = true;

    std::optional<double> material_volume;
    std::optional<double> displaced_volume;
    std::optional<double> surface_area;
    std::optional<double> mass;
    std::optional<Vec3> center_of_gravity;      // World frame
    std::optional<Vec3> center_of_buoyancy;     // World frame

    // First field that kept a value unresolved, e.g. "capsule3.geometry.thickness"
    std::optional<std::string> unresolved_field;
};

struct PropertyReport {
    std::string assembly;
    std::vector<PartProperties> parts;          // Graph order

    Aggregate<double> mass;
    Aggregate<double> material_volume;
    Aggregate<double> displaced_volume;         // Exposed parts only
    Aggregate<double> surface_area;             // Exposed parts only
    Aggregate<Vec3> center_of_gravity;          // Mass weighted
    Aggregate<Vec3> center_of_buoyancy;         // Displaced volume weighted, exposed parts only

    // Set when placements could not be resolved for the centers
    std::optional<std::string> placement_error;
};

// Compensated (Neumaier) running sum
class CompensatedSum {
public:
    void add(double value);
    double result() const { return sum_ + compensation_; }

private:
    double sum_ = 0.0;
    double compensation_ = 0.0;
};

// Computes volumes, mass and centers per part and for the whole assembly.
//
// Unlike binding and placement this tolerates free parameters: whatever
// depends on one is reported unresolved instead of throwing.
class PropertyAggregator {
public:
    explicit PropertyAggregator(const PartCatalog& catalog,
                                TraversalOrder order = TraversalOrder::BreadthFirst)
        : catalog_(catalog), order_(order) {}

    // Resolves placements itself; a placement failure leaves the centers
    // unresolved and is reported in placement_error. Parts the catalog
    // rejects still throw MalformedDocumentError.
    PropertyReport aggregate(const AssemblyGraph& graph) const;

    PropertyReport aggregate(const AssemblyGraph& graph, const PlacementMap& placements) const;

    // transform may be null, in which case the centers stay unresolved
    PartProperties part_properties(const Part& part, const PartTransform* transform) const;

private:
    PropertyReport aggregate_impl(const AssemblyGraph& graph, const PlacementMap* placements) const;

    const PartCatalog& catalog_;
    TraversalOrder order_;
};

}  // namespace symparts

#endif // SYMPARTS_PROPERTIES_PROPERTY_AGGREGATOR_HPP
