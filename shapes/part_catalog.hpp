#ifndef SYMPARTS_SHAPES_PART_CATALOG_HPP
#define SYMPARTS_SHAPES_PART_CATALOG_HPP

#include "geometry_capability.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace symparts {

struct Part;
class AssemblyGraph;

// Explicit registry of geometry capabilities keyed by part type id.
// Passed to the resolver and aggregator; there is no global instance.
class PartCatalog {
public:
    PartCatalog() = default;
    PartCatalog(PartCatalog&&) = default;
    PartCatalog& operator=(PartCatalog&&) = default;

    // Catalog preloaded with the shapes in builtin_shapes.hpp
    static PartCatalog with_builtin_shapes();

    // Register a capability; a second registration of the same type id throws
    void add(std::unique_ptr<GeometryCapability> capability);

    bool has(const std::string& type_id) const { return capabilities_.count(type_id) > 0; }
    const GeometryCapability* find(const std::string& type_id) const;

    // Capability for a part's type; throws UnknownPartTypeError
    const GeometryCapability& capability_for(const Part& part) const;

    std::vector<std::string> type_ids() const;
    size_t size() const { return capabilities_.size(); }

    // Every part type is known and declares exactly the capability's fields,
    // concrete densities are non-negative and concrete attachment points lie
    // in the unit cube. The resolver and aggregator run this on every part.
    void validate(const Part& part) const;
    void validate(const AssemblyGraph& graph) const;

private:
    std::map<std::string, std::unique_ptr<GeometryCapability>> capabilities_;
};

}  // namespace symparts

#endif // SYMPARTS_SHAPES_PART_CATALOG_HPP
