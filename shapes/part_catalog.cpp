#include "part_catalog.hpp"
#include "builtin_shapes.hpp"
#include <assembly/assembly_graph.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <stdexcept>

namespace symparts {

PartCatalog PartCatalog::with_builtin_shapes() {
    PartCatalog catalog;
    register_builtin_shapes(catalog);
    return catalog;
}

void PartCatalog::add(std::unique_ptr<GeometryCapability> capability) {
    if (!capability) {
        throw std::invalid_argument("PartCatalog::add: null capability");
    }
    std::string id = capability->type_id();
    if (has(id)) {
        throw std::invalid_argument("PartCatalog::add: duplicate part type " + id);
    }
    capabilities_.emplace(std::move(id), std::move(capability));
}

const GeometryCapability* PartCatalog::find(const std::string& type_id) const {
    auto it = capabilities_.find(type_id);
    return it == capabilities_.end() ? nullptr : it->second.get();
}

const GeometryCapability& PartCatalog::capability_for(const Part& part) const {
    const GeometryCapability* capability = find(part.type);
    if (capability == nullptr) {
        throw UnknownPartTypeError(part.name, part.type);
    }
    return *capability;
}

std::vector<std::string> PartCatalog::type_ids() const {
    std::vector<std::string> ids;
    ids.reserve(capabilities_.size());
    for (const auto& [id, capability] : capabilities_) {
        ids.push_back(id);
    }
    return ids;
}

void PartCatalog::validate(const Part& part) const {
    const GeometryCapability& capability = capability_for(part);
    part.geometry.check_fields(capability.fields(), part.name);
    part.check_material_density();
    for (const auto& point : part.attachment_points) {
        point.position.check_normalized(part.name + ".attachment_points." + point.name);
    }
}

void PartCatalog::validate(const AssemblyGraph& graph) const {
    auto log = logging::get_logger();
    for (const auto& part : graph.parts()) {
        validate(part);
    }
    log->debug("Validated {} parts of \"{}\" against catalog", graph.part_count(), graph.name());
}

}  // namespace symparts
