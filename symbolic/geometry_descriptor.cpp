#include "geometry_descriptor.hpp"
#include <common/errors.hpp>
#include <algorithm>

namespace symparts {

double ResolvedGeometry::get(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end()) {
        throw MalformedDocumentError("geometry." + field, "missing geometry field");
    }
    return it->second;
}

const SymbolicValue& GeometryDescriptor::at(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end()) {
        throw MalformedDocumentError("geometry." + field, "missing geometry field");
    }
    return it->second;
}

bool GeometryDescriptor::is_resolved() const {
    return std::all_of(fields_.begin(), fields_.end(),
                       [](const auto& entry) { return entry.second.is_resolved(); });
}

ResolvedGeometry GeometryDescriptor::resolve(const std::string& owner) const {
    std::map<std::string, double> values;
    for (const auto& [field, value] : fields_) {
        values[field] = resolve_field(value, owner + ".geometry." + field);
    }
    return ResolvedGeometry(std::move(values));
}

void GeometryDescriptor::check_fields(const std::vector<std::string>& declared,
                                      const std::string& owner) const {
    for (const auto& field : declared) {
        if (!has(field)) {
            throw MalformedDocumentError(owner + ".geometry." + field, "missing geometry field");
        }
    }
    for (const auto& [field, value] : fields_) {
        if (std::find(declared.begin(), declared.end(), field) == declared.end()) {
            throw MalformedDocumentError(owner + ".geometry." + field,
                                         "field not declared by the part type");
        }
    }
}

std::size_t GeometryDescriptor::bind(const std::string& name, double value) {
    std::size_t count = 0;
    for (auto& [field, symbolic] : fields_) {
        if (symbolic.bind(name, value)) ++count;
    }
    return count;
}

void GeometryDescriptor::collect_free_parameters(std::set<std::string>& out) const {
    for (const auto& [field, value] : fields_) {
        value.collect_free_parameters(out);
    }
}

}  // namespace symparts
