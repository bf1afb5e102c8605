#ifndef SYMPARTS_SERIALIZATION_PROPERTIES_JSON_HPP
#define SYMPARTS_SERIALIZATION_PROPERTIES_JSON_HPP

#include <nlohmann/json.hpp>
#include <properties/property_aggregator.hpp>
#include "config_json.hpp"

namespace symparts {

namespace detail {

// Unresolved values are written as null
template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace detail

template <typename T>
void to_json(nlohmann::json& j, const Aggregate<T>& aggregate) {
    j = {
        {"value", detail::optional_to_json(aggregate.value)},
        {"unresolved_parts", aggregate.unresolved_parts}
    };
}

inline void to_json(nlohmann::json& j, const PartProperties& props) {
    j["name"] = props.name;
    j["type"] = props.type;
    j["is_exposed"] = props.is_exposed;
    j["material_volume"] = detail::optional_to_json(props.material_volume);
    j["displaced_volume"] = detail::optional_to_json(props.displaced_volume);
    j["surface_area"] = detail::optional_to_json(props.surface_area);
    j["mass"] = detail::optional_to_json(props.mass);
    j["center_of_gravity"] = detail::optional_to_json(props.center_of_gravity);
    j["center_of_buoyancy"] = detail::optional_to_json(props.center_of_buoyancy);
    if (props.unresolved_field) {
        j["unresolved_field"] = *props.unresolved_field;
    }
}

// include_parts = false keeps only the assembly totals
inline nlohmann::json property_report_to_json(const PropertyReport& report, bool include_parts = true) {
    nlohmann::json j;
    j["assembly"] = report.assembly;
    j["mass"] = report.mass;
    j["material_volume"] = report.material_volume;
    j["displaced_volume"] = report.displaced_volume;
    j["surface_area"] = report.surface_area;
    j["center_of_gravity"] = report.center_of_gravity;
    j["center_of_buoyancy"] = report.center_of_buoyancy;
    j["placement_error"] = detail::optional_to_json(report.placement_error);
    if (include_parts) {
        j["parts"] = report.parts;
    }
    return j;
}

}  // namespace symparts

#endif // SYMPARTS_SERIALIZATION_PROPERTIES_JSON_HPP
