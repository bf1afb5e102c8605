#ifndef SYMPARTS_SERIALIZATION_PLACEMENT_JSON_HPP
#define SYMPARTS_SERIALIZATION_PLACEMENT_JSON_HPP

#include <nlohmann/json.hpp>
#include <placement/placement_resolver.hpp>
#include "config_json.hpp"

namespace symparts {

// PartTransform serialization
inline void to_json(nlohmann::json& j, const PartTransform& transform) {
    j["translation"] = transform.translation;
    j["rotation"] = transform.rotation;
    j["matrix"] = transform.matrix;
    j["extents"] = transform.extents;
    j["local_origin"] = transform.local_origin;
    j["placement"] = transform.placement;
}

inline void from_json(const nlohmann::json& j, PartTransform& transform) {
    transform.translation = j["translation"].get<Vec3>();
    transform.matrix = j["matrix"].get<Mat3>();
    transform.rotation = Rotation::from_matrix(transform.matrix);
    transform.extents = j["extents"].get<Vec3>();
    transform.local_origin = j["local_origin"].get<Vec3>();
    transform.placement = j["placement"].get<Vec3>();
}

// PlacementMap serialization; parts are keyed by name in traversal order
inline void to_json(nlohmann::json& j, const PlacementMap& placements) {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& name : placements.order) {
        nlohmann::json entry = placements.at(name);
        entry["name"] = name;
        parts.push_back(entry);
    }
    j["root"] = placements.root;
    j["order"] = placements.order;
    j["parts"] = parts;
}

inline void from_json(const nlohmann::json& j, PlacementMap& placements) {
    placements.root = j["root"].get<std::string>();
    placements.order = j["order"].get<std::vector<std::string>>();
    placements.transforms.clear();
    for (const auto& entry : j["parts"]) {
        placements.transforms[entry["name"].get<std::string>()] = entry.get<PartTransform>();
    }
}

// AssemblyBounds serialization
inline void to_json(nlohmann::json& j, const AssemblyBounds& bounds) {
    j = {
        {"min", bounds.min},
        {"max", bounds.max},
        {"length", bounds.length()},
        {"width", bounds.width()},
        {"height", bounds.height()}
    };
}

// Batch outcome: placements with bounds, or the error that stopped them
inline void to_json(nlohmann::json& j, const PlacementOutcome& outcome) {
    j["ok"] = outcome.ok();
    if (outcome.ok()) {
        j["placements"] = *outcome.placements;
        j["bounds"] = assembly_bounds(*outcome.placements);
    } else {
        j["error"] = {
            {"kind", outcome.error_kind},
            {"message", outcome.error_message}
        };
    }
}

}  // namespace symparts

#endif // SYMPARTS_SERIALIZATION_PLACEMENT_JSON_HPP
