#ifndef SYMPARTS_SERIALIZATION_ASSEMBLY_GRAPH_JSON_HPP
#define SYMPARTS_SERIALIZATION_ASSEMBLY_GRAPH_JSON_HPP

#include <nlohmann/json.hpp>
#include <assembly/assembly_graph.hpp>
#include <common/errors.hpp>
#include <shapes/part_catalog.hpp>
#include <symbolic/symbolic_value.hpp>
#include "json_serialization.hpp"
#include <string>

namespace symparts {

// A JSON number is a concrete value, a JSON string names a free parameter
inline void to_json(nlohmann::json& j, const SymbolicValue& value) {
    if (auto name = value.symbol_name()) {
        j = *name;
    } else {
        j = value.value();
    }
}

inline void to_json(nlohmann::json& j, const SymbolicVec3& v) {
    j = {{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

inline void to_json(nlohmann::json& j, const SymbolicOrientation& o) {
    j = {{"roll", o.roll}, {"pitch", o.pitch}, {"yaw", o.yaw}};
}

inline void to_json(nlohmann::json& j, const PartPoint& point) {
    j = {
        {"name", point.name},
        {"x", point.position.x},
        {"y", point.position.y},
        {"z", point.position.z}
    };
}

inline void to_json(nlohmann::json& j, const Part& part) {
    nlohmann::json geometry = nlohmann::json::object();
    for (const auto& [field, value] : part.geometry.fields()) {
        geometry[field] = value;
    }

    j["name"] = part.name;
    j["type"] = part.type;
    j["geometry"] = geometry;
    j["material_density"] = part.material_density;
    j["static_origin"] = part.static_origin ? nlohmann::json(*part.static_origin) : nlohmann::json(nullptr);
    j["static_placement"] = part.static_placement ? nlohmann::json(*part.static_placement) : nlohmann::json(nullptr);
    j["attachment_points"] = part.attachment_points;
    j["connection_ports"] = part.connection_ports;
    j["orientation"] = part.orientation;
    j["is_exposed"] = part.is_exposed;
}

// Document parsing. Every failure is reported as MalformedDocumentError
// carrying the path of the offending element.
namespace detail {

inline const nlohmann::json& require_key(const nlohmann::json& j, const std::string& key,
                                         const std::string& context) {
    if (!j.is_object()) {
        throw MalformedDocumentError(context, "expected an object");
    }
    auto it = j.find(key);
    if (it == j.end()) {
        throw MalformedDocumentError(context, "missing key \"" + key + "\"");
    }
    return *it;
}

inline std::string require_string(const nlohmann::json& j, const std::string& key,
                                  const std::string& context) {
    const nlohmann::json& value = require_key(j, key, context);
    if (!value.is_string()) {
        throw MalformedDocumentError(context + "." + key, "expected a string");
    }
    std::string result = value.get<std::string>();
    if (result.empty()) {
        throw MalformedDocumentError(context + "." + key, "must not be empty");
    }
    return result;
}

inline SymbolicValue symbolic_value_from_json(const nlohmann::json& j, const std::string& context) {
    if (j.is_number()) {
        return SymbolicValue(j.get<double>());
    }
    if (j.is_string()) {
        std::string name = j.get<std::string>();
        if (name.empty()) {
            throw MalformedDocumentError(context, "parameter name must not be empty");
        }
        return SymbolicValue::symbol(name);
    }
    throw MalformedDocumentError(context, "expected a number or a parameter name");
}

inline SymbolicValue require_symbolic(const nlohmann::json& j, const std::string& key,
                                      const std::string& context) {
    return symbolic_value_from_json(require_key(j, key, context), context + "." + key);
}

inline SymbolicVec3 symbolic_vec3_from_json(const nlohmann::json& j, const std::string& context) {
    return SymbolicVec3(require_symbolic(j, "x", context),
                        require_symbolic(j, "y", context),
                        require_symbolic(j, "z", context));
}

// Absent and null both mean "not set"
inline std::optional<SymbolicVec3> optional_vec3_from_json(const nlohmann::json& j, const std::string& key,
                                                           const std::string& context) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return symbolic_vec3_from_json(*it, context + "." + key);
}

inline const nlohmann::json& require_array(const nlohmann::json& j, const std::string& key,
                                           const std::string& context) {
    const nlohmann::json& value = require_key(j, key, context);
    if (!value.is_array()) {
        throw MalformedDocumentError(context + "." + key, "expected an array");
    }
    return value;
}

inline Part part_from_json(const nlohmann::json& j, const std::string& context) {
    Part part(require_string(j, "name", context), require_string(j, "type", context));
    const std::string path = part.name;

    const nlohmann::json& geometry = require_key(j, "geometry", context);
    if (!geometry.is_object()) {
        throw MalformedDocumentError(path + ".geometry", "expected an object");
    }
    for (const auto& [field, value] : geometry.items()) {
        part.geometry.set(field, symbolic_value_from_json(value, path + ".geometry." + field));
    }

    part.material_density = require_symbolic(j, "material_density", path);
    part.static_origin = optional_vec3_from_json(j, "static_origin", path);
    part.static_placement = optional_vec3_from_json(j, "static_placement", path);

    const nlohmann::json& orientation = require_key(j, "orientation", path);
    part.orientation = SymbolicOrientation{require_symbolic(orientation, "roll", path + ".orientation"),
                                           require_symbolic(orientation, "pitch", path + ".orientation"),
                                           require_symbolic(orientation, "yaw", path + ".orientation")};

    const nlohmann::json& points = require_array(j, "attachment_points", path);
    for (size_t i = 0; i < points.size(); ++i) {
        std::string point_path = path + ".attachment_points[" + std::to_string(i) + "]";
        part.add_attachment_point(require_string(points[i], "name", point_path),
                                  symbolic_vec3_from_json(points[i], point_path));
    }

    const nlohmann::json& ports = require_array(j, "connection_ports", path);
    for (size_t i = 0; i < ports.size(); ++i) {
        std::string port_path = path + ".connection_ports[" + std::to_string(i) + "]";
        part.add_connection_port(require_string(ports[i], "name", port_path),
                                 symbolic_vec3_from_json(ports[i], port_path));
    }

    const nlohmann::json& exposed = require_key(j, "is_exposed", path);
    if (!exposed.is_boolean()) {
        throw MalformedDocumentError(path + ".is_exposed", "expected a boolean");
    }
    part.is_exposed = exposed.get<bool>();

    return part;
}

// Optional edge list; absent or null means empty
inline const nlohmann::json* optional_array(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw MalformedDocumentError(key, "expected an array");
    }
    return &*it;
}

}  // namespace detail

// AssemblyGraph serialization
inline nlohmann::json assembly_graph_to_json(const AssemblyGraph& graph) {
    nlohmann::json j;
    j["name"] = graph.name();
    j["parts"] = graph.parts();

    nlohmann::json attachments = nlohmann::json::array();
    for (const auto& edge : graph.attachments()) {
        attachments.push_back({
            {"source_node", graph.part(edge.source_part).name},
            {"source_attachment", edge.source_point},
            {"destination_node", graph.part(edge.destination_part).name},
            {"destination_attachment", edge.destination_point}
        });
    }
    j["attachments"] = attachments;

    nlohmann::json connections = nlohmann::json::array();
    for (const auto& edge : graph.connections()) {
        connections.push_back({
            {"source_node", graph.part(edge.source_part).name},
            {"source_connection", edge.source_port},
            {"destination_node", graph.part(edge.destination_part).name},
            {"destination_connection", edge.destination_port}
        });
    }
    j["connections"] = connections;

    return j;
}

// AssemblyGraph deserialization. When a catalog is given every part is also
// checked against its type's declared geometry fields.
inline AssemblyGraph assembly_graph_from_json(const nlohmann::json& j, const PartCatalog* catalog = nullptr) {
    try {
        AssemblyGraph graph(detail::require_string(j, "name", "assembly"));

        const nlohmann::json& parts = detail::require_array(j, "parts", "assembly");
        for (size_t i = 0; i < parts.size(); ++i) {
            graph.add_part(detail::part_from_json(parts[i], "parts[" + std::to_string(i) + "]"));
        }

        if (const nlohmann::json* attachments = detail::optional_array(j, "attachments")) {
            for (size_t i = 0; i < attachments->size(); ++i) {
                const nlohmann::json& edge = (*attachments)[i];
                std::string context = "attachments[" + std::to_string(i) + "]";
                graph.attach(detail::require_string(edge, "source_node", context),
                             detail::require_string(edge, "source_attachment", context),
                             detail::require_string(edge, "destination_node", context),
                             detail::require_string(edge, "destination_attachment", context));
            }
        }

        if (const nlohmann::json* connections = detail::optional_array(j, "connections")) {
            for (size_t i = 0; i < connections->size(); ++i) {
                const nlohmann::json& edge = (*connections)[i];
                std::string context = "connections[" + std::to_string(i) + "]";
                graph.connect(detail::require_string(edge, "source_node", context),
                              detail::require_string(edge, "source_connection", context),
                              detail::require_string(edge, "destination_node", context),
                              detail::require_string(edge, "destination_connection", context));
            }
        }

        if (catalog != nullptr) {
            catalog->validate(graph);
        }
        return graph;
    } catch (const nlohmann::json::exception& e) {
        throw MalformedDocumentError("document", e.what());
    }
}

inline AssemblyGraph assembly_graph_from_string(const std::string& text, const PartCatalog* catalog = nullptr) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedDocumentError("document", e.what());
    }
    return assembly_graph_from_json(j, catalog);
}

inline AssemblyGraph load_assembly_file(const std::string& path, const PartCatalog* catalog = nullptr) {
    return assembly_graph_from_json(json::read_json_file(path), catalog);
}

inline void save_assembly_file(const std::string& path, const AssemblyGraph& graph) {
    json::write_json_file(path, assembly_graph_to_json(graph));
}

}  // namespace symparts

#endif // SYMPARTS_SERIALIZATION_ASSEMBLY_GRAPH_JSON_HPP
