#include "part.hpp"
#include <common/errors.hpp>
#include <algorithm>

namespace symparts {

namespace {

const PartPoint* find_point(const std::vector<PartPoint>& points, const std::string& name) {
    auto it = std::find_if(points.begin(), points.end(),
                           [&](const PartPoint& p) { return p.name == name; });
    return it == points.end() ? nullptr : &*it;
}

}  // namespace

const PartPoint* Part::find_attachment_point(const std::string& point_name) const {
    return find_point(attachment_points, point_name);
}

const PartPoint* Part::find_connection_port(const std::string& port_name) const {
    return find_point(connection_ports, port_name);
}

Part& Part::add_attachment_point(const std::string& point_name, const SymbolicVec3& position) {
    if (find_attachment_point(point_name) != nullptr) {
        throw MalformedDocumentError(name + ".attachment_points." + point_name,
                                     "duplicate attachment point name");
    }
    position.check_normalized(name + ".attachment_points." + point_name);
    attachment_points.push_back({point_name, position});
    return *this;
}

Part& Part::add_connection_port(const std::string& port_name, const SymbolicVec3& position) {
    if (find_connection_port(port_name) != nullptr) {
        throw MalformedDocumentError(name + ".connection_ports." + port_name,
                                     "duplicate connection port name");
    }
    connection_ports.push_back({port_name, position});
    return *this;
}

Part& Part::set_placement(const SymbolicVec3& placement, const SymbolicVec3& local_origin) {
    static_placement = placement;
    static_origin = local_origin;
    return *this;
}

Part& Part::set_orientation(SymbolicValue roll_deg, SymbolicValue pitch_deg, SymbolicValue yaw_deg) {
    orientation = {std::move(roll_deg), std::move(pitch_deg), std::move(yaw_deg)};
    return *this;
}

Part& Part::set_geometry(const std::string& field, SymbolicValue value) {
    geometry.set(field, std::move(value));
    return *this;
}

Part& Part::set_unexposed() {
    is_exposed = false;
    return *this;
}

bool Part::is_anchor() const {
    return static_origin.has_value() && static_placement.has_value() &&
           static_origin->is_resolved() && static_placement->is_resolved();
}

bool Part::is_resolved() const {
    std::set<std::string> names;
    collect_free_parameters(names);
    return names.empty();
}

void Part::check_material_density() const {
    if (material_density.is_resolved() && material_density.value() < 0.0) {
        throw MalformedDocumentError(name + ".material_density",
                                     "must not be negative, got " + material_density.to_string());
    }
}

std::size_t Part::bind(const std::string& parameter, double value) {
    std::size_t count = 0;
    count += geometry.bind(parameter, value);
    if (material_density.bind(parameter, value)) ++count;
    if (static_origin) count += static_origin->bind(parameter, value);
    if (static_placement) count += static_placement->bind(parameter, value);
    count += orientation.bind(parameter, value);
    for (auto& point : attachment_points) {
        count += point.position.bind(parameter, value);
    }
    for (auto& port : connection_ports) {
        count += port.position.bind(parameter, value);
    }
    return count;
}

void Part::collect_free_parameters(std::set<std::string>& out) const {
    geometry.collect_free_parameters(out);
    material_density.collect_free_parameters(out);
    if (static_origin) static_origin->collect_free_parameters(out);
    if (static_placement) static_placement->collect_free_parameters(out);
    orientation.collect_free_parameters(out);
    for (const auto& point : attachment_points) {
        point.position.collect_free_parameters(out);
    }
    for (const auto& port : connection_ports) {
        port.position.collect_free_parameters(out);
    }
}

std::set<std::string> Part::free_parameter_names() const {
    std::set<std::string> names;
    collect_free_parameters(names);
    return names;
}

}  // namespace symparts
