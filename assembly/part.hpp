#ifndef SYMPARTS_ASSEMBLY_PART_HPP
#define SYMPARTS_ASSEMBLY_PART_HPP

#include <symbolic/geometry_descriptor.hpp>
#include <symbolic/symbolic_value.hpp>
#include <symbolic/symbolic_vec3.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace symparts {

using PartId = uint32_t;

// Named location on a part. Attachment points are normalized to [0, 1] along
// each axis of the part's bounding extents (front, bottom, min corner at 0);
// connection ports use the same layout but carry no placement meaning.
struct PartPoint {
    std::string name;
    SymbolicVec3 position;

    bool operator==(const PartPoint& other) const = default;
};

// A node of the assembly graph.
//
// static_origin is a normalized local point of the part and static_placement
// the world position of that point. A part carrying both, fully resolved, can
// anchor an assembly; all other parts are placed through attachment edges.
struct Part {
    std::string name;
    std::string type;                                // Dotted "category.Kind" identifier
    GeometryDescriptor geometry;
    SymbolicValue material_density = 1.0;            // kg/m^3
    std::optional<SymbolicVec3> static_origin;
    std::optional<SymbolicVec3> static_placement;
    SymbolicOrientation orientation{0.0, 0.0, 0.0};  // Degrees
    std::vector<PartPoint> attachment_points;
    std::vector<PartPoint> connection_ports;
    bool is_exposed = true;                          // Environmentally exposed (wetted)

    Part() = default;
    Part(std::string name_, std::string type_)
        : name(std::move(name_)), type(std::move(type_)) {}

    const PartPoint* find_attachment_point(const std::string& point_name) const;
    const PartPoint* find_connection_port(const std::string& port_name) const;

    // Builder helpers; duplicate point/port names throw MalformedDocumentError,
    // as does a concrete attachment coordinate outside [0, 1]
    Part& add_attachment_point(const std::string& point_name, const SymbolicVec3& position);
    Part& add_connection_port(const std::string& port_name, const SymbolicVec3& position);
    Part& set_placement(const SymbolicVec3& placement, const SymbolicVec3& local_origin);
    Part& set_orientation(SymbolicValue roll_deg, SymbolicValue pitch_deg, SymbolicValue yaw_deg);
    Part& set_geometry(const std::string& field, SymbolicValue value);
    Part& set_unexposed();

    // Static origin and placement both present and fully concrete
    bool is_anchor() const;
    bool is_resolved() const;

    // MalformedDocumentError if the density is concrete and negative
    void check_material_density() const;

    std::size_t bind(const std::string& parameter, double value);
    void collect_free_parameters(std::set<std::string>& out) const;
    std::set<std::string> free_parameter_names() const;

    bool operator==(const Part& other) const = default;
};

}  // namespace symparts

#endif // SYMPARTS_ASSEMBLY_PART_HPP
