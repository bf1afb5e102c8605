#ifndef SYMPARTS_ASSEMBLY_ASSEMBLY_GRAPH_HPP
#define SYMPARTS_ASSEMBLY_ASSEMBLY_GRAPH_HPP

#include "part.hpp"
#include "edges.hpp"
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace symparts {

// The assembly document: parts stored in insertion order and indexed by name,
// edges stored as PartId pairs plus point names.
//
// Parts are immutable once added; the only in-place change is bind(), used by
// ParameterBinder on its own copy.
class AssemblyGraph {
public:
    AssemblyGraph() = default;
    explicit AssemblyGraph(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    // Part management; duplicate names throw MalformedDocumentError
    PartId add_part(const Part& part);
    const Part& part(PartId id) const;
    const Part& part(const std::string& name) const;
    std::optional<PartId> find_part(const std::string& name) const;
    bool has_part(const std::string& name) const { return part_index_.count(name) > 0; }
    size_t part_count() const { return parts_.size(); }
    const std::vector<Part>& parts() const { return parts_; }

    // Rigid attachment between two attachment points
    EdgeId attach(const std::string& source_part, const std::string& source_point,
                  const std::string& destination_part, const std::string& destination_point);
    const AttachmentEdge& attachment(EdgeId id) const;
    size_t attachment_count() const { return attachments_.size(); }
    const std::vector<AttachmentEdge>& attachments() const { return attachments_; }

    // Logical connection between two connection ports
    EdgeId connect(const std::string& source_part, const std::string& source_port,
                   const std::string& destination_part, const std::string& destination_port);
    const ConnectionEdge& connection(EdgeId id) const;
    size_t connection_count() const { return connections_.size(); }
    const std::vector<ConnectionEdge>& connections() const { return connections_; }

    // Edges touching a part, in edge order
    std::vector<EdgeId> attachments_for_part(PartId id) const;
    std::vector<EdgeId> connections_for_part(PartId id) const;

    // Human readable "part#point <-> part#point"
    std::string describe(const AttachmentEdge& edge) const;
    std::string describe(const ConnectionEdge& edge) const;

    std::set<std::string> free_parameter_names() const;
    bool is_resolved() const { return free_parameter_names().empty(); }

    // Substitute a free parameter everywhere; returns number of replaced values
    std::size_t bind(const std::string& parameter, double value);

    bool operator==(const AssemblyGraph& other) const;
    bool operator!=(const AssemblyGraph& other) const { return !(*this == other); }

private:
    PartId require_part(const std::string& name, const std::string& context) const;

    std::string name_;
    std::vector<Part> parts_;
    std::vector<AttachmentEdge> attachments_;
    std::vector<ConnectionEdge> connections_;

    // Mapping from part name to PartId for quick lookup
    std::unordered_map<std::string, PartId> part_index_;
};

}  // namespace symparts

#endif // SYMPARTS_ASSEMBLY_ASSEMBLY_GRAPH_HPP
