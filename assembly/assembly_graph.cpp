#include "assembly_graph.hpp"
#include <common/errors.hpp>
#include <stdexcept>

namespace symparts {

PartId AssemblyGraph::add_part(const Part& part) {
    if (part.name.empty()) {
        throw MalformedDocumentError("parts", "part name must not be empty");
    }
    if (has_part(part.name)) {
        throw MalformedDocumentError(part.name, "duplicate part name");
    }
    part.check_material_density();
    PartId id = static_cast<PartId>(parts_.size());
    parts_.push_back(part);
    part_index_[part.name] = id;
    return id;
}

const Part& AssemblyGraph::part(PartId id) const {
    if (id >= parts_.size()) {
        throw std::out_of_range("AssemblyGraph::part: invalid part id");
    }
    return parts_[id];
}

const Part& AssemblyGraph::part(const std::string& name) const {
    auto it = part_index_.find(name);
    if (it == part_index_.end()) {
        throw std::out_of_range("AssemblyGraph::part: no part named " + name);
    }
    return parts_[it->second];
}

std::optional<PartId> AssemblyGraph::find_part(const std::string& name) const {
    auto it = part_index_.find(name);
    if (it == part_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PartId AssemblyGraph::require_part(const std::string& name, const std::string& context) const {
    auto it = part_index_.find(name);
    if (it == part_index_.end()) {
        throw MalformedDocumentError(context, "references unknown part \"" + name + "\"");
    }
    return it->second;
}

EdgeId AssemblyGraph::attach(const std::string& source_part, const std::string& source_point,
                             const std::string& destination_part, const std::string& destination_point) {
    std::string context = "attachments[" + std::to_string(attachments_.size()) + "]";
    PartId src = require_part(source_part, context);
    PartId dst = require_part(destination_part, context);
    if (src == dst) {
        throw MalformedDocumentError(context, "part \"" + source_part + "\" cannot be attached to itself");
    }
    if (parts_[src].find_attachment_point(source_point) == nullptr) {
        throw MalformedDocumentError(context, "part \"" + source_part +
                                     "\" has no attachment point \"" + source_point + "\"");
    }
    if (parts_[dst].find_attachment_point(destination_point) == nullptr) {
        throw MalformedDocumentError(context, "part \"" + destination_part +
                                     "\" has no attachment point \"" + destination_point + "\"");
    }

    AttachmentEdge edge;
    edge.id = static_cast<EdgeId>(attachments_.size());
    edge.source_part = src;
    edge.source_point = source_point;
    edge.destination_part = dst;
    edge.destination_point = destination_point;
    attachments_.push_back(edge);
    return edge.id;
}

const AttachmentEdge& AssemblyGraph::attachment(EdgeId id) const {
    if (id >= attachments_.size()) {
        throw std::out_of_range("AssemblyGraph::attachment: invalid edge id");
    }
    return attachments_[id];
}

EdgeId AssemblyGraph::connect(const std::string& source_part, const std::string& source_port,
                              const std::string& destination_part, const std::string& destination_port) {
    std::string context = "connections[" + std::to_string(connections_.size()) + "]";
    PartId src = require_part(source_part, context);
    PartId dst = require_part(destination_part, context);
    if (src == dst) {
        throw MalformedDocumentError(context, "part \"" + source_part + "\" cannot be connected to itself");
    }
    if (parts_[src].find_connection_port(source_port) == nullptr) {
        throw MalformedDocumentError(context, "part \"" + source_part +
                                     "\" has no connection port \"" + source_port + "\"");
    }
    if (parts_[dst].find_connection_port(destination_port) == nullptr) {
        throw MalformedDocumentError(context, "part \"" + destination_part +
                                     "\" has no connection port \"" + destination_port + "\"");
    }

    ConnectionEdge edge;
    edge.id = static_cast<EdgeId>(connections_.size());
    edge.source_part = src;
    edge.source_port = source_port;
    edge.destination_part = dst;
    edge.destination_port = destination_port;
    connections_.push_back(edge);
    return edge.id;
}

const ConnectionEdge& AssemblyGraph::connection(EdgeId id) const {
    if (id >= connections_.size()) {
        throw std::out_of_range("AssemblyGraph::connection: invalid edge id");
    }
    return connections_[id];
}

std::vector<EdgeId> AssemblyGraph::attachments_for_part(PartId id) const {
    std::vector<EdgeId> result;
    for (const auto& edge : attachments_) {
        if (edge.source_part == id || edge.destination_part == id) {
            result.push_back(edge.id);
        }
    }
    return result;
}

std::vector<EdgeId> AssemblyGraph::connections_for_part(PartId id) const {
    std::vector<EdgeId> result;
    for (const auto& edge : connections_) {
        if (edge.source_part == id || edge.destination_part == id) {
            result.push_back(edge.id);
        }
    }
    return result;
}

std::string AssemblyGraph::describe(const AttachmentEdge& edge) const {
    return part(edge.source_part).name + "#" + edge.source_point + " <-> " +
           part(edge.destination_part).name + "#" + edge.destination_point;
}

std::string AssemblyGraph::describe(const ConnectionEdge& edge) const {
    return part(edge.source_part).name + "#" + edge.source_port + " <-> " +
           part(edge.destination_part).name + "#" + edge.destination_port;
}

std::set<std::string> AssemblyGraph::free_parameter_names() const {
    std::set<std::string> names;
    for (const auto& p : parts_) {
        p.collect_free_parameters(names);
    }
    return names;
}

std::size_t AssemblyGraph::bind(const std::string& parameter, double value) {
    std::size_t count = 0;
    for (auto& p : parts_) {
        count += p.bind(parameter, value);
    }
    return count;
}

bool AssemblyGraph::operator==(const AssemblyGraph& other) const {
    return name_ == other.name_ &&
           parts_ == other.parts_ &&
           attachments_ == other.attachments_ &&
           connections_ == other.connections_;
}

}  // namespace symparts
