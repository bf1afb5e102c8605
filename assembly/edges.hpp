#ifndef SYMPARTS_ASSEMBLY_EDGES_HPP
#define SYMPARTS_ASSEMBLY_EDGES_HPP

#include "part.hpp"
#include <cstdint>
#include <string>

namespace symparts {

using EdgeId = uint32_t;

// Rigid joint between two attachment points. Undirected for placement:
// the resolver walks it from whichever side is already placed.
struct AttachmentEdge {
    EdgeId id = 0;
    PartId source_part = 0;
    std::string source_point;
    PartId destination_part = 0;
    std::string destination_point;

    PartId other(PartId part) const {
        return part == source_part ? destination_part : source_part;
    }

    bool operator==(const AttachmentEdge& other) const = default;
};

// Logical/electrical link between two connection ports; no placement effect.
struct ConnectionEdge {
    EdgeId id = 0;
    PartId source_part = 0;
    std::string source_port;
    PartId destination_part = 0;
    std::string destination_port;

    bool operator==(const ConnectionEdge& other) const = default;
};

}  // namespace symparts

#endif // SYMPARTS_ASSEMBLY_EDGES_HPP
