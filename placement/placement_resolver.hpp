#ifndef SYMPARTS_PLACEMENT_PLACEMENT_RESOLVER_HPP
#define SYMPARTS_PLACEMENT_PLACEMENT_RESOLVER_HPP

#include <assembly/assembly_graph.hpp>
#include <math/rotation.hpp>
#include <math/vec3.hpp>
#include <shapes/part_catalog.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace symparts {

enum class TraversalOrder {
    BreadthFirst,
    DepthFirst
};

// Absolute placement of one part: world = translation + rotation * local,
// where local is measured from the min corner of the part's bounding box.
struct PartTransform {
    Vec3 translation;
    Rotation rotation;
    Mat3 matrix;             // rotation.matrix(), cached
    Vec3 extents;            // Bounding extents used to scale normalized points
    Vec3 local_origin;       // Normalized point the part was placed by
    Vec3 placement;          // World position of local_origin

    // World position of a normalized [0, 1] point of the part
    Vec3 apply(const Vec3& normalized_point) const {
        return to_world(normalized_point.hadamard(extents));
    }

    // World position of an offset from the part's min corner
    Vec3 to_world(const Vec3& local_offset) const {
        return translation + matrix * local_offset;
    }

    bool operator==(const PartTransform& other) const = default;
};

struct PlacementMap {
    std::string root;
    std::vector<std::string> order;                     // Traversal order, root first
    std::map<std::string, PartTransform> transforms;

    bool contains(const std::string& part_name) const { return transforms.count(part_name) > 0; }
    const PartTransform& at(const std::string& part_name) const;
    size_t size() const { return transforms.size(); }

    bool operator==(const PlacementMap& other) const = default;
};

// Result of resolving one graph of a batch
struct PlacementOutcome {
    std::optional<PlacementMap> placements;
    std::string error_kind;
    std::string error_message;

    bool ok() const { return placements.has_value(); }
};

// World axis-aligned box around every placed part
struct AssemblyBounds {
    Vec3 min;
    Vec3 max;

    Vec3 size() const { return max - min; }
    double length() const { return max.x - min.x; }
    double width() const { return max.y - min.y; }
    double height() const { return max.z - min.z; }
};

// Computes every part's absolute transform from the single anchor part and
// the attachment tree. The resolver is stateless apart from its options.
class PlacementResolver {
public:
    explicit PlacementResolver(const PartCatalog& catalog,
                               TraversalOrder order = TraversalOrder::BreadthFirst)
        : catalog_(catalog), order_(order) {}

    TraversalOrder traversal_order() const { return order_; }

    // Throws NoRootError, AmbiguousRootError, CyclicAttachmentError,
    // DisconnectedPartError or UnresolvedParameterError
    PlacementMap resolve(const AssemblyGraph& graph) const;

    // The unique part with fully resolved static origin and placement
    PartId find_anchor(const AssemblyGraph& graph) const;

    // Resolve independent graphs in parallel; num_threads <= 0 uses the
    // OpenMP default. Errors are captured per graph.
    std::vector<PlacementOutcome> resolve_batch(const std::vector<AssemblyGraph>& graphs,
                                                int num_threads = 0) const;

private:
    struct TreeLink {
        PartId part;
        std::optional<EdgeId> parent_edge;   // Empty for the anchor
    };

    // Spanning tree of the attachment edges reachable from the anchor
    std::vector<TreeLink> build_tree(const AssemblyGraph& graph, PartId anchor) const;

    Vec3 part_extents(const Part& part) const;

    const PartCatalog& catalog_;
    TraversalOrder order_;
};

// Uses the 8 transformed corners of each part's bounding box
AssemblyBounds assembly_bounds(const PlacementMap& placements);

const char* to_string(TraversalOrder order);
TraversalOrder traversal_order_from_string(const std::string& name);

}  // namespace symparts

#endif // SYMPARTS_PLACEMENT_PLACEMENT_RESOLVER_HPP
