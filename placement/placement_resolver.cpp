#include "placement_resolver.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <deque>
#include <limits>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace symparts {

const PartTransform& PlacementMap::at(const std::string& part_name) const {
    auto it = transforms.find(part_name);
    if (it == transforms.end()) {
        throw std::out_of_range("PlacementMap::at: no transform for part " + part_name);
    }
    return it->second;
}

PartId PlacementResolver::find_anchor(const AssemblyGraph& graph) const {
    std::vector<PartId> anchors;
    for (PartId id = 0; id < graph.part_count(); ++id) {
        if (graph.part(id).is_anchor()) {
            anchors.push_back(id);
        }
    }

    if (anchors.empty()) {
        throw NoRootError(graph.name());
    }
    if (anchors.size() > 1) {
        std::vector<std::string> names;
        for (PartId id : anchors) {
            names.push_back(graph.part(id).name);
        }
        throw AmbiguousRootError(names);
    }
    return anchors.front();
}

std::vector<PlacementResolver::TreeLink> PlacementResolver::build_tree(const AssemblyGraph& graph,
                                                                       PartId anchor) const {
    auto log = logging::get_logger();

    const size_t n = graph.part_count();
    std::vector<bool> visited(n, false);
    std::vector<std::optional<EdgeId>> parent_edge(n);
    std::vector<TreeLink> tree;
    tree.reserve(n);

    // Front for BFS, back for DFS
    std::deque<PartId> pending;
    pending.push_back(anchor);
    visited[anchor] = true;

    while (!pending.empty()) {
        PartId current;
        if (order_ == TraversalOrder::BreadthFirst) {
            current = pending.front();
            pending.pop_front();
        } else {
            current = pending.back();
            pending.pop_back();
        }
        tree.push_back({current, parent_edge[current]});

        for (EdgeId edge_id : graph.attachments_for_part(current)) {
            if (parent_edge[current] == edge_id) {
                continue;
            }
            const AttachmentEdge& edge = graph.attachment(edge_id);
            PartId next = edge.other(current);
            if (visited[next]) {
                throw CyclicAttachmentError(graph.describe(edge));
            }
            visited[next] = true;
            parent_edge[next] = edge_id;
            pending.push_back(next);
        }
    }

    if (tree.size() != n) {
        std::vector<std::string> unreached;
        for (PartId id = 0; id < n; ++id) {
            if (!visited[id]) {
                unreached.push_back(graph.part(id).name);
            }
        }
        throw DisconnectedPartError(unreached);
    }

    log->debug("Attachment tree of \"{}\": {} parts from anchor {} ({})",
               graph.name(), tree.size(), graph.part(anchor).name, to_string(order_));
    return tree;
}

Vec3 PlacementResolver::part_extents(const Part& part) const {
    catalog_.validate(part);
    const GeometryCapability& capability = catalog_.capability_for(part);
    return capability.bounding_extents(part.geometry.resolve(part.name));
}

PlacementMap PlacementResolver::resolve(const AssemblyGraph& graph) const {
    PartId anchor = find_anchor(graph);
    std::vector<TreeLink> tree = build_tree(graph, anchor);

    PlacementMap result;
    result.root = graph.part(anchor).name;

    for (const TreeLink& link : tree) {
        const Part& part = graph.part(link.part);

        PartTransform transform;
        transform.rotation = part.orientation.resolve(part.name + ".orientation");
        transform.matrix = transform.rotation.matrix();
        transform.extents = part_extents(part);

        if (!link.parent_edge) {
            transform.local_origin = part.static_origin->resolve(part.name + ".static_origin");
            transform.placement = part.static_placement->resolve(part.name + ".static_placement");
        } else {
            // Parent is earlier in the tree, so its transform already exists
            const AttachmentEdge& edge = graph.attachment(*link.parent_edge);
            bool is_source = edge.source_part == link.part;
            const Part& parent = graph.part(edge.other(link.part));
            const std::string& parent_point = is_source ? edge.destination_point : edge.source_point;
            const std::string& own_point = is_source ? edge.source_point : edge.destination_point;

            Vec3 parent_normalized = parent.find_attachment_point(parent_point)->position
                .resolve_normalized(parent.name + ".attachment_points." + parent_point);
            transform.local_origin = part.find_attachment_point(own_point)->position
                .resolve_normalized(part.name + ".attachment_points." + own_point);
            transform.placement = result.transforms.at(parent.name).apply(parent_normalized);
        }

        transform.translation = transform.placement -
                                transform.matrix * transform.local_origin.hadamard(transform.extents);

        result.order.push_back(part.name);
        result.transforms.emplace(part.name, transform);
    }

    return result;
}

std::vector<PlacementOutcome> PlacementResolver::resolve_batch(const std::vector<AssemblyGraph>& graphs,
                                                               int num_threads) const {
    auto log = logging::get_logger();
    std::vector<PlacementOutcome> outcomes(graphs.size());

    #ifdef _OPENMP
    int use_threads = (num_threads > 0) ? num_threads : omp_get_max_threads();
    log->debug("Resolving {} assemblies with {} OpenMP threads", graphs.size(), use_threads);
    #else
    (void)num_threads;
    log->debug("Resolving {} assemblies single-threaded (OpenMP not available)", graphs.size());
    #endif

    // Exceptions must not leave the parallel region; each one is captured in its outcome
    #pragma omp parallel for schedule(dynamic) num_threads(use_threads) if(graphs.size() > 1)
    for (long i = 0; i < static_cast<long>(graphs.size()); ++i) {
        PlacementOutcome& outcome = outcomes[static_cast<size_t>(i)];
        try {
            outcome.placements = resolve(graphs[static_cast<size_t>(i)]);
        } catch (const AssemblyError& e) {
            outcome.error_kind = e.kind();
            outcome.error_message = e.what();
        } catch (const std::exception& e) {
            outcome.error_kind = "std::exception";
            outcome.error_message = e.what();
        }
    }

    size_t failures = std::count_if(outcomes.begin(), outcomes.end(),
                                    [](const PlacementOutcome& o) { return !o.ok(); });
    if (failures > 0) {
        log->warn("{} of {} assemblies could not be placed", failures, graphs.size());
    }
    return outcomes;
}

AssemblyBounds assembly_bounds(const PlacementMap& placements) {
    if (placements.transforms.empty()) {
        return AssemblyBounds{};
    }

    constexpr double inf = std::numeric_limits<double>::infinity();
    AssemblyBounds bounds{Vec3(inf, inf, inf), Vec3(-inf, -inf, -inf)};

    for (const auto& [name, transform] : placements.transforms) {
        for (int corner = 0; corner < 8; ++corner) {
            Vec3 normalized((corner & 1) ? 1.0 : 0.0,
                            (corner & 2) ? 1.0 : 0.0,
                            (corner & 4) ? 1.0 : 0.0);
            Vec3 world = transform.apply(normalized);
            bounds.min = Vec3(std::min(bounds.min.x, world.x),
                              std::min(bounds.min.y, world.y),
                              std::min(bounds.min.z, world.z));
            bounds.max = Vec3(std::max(bounds.max.x, world.x),
                              std::max(bounds.max.y, world.y),
                              std::max(bounds.max.z, world.z));
        }
    }

    return bounds;
}

const char* to_string(TraversalOrder order) {
    switch (order) {
        case TraversalOrder::BreadthFirst: return "breadth_first";
        case TraversalOrder::DepthFirst: return "depth_first";
    }
    return "breadth_first";
}

TraversalOrder traversal_order_from_string(const std::string& name) {
    if (name == "breadth_first" || name == "bfs") return TraversalOrder::BreadthFirst;
    if (name == "depth_first" || name == "dfs") return TraversalOrder::DepthFirst;
    throw std::invalid_argument("Unknown traversal order: " + name);
}

}  // namespace symparts
