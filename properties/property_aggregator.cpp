#include "property_aggregator.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>

namespace symparts {

void CompensatedSum::add(double value) {
    double t = sum_ + value;
    if (std::abs(sum_) >= std::abs(value)) {
        compensation_ += (sum_ - t) + value;
    } else {
        compensation_ += (value - t) + sum_;
    }
    sum_ = t;
}

namespace {

// Sum of the selected per-part value; unresolved if any selected part lacks it
Aggregate<double> total(const std::vector<const PartProperties*>& parts,
                        std::optional<double> PartProperties::*member,
                        bool exposed_only) {
    Aggregate<double> result;
    CompensatedSum sum;
    for (const PartProperties* part : parts) {
        if (exposed_only && !part->is_exposed) {
            continue;
        }
        const auto& value = part->*member;
        if (value) {
            sum.add(*value);
        } else {
            result.unresolved_parts.push_back(part->name);
        }
    }
    if (result.unresolved_parts.empty()) {
        result.value = sum.result();
    }
    return result;
}

// Weighted mean of a per-part point
Aggregate<Vec3> weighted_center(const std::vector<const PartProperties*>& parts,
                                std::optional<double> PartProperties::*weight,
                                std::optional<Vec3> PartProperties::*point,
                                bool exposed_only) {
    Aggregate<Vec3> result;
    CompensatedSum total_weight;
    CompensatedSum x, y, z;
    for (const PartProperties* part : parts) {
        if (exposed_only && !part->is_exposed) {
            continue;
        }
        const auto& w = part->*weight;
        const auto& p = part->*point;
        if (!w || !p) {
            result.unresolved_parts.push_back(part->name);
            continue;
        }
        total_weight.add(*w);
        x.add(*w * p->x);
        y.add(*w * p->y);
        z.add(*w * p->z);
    }
    double denominator = total_weight.result();
    if (result.unresolved_parts.empty() && denominator > 0.0) {
        result.value = Vec3(x.result(), y.result(), z.result()) / denominator;
    }
    return result;
}

}  // namespace

PartProperties PropertyAggregator::part_properties(const Part& part, const PartTransform* transform) const {
    catalog_.validate(part);
    const GeometryCapability& capability = catalog_.capability_for(part);

    PartProperties props;
    props.name = part.name;
    props.type = part.type;
    props.is_exposed = part.is_exposed;

    std::optional<ResolvedGeometry> geometry;
    try {
        geometry = part.geometry.resolve(part.name);
    } catch (const UnresolvedParameterError& e) {
        props.unresolved_field = e.field();
    }

    if (geometry) {
        props.material_volume = capability.material_volume(*geometry);
        props.displaced_volume = capability.displaced_volume(*geometry);
        props.surface_area = capability.surface_area(*geometry);
        if (transform != nullptr) {
            props.center_of_gravity = transform->to_world(capability.local_center_of_gravity(*geometry));
            props.center_of_buoyancy = transform->to_world(capability.local_center_of_buoyancy(*geometry));
        }
    }

    if (part.material_density.is_resolved()) {
        if (props.material_volume) {
            props.mass = part.material_density.value() * *props.material_volume;
        }
    } else if (!props.unresolved_field) {
        props.unresolved_field = part.name + ".material_density";
    }

    return props;
}

PropertyReport PropertyAggregator::aggregate(const AssemblyGraph& graph) const {
    auto log = logging::get_logger();

    // Document errors are not tolerated; only placement failures are
    catalog_.validate(graph);

    std::optional<PlacementMap> placements;
    std::optional<std::string> placement_error;
    try {
        placements = PlacementResolver(catalog_, order_).resolve(graph);
    } catch (const AssemblyError& e) {
        log->warn("Centers of \"{}\" left unresolved: {}", graph.name(), e.what());
        placement_error = e.what();
    }

    PropertyReport report = aggregate_impl(graph, placements ? &*placements : nullptr);
    report.placement_error = placement_error;
    return report;
}

PropertyReport PropertyAggregator::aggregate(const AssemblyGraph& graph, const PlacementMap& placements) const {
    return aggregate_impl(graph, &placements);
}

PropertyReport PropertyAggregator::aggregate_impl(const AssemblyGraph& graph,
                                                  const PlacementMap* placements) const {
    auto log = logging::get_logger();

    PropertyReport report;
    report.assembly = graph.name();
    report.parts.reserve(graph.part_count());
    for (const auto& part : graph.parts()) {
        const PartTransform* transform = nullptr;
        if (placements != nullptr && placements->contains(part.name)) {
            transform = &placements->at(part.name);
        }
        report.parts.push_back(part_properties(part, transform));
    }

    // Totals do not depend on part order
    std::vector<const PartProperties*> sorted;
    sorted.reserve(report.parts.size());
    for (const auto& props : report.parts) {
        sorted.push_back(&props);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const PartProperties* a, const PartProperties* b) { return a->name < b->name; });

    report.mass = total(sorted, &PartProperties::mass, false);
    report.material_volume = total(sorted, &PartProperties::material_volume, false);
    report.displaced_volume = total(sorted, &PartProperties::displaced_volume, true);
    report.surface_area = total(sorted, &PartProperties::surface_area, true);
    report.center_of_gravity = weighted_center(sorted, &PartProperties::mass,
                                               &PartProperties::center_of_gravity, false);
    report.center_of_buoyancy = weighted_center(sorted, &PartProperties::displaced_volume,
                                                &PartProperties::center_of_buoyancy, true);

    if (!report.mass.is_resolved()) {
        log->debug("Mass of \"{}\" unresolved for {} parts", graph.name(),
                   report.mass.unresolved_parts.size());
    }
    return report;
}

}  // namespace symparts
