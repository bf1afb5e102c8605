#ifndef SYMPARTS_SHAPES_GEOMETRY_CAPABILITY_HPP
#define SYMPARTS_SHAPES_GEOMETRY_CAPABILITY_HPP

#include <math/vec3.hpp>
#include <symbolic/geometry_descriptor.hpp>
#include <string>
#include <vector>

namespace symparts {

// Closed-form geometry of one part type.
//
// All quantities are expressed in the part's local frame: the minimum corner
// of the bounding box sits at the origin and the box extends along +x, +y, +z.
// Inputs are fully resolved; callers resolve the descriptor first so that a
// free parameter is reported with its field path.
class GeometryCapability {
public:
    virtual ~GeometryCapability() = default;

    // Dotted "category.Kind" identifier
    virtual std::string type_id() const = 0;

    // Exact set of geometry fields a part of this type declares
    virtual std::vector<std::string> fields() const = 0;

    // Size of the bounding box along x, y, z
    virtual Vec3 bounding_extents(const ResolvedGeometry& g) const = 0;

    // Volume of material (shell only for hollow shapes)
    virtual double material_volume(const ResolvedGeometry& g) const = 0;

    // Volume of fluid displaced when submerged
    virtual double displaced_volume(const ResolvedGeometry& g) const = 0;

    virtual double surface_area(const ResolvedGeometry& g) const = 0;

    virtual Vec3 local_center_of_gravity(const ResolvedGeometry& g) const = 0;

    // Centroid of the displaced volume; matches the center of gravity for
    // shapes whose material is symmetric about it
    virtual Vec3 local_center_of_buoyancy(const ResolvedGeometry& g) const {
        return local_center_of_gravity(g);
    }
};

}  // namespace symparts

#endif // SYMPARTS_SHAPES_GEOMETRY_CAPABILITY_HPP
