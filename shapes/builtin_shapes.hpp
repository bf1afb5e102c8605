#ifndef SYMPARTS_SHAPES_BUILTIN_SHAPES_HPP
#define SYMPARTS_SHAPES_BUILTIN_SHAPES_HPP

#include "geometry_capability.hpp"

namespace symparts {

class PartCatalog;

// Registers every shape below into the catalog
void register_builtin_shapes(PartCatalog& catalog);

// Hollow cylinder closed by two semi-ellipsoidal end caps, axis along z.
// Fields: cylinder_radius, cylinder_length, endcap_length, thickness
class CapsuleShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Capsule"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Solid cylinder, axis along z. Fields: radius, height
class CylinderShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Cylinder"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Open-ended tube, axis along z. Fields: radius, height, thickness
class PipeShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Pipe"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Solid sphere. Fields: radius
class SphereShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Sphere"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Solid rectangular block. Fields: length (x), width (y), height (z)
class CuboidShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Cuboid"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Closed hollow box with uniform wall thickness.
// Fields: length, width, height, thickness
class BoxShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Box"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Solid conical frustum standing on its bottom face.
// Fields: bottom_radius, top_radius, height
class ConeShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Cone"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Solid torus lying in the xy plane. Fields: hole_radius, tube_radius
class TorusShape : public GeometryCapability {
public:
    std::string type_id() const override { return "generic.Torus"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

// Hollow hemispherical end cap, dome toward +z. Fields: radius, thickness
class HemisphereShape : public GeometryCapability {
public:
    std::string type_id() const override { return "endcaps.Hemisphere"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_buoyancy(const ResolvedGeometry& g) const override;
};

// Flat disc whose rim is rounded by a quarter torus. Fields: radius, thickness
class FlangedFlatPlateShape : public GeometryCapability {
public:
    std::string type_id() const override { return "endcaps.FlangedFlatPlate"; }
    std::vector<std::string> fields() const override;
    Vec3 bounding_extents(const ResolvedGeometry& g) const override;
    double material_volume(const ResolvedGeometry& g) const override;
    double displaced_volume(const ResolvedGeometry& g) const override;
    double surface_area(const ResolvedGeometry& g) const override;
    Vec3 local_center_of_gravity(const ResolvedGeometry& g) const override;
};

}  // namespace symparts

#endif // SYMPARTS_SHAPES_BUILTIN_SHAPES_HPP
