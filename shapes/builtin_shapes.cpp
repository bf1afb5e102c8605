#include "builtin_shapes.hpp"
#include "part_catalog.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <numbers>

namespace symparts {

namespace {

constexpr double pi = std::numbers::pi;

}  // namespace

void register_builtin_shapes(PartCatalog& catalog) {
    catalog.add(std::make_unique<BoxShape>());
    catalog.add(std::make_unique<CapsuleShape>());
    catalog.add(std::make_unique<ConeShape>());
    catalog.add(std::make_unique<CuboidShape>());
    catalog.add(std::make_unique<CylinderShape>());
    catalog.add(std::make_unique<PipeShape>());
    catalog.add(std::make_unique<SphereShape>());
    catalog.add(std::make_unique<TorusShape>());
    catalog.add(std::make_unique<HemisphereShape>());
    catalog.add(std::make_unique<FlangedFlatPlateShape>());
}

// Capsule

std::vector<std::string> CapsuleShape::fields() const {
    return {"cylinder_radius", "cylinder_length", "endcap_length", "thickness"};
}

Vec3 CapsuleShape::bounding_extents(const ResolvedGeometry& g) const {
    double diameter = 2.0 * g.get("cylinder_radius");
    return Vec3(diameter, diameter, g.get("cylinder_length") + 2.0 * g.get("endcap_length"));
}

double CapsuleShape::displaced_volume(const ResolvedGeometry& g) const {
    double r = g.get("cylinder_radius");
    return pi * r * r * g.get("cylinder_length") +
           (4.0 * pi / 3.0) * g.get("endcap_length") * r * r;
}

double CapsuleShape::material_volume(const ResolvedGeometry& g) const {
    double t = g.get("thickness");
    double inner_r = g.get("cylinder_radius") - t;
    double inner_e = g.get("endcap_length") - t;
    return displaced_volume(g) -
           (pi * inner_r * inner_r * g.get("cylinder_length") +
            (4.0 * pi / 3.0) * inner_e * inner_r * inner_r);
}

double CapsuleShape::surface_area(const ResolvedGeometry& g) const {
    double r = g.get("cylinder_radius");
    double e = g.get("endcap_length");
    // Knud Thomsen approximation for the spheroid formed by both end caps
    constexpr double p = 1.6;
    double spheroid = 4.0 * pi * std::pow((2.0 * std::pow(e * r, p) + std::pow(r, 2.0 * p)) / 3.0, 1.0 / p);
    return 2.0 * pi * r * g.get("cylinder_length") + spheroid;
}

Vec3 CapsuleShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    double r = g.get("cylinder_radius");
    return Vec3(r, r, g.get("endcap_length") + 0.5 * g.get("cylinder_length"));
}

// Cylinder

std::vector<std::string> CylinderShape::fields() const {
    return {"radius", "height"};
}

Vec3 CylinderShape::bounding_extents(const ResolvedGeometry& g) const {
    double diameter = 2.0 * g.get("radius");
    return Vec3(diameter, diameter, g.get("height"));
}

double CylinderShape::displaced_volume(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return pi * r * r * g.get("height");
}

double CylinderShape::material_volume(const ResolvedGeometry& g) const {
    return displaced_volume(g);
}

double CylinderShape::surface_area(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return 2.0 * pi * r * g.get("height") + 2.0 * pi * r * r;
}

Vec3 CylinderShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    return bounding_extents(g) * 0.5;
}

// Pipe

std::vector<std::string> PipeShape::fields() const {
    return {"radius", "height", "thickness"};
}

Vec3 PipeShape::bounding_extents(const ResolvedGeometry& g) const {
    double diameter = 2.0 * g.get("radius");
    return Vec3(diameter, diameter, g.get("height"));
}

double PipeShape::displaced_volume(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return pi * r * r * g.get("height");
}

double PipeShape::material_volume(const ResolvedGeometry& g) const {
    double inner = g.get("radius") - g.get("thickness");
    return displaced_volume(g) - pi * inner * inner * g.get("height");
}

double PipeShape::surface_area(const ResolvedGeometry& g) const {
    return 2.0 * pi * g.get("radius") * g.get("height");
}

Vec3 PipeShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    return bounding_extents(g) * 0.5;
}

// Sphere

std::vector<std::string> SphereShape::fields() const {
    return {"radius"};
}

Vec3 SphereShape::bounding_extents(const ResolvedGeometry& g) const {
    double diameter = 2.0 * g.get("radius");
    return Vec3(diameter, diameter, diameter);
}

double SphereShape::displaced_volume(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return (4.0 / 3.0) * pi * r * r * r;
}

double SphereShape::material_volume(const ResolvedGeometry& g) const {
    return displaced_volume(g);
}

double SphereShape::surface_area(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return 4.0 * pi * r * r;
}

Vec3 SphereShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return Vec3(r, r, r);
}

// Cuboid

std::vector<std::string> CuboidShape::fields() const {
    return {"length", "width", "height"};
}

Vec3 CuboidShape::bounding_extents(const ResolvedGeometry& g) const {
    return Vec3(g.get("length"), g.get("width"), g.get("height"));
}

double CuboidShape::displaced_volume(const ResolvedGeometry& g) const {
    return g.get("length") * g.get("width") * g.get("height");
}

double CuboidShape::material_volume(const ResolvedGeometry& g) const {
    return displaced_volume(g);
}

double CuboidShape::surface_area(const ResolvedGeometry& g) const {
    double l = g.get("length");
    double w = g.get("width");
    double h = g.get("height");
    return 2.0 * (l * w + l * h + w * h);
}

Vec3 CuboidShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    return bounding_extents(g) * 0.5;
}

// Box

std::vector<std::string> BoxShape::fields() const {
    return {"length", "width", "height", "thickness"};
}

Vec3 BoxShape::bounding_extents(const ResolvedGeometry& g) const {
    return Vec3(g.get("length"), g.get("width"), g.get("height"));
}

double BoxShape::displaced_volume(const ResolvedGeometry& g) const {
    return g.get("length") * g.get("width") * g.get("height");
}

double BoxShape::material_volume(const ResolvedGeometry& g) const {
    double wall = 2.0 * g.get("thickness");
    return displaced_volume(g) -
           (g.get("length") - wall) * (g.get("width") - wall) * (g.get("height") - wall);
}

double BoxShape::surface_area(const ResolvedGeometry& g) const {
    double l = g.get("length");
    double w = g.get("width");
    double h = g.get("height");
    return 2.0 * (l * w + l * h + w * h);
}

Vec3 BoxShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    return bounding_extents(g) * 0.5;
}

// Cone

std::vector<std::string> ConeShape::fields() const {
    return {"bottom_radius", "top_radius", "height"};
}

Vec3 ConeShape::bounding_extents(const ResolvedGeometry& g) const {
    double diameter = 2.0 * std::max(g.get("bottom_radius"), g.get("top_radius"));
    return Vec3(diameter, diameter, g.get("height"));
}

double ConeShape::displaced_volume(const ResolvedGeometry& g) const {
    double rb = g.get("bottom_radius");
    double rt = g.get("top_radius");
    return (pi * g.get("height") / 3.0) * (rb * rb + rt * rt + rb * rt);
}

double ConeShape::material_volume(const ResolvedGeometry& g) const {
    return displaced_volume(g);
}

double ConeShape::surface_area(const ResolvedGeometry& g) const {
    double rb = g.get("bottom_radius");
    double rt = g.get("top_radius");
    double h = g.get("height");
    double slant = std::sqrt(h * h + (rb - rt) * (rb - rt));
    return pi * (rb * rb + rt * rt) + pi * (rb + rt) * slant;
}

Vec3 ConeShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    double rb = g.get("bottom_radius");
    double rt = g.get("top_radius");
    double h = g.get("height");
    double axis = std::max(rb, rt);
    double denominator = 4.0 * (rb * rb + rb * rt + rt * rt);
    double z = denominator > 0.0 ? h * (rb * rb + 2.0 * rb * rt + 3.0 * rt * rt) / denominator
                                 : 0.5 * h;
    return Vec3(axis, axis, z);
}

// Torus

std::vector<std::string> TorusShape::fields() const {
    return {"hole_radius", "tube_radius"};
}

Vec3 TorusShape::bounding_extents(const ResolvedGeometry& g) const {
    double span = 2.0 * g.get("hole_radius") + 4.0 * g.get("tube_radius");
    return Vec3(span, span, 2.0 * g.get("tube_radius"));
}

double TorusShape::displaced_volume(const ResolvedGeometry& g) const {
    double t = g.get("tube_radius");
    return (pi * t * t) * (2.0 * pi * (g.get("hole_radius") + t));
}

double TorusShape::material_volume(const ResolvedGeometry& g) const {
    return displaced_volume(g);
}

double TorusShape::surface_area(const ResolvedGeometry& g) const {
    double t = g.get("tube_radius");
    return (2.0 * pi * (g.get("hole_radius") + t)) * (2.0 * pi * t);
}

Vec3 TorusShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    return bounding_extents(g) * 0.5;
}

// Hemisphere

std::vector<std::string> HemisphereShape::fields() const {
    return {"radius", "thickness"};
}

Vec3 HemisphereShape::bounding_extents(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return Vec3(2.0 * r, 2.0 * r, r);
}

double HemisphereShape::displaced_volume(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return (2.0 * pi / 3.0) * r * r * r;
}

double HemisphereShape::material_volume(const ResolvedGeometry& g) const {
    double inner = g.get("radius") - g.get("thickness");
    return displaced_volume(g) - (2.0 * pi / 3.0) * inner * inner * inner;
}

double HemisphereShape::surface_area(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return 2.0 * pi * r * r;
}

Vec3 HemisphereShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return Vec3(r, r, 0.5 * r);
}

// Centroid of a solid hemisphere
Vec3 HemisphereShape::local_center_of_buoyancy(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return Vec3(r, r, 3.0 * r / 8.0);
}

// Flanged flat plate

std::vector<std::string> FlangedFlatPlateShape::fields() const {
    return {"radius", "thickness"};
}

Vec3 FlangedFlatPlateShape::bounding_extents(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return Vec3(2.0 * r, 2.0 * r, g.get("thickness"));
}

double FlangedFlatPlateShape::displaced_volume(const ResolvedGeometry& g) const {
    double t = g.get("thickness");
    double core = g.get("radius") - t;
    return pi * core * core * t + (0.25 * pi * t * t) * (2.0 * pi * (core + t));
}

double FlangedFlatPlateShape::material_volume(const ResolvedGeometry& g) const {
    return displaced_volume(g);
}

double FlangedFlatPlateShape::surface_area(const ResolvedGeometry& g) const {
    double t = g.get("thickness");
    double core = g.get("radius") - t;
    return pi * core * core + (2.0 * pi * (core + t)) * (2.0 * pi * t) * 0.25;
}

Vec3 FlangedFlatPlateShape::local_center_of_gravity(const ResolvedGeometry& g) const {
    double r = g.get("radius");
    return Vec3(r, r, 0.5 * g.get("thickness"));
}

}  // namespace symparts
