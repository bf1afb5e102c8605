#include <gtest/gtest.h>
#include <shapes/builtin_shapes.hpp>
#include <shapes/part_catalog.hpp>
#include <assembly/assembly_graph.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <numbers>

using namespace symparts;

namespace {

constexpr double pi = std::numbers::pi;

const GeometryCapability& shape(const PartCatalog& catalog, const std::string& type_id) {
    const GeometryCapability* capability = catalog.find(type_id);
    EXPECT_NE(capability, nullptr) << type_id;
    return *capability;
}

}  // namespace

TEST(BuiltinShapes, CatalogContents) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    EXPECT_EQ(catalog.size(), 10u);
    EXPECT_EQ(catalog.type_ids(), (std::vector<std::string>{
        "endcaps.FlangedFlatPlate", "endcaps.Hemisphere",
        "generic.Box", "generic.Capsule", "generic.Cone", "generic.Cuboid",
        "generic.Cylinder", "generic.Pipe", "generic.Sphere", "generic.Torus"}));
    EXPECT_EQ(catalog.find("generic.Hyperboloid"), nullptr);
}

TEST(BuiltinShapes, EmptyCatalogByDefault) {
    PartCatalog catalog;
    EXPECT_EQ(catalog.size(), 0u);
    register_builtin_shapes(catalog);
    EXPECT_TRUE(catalog.has("generic.Capsule"));
}

TEST(BuiltinShapes, DuplicateRegistrationThrows) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    EXPECT_THROW(catalog.add(std::make_unique<SphereShape>()), std::invalid_argument);
    EXPECT_THROW(catalog.add(nullptr), std::invalid_argument);
    EXPECT_EQ(catalog.size(), 10u);
}

TEST(BuiltinShapes, CapsuleMatchesReferenceValues) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    const GeometryCapability& capsule = shape(catalog, "generic.Capsule");
    ResolvedGeometry g = test::make_capsule("c", 0.5, 1.0, 0.25, 0.02, 1200.0).geometry.resolve("c");

    EXPECT_EQ(capsule.bounding_extents(g), Vec3(1.0, 1.0, 1.5));
    EXPECT_NEAR(capsule.displaced_volume(g), 1.0471975511965976, 1e-12);
    EXPECT_NEAR(capsule.material_volume(g), 0.10140223327746889, 1e-12);
    EXPECT_EQ(capsule.local_center_of_gravity(g), Vec3(0.5, 0.5, 0.75));
    EXPECT_EQ(capsule.local_center_of_buoyancy(g), capsule.local_center_of_gravity(g));
}

TEST(BuiltinShapes, CapsuleWithSphericalCapsHasSphereArea) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    ResolvedGeometry g({{"cylinder_radius", 0.5}, {"cylinder_length", 0.0},
                        {"endcap_length", 0.5}, {"thickness", 0.01}});
    EXPECT_NEAR(shape(catalog, "generic.Capsule").surface_area(g), pi, 1e-12);
    EXPECT_NEAR(shape(catalog, "generic.Capsule").displaced_volume(g),
                shape(catalog, "generic.Sphere").displaced_volume(ResolvedGeometry({{"radius", 0.5}})),
                1e-12);
}

TEST(BuiltinShapes, SolidPrimitives) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();

    ResolvedGeometry cuboid({{"length", 2.0}, {"width", 3.0}, {"height", 4.0}});
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Cuboid").displaced_volume(cuboid), 24.0);
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Cuboid").surface_area(cuboid), 52.0);
    EXPECT_EQ(shape(catalog, "generic.Cuboid").local_center_of_gravity(cuboid), Vec3(1.0, 1.5, 2.0));

    ResolvedGeometry cylinder({{"radius", 1.0}, {"height", 2.0}});
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Cylinder").displaced_volume(cylinder), 2.0 * pi);
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Cylinder").surface_area(cylinder), 6.0 * pi);
    EXPECT_EQ(shape(catalog, "generic.Cylinder").bounding_extents(cylinder), Vec3(2.0, 2.0, 2.0));

    ResolvedGeometry sphere({{"radius", 2.0}});
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Sphere").displaced_volume(sphere), 32.0 * pi / 3.0);
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Sphere").surface_area(sphere), 16.0 * pi);
    EXPECT_EQ(shape(catalog, "generic.Sphere").local_center_of_gravity(sphere), Vec3(2.0, 2.0, 2.0));
}

TEST(BuiltinShapes, HollowShapesSubtractTheirCavity) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();

    ResolvedGeometry box({{"length", 2.0}, {"width", 2.0}, {"height", 2.0}, {"thickness", 0.5}});
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Box").displaced_volume(box), 8.0);
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Box").material_volume(box), 7.0);

    ResolvedGeometry pipe({{"radius", 1.0}, {"height", 1.0}, {"thickness", 0.5}});
    EXPECT_DOUBLE_EQ(shape(catalog, "generic.Pipe").material_volume(pipe), 0.75 * pi);

    ResolvedGeometry hemisphere({{"radius", 1.0}, {"thickness", 1.0}});
    const GeometryCapability& dome = shape(catalog, "endcaps.Hemisphere");
    EXPECT_DOUBLE_EQ(dome.material_volume(hemisphere), dome.displaced_volume(hemisphere));
    EXPECT_EQ(dome.bounding_extents(hemisphere), Vec3(2.0, 2.0, 1.0));
    EXPECT_EQ(dome.local_center_of_buoyancy(hemisphere), Vec3(1.0, 1.0, 0.375));
}

TEST(BuiltinShapes, ConeCentroid) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    const GeometryCapability& cone = shape(catalog, "generic.Cone");

    // Solid cone: centroid a quarter of the height above the base
    ResolvedGeometry pointed({{"bottom_radius", 1.0}, {"top_radius", 0.0}, {"height", 4.0}});
    EXPECT_DOUBLE_EQ(cone.local_center_of_gravity(pointed).z, 1.0);
    EXPECT_DOUBLE_EQ(cone.displaced_volume(pointed), 4.0 * pi / 3.0);

    // Equal radii degenerate to a cylinder
    ResolvedGeometry straight({{"bottom_radius", 1.0}, {"top_radius", 1.0}, {"height", 2.0}});
    EXPECT_DOUBLE_EQ(cone.local_center_of_gravity(straight).z, 1.0);
    EXPECT_DOUBLE_EQ(cone.displaced_volume(straight), 2.0 * pi);
    EXPECT_DOUBLE_EQ(cone.surface_area(straight), 6.0 * pi);

    // Inverted cone is as wide as its top
    ResolvedGeometry inverted({{"bottom_radius", 0.5}, {"top_radius", 2.0}, {"height", 1.0}});
    EXPECT_EQ(cone.bounding_extents(inverted), Vec3(4.0, 4.0, 1.0));
}

TEST(BuiltinShapes, Torus) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    const GeometryCapability& torus = shape(catalog, "generic.Torus");
    ResolvedGeometry g({{"hole_radius", 1.0}, {"tube_radius", 0.5}});
    EXPECT_DOUBLE_EQ(torus.displaced_volume(g), 0.25 * pi * 2.0 * pi * 1.5);
    EXPECT_DOUBLE_EQ(torus.surface_area(g), 2.0 * pi * 1.5 * 2.0 * pi * 0.5);
    EXPECT_NEAR(torus.bounding_extents(g).z, 1.0, 1e-12);
}

TEST(PartCatalog, ValidateAcceptsDeclaredFields) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    EXPECT_NO_THROW(catalog.validate(test::make_capsule_assembly()));
}

TEST(PartCatalog, ValidateRejectsMissingAndExtraFields) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();

    Part missing("hull", "generic.Cuboid");
    missing.geometry = GeometryDescriptor{{"length", 1.0}, {"width", 1.0}};
    try {
        catalog.validate(missing);
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "hull.geometry.height");
    }

    Part extra = test::make_block("hull", 1.0);
    extra.set_geometry("draft", 0.3);
    try {
        catalog.validate(extra);
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "hull.geometry.draft");
    }
}

TEST(PartCatalog, ValidateRejectsUnknownTypeAndNegativeDensity) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();

    Part unknown("widget", "generic.Hyperboloid");
    try {
        catalog.validate(unknown);
        FAIL() << "expected UnknownPartTypeError";
    } catch (const UnknownPartTypeError& e) {
        EXPECT_EQ(e.type_id(), "generic.Hyperboloid");
        EXPECT_STREQ(e.kind(), "UnknownPartTypeError");
    }

    Part dense = test::make_block("ballast", -5.0);
    try {
        catalog.validate(dense);
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "ballast.material_density");
    }

    // A symbolic density is checked once bound
    Part symbolic = test::make_block("ballast", 1.0);
    symbolic.material_density = SymbolicValue::symbol("ballast_density");
    EXPECT_NO_THROW(catalog.validate(symbolic));
}
