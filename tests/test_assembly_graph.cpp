#include <gtest/gtest.h>
#include <assembly/assembly_graph.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"

using namespace symparts;

TEST(AssemblyGraph, AddAndRetrievePart) {
    AssemblyGraph graph("single");
    Part part("tank", "generic.Cylinder");
    part.set_geometry("radius", 0.5).set_geometry("height", 2.0);

    PartId id = graph.add_part(part);
    EXPECT_EQ(id, 0u);
    EXPECT_EQ(graph.part_count(), 1u);
    EXPECT_EQ(graph.part(id).name, "tank");
    EXPECT_EQ(graph.part("tank").type, "generic.Cylinder");
    EXPECT_TRUE(graph.has_part("tank"));
    EXPECT_EQ(graph.find_part("tank"), std::optional<PartId>(0));
    EXPECT_FALSE(graph.find_part("missing").has_value());
}

TEST(AssemblyGraph, InvalidPartIdThrows) {
    AssemblyGraph graph;
    EXPECT_THROW(graph.part(PartId{3}), std::out_of_range);
    EXPECT_THROW(graph.part("missing"), std::out_of_range);
    EXPECT_THROW(graph.attachment(EdgeId{0}), std::out_of_range);
}

TEST(AssemblyGraph, DuplicatePartNameRejected) {
    AssemblyGraph graph;
    graph.add_part(test::make_block("a", 1.0));
    EXPECT_THROW(graph.add_part(test::make_block("a", 2.0)), MalformedDocumentError);
    EXPECT_EQ(graph.part_count(), 1u);
}

TEST(AssemblyGraph, DuplicatePointNameRejected) {
    Part part = test::make_block("a", 1.0);
    EXPECT_THROW(part.add_attachment_point("Left", Vec3(0.0, 0.0, 0.0)), MalformedDocumentError);

    // Points and ports live in separate namespaces
    EXPECT_NO_THROW(part.add_connection_port("Left", Vec3(0.0, 0.0, 0.0)));
}

TEST(AssemblyGraph, AttachmentPointOutsideUnitCubeRejected) {
    Part part = test::make_block("keel", 1000.0);
    try {
        part.add_attachment_point("Far", Vec3(5.0, -3.0, 2.0));
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "keel.attachment_points.Far.x");
    }
    EXPECT_EQ(part.find_attachment_point("Far"), nullptr);

    // Symbolic coordinates are checked once bound
    EXPECT_NO_THROW(part.add_attachment_point("Mount", SymbolicVec3(SymbolicValue::symbol("u"), 1.0, 0.0)));
}

TEST(AssemblyGraph, NegativeDensityRejected) {
    AssemblyGraph graph("ballast");
    try {
        graph.add_part(test::make_block("lead", -11340.0));
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "lead.material_density");
    }
    EXPECT_EQ(graph.part_count(), 0u);
}

TEST(AssemblyGraph, AttachStoresPartIdsAndPointNames) {
    AssemblyGraph graph;
    graph.add_part(test::make_block("a", 1.0));
    graph.add_part(test::make_block("b", 1.0));

    EdgeId id = graph.attach("a", "Right", "b", "Left");
    const AttachmentEdge& edge = graph.attachment(id);
    EXPECT_EQ(edge.source_part, 0u);
    EXPECT_EQ(edge.source_point, "Right");
    EXPECT_EQ(edge.destination_part, 1u);
    EXPECT_EQ(edge.destination_point, "Left");
    EXPECT_EQ(edge.other(0), 1u);
    EXPECT_EQ(edge.other(1), 0u);
    EXPECT_EQ(graph.describe(edge), "a#Right <-> b#Left");
}

TEST(AssemblyGraph, AttachValidatesEndpoints) {
    AssemblyGraph graph;
    graph.add_part(test::make_block("a", 1.0));
    graph.add_part(test::make_block("b", 1.0));

    EXPECT_THROW(graph.attach("a", "Right", "missing", "Left"), MalformedDocumentError);
    EXPECT_THROW(graph.attach("a", "Top", "b", "Left"), MalformedDocumentError);
    EXPECT_THROW(graph.attach("a", "Right", "b", "Top"), MalformedDocumentError);
    EXPECT_THROW(graph.attach("a", "Right", "a", "Left"), MalformedDocumentError);
    EXPECT_EQ(graph.attachment_count(), 0u);
}

TEST(AssemblyGraph, AttachmentPointMayBeReused) {
    AssemblyGraph graph;
    graph.add_part(test::make_block("a", 1.0));
    graph.add_part(test::make_block("b", 1.0));
    graph.add_part(test::make_block("c", 1.0));

    graph.attach("a", "Right", "b", "Left");
    EXPECT_NO_THROW(graph.attach("a", "Right", "c", "Left"));
    EXPECT_EQ(graph.attachments_for_part(0), (std::vector<EdgeId>{0, 1}));
    EXPECT_EQ(graph.attachments_for_part(2), (std::vector<EdgeId>{1}));
}

TEST(AssemblyGraph, ConnectionsFormAMultigraph) {
    AssemblyGraph graph = test::make_capsule_assembly();
    EXPECT_EQ(graph.connection_count(), 2u);

    // A second link between the same ports is allowed
    EXPECT_NO_THROW(graph.connect("capsule1", "ElectricalPort1", "capsule2", "ElectricalPort1"));
    EXPECT_EQ(graph.connection_count(), 3u);

    // Ports, not attachment points
    EXPECT_THROW(graph.connect("capsule1", "RearCenter", "capsule2", "FrontCenter"),
                 MalformedDocumentError);
    EXPECT_THROW(graph.connect("capsule1", "ElectricalPort1", "capsule1", "ElectricalPort2"),
                 MalformedDocumentError);
}

TEST(AssemblyGraph, CapsuleAssemblyStructure) {
    AssemblyGraph graph = test::make_capsule_assembly();
    EXPECT_EQ(graph.name(), "capsule_train");
    ASSERT_EQ(graph.part_count(), 3u);
    EXPECT_EQ(graph.parts()[0].name, "capsule1");
    EXPECT_EQ(graph.parts()[2].name, "capsule3");
    EXPECT_EQ(graph.attachment_count(), 2u);
    EXPECT_TRUE(graph.part("capsule1").is_anchor());
    EXPECT_FALSE(graph.part("capsule2").is_anchor());
    EXPECT_EQ(graph.connections_for_part(*graph.find_part("capsule3")), (std::vector<EdgeId>{1}));
}

TEST(AssemblyGraph, FreeParametersAcrossParts) {
    AssemblyGraph graph = test::make_capsule_assembly();
    EXPECT_EQ(graph.free_parameter_names(), std::set<std::string>{"capsule3_thickness"});
    EXPECT_FALSE(graph.is_resolved());

    EXPECT_EQ(graph.bind("capsule3_thickness", 0.01), 1u);
    EXPECT_TRUE(graph.is_resolved());
}

TEST(AssemblyGraph, FreeParametersInEveryPartField) {
    Part part("buoy", "generic.Sphere");
    part.set_geometry("radius", SymbolicValue::symbol("r"));
    part.material_density = SymbolicValue::symbol("rho");
    part.set_placement(SymbolicVec3(SymbolicValue::symbol("px"), 0.0, 0.0), Vec3(0.5, 0.5, 0.5));
    part.set_orientation(0.0, 0.0, SymbolicValue::symbol("heading"));
    part.add_attachment_point("Mount", SymbolicVec3(0.5, 0.5, SymbolicValue::symbol("mount_z")));
    part.add_connection_port("Signal", SymbolicVec3(SymbolicValue::symbol("port_x"), 0.5, 0.5));

    EXPECT_EQ(part.free_parameter_names(),
              (std::set<std::string>{"heading", "mount_z", "port_x", "px", "r", "rho"}));
    EXPECT_FALSE(part.is_anchor());
    EXPECT_EQ(part.bind("px", 1.0), 1u);
    EXPECT_TRUE(part.is_anchor());
}

TEST(AssemblyGraph, CopiesCompareEqual) {
    AssemblyGraph a = test::make_capsule_assembly();
    AssemblyGraph b = a;
    EXPECT_TRUE(a == b);
    b.bind("capsule3_thickness", 0.01);
    EXPECT_FALSE(a == b);
}
