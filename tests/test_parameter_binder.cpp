#include <gtest/gtest.h>
#include <binding/parameter_binder.hpp>
#include <common/errors.hpp>
#include <shapes/part_catalog.hpp>
#include "test_helpers.hpp"

using namespace symparts;

namespace {

// Two blocks whose sizes and hull density are free parameters
AssemblyGraph parametric_pair() {
    AssemblyGraph graph("pair");

    Part a = test::make_block("a", 1000.0);
    a.set_geometry("length", SymbolicValue::symbol("hull_length"))
     .set_placement(Vec3(0.0, 0.0, 0.0), Vec3(0.0, 0.0, 0.0));
    a.material_density = SymbolicValue::symbol("hull_density");
    graph.add_part(a);

    Part b = test::make_block("b", 1000.0);
    b.set_geometry("length", SymbolicValue::symbol("hull_length"))
     .set_geometry("height", SymbolicValue::symbol("mast_height"));
    graph.add_part(b);

    graph.attach("a", "Right", "b", "Left");
    return graph;
}

}  // namespace

TEST(ParameterBinder, SubstitutesEveryOccurrence) {
    AssemblyGraph bound = ParameterBinder::bind(parametric_pair(), {{"hull_length", 2.5}});

    EXPECT_EQ(bound.free_parameter_names(), (std::set<std::string>{"hull_density", "mast_height"}));
    EXPECT_EQ(bound.part("a").geometry.at("length"), SymbolicValue(2.5));
    EXPECT_EQ(bound.part("b").geometry.at("length"), SymbolicValue(2.5));
}

TEST(ParameterBinder, InputIsNotModified) {
    AssemblyGraph graph = parametric_pair();
    AssemblyGraph copy = graph;
    ParameterBinder::bind(graph, {{"hull_length", 2.5}, {"mast_height", 3.0}});
    EXPECT_TRUE(graph == copy);
    EXPECT_EQ(graph.free_parameter_names().size(), 3u);
}

TEST(ParameterBinder, EmptyMapIsIdentity) {
    AssemblyGraph graph = parametric_pair();
    EXPECT_TRUE(ParameterBinder::bind(graph, {}) == graph);
    EXPECT_TRUE(ParameterBinder::bind(graph, {}, BindOptions{true}) == graph);
}

TEST(ParameterBinder, Idempotent) {
    ParameterMap params{{"hull_length", 2.5}, {"hull_density", 800.0}};
    AssemblyGraph once = ParameterBinder::bind(parametric_pair(), params);
    AssemblyGraph twice = ParameterBinder::bind(once, params);
    EXPECT_TRUE(once == twice);
}

TEST(ParameterBinder, DisjointMapsCommute) {
    ParameterMap first{{"hull_length", 2.5}};
    ParameterMap second{{"mast_height", 4.0}, {"hull_density", 650.0}};

    AssemblyGraph graph = parametric_pair();
    AssemblyGraph ab = ParameterBinder::bind(ParameterBinder::bind(graph, first), second);
    AssemblyGraph ba = ParameterBinder::bind(ParameterBinder::bind(graph, second), first);
    EXPECT_TRUE(ab == ba);
    EXPECT_TRUE(ab.is_resolved());

    ParameterMap combined = first;
    combined.insert(second.begin(), second.end());
    EXPECT_TRUE(ParameterBinder::bind(graph, combined) == ab);
}

TEST(ParameterBinder, UnknownKeysIgnoredByDefault) {
    AssemblyGraph graph = parametric_pair();
    AssemblyGraph bound = ParameterBinder::bind(graph, {{"keel_depth", 1.0}, {"mast_height", 4.0}});
    EXPECT_EQ(bound.free_parameter_names(), (std::set<std::string>{"hull_density", "hull_length"}));
}

TEST(ParameterBinder, StrictModeRejectsUnknownKeys) {
    AssemblyGraph graph = parametric_pair();
    try {
        ParameterBinder::bind(graph, {{"keel_depth", 1.0}, {"mast_height", 4.0}}, BindOptions{true});
        FAIL() << "expected UnknownParameterError";
    } catch (const UnknownParameterError& e) {
        EXPECT_EQ(e.parameter(), "keel_depth");
        EXPECT_STREQ(e.kind(), "UnknownParameterError");
    }

    AssemblyGraph bound = ParameterBinder::bind(graph, {{"mast_height", 4.0}}, BindOptions{true});
    EXPECT_FALSE(bound.is_resolved());
}

TEST(ParameterBinder, AlreadyBoundNameIsUnknown) {
    AssemblyGraph bound = ParameterBinder::bind(parametric_pair(), {{"hull_length", 2.5}});
    EXPECT_EQ(ParameterBinder::unmatched_keys(bound, {{"hull_length", 3.0}, {"mast_height", 1.0}}),
              (std::vector<std::string>{"hull_length"}));
    EXPECT_THROW(ParameterBinder::bind(bound, {{"hull_length", 3.0}}, BindOptions{true}),
                 UnknownParameterError);
}

TEST(ParameterBinder, BindsPointsAndOrientation) {
    AssemblyGraph graph("tilted");
    Part a = test::make_block("a", 1000.0);
    a.set_placement(SymbolicVec3(0.0, 0.0, SymbolicValue::symbol("draft")), Vec3(0.5, 0.5, 0.0))
     .set_orientation(SymbolicValue::symbol("heel"), 0.0, 0.0);
    graph.add_part(a);

    EXPECT_EQ(graph.free_parameter_names(), (std::set<std::string>{"draft", "heel"}));
    AssemblyGraph bound = ParameterBinder::bind(graph, {{"draft", -0.4}, {"heel", 15.0}});
    ASSERT_TRUE(bound.is_resolved());
    EXPECT_TRUE(bound.part("a").is_anchor());
    EXPECT_EQ(bound.part("a").orientation.roll, SymbolicValue(15.0));
}

TEST(ParameterBinder, MakeConcrete) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    ParameterMap params{{"hull_length", 2.0}, {"hull_density", 800.0}, {"mast_height", 3.0}};

    ConcreteAssembly concrete = make_concrete(parametric_pair(), params, catalog);
    EXPECT_TRUE(concrete.graph.is_resolved());
    EXPECT_EQ(concrete.placements.root, "a");

    // b's Left face center meets a's Right face center at x = 2
    const PartTransform& b = concrete.placements.at("b");
    EXPECT_NEAR(b.translation.x, 2.0, 1e-12);
    EXPECT_NEAR(b.translation.y, 0.0, 1e-12);
    EXPECT_NEAR(b.translation.z, 0.5 - 1.5, 1e-12);
    EXPECT_EQ(b.extents, Vec3(2.0, 1.0, 3.0));
}

TEST(ParameterBinder, MakeConcreteNeedsEveryGeometryParameter) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    EXPECT_THROW(make_concrete(parametric_pair(), {{"hull_length", 2.0}}, catalog),
                 UnresolvedParameterError);
    EXPECT_THROW(make_concrete(parametric_pair(), {{"bogus", 1.0}}, catalog, BindOptions{true}),
                 UnknownParameterError);
}

TEST(ParameterBinder, NegativeDensityIsRejected) {
    AssemblyGraph graph = parametric_pair();
    try {
        ParameterBinder::bind(graph, {{"hull_density", -1000.0}});
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "a.material_density");
    }

    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    ParameterMap params{{"hull_length", 2.0}, {"hull_density", -1.0}, {"mast_height", 3.0}};
    EXPECT_THROW(make_concrete(graph, params, catalog), MalformedDocumentError);

    // Zero is a valid density
    EXPECT_NO_THROW(ParameterBinder::bind(graph, {{"hull_density", 0.0}}));
}
