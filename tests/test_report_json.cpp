#include <gtest/gtest.h>
#include <cli/pipeline_config.hpp>
#include <serialization/config_json.hpp>
#include <serialization/assembly_graph_json.hpp>
#include <serialization/placement_json.hpp>
#include <serialization/properties_json.hpp>
#include <serialization/json_serialization.hpp>
#include <shapes/part_catalog.hpp>
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>

using namespace symparts;

TEST(ConfigJson, PipelineConfigDefaults) {
    PipelineConfig config = nlohmann::json::object().get<PipelineConfig>();
    EXPECT_FALSE(config.binding.strict);
    EXPECT_EQ(config.traversal, TraversalOrder::BreadthFirst);
    EXPECT_TRUE(config.include_parts);
    EXPECT_EQ(config.num_threads, 0);
}

TEST(ConfigJson, PipelineConfigFields) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "binding": {"strict": true},
        "traversal": "depth_first",
        "include_parts": false,
        "num_threads": 4
    })");
    PipelineConfig config = j.get<PipelineConfig>();
    EXPECT_TRUE(config.binding.strict);
    EXPECT_EQ(config.traversal, TraversalOrder::DepthFirst);
    EXPECT_FALSE(config.include_parts);
    EXPECT_EQ(config.num_threads, 4);

    nlohmann::json written = config;
    EXPECT_EQ(written["traversal"], "depth_first");
    EXPECT_EQ(written["binding"]["strict"], true);
}

TEST(ConfigJson, ParameterMap) {
    ParameterMap params = parameter_map_from_json(
        nlohmann::json::parse(R"({"capsule3_thickness": 0.01, "count": 3})"));
    EXPECT_EQ(params.size(), 2u);
    EXPECT_DOUBLE_EQ(params.at("capsule3_thickness"), 0.01);
    EXPECT_DOUBLE_EQ(params.at("count"), 3.0);
    EXPECT_EQ(parameter_map_to_json(params)["count"], 3.0);
}

TEST(ConfigJson, ParameterMapRejectsNonNumbers) {
    try {
        parameter_map_from_json(nlohmann::json::parse(R"({"radius": "wide"})"));
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), "parameters.radius");
    }
    EXPECT_THROW(parameter_map_from_json(nlohmann::json::array({1.0})), MalformedDocumentError);
}

TEST(PlacementJson, TransformsSurviveTheDocument) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    PlacementMap placements = PlacementResolver(catalog).resolve(test::make_bound_capsule_assembly());

    nlohmann::json j = placements;
    EXPECT_EQ(j["root"], "capsule1");
    ASSERT_EQ(j["parts"].size(), 3u);
    EXPECT_EQ(j["parts"][1]["name"], "capsule2");
    EXPECT_NEAR(j["parts"][1]["rotation"]["pitch"].get<double>(), -90.0, 1e-9);

    PlacementMap loaded = j.get<PlacementMap>();
    EXPECT_EQ(loaded.root, placements.root);
    EXPECT_EQ(loaded.order, placements.order);
    for (const auto& name : placements.order) {
        EXPECT_EQ(loaded.at(name).translation, placements.at(name).translation) << name;
        EXPECT_EQ(loaded.at(name).matrix, placements.at(name).matrix) << name;
    }
}

TEST(PlacementJson, BatchOutcomes) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    std::vector<AssemblyGraph> graphs{test::make_bound_capsule_assembly(), AssemblyGraph("empty")};
    std::vector<PlacementOutcome> outcomes = PlacementResolver(catalog).resolve_batch(graphs, 2);
    ASSERT_EQ(outcomes.size(), 2u);

    nlohmann::json placed = outcomes[0];
    EXPECT_TRUE(placed["ok"].get<bool>());
    EXPECT_EQ(placed["placements"]["root"], "capsule1");
    EXPECT_TRUE(placed.contains("bounds"));
    EXPECT_FALSE(placed.contains("error"));

    nlohmann::json failed = outcomes[1];
    EXPECT_FALSE(failed["ok"].get<bool>());
    EXPECT_EQ(failed["error"]["kind"], outcomes[1].error_kind);
    EXPECT_FALSE(failed["error"]["message"].get<std::string>().empty());
    EXPECT_FALSE(failed.contains("placements"));
}

TEST(PropertiesJson, UnresolvedValuesAreNull) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    PropertyReport report = PropertyAggregator(catalog).aggregate(test::make_capsule_assembly());

    nlohmann::json j = property_report_to_json(report);
    EXPECT_TRUE(j["mass"]["value"].is_null());
    EXPECT_EQ(j["mass"]["unresolved_parts"], nlohmann::json::array({"capsule3"}));
    EXPECT_TRUE(j["placement_error"].is_string());
    ASSERT_EQ(j["parts"].size(), 3u);
    EXPECT_TRUE(j["parts"][0]["mass"].is_number());
    EXPECT_FALSE(j["parts"][0].contains("unresolved_field"));
    EXPECT_EQ(j["parts"][2]["unresolved_field"], "capsule3.geometry.thickness");

    nlohmann::json totals = property_report_to_json(report, false);
    EXPECT_FALSE(totals.contains("parts"));
}

TEST(PropertiesJson, ResolvedCentersAreArrays) {
    PartCatalog catalog = PartCatalog::with_builtin_shapes();
    PropertyReport report = PropertyAggregator(catalog).aggregate(test::make_bound_capsule_assembly());

    nlohmann::json j = property_report_to_json(report);
    ASSERT_TRUE(j["center_of_gravity"]["value"].is_array());
    EXPECT_EQ(j["center_of_gravity"]["value"].size(), 3u);
    EXPECT_TRUE(j["center_of_gravity"]["unresolved_parts"].empty());
    EXPECT_TRUE(j["placement_error"].is_null());
}

TEST(SerializedData, Envelope) {
    json::SerializedData data;
    data.step = "placements";
    data.data = {{"root", "capsule1"}};

    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["version"], json::SERIALIZATION_VERSION);
    EXPECT_EQ(j["step"], "placements");
    EXPECT_EQ(j["data"]["root"], "capsule1");
    EXPECT_FALSE(j.contains("timestamp"));
    EXPECT_FALSE(j.contains("config"));
}

TEST(SerializedData, StampedCarriesStepAndSource) {
    json::SerializedData data = json::SerializedData::stamped("properties", "mast.json");
    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["step"], "properties");
    EXPECT_EQ(j["source_file"], "mast.json");
    ASSERT_TRUE(j.contains("timestamp"));
    EXPECT_EQ(j["timestamp"].get<std::string>().back(), 'Z');

    EXPECT_FALSE(json::SerializedData::stamped("batch_placements").to_json().contains("source_file"));
}

TEST(JsonFiles, UnparsableFileNamesThePath) {
    std::string path = (std::filesystem::temp_directory_path() / "symparts_unparsable.json").string();
    {
        std::ofstream out(path);
        out << "{\"name\": ";
    }

    try {
        json::read_json_file(path);
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.context(), path);
    }
    EXPECT_THROW(load_assembly_file(path), MalformedDocumentError);
    std::filesystem::remove(path);

    EXPECT_THROW(json::read_json_file(path), std::runtime_error);
}
