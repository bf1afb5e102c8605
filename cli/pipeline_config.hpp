#ifndef SYMPARTS_CLI_PIPELINE_CONFIG_HPP
#define SYMPARTS_CLI_PIPELINE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <binding/parameter_binder.hpp>
#include <placement/placement_resolver.hpp>
#include <serialization/config_json.hpp>

namespace symparts {

// Settings shared by the bind, place, batch and properties commands
struct PipelineConfig {
    BindOptions binding;
    TraversalOrder traversal = TraversalOrder::BreadthFirst;
    bool include_parts = true;   // Per-part entries in property reports
    int num_threads = 0;         // Batch placement workers: 0 = auto-detect
};

// PipelineConfig serialization
inline void to_json(nlohmann::json& j, const PipelineConfig& config) {
    j = {
        {"binding", config.binding},
        {"traversal", config.traversal},
        {"include_parts", config.include_parts},
        {"num_threads", config.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, PipelineConfig& config) {
    if (j.contains("binding")) {
        config.binding = j["binding"].get<BindOptions>();
    }
    config.traversal = j.value("traversal", TraversalOrder::BreadthFirst);
    config.include_parts = j.value("include_parts", true);
    config.num_threads = j.value("num_threads", 0);
}

}  // namespace symparts

#endif // SYMPARTS_CLI_PIPELINE_CONFIG_HPP
