#ifndef SYMPARTS_SERIALIZATION_CONFIG_JSON_HPP
#define SYMPARTS_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <binding/parameter_binder.hpp>
#include <common/errors.hpp>
#include <math/rotation.hpp>
#include <math/vec3.hpp>
#include <placement/placement_resolver.hpp>

namespace symparts {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
    v.z = j[2].get<double>();
}

// Mat3 serialization (row-major nested arrays)
inline void to_json(nlohmann::json& j, const Mat3& m) {
    j = nlohmann::json::array();
    for (const auto& row : m.m) {
        j.push_back(nlohmann::json::array({row[0], row[1], row[2]}));
    }
}

inline void from_json(const nlohmann::json& j, Mat3& m) {
    for (size_t r = 0; r < 3; ++r) {
        for (size_t c = 0; c < 3; ++c) {
            m.m[r][c] = j[r][c].get<double>();
        }
    }
}

// Rotation serialization, in degrees like the assembly document
inline void to_json(nlohmann::json& j, const Rotation& rotation) {
    j = {
        {"roll", rotation.roll_degrees()},
        {"pitch", rotation.pitch_degrees()},
        {"yaw", rotation.yaw_degrees()}
    };
}

inline void from_json(const nlohmann::json& j, Rotation& rotation) {
    rotation = Rotation::from_degrees(j.value("roll", 0.0), j.value("pitch", 0.0), j.value("yaw", 0.0));
}

NLOHMANN_JSON_SERIALIZE_ENUM(TraversalOrder, {
    {TraversalOrder::BreadthFirst, "breadth_first"},
    {TraversalOrder::DepthFirst, "depth_first"},
})

// BindOptions serialization
inline void to_json(nlohmann::json& j, const BindOptions& options) {
    j = {
        {"strict", options.strict}
    };
}

inline void from_json(const nlohmann::json& j, BindOptions& options) {
    options.strict = j.value("strict", false);
}

// Parameter maps are flat objects of name -> number
inline ParameterMap parameter_map_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MalformedDocumentError("parameters", "expected an object of name -> number");
    }
    ParameterMap params;
    for (const auto& [name, value] : j.items()) {
        if (!value.is_number()) {
            throw MalformedDocumentError("parameters." + name, "value must be a number");
        }
        params[name] = value.get<double>();
    }
    return params;
}

inline nlohmann::json parameter_map_to_json(const ParameterMap& params) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : params) {
        j[name] = value;
    }
    return j;
}

}  // namespace symparts

#endif // SYMPARTS_SERIALIZATION_CONFIG_JSON_HPP
