#include "symbolic_vec3.hpp"
#include <common/errors.hpp>

namespace symparts {

namespace {

void check_unit_interval(const SymbolicValue& value, const std::string& field_path) {
    if (value.is_resolved() && (value.value() < 0.0 || value.value() > 1.0)) {
        throw MalformedDocumentError(field_path, "normalized coordinate " + value.to_string() +
                                                 " outside [0, 1]");
    }
}

}  // namespace

Vec3 SymbolicVec3::resolve(const std::string& field_path) const {
    return {
        resolve_field(x, field_path + ".x"),
        resolve_field(y, field_path + ".y"),
        resolve_field(z, field_path + ".z")
    };
}

void SymbolicVec3::check_normalized(const std::string& field_path) const {
    check_unit_interval(x, field_path + ".x");
    check_unit_interval(y, field_path + ".y");
    check_unit_interval(z, field_path + ".z");
}

Vec3 SymbolicVec3::resolve_normalized(const std::string& field_path) const {
    Vec3 v = resolve(field_path);
    check_normalized(field_path);
    return v;
}

std::size_t SymbolicVec3::bind(const std::string& name, double value) {
    std::size_t count = 0;
    if (x.bind(name, value)) ++count;
    if (y.bind(name, value)) ++count;
    if (z.bind(name, value)) ++count;
    return count;
}

void SymbolicVec3::collect_free_parameters(std::set<std::string>& out) const {
    x.collect_free_parameters(out);
    y.collect_free_parameters(out);
    z.collect_free_parameters(out);
}

Rotation SymbolicOrientation::resolve(const std::string& field_path) const {
    return Rotation::from_degrees(
        resolve_field(roll, field_path + ".roll"),
        resolve_field(pitch, field_path + ".pitch"),
        resolve_field(yaw, field_path + ".yaw"));
}

std::size_t SymbolicOrientation::bind(const std::string& name, double value) {
    std::size_t count = 0;
    if (roll.bind(name, value)) ++count;
    if (pitch.bind(name, value)) ++count;
    if (yaw.bind(name, value)) ++count;
    return count;
}

void SymbolicOrientation::collect_free_parameters(std::set<std::string>& out) const {
    roll.collect_free_parameters(out);
    pitch.collect_free_parameters(out);
    yaw.collect_free_parameters(out);
}

}  // namespace symparts
