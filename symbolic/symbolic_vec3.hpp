#ifndef SYMPARTS_SYMBOLIC_SYMBOLIC_VEC3_HPP
#define SYMPARTS_SYMBOLIC_SYMBOLIC_VEC3_HPP

#include "symbolic_value.hpp"
#include <math/rotation.hpp>
#include <math/vec3.hpp>
#include <set>
#include <string>

namespace symparts {

// Three symbolic coordinates (a normalized local point or a world position)
struct SymbolicVec3 {
    SymbolicValue x;
    SymbolicValue y;
    SymbolicValue z;

    SymbolicVec3() = default;
    SymbolicVec3(SymbolicValue x_, SymbolicValue y_, SymbolicValue z_)
        : x(std::move(x_)), y(std::move(y_)), z(std::move(z_)) {}
    SymbolicVec3(const Vec3& v) : x(v.x), y(v.y), z(v.z) {}

    bool is_resolved() const {
        return x.is_resolved() && y.is_resolved() && z.is_resolved();
    }

    // Concrete vector; field_path prefixes the ".x/.y/.z" in error messages
    Vec3 resolve(const std::string& field_path) const;

    // Normalized points must lie in the unit cube; symbolic coordinates are
    // skipped here and checked by resolve_normalized once bound
    void check_normalized(const std::string& field_path) const;
    Vec3 resolve_normalized(const std::string& field_path) const;

    std::size_t bind(const std::string& name, double value);
    void collect_free_parameters(std::set<std::string>& out) const;

    bool operator==(const SymbolicVec3& other) const = default;
};

// Roll/pitch/yaw in degrees, each possibly symbolic
struct SymbolicOrientation {
    SymbolicValue roll;
    SymbolicValue pitch;
    SymbolicValue yaw;

    bool is_resolved() const {
        return roll.is_resolved() && pitch.is_resolved() && yaw.is_resolved();
    }

    Rotation resolve(const std::string& field_path) const;

    std::size_t bind(const std::string& name, double value);
    void collect_free_parameters(std::set<std::string>& out) const;

    bool operator==(const SymbolicOrientation& other) const = default;
};

}  // namespace symparts

#endif // SYMPARTS_SYMBOLIC_SYMBOLIC_VEC3_HPP
