#ifndef SYMPARTS_MATH_ROTATION_HPP
#define SYMPARTS_MATH_ROTATION_HPP

#include "vec3.hpp"
#include <array>

namespace symparts {

// Row-major 3x3 matrix
struct Mat3 {
    std::array<std::array<double, 3>, 3> m{{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}}};

    constexpr Vec3 operator*(const Vec3& v) const {
        return {
            m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z,
            m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z,
            m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z
        };
    }

    constexpr bool operator==(const Mat3& other) const { return m == other.m; }
    constexpr bool operator!=(const Mat3& other) const { return !(*this == other); }
};

// Right-handed rotation following the nautical/aeronautical convention:
// intrinsic yaw (about z), then pitch (about y), then roll (about x).
// Angles are stored in radians.
struct Rotation {
    double roll = 0.0;
    double pitch = 0.0;
    double yaw = 0.0;

    static Rotation from_degrees(double roll_deg, double pitch_deg, double yaw_deg);
    static Rotation from_matrix(const Mat3& matrix);

    // R = Rz(yaw) * Ry(pitch) * Rx(roll)
    Mat3 matrix() const;

    double roll_degrees() const;
    double pitch_degrees() const;
    double yaw_degrees() const;

    bool operator==(const Rotation& other) const = default;
};

}  // namespace symparts

#endif // SYMPARTS_MATH_ROTATION_HPP
