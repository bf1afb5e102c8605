#include "rotation.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace symparts {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kRadToDeg = 180.0 / std::numbers::pi;

}  // namespace

Rotation Rotation::from_degrees(double roll_deg, double pitch_deg, double yaw_deg) {
    return {roll_deg * kDegToRad, pitch_deg * kDegToRad, yaw_deg * kDegToRad};
}

Rotation Rotation::from_matrix(const Mat3& matrix) {
    Rotation result;
    result.roll = std::atan2(matrix.m[2][1], matrix.m[2][2]);
    result.pitch = -std::asin(std::clamp(matrix.m[2][0], -1.0, 1.0));
    result.yaw = std::atan2(matrix.m[1][0], matrix.m[0][0]);
    return result;
}

Mat3 Rotation::matrix() const {
    const double sr = std::sin(roll), cr = std::cos(roll);
    const double sp = std::sin(pitch), cp = std::cos(pitch);
    const double sy = std::sin(yaw), cy = std::cos(yaw);

    Mat3 r;
    r.m[0] = {cp * cy, sr * sp * cy - sy * cr, sr * sy + sp * cr * cy};
    r.m[1] = {sy * cp, sr * sp * sy + cr * cy, sp * sy * cr - sr * cy};
    r.m[2] = {-sp, sr * cp, cr * cp};
    return r;
}

double Rotation::roll_degrees() const { return roll * kRadToDeg; }
double Rotation::pitch_degrees() const { return pitch * kRadToDeg; }
double Rotation::yaw_degrees() const { return yaw * kRadToDeg; }

}  // namespace symparts
