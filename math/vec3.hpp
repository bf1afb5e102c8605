#ifndef SYMPARTS_MATH_VEC3_HPP
#define SYMPARTS_MATH_VEC3_HPP

namespace symparts {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    // Component-wise product (scales a normalized point by extents)
    constexpr Vec3 hadamard(const Vec3& other) const {
        return {x * other.x, y * other.y, z * other.z};
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }
};

// Scalar * Vec3
constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

}  // namespace symparts

#endif // SYMPARTS_MATH_VEC3_HPP
