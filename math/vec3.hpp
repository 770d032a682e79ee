#ifndef BOWTIEMODEL_MATH_VEC3_HPP
#define BOWTIEMODEL_MATH_VEC3_HPP

#include <cmath>
#include <cstddef>

namespace bowtiemodel {

// Point or displacement in model space, in meters
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

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Component-wise min/max, used for axis-aligned extents
    constexpr Vec3 min(const Vec3& other) const {
        return {x < other.x ? x : other.x,
                y < other.y ? y : other.y,
                z < other.z ? z : other.z};
    }

    constexpr Vec3 max(const Vec3& other) const {
        return {x > other.x ? x : other.x,
                y > other.y ? y : other.y,
                z > other.z ? z : other.z};
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }

    // Array access
    constexpr double& operator[](size_t i) {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }

    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

// Scalar * Vec3
constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

// Approximate comparison with an absolute tolerance per component
inline bool approx_equal(const Vec3& a, const Vec3& b, double tolerance) {
    return std::abs(a.x - b.x) <= tolerance &&
           std::abs(a.y - b.y) <= tolerance &&
           std::abs(a.z - b.z) <= tolerance;
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_MATH_VEC3_HPP
