#ifndef DROPLET_VEC3_H
#define DROPLET_VEC3_H

#include <cmath>
#include "raylib.h"

namespace droplet {
namespace math {

struct Vec3 {
    float x, y, z;

    constexpr Vec3() : x(0.0f), y(0.0f), z(0.0f) {}
    constexpr Vec3(float x, float y, float z) : x(x), y(y), z(z) {}
    constexpr explicit Vec3(float s) : x(s), y(s), z(s) {}

    // Conversion from/to Raylib Vector3 for the demo and ECS components
    Vec3(const Vector3& v) : x(v.x), y(v.y), z(v.z) {}
    operator Vector3() const { return {x, y, z}; }

    constexpr Vec3 operator+(const Vec3& other) const {
        return Vec3(x + other.x, y + other.y, z + other.z);
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return Vec3(x - other.x, y - other.y, z - other.z);
    }

    constexpr Vec3 operator*(float s) const {
        return Vec3(x * s, y * s, z * s);
    }

    constexpr Vec3 operator/(float s) const {
        return Vec3(x / s, y / s, z / s);
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    constexpr Vec3 operator-() const {
        return Vec3(-x, -y, -z);
    }

    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }

    constexpr float dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr float length_squared() const {
        return x*x + y*y + z*z;
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    float distance_squared(const Vec3& other) const {
        return (*this - other).length_squared();
    }

    Vec3 min(const Vec3& other) const {
        return Vec3(std::fmin(x, other.x), std::fmin(y, other.y), std::fmin(z, other.z));
    }

    Vec3 max(const Vec3& other) const {
        return Vec3(std::fmax(x, other.x), std::fmax(y, other.y), std::fmax(z, other.z));
    }

    // Component-wise clamp into [lo, hi]
    Vec3 clamp(const Vec3& lo, const Vec3& hi) const {
        return max(lo).min(hi);
    }

    // Writes xyz plus a w component into a std140/std430 vec4 slot
    void store(float out[4], float w = 0.0f) const {
        out[0] = x; out[1] = y; out[2] = z; out[3] = w;
    }

    static Vec3 load(const float in[4]) {
        return Vec3(in[0], in[1], in[2]);
    }

    static constexpr Vec3 zero() { return Vec3(0.0f, 0.0f, 0.0f); }
};

constexpr Vec3 operator*(float s, const Vec3& v) {
    return v * s;
}

} // namespace math
} // namespace droplet

#endif // DROPLET_VEC3_H
