#pragma once
#include <ecs/ecs.hpp>
#include <cmath>

namespace fpc::math {

/**
 * @brief Wraps an angle in degrees into the range (-180, 180].
 *
 * Display only. Controller state keeps the unwrapped value.
 */
inline float wrap_degrees(float angle) {
    angle = std::fmod(angle, 360.0f);
    if (angle <= -180.0f) angle += 360.0f;
    if (angle >   180.0f) angle -= 360.0f;
    return angle;
}

inline ecs::Vec3 add(const ecs::Vec3& a, const ecs::Vec3& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline ecs::Vec3 scale(const ecs::Vec3& v, float s) {
    return {v.x * s, v.y * s, v.z * s};
}

inline float length(const ecs::Vec3& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

/**
 * @brief Returns v with unit length, or v unchanged when it is (near) zero.
 */
inline ecs::Vec3 normalized_or_zero(const ecs::Vec3& v) {
    float len = length(v);
    if (len < 1e-6f) return v;
    return scale(v, 1.0f / len);
}

/**
 * @brief Clamps a 2D input vector to the unit disc.
 */
inline ecs::Vec2 clamp_unit(ecs::Vec2 v) {
    float mag_sq = v.x * v.x + v.y * v.y;
    if (mag_sq > 1.0f) {
        float mag = std::sqrt(mag_sq);
        v.x /= mag;
        v.y /= mag;
    }
    return v;
}

/**
 * @brief Zeroes an axis value inside the deadzone.
 */
inline float apply_deadzone(float value, float deadzone) {
    return (std::abs(value) > deadzone) ? value : 0.0f;
}

} // namespace fpc::math
