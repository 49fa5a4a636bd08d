/*
 * vector_ops.hpp - Internal algorithms shared by Vector2 and Vector3
 *
 * This file is for INTERNAL USE ONLY. Do not include in public headers.
 * The templates rely on the vector's arithmetic operators plus dot() and
 * square_magnitude(), found by argument-dependent lookup.
 */

#ifndef PORTMATH_INTERNAL_VECTOR_OPS_HPP
#define PORTMATH_INTERNAL_VECTOR_OPS_HPP

#include "../kernel/kernel.hpp"

namespace portmath {
namespace internal {

// Combined magnitude below which angle queries report 0
constexpr float ANGLE_DEGENERATE_MAGNITUDE = 1e-10f;

// Squared magnitude 0 and 1 are their own square roots
inline float magnitude_from_square(float square) {
    if (square == 0.0f || square == 1.0f) return square;
    return math::sqrt(square);
}

template<typename V>
V normalize(const V& value) {
    // divide_scalar() maps a zero magnitude to the zero vector
    return value / magnitude_from_square(value.square_magnitude());
}

template<typename V>
float angle_between(const V& a, const V& b) {
    float magnitude = math::sqrt(a.square_magnitude() * b.square_magnitude());
    if (magnitude < ANGLE_DEGENERATE_MAGNITUDE) return 0.0f;

    float cosine = math::clamp(dot(a, b) / magnitude, -1.0f, 1.0f);
    return math::acos(cosine);
}

template<typename V>
V project(const V& value, const V& onto) {
    float square = onto.square_magnitude();
    if (square == 0.0f) return V();
    return onto * (dot(value, onto) / square);
}

template<typename V>
V reflect(const V& value, const V& normal) {
    return normal * (-2.0f * dot(normal, value)) + value;
}

template<typename V>
V move_towards(const V& current, const V& target, float max_delta) {
    V direction = target - current;
    float square = direction.square_magnitude();

    // Within reach: land exactly on the target
    if (square == 0.0f || (max_delta >= 0.0f && square <= max_delta * max_delta)) {
        return target;
    }

    return current + direction * (max_delta / math::sqrt(square));
}

// Critically damped spring step. Writes the new velocity to *velocity and
// returns the new position.
template<typename V>
V smooth_damp(const V& current, const V& target, V* velocity,
              float smooth_time, float max_speed, float delta) {
    smooth_time = math::max(0.0001f, smooth_time);
    float omega = 2.0f / smooth_time;
    float x = omega * delta;
    float decay = 1.0f / (1.0f + x + 0.47999998927116394f * x * x + 0.23499999940395355f * x * x * x);

    V offset = current - target;
    float max_offset = max_speed * smooth_time;
    float square = offset.square_magnitude();

    if (square > max_offset * max_offset) {
        offset *= max_offset / math::sqrt(square);
    }

    V clamped_target = current - offset;
    V spring = (*velocity + offset * omega) * delta;
    V next_velocity = (*velocity - spring * omega) * decay;
    V result = clamped_target + (offset + spring) * decay;

    // Overshot the target: derive velocity from the displacement
    if (dot(target - current, result - target) > 0.0f) {
        next_velocity = (result - target) / delta;
    }

    *velocity = next_velocity;
    return result;
}

} // namespace internal
} // namespace portmath

#endif // PORTMATH_INTERNAL_VECTOR_OPS_HPP
