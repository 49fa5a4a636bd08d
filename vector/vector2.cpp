/*
 * vector2.cpp - 2D Vector implementation
 */

#include "vector2.hpp"
#include "vector3.hpp"
#include "../internal/vector_ops.hpp"

namespace portmath {
namespace math {

// ============================================================================
// Construction / Properties
// ============================================================================

Vector2 Vector2::from_heading(float angle) {
    SinCos sc = sin_cos(angle);
    return Vector2(sc.cos, sc.sin);
}

Vector2 Vector2::from_heading_deg(float degrees) {
    SinCos sc = sin_cos_deg(degrees);
    return Vector2(sc.cos, sc.sin);
}

float Vector2::magnitude() const {
    return internal::magnitude_from_square(square_magnitude());
}

Vector3 Vector2::to_vector3() const {
    return Vector3(x, y, 0.0f);
}

Vector2 Vector2::divide_scalar(float s) const {
    if (s == 0.0f) return zero();
    return Vector2(x / s, y / s);
}

Vector2 Vector2::reciprocal_scalar(float s) const {
    return Vector2(x != 0.0f ? s / x : 0.0f,
                   y != 0.0f ? s / y : 0.0f);
}

bool approximately(const Vector2& a, const Vector2& b, float epsilon) {
    return approx(a.x, b.x, epsilon) && approx(a.y, b.y, epsilon);
}

// ============================================================================
// Operations
// ============================================================================

float distance(const Vector2& a, const Vector2& b) {
    return (b - a).magnitude();
}

Vector2 normalize(const Vector2& v) {
    return internal::normalize(v);
}

Vector2 project(const Vector2& v, const Vector2& onto) {
    return internal::project(v, onto);
}

Vector2 reject(const Vector2& v, const Vector2& onto) {
    return v - project(v, onto);
}

Vector2 reflect(const Vector2& v, const Vector2& normal) {
    return internal::reflect(v, normal);
}

float angle_between(const Vector2& a, const Vector2& b) {
    return internal::angle_between(a, b);
}

float angle_between_deg(const Vector2& a, const Vector2& b) {
    return rad2deg(angle_between(a, b));
}

float signed_angle_between(const Vector2& a, const Vector2& b) {
    return sign(dot(a, perpendicular(b))) * angle_between(a, b);
}

float signed_angle_between_deg(const Vector2& a, const Vector2& b) {
    return rad2deg(signed_angle_between(a, b));
}

// ============================================================================
// Interpolation
// ============================================================================

Vector2 lerp(const Vector2& a, const Vector2& b, float t) {
    return lerp_unclamped(a, b, clamp(t, 0.0f, 1.0f));
}

Vector2 lerp_unclamped(const Vector2& a, const Vector2& b, float t) {
    return Vector2(math::lerp_unclamped(a.x, b.x, t),
                   math::lerp_unclamped(a.y, b.y, t));
}

Vector2 move_towards(const Vector2& current, const Vector2& target, float max_delta) {
    return internal::move_towards(current, target, max_delta);
}

SmoothDamp<Vector2> smooth_damp(const Vector2& current, const Vector2& target, const Vector2& velocity,
                                float smooth_time, float max_speed, float delta) {
    SmoothDamp<Vector2> result;
    result.velocity = velocity;
    result.position = internal::smooth_damp(current, target, &result.velocity, smooth_time, max_speed, delta);
    return result;
}

} // namespace math
} // namespace portmath
