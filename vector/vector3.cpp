/*
 * vector3.cpp - 3D Vector implementation
 */

#include "vector3.hpp"
#include "../internal/vector_ops.hpp"

#if !defined(PORTMATH_NO_QUATERNIONS)
#include "../quaternion/quaternion.hpp"
#endif

namespace portmath {
namespace math {

// Above this cosine slerp degrades to a normalized lerp
static constexpr float SLERP_LINEAR_THRESHOLD = 0.9995f;

// ============================================================================
// Construction / Properties
// ============================================================================

Vector3 Vector3::from_angles(float theta, float phi) {
    SinCos t = sin_cos(theta);
    SinCos p = sin_cos(phi);
    return Vector3(p.cos * t.cos, p.cos * t.sin, p.sin);
}

Vector3 Vector3::from_angles_deg(float theta, float phi) {
    return from_angles(deg2rad(theta), deg2rad(phi));
}

float Vector3::magnitude() const {
    return internal::magnitude_from_square(square_magnitude());
}

Vector3 Vector3::divide_scalar(float s) const {
    if (s == 0.0f) return zero();
    return Vector3(x / s, y / s, z / s);
}

Vector3 Vector3::reciprocal_scalar(float s) const {
    return Vector3(x != 0.0f ? s / x : 0.0f,
                   y != 0.0f ? s / y : 0.0f,
                   z != 0.0f ? s / z : 0.0f);
}

bool approximately(const Vector3& a, const Vector3& b, float epsilon) {
    return approx(a.x, b.x, epsilon) && approx(a.y, b.y, epsilon) && approx(a.z, b.z, epsilon);
}

// ============================================================================
// Operations
// ============================================================================

float distance(const Vector3& a, const Vector3& b) {
    return (b - a).magnitude();
}

Vector3 normalize(const Vector3& v) {
    return internal::normalize(v);
}

Vector3 project(const Vector3& v, const Vector3& onto) {
    return internal::project(v, onto);
}

Vector3 reject(const Vector3& v, const Vector3& onto) {
    return v - project(v, onto);
}

Vector3 reflect(const Vector3& v, const Vector3& normal) {
    return internal::reflect(v, normal);
}

float angle_between(const Vector3& a, const Vector3& b) {
    return internal::angle_between(a, b);
}

float angle_between_deg(const Vector3& a, const Vector3& b) {
    return rad2deg(angle_between(a, b));
}

float signed_angle_between(const Vector3& a, const Vector3& b, const Vector3& axis) {
    return sign(dot(axis, cross(a, b))) * angle_between(a, b);
}

float signed_angle_between_deg(const Vector3& a, const Vector3& b, const Vector3& axis) {
    return rad2deg(signed_angle_between(a, b, axis));
}

// ============================================================================
// Interpolation
// ============================================================================

Vector3 lerp(const Vector3& a, const Vector3& b, float t) {
    return lerp_unclamped(a, b, clamp(t, 0.0f, 1.0f));
}

Vector3 lerp_unclamped(const Vector3& a, const Vector3& b, float t) {
    return Vector3(math::lerp_unclamped(a.x, b.x, t),
                   math::lerp_unclamped(a.y, b.y, t),
                   math::lerp_unclamped(a.z, b.z, t));
}

Vector3 slerp(const Vector3& a, const Vector3& b, float t) {
    return slerp_unclamped(a, b, clamp(t, 0.0f, 1.0f));
}

Vector3 slerp_unclamped(const Vector3& a, const Vector3& b, float t) {
    float size = math::lerp_unclamped(a.magnitude(), b.magnitude(), t);
    Vector3 from = normalize(a);
    Vector3 to = normalize(b);
    float cosine = dot(from, to);

    // Take the shorter arc
    if (cosine < 0.0f) {
        to = -to;
        cosine = -cosine;
    }

    if (cosine > SLERP_LINEAR_THRESHOLD) {
        return normalize(from + (to - from) * t) * size;
    }

    float angle = t * acos(cosine);
    Vector3 ortho = normalize(to - from * cosine);
    SinCos sc = sin_cos(angle);

    return from * (size * sc.cos) + ortho * (size * sc.sin);
}

Vector3 move_towards(const Vector3& current, const Vector3& target, float max_delta) {
    return internal::move_towards(current, target, max_delta);
}

SmoothDamp<Vector3> smooth_damp(const Vector3& current, const Vector3& target, const Vector3& velocity,
                                float smooth_time, float max_speed, float delta) {
    SmoothDamp<Vector3> result;
    result.velocity = velocity;
    result.position = internal::smooth_damp(current, target, &result.velocity, smooth_time, max_speed, delta);
    return result;
}

#if !defined(PORTMATH_NO_QUATERNIONS)
Vector3 rotate_towards(const Vector3& current, const Vector3& target,
                       float max_radians, float max_magnitude) {
    Vector3 axis = cross(current, target);
    float limit = abs(max_radians);
    float angle = clamp(signed_angle_between(current, target, axis), -limit, limit);

    if (angle == 0.0f) return target;

    Vector3 rotated = Quaternion::from_axis_angle(axis, angle) * current;
    float current_magnitude = current.magnitude();
    float target_magnitude = target.magnitude();
    float new_magnitude;

    if (current_magnitude < target_magnitude) {
        new_magnitude = min(current_magnitude + max_magnitude, target_magnitude);
    } else if (current_magnitude > target_magnitude) {
        new_magnitude = max(current_magnitude - max_magnitude, target_magnitude);
    } else {
        return rotated;
    }

    return normalize(rotated) * new_magnitude;
}
#endif

} // namespace math
} // namespace portmath
