/*
 * quaternion.cpp - Quaternion implementation
 */

#include "quaternion.hpp"

namespace portmath {
namespace math {

// Gimbal lock band for euler(): |a*b - c*d| against this fraction of |q|^2
static constexpr float GIMBAL_LOCK_THRESHOLD = 0.499999995f;

// Above this |cos| slerp degrades to a normalized lerp
static constexpr float SLERP_LINEAR_THRESHOLD = 0.9995f;

// ============================================================================
// Construction
// ============================================================================

Quaternion Quaternion::from_axis_angle(const Vector3& axis, float angle) {
    SinCos sc = sin_cos(0.5f * angle);
    Vector3 n = math::normalize(axis);
    return Quaternion(sc.cos, sc.sin * n.x, sc.sin * n.y, sc.sin * n.z);
}

Quaternion Quaternion::from_axis_angle_deg(const Vector3& axis, float degrees) {
    return from_axis_angle(axis, deg2rad(degrees));
}

Quaternion Quaternion::from_euler(const Vector3& angles) {
    SinCos yaw = sin_cos(-0.5f * angles.x);
    SinCos pitch = sin_cos(-0.5f * angles.y);
    SinCos roll = sin_cos(-0.5f * angles.z);

    return Quaternion(
        yaw.cos * pitch.cos * roll.cos - yaw.sin * pitch.sin * roll.sin,
        yaw.cos * pitch.sin * roll.sin - yaw.sin * pitch.cos * roll.cos,
        -(yaw.cos * pitch.sin * roll.cos) - yaw.sin * pitch.cos * roll.sin,
        -(yaw.sin * pitch.sin * roll.cos) - yaw.cos * pitch.cos * roll.sin
    );
}

Quaternion Quaternion::from_euler_deg(const Vector3& degrees) {
    return from_euler(degrees * DEG_TO_RAD);
}

// ============================================================================
// Properties
// ============================================================================

Vector3 Quaternion::euler() const {
    float unit = squared_magnitude();
    if (unit == 0.0f) return Vector3::zero();

    float test = a * b - c * d;

    if (test >= GIMBAL_LOCK_THRESHOLD * unit) {
        return Vector3(PI_OVER_2, 2.0f * atan2(c, a), 0.0f);
    }
    if (test <= -GIMBAL_LOCK_THRESHOLD * unit) {
        return Vector3(-PI_OVER_2, 2.0f * atan2(c, a), 0.0f);
    }

    float aa = a * a;
    float bb = b * b;
    float cc = c * c;
    float dd = d * d;

    return Vector3(
        asin(2.0f * test / unit),
        atan2(2.0f * (b * d + a * c), aa - bb - cc + dd),
        atan2(2.0f * (b * c + a * d), aa - bb + cc - dd)
    );
}

Vector3 Quaternion::euler_deg() const {
    return euler() * RAD_TO_DEG;
}

float Quaternion::magnitude() const {
    float square = squared_magnitude();
    if (square == 0.0f || square == 1.0f) return square;
    return sqrt(square);
}

// ============================================================================
// Algebra
// ============================================================================

Quaternion Quaternion::invert() const {
    float square = squared_magnitude();
    if (square == 0.0f) return *this;
    return conjugate() / square;
}

Quaternion Quaternion::multiply(const Quaternion& rhs) const {
    return Quaternion(
        a * rhs.a - b * rhs.b - c * rhs.c - d * rhs.d,
        a * rhs.b + b * rhs.a + c * rhs.d - d * rhs.c,
        a * rhs.c - b * rhs.d + c * rhs.a + d * rhs.b,
        a * rhs.d + b * rhs.c - c * rhs.b + d * rhs.a
    );
}

Quaternion Quaternion::divide(const Quaternion& rhs) const {
    Quaternion product = multiply(rhs.conjugate());
    return product / product.squared_magnitude();
}

Vector3 Quaternion::multiply(const Vector3& v) const {
    Vector3 axis(b, c, d);
    return v + cross(axis, cross(axis, v) + v * a) * 2.0f;
}

Vector2 Quaternion::multiply(const Vector2& v) const {
    return multiply(v.to_vector3()).to_vector2();
}

Quaternion Quaternion::divide_scalar(float s) const {
    if (s == 0.0f) return Quaternion();
    return Quaternion(a / s, b / s, c / s, d / s);
}

Quaternion Quaternion::reciprocal_scalar(float s) const {
    return Quaternion(a != 0.0f ? s / a : 0.0f,
                      b != 0.0f ? s / b : 0.0f,
                      c != 0.0f ? s / c : 0.0f,
                      d != 0.0f ? s / d : 0.0f);
}

bool approximately(const Quaternion& p, const Quaternion& q, float epsilon) {
    return approx(p.a, q.a, epsilon) && approx(p.b, q.b, epsilon)
        && approx(p.c, q.c, epsilon) && approx(p.d, q.d, epsilon);
}

// ============================================================================
// Interpolation
// ============================================================================

Quaternion slerp(const Quaternion& from, const Quaternion& to, float t) {
    return slerp_unclamped(from, to, clamp(t, 0.0f, 1.0f));
}

Quaternion slerp_unclamped(const Quaternion& from, const Quaternion& to, float t) {
    Quaternion unit_from = from.normalize();
    Quaternion unit_to = to.normalize();
    float cosine = dot(unit_from, unit_to);

    // q and -q are the same rotation; take the shorter arc
    if (cosine < 0.0f) {
        unit_to = -unit_to;
        cosine = -cosine;
    }

    if (cosine > SLERP_LINEAR_THRESHOLD) {
        return (unit_from + (unit_to - unit_from) * t).normalize();
    }

    float angle = t * acos(cosine);
    Quaternion ortho = (unit_to - unit_from * cosine).normalize();
    SinCos sc = sin_cos(angle);

    return unit_from * sc.cos + ortho * sc.sin;
}

} // namespace math
} // namespace portmath
