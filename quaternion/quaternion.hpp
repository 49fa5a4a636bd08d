/*
 * quaternion.hpp - Quaternion
 *
 * q = a + b*i + c*j + d*k. Unit quaternions represent 3D rotations; the type
 * does not enforce unit length, but the axis-angle and Euler factories
 * produce unit values.
 *
 * Euler angles are (x, y, z) radians composed as Ry(y) * Rx(x) * Rz(z),
 * i.e. yaw about y, then pitch about x, then roll about z.
 */

#ifndef PORTMATH_QUATERNION_HPP
#define PORTMATH_QUATERNION_HPP

#include "../vector/vector3.hpp"

namespace portmath {
namespace math {

// ============================================================================
// Quaternion
// ============================================================================

struct PORTMATH_EMPTY_BASES Quaternion : AddSubArithmetic<Quaternion>, MulDivScalar<Quaternion> {
    float a, b, c, d;

    Quaternion() : a(0), b(0), c(0), d(0) {}
    Quaternion(float a_, float b_, float c_, float d_) : a(a_), b(b_), c(c_), d(d_) {}

    static Quaternion identity() { return Quaternion(1, 0, 0, 0); }

    // Rotation of angle radians about axis (normalized internally)
    static Quaternion from_axis_angle(const Vector3& axis, float angle);
    static Quaternion from_axis_angle_deg(const Vector3& axis, float degrees);

    static Quaternion from_euler(const Vector3& angles);
    static Quaternion from_euler_deg(const Vector3& degrees);

    // Inverse of from_euler(). Near gimbal lock (pitch at +-PI/2) roll is
    // folded into yaw and returned as 0.
    Vector3 euler() const;
    Vector3 euler_deg() const;
    void set_euler(const Vector3& angles) { *this = from_euler(angles); }
    void set_euler_deg(const Vector3& degrees) { *this = from_euler_deg(degrees); }

    float magnitude() const;
    float squared_magnitude() const { return a * a + b * b + c * c + d * d; }

    Quaternion conjugate() const { return Quaternion(a, -b, -c, -d); }

    // conjugate / squared_magnitude; the zero quaternion is returned as is
    Quaternion invert() const;

    // Zero quaternion stays zero
    Quaternion normalize() const { return *this / magnitude(); }

    // Hamilton product (this * rhs)
    Quaternion multiply(const Quaternion& rhs) const;

    // this * conjugate(rhs), scaled by the product's inverse squared magnitude
    Quaternion divide(const Quaternion& rhs) const;

    // Rotates v by this quaternion: v + 2 * q.xyz x (q.xyz x v + a * v)
    Vector3 multiply(const Vector3& v) const;
    // Rotates v in the z = 0 plane
    Vector2 multiply(const Vector2& v) const;

    // Arithmetic hooks
    Quaternion add(const Quaternion& rhs) const      { return Quaternion(a + rhs.a, b + rhs.b, c + rhs.c, d + rhs.d); }
    Quaternion subtract(const Quaternion& rhs) const { return Quaternion(a - rhs.a, b - rhs.b, c - rhs.c, d - rhs.d); }
    Quaternion negate() const                        { return Quaternion(-a, -b, -c, -d); }
    Quaternion multiply_scalar(float s) const        { return Quaternion(a * s, b * s, c * s, d * s); }
    Quaternion divide_scalar(float s) const;
    Quaternion reciprocal_scalar(float s) const;
};

static_assert(sizeof(Quaternion) == 4 * sizeof(float), "Quaternion must be tightly packed");
static_assert(std::is_trivially_copyable<Quaternion>::value, "Quaternion must be plain data");

inline Quaternion operator*(const Quaternion& lhs, const Quaternion& rhs) { return lhs.multiply(rhs); }
inline Quaternion operator/(const Quaternion& lhs, const Quaternion& rhs) { return lhs.divide(rhs); }
inline Vector3 operator*(const Quaternion& q, const Vector3& v) { return q.multiply(v); }
inline Vector2 operator*(const Quaternion& q, const Vector2& v) { return q.multiply(v); }

inline Quaternion& operator*=(Quaternion& lhs, const Quaternion& rhs) { lhs = lhs.multiply(rhs); return lhs; }
inline Quaternion& operator/=(Quaternion& lhs, const Quaternion& rhs) { lhs = lhs.divide(rhs); return lhs; }

// Comparison
bool approximately(const Quaternion& p, const Quaternion& q, float epsilon = EPSILON);
inline bool operator==(const Quaternion& p, const Quaternion& q) { return approximately(p, q); }
inline bool operator!=(const Quaternion& p, const Quaternion& q) { return !(p == q); }

// ============================================================================
// Quaternion Operations
// ============================================================================

inline float dot(const Quaternion& p, const Quaternion& q) {
    return p.a * q.a + p.b * q.b + p.c * q.c + p.d * q.d;
}

// Shortest-arc spherical interpolation between the normalized operands;
// near-identical rotations fall back to a normalized lerp
Quaternion slerp(const Quaternion& from, const Quaternion& to, float t);
Quaternion slerp_unclamped(const Quaternion& from, const Quaternion& to, float t);

} // namespace math
} // namespace portmath

#endif // PORTMATH_QUATERNION_HPP
