/*
 * vector3.hpp - 3D Vector
 *
 * Plain value type over the scalar kernel, plus the mixed Vector2/Vector3
 * arithmetic. Equality is approximate (per-component difference below
 * EPSILON).
 */

#ifndef PORTMATH_VECTOR3_HPP
#define PORTMATH_VECTOR3_HPP

#include "vector2.hpp"

namespace portmath {
namespace math {

// ============================================================================
// Vector3
// ============================================================================

struct PORTMATH_EMPTY_BASES Vector3 : AddSubArithmetic<Vector3>, MulDivScalar<Vector3> {
    float x, y, z;

    Vector3() : x(0), y(0), z(0) {}
    Vector3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
    explicit Vector3(const Vector2& v, float z_ = 0.0f) : x(v.x), y(v.y), z(z_) {}

    static Vector3 zero()    { return Vector3(0, 0, 0); }
    static Vector3 one()     { return Vector3(1, 1, 1); }
    static Vector3 left()    { return Vector3(-1, 0, 0); }
    static Vector3 right()   { return Vector3(1, 0, 0); }
    static Vector3 up()      { return Vector3(0, 1, 0); }
    static Vector3 down()    { return Vector3(0, -1, 0); }
    static Vector3 forward() { return Vector3(0, 0, 1); }
    static Vector3 back()    { return Vector3(0, 0, -1); }

    // Spherical direction: theta is the azimuth in the xy plane, phi the
    // elevation toward +z. (cos(phi)cos(theta), cos(phi)sin(theta), sin(phi))
    static Vector3 from_angles(float theta, float phi);
    static Vector3 from_angles_deg(float theta, float phi);

    float magnitude() const;
    float square_magnitude() const { return x * x + y * y + z * z; }

    Vector2 to_vector2() const { return Vector2(x, y); }

    // Arithmetic hooks
    Vector3 add(const Vector3& rhs) const      { return Vector3(x + rhs.x, y + rhs.y, z + rhs.z); }
    Vector3 subtract(const Vector3& rhs) const { return Vector3(x - rhs.x, y - rhs.y, z - rhs.z); }
    Vector3 negate() const                     { return Vector3(-x, -y, -z); }
    Vector3 multiply_scalar(float s) const     { return Vector3(x * s, y * s, z * s); }
    Vector3 divide_scalar(float s) const;
    Vector3 reciprocal_scalar(float s) const;
};

static_assert(sizeof(Vector3) == 3 * sizeof(float), "Vector3 must be tightly packed");
static_assert(std::is_trivially_copyable<Vector3>::value, "Vector3 must be plain data");

// Comparison
bool approximately(const Vector3& a, const Vector3& b, float epsilon = EPSILON);
inline bool operator==(const Vector3& a, const Vector3& b) { return approximately(a, b); }
inline bool operator!=(const Vector3& a, const Vector3& b) { return !(a == b); }

// Mixed-dimension arithmetic. A Vector2 acts as (x, y, 0): adding one to a
// Vector3 leaves z alone, adding a Vector3 to a Vector2 yields a Vector3.
inline Vector3 operator+(const Vector3& a, const Vector2& b) { return Vector3(a.x + b.x, a.y + b.y, a.z); }
inline Vector3 operator-(const Vector3& a, const Vector2& b) { return Vector3(a.x - b.x, a.y - b.y, a.z); }
inline Vector3 operator+(const Vector2& a, const Vector3& b) { return Vector3(a.x + b.x, a.y + b.y, b.z); }
inline Vector3 operator-(const Vector2& a, const Vector3& b) { return Vector3(a.x - b.x, a.y - b.y, -b.z); }

inline Vector3& operator+=(Vector3& a, const Vector2& b) { a.x += b.x; a.y += b.y; return a; }
inline Vector3& operator-=(Vector3& a, const Vector2& b) { a.x -= b.x; a.y -= b.y; return a; }
inline Vector2& operator+=(Vector2& a, const Vector3& b) { a.x += b.x; a.y += b.y; return a; }
inline Vector2& operator-=(Vector2& a, const Vector3& b) { a.x -= b.x; a.y -= b.y; return a; }

// ============================================================================
// Vector3 Operations
// ============================================================================

inline float dot(const Vector3& a, const Vector3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vector3 cross(const Vector3& a, const Vector3& b) {
    return Vector3(a.y * b.z - a.z * b.y,
                   a.z * b.x - a.x * b.z,
                   a.x * b.y - a.y * b.x);
}

float distance(const Vector3& a, const Vector3& b);

// Component-wise product
inline Vector3 scale(const Vector3& a, const Vector3& b) { return Vector3(a.x * b.x, a.y * b.y, a.z * b.z); }

// Zero vector stays zero
Vector3 normalize(const Vector3& v);

// Projection onto a zero vector is the zero vector
Vector3 project(const Vector3& v, const Vector3& onto);
Vector3 reject(const Vector3& v, const Vector3& onto);
Vector3 reflect(const Vector3& v, const Vector3& normal);

// Unsigned angle in [0, PI]; 0 when either vector is (near) zero
float angle_between(const Vector3& a, const Vector3& b);
float angle_between_deg(const Vector3& a, const Vector3& b);

// Positive when cross(a, b) points along axis
float signed_angle_between(const Vector3& a, const Vector3& b, const Vector3& axis);
float signed_angle_between_deg(const Vector3& a, const Vector3& b, const Vector3& axis);

Vector3 lerp(const Vector3& a, const Vector3& b, float t);
Vector3 lerp_unclamped(const Vector3& a, const Vector3& b, float t);

// Spherical interpolation of direction along the shorter arc, with the
// magnitude interpolated linearly. Near-parallel inputs fall back to a
// normalized lerp.
Vector3 slerp(const Vector3& a, const Vector3& b, float t);
Vector3 slerp_unclamped(const Vector3& a, const Vector3& b, float t);

// Steps at most max_delta toward target, landing on it when within reach
Vector3 move_towards(const Vector3& current, const Vector3& target, float max_delta);

SmoothDamp<Vector3> smooth_damp(const Vector3& current, const Vector3& target, const Vector3& velocity,
                                float smooth_time, float max_speed, float delta);

#if !defined(PORTMATH_NO_QUATERNIONS)
// Rotates current toward target by at most max_radians, and moves its length
// toward the target's by at most max_magnitude.
Vector3 rotate_towards(const Vector3& current, const Vector3& target,
                       float max_radians, float max_magnitude);
#endif

} // namespace math
} // namespace portmath

#endif // PORTMATH_VECTOR3_HPP
