/*
 * vector2.hpp - 2D Vector
 *
 * Plain value type over the scalar kernel. Equality is approximate
 * (per-component difference below EPSILON).
 */

#ifndef PORTMATH_VECTOR2_HPP
#define PORTMATH_VECTOR2_HPP

#include <type_traits>

#include "../kernel/kernel.hpp"
#include "arithmetic.hpp"

namespace portmath {
namespace math {

struct Vector3;

// New position and velocity produced by smooth_damp()
template<typename V>
struct SmoothDamp {
    V position;
    V velocity;
};

// ============================================================================
// Vector2
// ============================================================================

struct PORTMATH_EMPTY_BASES Vector2 : AddSubArithmetic<Vector2>, MulDivScalar<Vector2> {
    float x, y;

    Vector2() : x(0), y(0) {}
    Vector2(float x_, float y_) : x(x_), y(y_) {}

    static Vector2 zero()  { return Vector2(0, 0); }
    static Vector2 one()   { return Vector2(1, 1); }
    static Vector2 left()  { return Vector2(-1, 0); }
    static Vector2 right() { return Vector2(1, 0); }
    static Vector2 up()    { return Vector2(0, 1); }
    static Vector2 down()  { return Vector2(0, -1); }

    // Unit vector pointing at angle (counter-clockwise from +x)
    static Vector2 from_heading(float angle);
    static Vector2 from_heading_deg(float degrees);

    float heading() const { return atan2(y, x); }
    float heading_deg() const { return rad2deg(heading()); }

    // Replaces the vector with the unit vector of the given heading
    void set_heading(float angle) { *this = from_heading(angle); }
    void set_heading_deg(float degrees) { *this = from_heading_deg(degrees); }

    float magnitude() const;
    float square_magnitude() const { return x * x + y * y; }

    Vector3 to_vector3() const;

    // Arithmetic hooks
    Vector2 add(const Vector2& rhs) const      { return Vector2(x + rhs.x, y + rhs.y); }
    Vector2 subtract(const Vector2& rhs) const { return Vector2(x - rhs.x, y - rhs.y); }
    Vector2 negate() const                     { return Vector2(-x, -y); }
    Vector2 multiply_scalar(float s) const     { return Vector2(x * s, y * s); }
    Vector2 divide_scalar(float s) const;
    Vector2 reciprocal_scalar(float s) const;
};

static_assert(sizeof(Vector2) == 2 * sizeof(float), "Vector2 must be tightly packed");
static_assert(std::is_trivially_copyable<Vector2>::value, "Vector2 must be plain data");

// Comparison
bool approximately(const Vector2& a, const Vector2& b, float epsilon = EPSILON);
inline bool operator==(const Vector2& a, const Vector2& b) { return approximately(a, b); }
inline bool operator!=(const Vector2& a, const Vector2& b) { return !(a == b); }

// ============================================================================
// Vector2 Operations
// ============================================================================

inline float dot(const Vector2& a, const Vector2& b) { return a.x * b.x + a.y * b.y; }

// Clockwise perpendicular (y, -x)
inline Vector2 perpendicular(const Vector2& v) { return Vector2(v.y, -v.x); }

float distance(const Vector2& a, const Vector2& b);

// Component-wise product
inline Vector2 scale(const Vector2& a, const Vector2& b) { return Vector2(a.x * b.x, a.y * b.y); }

// Zero vector stays zero
Vector2 normalize(const Vector2& v);

Vector2 project(const Vector2& v, const Vector2& onto);
Vector2 reject(const Vector2& v, const Vector2& onto);
Vector2 reflect(const Vector2& v, const Vector2& normal);

// Unsigned angle in [0, PI]; 0 when either vector is (near) zero
float angle_between(const Vector2& a, const Vector2& b);
float angle_between_deg(const Vector2& a, const Vector2& b);

// Positive when b lies counter-clockwise of a
float signed_angle_between(const Vector2& a, const Vector2& b);
float signed_angle_between_deg(const Vector2& a, const Vector2& b);

Vector2 lerp(const Vector2& a, const Vector2& b, float t);
Vector2 lerp_unclamped(const Vector2& a, const Vector2& b, float t);

// Steps at most max_delta toward target, landing on it when within reach
Vector2 move_towards(const Vector2& current, const Vector2& target, float max_delta);

SmoothDamp<Vector2> smooth_damp(const Vector2& current, const Vector2& target, const Vector2& velocity,
                                float smooth_time, float max_speed, float delta);

} // namespace math
} // namespace portmath

#endif // PORTMATH_VECTOR2_HPP
