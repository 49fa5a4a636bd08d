/*
 * ray.hpp - 2D and 3D rays
 *
 * A ray is an origin plus a direction. The direction is not normalized, so
 * get_point(t) is origin + direction * t. Scalar multiply and divide scale
 * the direction only.
 */

#ifndef PORTMATH_GEOMETRY_RAY_HPP
#define PORTMATH_GEOMETRY_RAY_HPP

#include "../vector/vector3.hpp"

namespace portmath {
namespace geometry {

struct Ray3;

// ============================================================================
// Ray2
// ============================================================================

struct PORTMATH_EMPTY_BASES Ray2 : math::MulDivScalar<Ray2> {
    math::Vector2 origin;
    math::Vector2 direction;

    Ray2() {}
    Ray2(const math::Vector2& origin_, const math::Vector2& direction_)
        : origin(origin_), direction(direction_) {}
    // Drops z
    explicit Ray2(const Ray3& ray);

    math::Vector2 get_point(float distance) const { return origin + direction * distance; }

    // Point on the ray's line nearest to point
    math::Vector2 closest_point(const math::Vector2& point) const;
    float distance(const math::Vector2& point) const;

    Ray2 operator-() const { return Ray2(origin, -direction); }

    // Scalar hooks
    Ray2 multiply_scalar(float s) const   { return Ray2(origin, direction * s); }
    Ray2 divide_scalar(float s) const     { return Ray2(origin, direction / s); }
    Ray2 reciprocal_scalar(float s) const { return Ray2(origin, s / direction); }
};

// ============================================================================
// Ray3
// ============================================================================

struct PORTMATH_EMPTY_BASES Ray3 : math::MulDivScalar<Ray3> {
    math::Vector3 origin;
    math::Vector3 direction;

    Ray3() {}
    Ray3(const math::Vector3& origin_, const math::Vector3& direction_)
        : origin(origin_), direction(direction_) {}
    explicit Ray3(const Ray2& ray)
        : origin(ray.origin.to_vector3()), direction(ray.direction.to_vector3()) {}

    math::Vector3 get_point(float distance) const { return origin + direction * distance; }

    math::Vector3 closest_point(const math::Vector3& point) const;
    float distance(const math::Vector3& point) const;

    Ray3 operator-() const { return Ray3(origin, -direction); }

    Ray3 multiply_scalar(float s) const   { return Ray3(origin, direction * s); }
    Ray3 divide_scalar(float s) const     { return Ray3(origin, direction / s); }
    Ray3 reciprocal_scalar(float s) const { return Ray3(origin, s / direction); }
};

inline bool operator==(const Ray2& a, const Ray2& b) { return a.origin == b.origin && a.direction == b.direction; }
inline bool operator!=(const Ray2& a, const Ray2& b) { return !(a == b); }
inline bool operator==(const Ray3& a, const Ray3& b) { return a.origin == b.origin && a.direction == b.direction; }
inline bool operator!=(const Ray3& a, const Ray3& b) { return !(a == b); }

} // namespace geometry
} // namespace portmath

#endif // PORTMATH_GEOMETRY_RAY_HPP
