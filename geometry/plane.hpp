/*
 * plane.hpp - Infinite plane
 *
 * Stored as a unit normal n and offset d; a point p lies on the plane when
 * dot(n, p) + d == 0. Points with a positive signed distance are on the side
 * the normal points to.
 */

#ifndef PORTMATH_GEOMETRY_PLANE_HPP
#define PORTMATH_GEOMETRY_PLANE_HPP

#include "ray.hpp"
#include "raycast_info.hpp"

namespace portmath {
namespace geometry {

class Plane {
public:
    // normal is normalized on the way in
    Plane(const math::Vector3& normal, float distance);

    static Plane from_point(const math::Vector3& normal, const math::Vector3& point);
    // Normal follows cross(b - a, c - a)
    static Plane from_triangle(const math::Vector3& a, const math::Vector3& b, const math::Vector3& c);

    static Plane xy_plane() { return Plane(math::Vector3::forward(), 0.0f); }
    static Plane xz_plane() { return Plane(math::Vector3::up(), 0.0f); }
    static Plane yz_plane() { return Plane(math::Vector3::right(), 0.0f); }

    const math::Vector3& normal() const { return normal_; }
    void set_normal(const math::Vector3& value);
    float distance() const { return distance_; }
    void set_distance(float value) { distance_ = value; }

    // Same plane, facing the other way
    Plane flipped() const { return Plane(-normal_, -distance_); }
    Plane operator-() const { return flipped(); }

    // Signed distance from the plane
    float distance_to_point(const math::Vector3& point) const;
    math::Vector3 closest_point(const math::Vector3& point) const;

    bool is_on_plane(const math::Vector3& point) const;
    bool is_on_positive_side(const math::Vector3& point) const { return distance_to_point(point) > 0.0f; }
    bool is_on_same_side(const math::Vector3& a, const math::Vector3& b) const {
        return is_on_positive_side(a) == is_on_positive_side(b);
    }

    // Intersection with the ray's line. is_hit is set only for intersections
    // in front of the origin; a ray parallel to the plane yields an empty
    // result.
    RaycastInfo raycast(const Ray3& ray) const;

private:
    Plane() : distance_(0.0f) {}

    math::Vector3 normal_;
    float distance_;
};

bool operator==(const Plane& a, const Plane& b);
inline bool operator!=(const Plane& a, const Plane& b) { return !(a == b); }

} // namespace geometry
} // namespace portmath

#endif // PORTMATH_GEOMETRY_PLANE_HPP
