/*
 * ray.cpp - Ray implementation
 */

#include "ray.hpp"

namespace portmath {
namespace geometry {

Ray2::Ray2(const Ray3& ray)
    : origin(ray.origin.to_vector2()), direction(ray.direction.to_vector2()) {}

math::Vector2 Ray2::closest_point(const math::Vector2& point) const {
    return math::project(point - origin, direction) + origin;
}

float Ray2::distance(const math::Vector2& point) const {
    return math::distance(point, closest_point(point));
}

math::Vector3 Ray3::closest_point(const math::Vector3& point) const {
    return math::project(point - origin, direction) + origin;
}

float Ray3::distance(const math::Vector3& point) const {
    return math::distance(point, closest_point(point));
}

} // namespace geometry
} // namespace portmath
