/*
 * plane.cpp - Plane implementation
 */

#include "plane.hpp"

namespace portmath {
namespace geometry {

Plane::Plane(const math::Vector3& normal, float distance)
    : normal_(math::normalize(normal)), distance_(distance) {}

Plane Plane::from_point(const math::Vector3& normal, const math::Vector3& point) {
    Plane plane;
    plane.normal_ = math::normalize(normal);
    plane.distance_ = -math::dot(plane.normal_, point);
    return plane;
}

Plane Plane::from_triangle(const math::Vector3& a, const math::Vector3& b, const math::Vector3& c) {
    Plane plane;
    plane.normal_ = math::normalize(math::cross(b - a, c - a));
    plane.distance_ = -math::dot(plane.normal_, a);
    return plane;
}

void Plane::set_normal(const math::Vector3& value) {
    normal_ = math::normalize(value);
}

float Plane::distance_to_point(const math::Vector3& point) const {
    return math::dot(normal_, point) + distance_;
}

math::Vector3 Plane::closest_point(const math::Vector3& point) const {
    return point - normal_ * distance_to_point(point);
}

bool Plane::is_on_plane(const math::Vector3& point) const {
    return math::approx(distance_to_point(point), 0.0f);
}

RaycastInfo Plane::raycast(const Ray3& ray) const {
    float facing = math::dot(ray.direction, normal_);
    if (math::approx(facing, 0.0f)) {
        return RaycastInfo::empty();
    }

    float t = -(math::dot(ray.origin, normal_) + distance_) / facing;
    return RaycastInfoBuilder()
        .set_hit(t > 0.0f)
        .set_distance(t)
        .set_normal(normal_)
        .set_point(ray.get_point(t))
        .build();
}

bool operator==(const Plane& a, const Plane& b) {
    return a.normal() == b.normal() && math::approx(a.distance(), b.distance());
}

} // namespace geometry
} // namespace portmath
