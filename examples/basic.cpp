/*
 * basic.cpp - Tour of the scalar kernel, vectors, quaternions and planes
 */

#include "portmath.hpp"
#include <cstdio>

using namespace portmath;

int main() {
    printf("portmath kernel: %s\n", math::kernel_mode_to_string(math::active_kernel_mode()));
    printf("  sin(PI/6)   = %f\n", math::sin(math::PI / 6.0f));
    printf("  sqrt(2)     = %f\n", math::sqrt(2.0f));
    printf("  ln(10)      = %f\n", math::ln(10.0f));
    printf("  atan2(1,-1) = %f deg\n", math::atan2_deg(1.0f, -1.0f));

#if !defined(PORTMATH_NO_VECTORS)
    math::Vector3 a(1.0f, 2.0f, 3.0f);
    math::Vector3 b(-2.0f, 0.5f, 1.0f);
    math::Vector3 c = math::cross(a, b);
    printf("\ncross((1,2,3), (-2,0.5,1)) = (%f, %f, %f)\n", c.x, c.y, c.z);
    printf("angle between = %f deg\n", math::angle_between_deg(a, b));

    // Chase a target for one second at 60 Hz
    math::Vector2 position = math::Vector2::zero();
    math::Vector2 velocity = math::Vector2::zero();
    math::Vector2 target(10.0f, 5.0f);
    for (int frame = 0; frame < 60; ++frame) {
        math::SmoothDamp<math::Vector2> step =
            math::smooth_damp(position, target, velocity, 0.25f, 100.0f, 1.0f / 60.0f);
        position = step.position;
        velocity = step.velocity;
    }
    printf("smooth_damp after 1s = (%f, %f)\n", position.x, position.y);
#endif

#if !defined(PORTMATH_NO_QUATERNIONS) && !defined(PORTMATH_NO_VECTORS)
    math::Quaternion q = math::Quaternion::from_euler_deg(math::Vector3(30.0f, 45.0f, 10.0f));
    math::Vector3 rotated = q * math::Vector3::forward();
    math::Vector3 angles = q.euler_deg();
    printf("\nrotated forward = (%f, %f, %f)\n", rotated.x, rotated.y, rotated.z);
    printf("euler (deg)     = (%f, %f, %f)\n", angles.x, angles.y, angles.z);
#endif

#if !defined(PORTMATH_NO_GEOMETRY) && !defined(PORTMATH_NO_VECTORS)
    geometry::Plane ground = geometry::Plane::xz_plane();
    geometry::Ray3 ray(math::Vector3(0.0f, 4.0f, 0.0f), math::Vector3(1.0f, -1.0f, 0.5f));
    geometry::RaycastInfo hit = ground.raycast(ray);
    if (hit.is_hit) {
        printf("\nray hits ground at (%f, %f, %f), t = %f\n",
               hit.point.x, hit.point.y, hit.point.z, hit.distance);
    } else {
        printf("\nray misses ground\n");
    }
#endif

    return 0;
}
