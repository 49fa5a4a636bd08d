/*
 * portmath.hpp - Portable 32-bit float math
 *
 * Modules (selected at build time):
 *   - Scalar kernel (always)
 *   - Vector2 / Vector3          unless PORTMATH_NO_VECTORS
 *   - Quaternion                 unless PORTMATH_NO_QUATERNIONS (needs vectors)
 *   - Rays, planes, raycasts     unless PORTMATH_NO_GEOMETRY (needs vectors)
 *
 * Kernel realization:
 *   - host float library         default
 *   - self-contained             PORTMATH_KERNEL_SELF_CONTAINED
 *   - self-contained, no <cmath> PORTMATH_FREESTANDING
 *
 * The Boost.Geometry adapters (geometry/shapes.hpp) and the kernel deviation
 * report (report/kernel_report.hpp) are included separately.
 */

#ifndef PORTMATH_HPP
#define PORTMATH_HPP

#include "kernel/kernel.hpp"

#if !defined(PORTMATH_NO_VECTORS)
    #include "vector/vector2.hpp"
    #include "vector/vector3.hpp"

    #if !defined(PORTMATH_NO_QUATERNIONS)
        #include "quaternion/quaternion.hpp"
    #endif

    #if !defined(PORTMATH_NO_GEOMETRY)
        #include "geometry/raycast_info.hpp"
        #include "geometry/ray.hpp"
        #include "geometry/plane.hpp"
    #endif
#endif

#endif // PORTMATH_HPP
