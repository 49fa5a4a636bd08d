/*
 * constants.hpp - Scalar constants and small value types shared by the kernel
 *
 * Constants are stored at the literal precision the kernel is calibrated
 * against, then truncated to 32-bit float. Do not replace them with
 * higher-precision literals: the trig and log identities are tuned to these.
 */

#ifndef PORTMATH_KERNEL_CONSTANTS_HPP
#define PORTMATH_KERNEL_CONSTANTS_HPP

namespace portmath {
namespace math {

// ============================================================================
// Constants
// ============================================================================

constexpr float PI         = 3.14159265359f;
constexpr float PI_OVER_2  = 1.570796326f;
constexpr float PI_OVER_4  = 0.785398163f;
constexpr float TWO_PI     = 6.28318530718f;
constexpr float E          = 2.71828182845f;
constexpr float DEG_TO_RAD = 0.01745329251f;
constexpr float RAD_TO_DEG = 57.2957795131f;
constexpr float LN2        = 0.69314718056f;
constexpr float LN10       = 2.30258509299f;

// Default tolerance for approximate equality of scalars and composite types
constexpr float EPSILON = 1e-6f;

// ============================================================================
// Value Types
// ============================================================================

// Result of the combined sine/cosine primitive
struct SinCos {
    float sin;
    float cos;
};

// Closed interval used by map() and repeat(). start may exceed end.
struct Range {
    float start;
    float end;
};

} // namespace math
} // namespace portmath

#endif // PORTMATH_KERNEL_CONSTANTS_HPP
