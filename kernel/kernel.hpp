/*
 * kernel.hpp - Portable 32-bit Scalar Math Kernel
 *
 * Stateless float functions: sign/min/max/clamp, rounding, interpolation and
 * the transcendental set (trig, hyperbolic, exp/log, pow, sqrt).
 *
 * Each transcendental primitive forwards to kernel::ActiveKernel, which the
 * build binds to either the host float library or the self-contained
 * realization (see kernel_backend.hpp). Domain violations are reported
 * through NaN and +-infinity; nothing here throws, allocates or logs.
 */

#ifndef PORTMATH_KERNEL_HPP
#define PORTMATH_KERNEL_HPP

#include <cstdint>

#include "constants.hpp"
#include "kernel_backend.hpp"

namespace portmath {
namespace math {

// ============================================================================
// Configuration Queries
// ============================================================================

KernelMode active_kernel_mode();
const char* kernel_mode_to_string(KernelMode mode);

// True if the realization was compiled into this build
bool is_kernel_mode_available(KernelMode mode);

// ============================================================================
// Basic Operations
// ============================================================================

struct MinMax {
    float min;
    float max;
};

inline float abs(float value) { return kernel::ActiveKernel::abs(value); }
int32_t abs_i32(int32_t value);

// -1 or 1 following the sign bit (so sign(-0.0) == -1); NaN for NaN
inline float sign(float value) { return kernel::ActiveKernel::sign(value); }

// NaN operands are ignored in favor of the other argument
inline float min(float a, float b) { return kernel::ActiveKernel::min(a, b); }
inline float max(float a, float b) { return kernel::ActiveKernel::max(a, b); }
inline MinMax min_max(float a, float b) { return MinMax{ min(a, b), max(a, b) }; }

inline float clamp(float value, float min_value, float max_value) {
    if (value < min_value) return min_value;
    if (value > max_value) return max_value;
    return value;
}

inline bool approx(float a, float b, float epsilon = EPSILON) {
    return abs(a - b) < epsilon;
}

// ============================================================================
// Rounding
// ============================================================================

inline float trunc(float value) { return kernel::ActiveKernel::trunc(value); }
inline float floor(float value) { return kernel::ActiveKernel::floor(value); }
inline float ceil(float value)  { return kernel::ActiveKernel::ceil(value); }

// Ties round away from zero
inline float round(float value) { return kernel::ActiveKernel::round(value); }

// Fractional part in [0, 1), measured up from floor(value)
inline float fract(float value) { return value - floor(value); }

// Rounds to the given decimal position (digits clamped to [-15, 15]).
// round_to_digit(1.2345, 2) == 1.23, round_to_digit(1250, -2) == 1300
float round_to_digit(float value, int32_t digits);

// ============================================================================
// Interpolation
// ============================================================================

inline float lerp_unclamped(float a, float b, float t) { return a + t * (b - a); }

// t is clamped to [0, 1]
inline float lerp(float a, float b, float t) { return lerp_unclamped(a, b, clamp(t, 0.0f, 1.0f)); }

// Linear map of value from in_range onto out_range (no clamping)
float map(float value, Range in_range, Range out_range);

// Wraps value into range; values already inside are returned untouched.
// Values below the range are mirrored from the end: repeat(1, 2..3) == 3
float repeat(float value, Range range);

// Hermite smoothing of value between the two edges, result in [0, 1]
float smoothstep(float value, float left_edge, float right_edge);

// ============================================================================
// Angles
// ============================================================================

inline float deg2rad(float degrees) { return degrees * DEG_TO_RAD; }
inline float rad2deg(float radians) { return radians * RAD_TO_DEG; }

// ============================================================================
// Trigonometry
// ============================================================================

// The combined primitive; sin() and cos() are views of it
inline SinCos sin_cos(float angle) { return kernel::ActiveKernel::sin_cos(angle); }
inline SinCos sin_cos_deg(float degrees) { return sin_cos(deg2rad(degrees)); }

inline float sin(float angle) { return sin_cos(angle).sin; }
inline float cos(float angle) { return sin_cos(angle).cos; }
inline float tan(float angle) { return kernel::ActiveKernel::tan(angle); }

inline float sec(float angle) { return 1.0f / cos(angle); }
inline float csc(float angle) { return 1.0f / sin(angle); }
inline float cot(float angle) { return 1.0f / tan(angle); }

inline float sin_deg(float degrees) { return sin(deg2rad(degrees)); }
inline float cos_deg(float degrees) { return cos(deg2rad(degrees)); }
inline float tan_deg(float degrees) { return tan(deg2rad(degrees)); }
inline float sec_deg(float degrees) { return sec(deg2rad(degrees)); }
inline float csc_deg(float degrees) { return csc(deg2rad(degrees)); }
inline float cot_deg(float degrees) { return cot(deg2rad(degrees)); }

// Domain [-1, 1], NaN outside
inline float asin(float value) { return kernel::ActiveKernel::asin(value); }
inline float acos(float value) { return kernel::ActiveKernel::acos(value); }
inline float atan(float value) { return kernel::ActiveKernel::atan(value); }

// Full-circle angle of (x, y). atan2(0, 0) is 0 in every build.
inline float atan2(float y, float x) {
    if (y == 0.0f && x == 0.0f) return 0.0f;
    return kernel::ActiveKernel::atan2(y, x);
}

inline float asin_deg(float value) { return rad2deg(asin(value)); }
inline float acos_deg(float value) { return rad2deg(acos(value)); }
inline float atan_deg(float value) { return rad2deg(atan(value)); }
inline float atan2_deg(float y, float x) { return rad2deg(atan2(y, x)); }

// ============================================================================
// Hyperbolic
// ============================================================================

inline float sinh(float value) { return kernel::ActiveKernel::sinh(value); }
inline float cosh(float value) { return kernel::ActiveKernel::cosh(value); }
inline float tanh(float value) { return kernel::ActiveKernel::tanh(value); }

inline float asinh(float value) { return kernel::ActiveKernel::asinh(value); }
// NaN below 1
inline float acosh(float value) { return kernel::ActiveKernel::acosh(value); }
// +-infinity at and beyond +-1
inline float atanh(float value) { return kernel::ActiveKernel::atanh(value); }

// ============================================================================
// Exponential / Logarithmic
// ============================================================================

inline float exp(float value)  { return kernel::ActiveKernel::exp(value); }
inline float exp2(float value) { return kernel::ActiveKernel::exp2(value); }

// ln(0) == -inf, ln(negative) == NaN, ln(inf) == inf
inline float ln(float value)    { return kernel::ActiveKernel::ln(value); }
inline float ln_1p(float value) { return kernel::ActiveKernel::ln_1p(value); }
inline float log2(float value)  { return kernel::ActiveKernel::log2(value); }
inline float log10(float value) { return kernel::ActiveKernel::log10(value); }
inline float log(float value, float base) { return ln(value) / ln(base); }

inline float pow_i32(float value, int32_t power) { return kernel::ActiveKernel::pow_i32(value, power); }

// Short-circuits trivial and integral powers before the general exp/ln path
float pow(float value, float power);

// Negative inputs give NaN; sqrt(-0.0) == 0
inline float sqrt(float value) { return kernel::ActiveKernel::sqrt(value); }

} // namespace math
} // namespace portmath

#endif // PORTMATH_KERNEL_HPP
