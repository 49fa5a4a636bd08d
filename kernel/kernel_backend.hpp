/*
 * kernel_backend.hpp - Scalar kernel realizations
 *
 * Every primitive of the scalar kernel has two realizations with identical
 * signatures:
 *   - HostKernel: defers to the platform float library (<cmath>)
 *   - SoftKernel: computed from add/multiply/compare on 32-bit floats only
 *
 * The build selects one of them as ActiveKernel. The public functions in
 * kernel.hpp forward to ActiveKernel, so the choice is made once per build
 * and never per call. Both types stay callable by name so the two can be
 * compared in the same process (see report/kernel_report.hpp).
 */

#ifndef PORTMATH_KERNEL_BACKEND_HPP
#define PORTMATH_KERNEL_BACKEND_HPP

#include <cstdint>

#include "constants.hpp"

//=============================================================================
// Realization Selection
// These may already be defined by the build system (CMake), so check first
//=============================================================================

#if defined(PORTMATH_FREESTANDING)
    #ifndef PORTMATH_KERNEL_SELF_CONTAINED
    #define PORTMATH_KERNEL_SELF_CONTAINED
    #endif
#else
    #ifndef PORTMATH_HAS_HOST_KERNEL
    #define PORTMATH_HAS_HOST_KERNEL
    #endif
#endif

namespace portmath {
namespace math {

enum class KernelMode : uint8_t {
    HostDelegated = 0,
    SelfContained
};

namespace kernel {

#if defined(PORTMATH_HAS_HOST_KERNEL)

struct HostKernel {
    static constexpr KernelMode mode = KernelMode::HostDelegated;

    static float abs(float value);
    static float sign(float value);
    static float min(float a, float b);
    static float max(float a, float b);

    static float trunc(float value);
    static float floor(float value);
    static float ceil(float value);
    static float round(float value);

    static float sqrt(float value);

    static SinCos sin_cos(float angle);
    static float tan(float angle);
    static float asin(float value);
    static float acos(float value);
    static float atan(float value);
    static float atan2(float y, float x);

    static float sinh(float value);
    static float cosh(float value);
    static float tanh(float value);
    static float asinh(float value);
    static float acosh(float value);
    static float atanh(float value);

    static float exp(float value);
    static float exp2(float value);
    static float ln(float value);
    static float ln_1p(float value);
    static float log2(float value);
    static float log10(float value);

    static float pow(float value, float power);
    static float pow_i32(float value, int32_t power);
};

#endif // PORTMATH_HAS_HOST_KERNEL

struct SoftKernel {
    static constexpr KernelMode mode = KernelMode::SelfContained;

    // CORDIC rounds used by sin_cos()
    static constexpr int CORDIC_ITERATIONS = 28;
    // Taylor terms summed by exp()
    static constexpr int EXP_TERMS = 100;
    // Highest power of (x - 1) in the ln() series
    static constexpr int LN_SERIES_DEGREE = 16;
    // Iteration cap and stop delta of sqrt()
    static constexpr int SQRT_MAX_ITERATIONS = 50;
    static constexpr float SQRT_STOP_DELTA = 1e-9f;

    static float abs(float value);
    static float sign(float value);
    static float min(float a, float b);
    static float max(float a, float b);

    static float trunc(float value);
    static float floor(float value);
    static float ceil(float value);
    static float round(float value);

    static float sqrt(float value);

    static SinCos sin_cos(float angle);
    static float tan(float angle);
    static float asin(float value);
    static float acos(float value);
    static float atan(float value);
    static float atan2(float y, float x);

    static float sinh(float value);
    static float cosh(float value);
    static float tanh(float value);
    static float asinh(float value);
    static float acosh(float value);
    static float atanh(float value);

    static float exp(float value);
    static float exp2(float value);
    static float ln(float value);
    static float ln_1p(float value);
    static float log2(float value);
    static float log10(float value);

    static float pow(float value, float power);
    static float pow_i32(float value, int32_t power);
};

#if defined(PORTMATH_KERNEL_SELF_CONTAINED)
using ActiveKernel = SoftKernel;
#else
using ActiveKernel = HostKernel;
#endif

} // namespace kernel
} // namespace math
} // namespace portmath

#endif // PORTMATH_KERNEL_BACKEND_HPP
