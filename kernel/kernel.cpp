/*
 * kernel.cpp - Scalar kernel functions shared by both realizations
 */

#include "kernel.hpp"

namespace portmath {
namespace math {

//=============================================================================
// Configuration Queries
//=============================================================================

KernelMode active_kernel_mode() {
    return kernel::ActiveKernel::mode;
}

const char* kernel_mode_to_string(KernelMode mode) {
    switch (mode) {
        case KernelMode::HostDelegated: return "host-delegated";
        case KernelMode::SelfContained: return "self-contained";
        default: return "Unknown";
    }
}

bool is_kernel_mode_available(KernelMode mode) {
    switch (mode) {
        case KernelMode::HostDelegated:
#if defined(PORTMATH_HAS_HOST_KERNEL)
            return true;
#else
            return false;
#endif
        case KernelMode::SelfContained:
            return true;
        default:
            return false;
    }
}

//=============================================================================
// Basic Operations
//=============================================================================

int32_t abs_i32(int32_t value) {
    // INT32_MIN has no positive counterpart and is returned unchanged
    if (value < 0 && value != INT32_MIN) return -value;
    return value;
}

//=============================================================================
// Rounding
//=============================================================================

float round_to_digit(float value, int32_t digits) {
    if (digits < -15) digits = -15;
    if (digits > 15) digits = 15;

    float pow10 = pow_i32(10.0f, digits);
    float powered = value * pow10;
    float fraction = fract(powered);
    float truncated = trunc(powered);

    if (fraction == 0.0f) return value;
    if (value < 0.0f) fraction = 1.0f - fraction;

    if (fraction >= 0.5f) {
        return (truncated + sign(value)) / pow10;
    }
    return truncated / pow10;
}

//=============================================================================
// Interpolation
//=============================================================================

float map(float value, Range in_range, Range out_range) {
    return (value - in_range.start)
        * (out_range.end - out_range.start)
        / (in_range.end - in_range.start)
        + out_range.start;
}

float repeat(float value, Range range) {
    if (value >= range.start && value <= range.end) return value;

    float offset = value - range.start;
    float span = range.end - range.start;
    float inv_span = 1.0f / span;

    // Below the range the wrap is measured back from the end
    if (offset < 0.0f) {
        return range.end - span * fract(offset * inv_span);
    }
    return span * fract(offset * inv_span) + range.start;
}

float smoothstep(float value, float left_edge, float right_edge) {
    float t = clamp((value - left_edge) / (right_edge - left_edge), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

//=============================================================================
// Exponential
//=============================================================================

// Integral powers up to 2^24 go through pow_i32
static constexpr float MAX_INTEGRAL_POWER = 16777216.0f;

float pow(float value, float power) {
    if (power == 0.0f) return 1.0f;
    if (power == 1.0f) return value;
    if (value == 1.0f) return 1.0f;
    if (value == 2.0f) return exp2(power);

    if (abs(power) <= MAX_INTEGRAL_POWER && fract(power) == 0.0f) {
        return pow_i32(value, static_cast<int32_t>(floor(power)));
    }

    return kernel::ActiveKernel::pow(value, power);
}

} // namespace math
} // namespace portmath
