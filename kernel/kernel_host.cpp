/*
 * kernel_host.cpp - Host-delegated scalar kernel
 *
 * Forwards each primitive to the platform float library.
 */

#include "kernel_backend.hpp"

#if defined(PORTMATH_HAS_HOST_KERNEL)

#include <cmath>

namespace portmath {
namespace math {
namespace kernel {

// ============================================================================
// Basic Operations
// ============================================================================

float HostKernel::abs(float value) { return std::fabs(value); }

float HostKernel::sign(float value) {
    if (std::isnan(value)) return value;
    return std::copysign(1.0f, value);
}

float HostKernel::min(float a, float b) { return std::fmin(a, b); }
float HostKernel::max(float a, float b) { return std::fmax(a, b); }

// ============================================================================
// Rounding
// ============================================================================

float HostKernel::trunc(float value) { return std::trunc(value); }
float HostKernel::floor(float value) { return std::floor(value); }
float HostKernel::ceil(float value)  { return std::ceil(value); }
float HostKernel::round(float value) { return std::round(value); }

// ============================================================================
// Roots
// ============================================================================

float HostKernel::sqrt(float value) {
    // sqrt(-0.0) is -0.0 on the host, report it as plain zero
    if (value == 0.0f) return 0.0f;
    return std::sqrt(value);
}

// ============================================================================
// Trigonometry
// ============================================================================

SinCos HostKernel::sin_cos(float angle) {
    return SinCos{ std::sin(angle), std::cos(angle) };
}

float HostKernel::tan(float angle)   { return std::tan(angle); }
float HostKernel::asin(float value)  { return std::asin(value); }
float HostKernel::acos(float value)  { return std::acos(value); }
float HostKernel::atan(float value)  { return std::atan(value); }
float HostKernel::atan2(float y, float x) { return std::atan2(y, x); }

// ============================================================================
// Hyperbolic
// ============================================================================

float HostKernel::sinh(float value)  { return std::sinh(value); }
float HostKernel::cosh(float value)  { return std::cosh(value); }
float HostKernel::tanh(float value)  { return std::tanh(value); }
float HostKernel::asinh(float value) { return std::asinh(value); }
float HostKernel::acosh(float value) { return std::acosh(value); }

float HostKernel::atanh(float value) {
    // std::atanh is NaN beyond +-1, the kernel contract saturates instead
    if (value >= 1.0f) return HUGE_VALF;
    if (value <= -1.0f) return -HUGE_VALF;
    return std::atanh(value);
}

// ============================================================================
// Exponential / Logarithmic
// ============================================================================

float HostKernel::exp(float value)   { return std::exp(value); }
float HostKernel::exp2(float value)  { return std::exp2(value); }
float HostKernel::ln(float value)    { return std::log(value); }
float HostKernel::ln_1p(float value) { return std::log1p(value); }
float HostKernel::log2(float value)  { return std::log2(value); }
float HostKernel::log10(float value) { return std::log10(value); }

float HostKernel::pow(float value, float power) { return std::pow(value, power); }

float HostKernel::pow_i32(float value, int32_t power) {
    if (power == 0) return 1.0f;
    // Large odd exponents are not representable as float; keep the parity
    return static_cast<float>(std::pow(static_cast<double>(value), static_cast<double>(power)));
}

} // namespace kernel
} // namespace math
} // namespace portmath

#endif // PORTMATH_HAS_HOST_KERNEL
