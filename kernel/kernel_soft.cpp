/*
 * kernel_soft.cpp - Self-contained scalar kernel
 *
 * Computes every primitive from add/multiply/divide/compare on 32-bit
 * floats, so it links in freestanding builds without a float library.
 *
 *   sin_cos   whole-turn and half-turn range reduction, then CORDIC
 *   asin/acos cubic minimax polynomial times sqrt(1 - |x|)
 *   atan2     odd minimax polynomial on min/max of |x|, |y|
 *   exp       Taylor series around 0, reciprocal for negative inputs
 *   ln        reduction by 10 and 2, then the alternating series in (x - 1)
 *   sqrt      cubically convergent Halley update on a [1, 4) mantissa
 *
 * Results are bit-reproducible for identical inputs as long as the compiler
 * does not contract multiply-add pairs (the build passes -ffp-contract=off).
 */

#include "kernel_backend.hpp"

#include <limits>

namespace portmath {
namespace math {
namespace kernel {

// ============================================================================
// Internal Helpers
// ============================================================================

static constexpr float INF = std::numeric_limits<float>::infinity();
static constexpr float NOT_A_NUMBER = std::numeric_limits<float>::quiet_NaN();

// 2^23: every float of at least this magnitude is already an integer
static constexpr float INTEGRAL_MAGNITUDE = 8388608.0f;

// Past this the 1 under asinh's root is lost in float rounding
static constexpr float ASINH_LARGE = 1e9f;

static inline bool is_nan(float value) { return value != value; }
static inline bool is_infinite(float value) { return value == INF || value == -INF; }

// ============================================================================
// Basic Operations
// ============================================================================

float SoftKernel::abs(float value) {
    if (value < 0.0f) return -value;
    if (value == 0.0f) return 0.0f;
    return value;
}

float SoftKernel::sign(float value) {
    if (is_nan(value)) return value;
    if (value < 0.0f) return -1.0f;
    if (value > 0.0f) return 1.0f;

    // Signed zero: the reciprocal carries the sign bit
    return (1.0f / value) < 0.0f ? -1.0f : 1.0f;
}

float SoftKernel::min(float a, float b) {
    if (is_nan(a)) return b;
    if (is_nan(b)) return a;
    return (a < b) ? a : b;
}

float SoftKernel::max(float a, float b) {
    if (is_nan(a)) return b;
    if (is_nan(b)) return a;
    return (a > b) ? a : b;
}

// ============================================================================
// Rounding
// ============================================================================

float SoftKernel::trunc(float value) {
    // NaN, infinities and large magnitudes fail the comparison and pass through
    if (!(abs(value) < INTEGRAL_MAGNITUDE)) return value;
    return static_cast<float>(static_cast<int32_t>(value));
}

float SoftKernel::floor(float value) {
    float truncated = trunc(value);
    if (value < 0.0f && truncated != value) return truncated - 1.0f;
    return truncated;
}

float SoftKernel::ceil(float value) {
    float truncated = trunc(value);
    if (value > 0.0f && truncated != value) return truncated + 1.0f;
    return truncated;
}

float SoftKernel::round(float value) {
    float fraction = value - floor(value);
    float truncated = trunc(value);

    if (value < 0.0f && fraction > 0.0f) {
        fraction = 1.0f - fraction;
    }

    // Ties go away from zero
    if (fraction >= 0.5f) return truncated + sign(value);
    return truncated;
}

// ============================================================================
// Roots
// ============================================================================

float SoftKernel::sqrt(float value) {
    if (is_nan(value)) return value;
    if (value == 0.0f) return 0.0f;
    if (value < 0.0f) return NOT_A_NUMBER;
    if (value == 1.0f) return 1.0f;
    if (is_infinite(value)) return value;

    // Scale into [1, 4) by exact powers of four so the absolute stop delta
    // means the same thing for every input magnitude
    float scale = 1.0f;
    while (value >= 4.0f) {
        value *= 0.25f;
        scale *= 2.0f;
    }
    while (value < 1.0f) {
        value *= 4.0f;
        scale *= 0.5f;
    }

    float x = value;
    for (int i = 0; i < SQRT_MAX_ITERATIONS; i++) {
        float x2 = x * x;
        float next = x * (x2 + 3.0f * value) / (3.0f * x2 + value);
        float delta = abs(next - x);
        x = next;
        if (delta < SQRT_STOP_DELTA) break;
    }

    return x * scale;
}

// ============================================================================
// Trigonometry
// ============================================================================

// atan(2^-i) for each CORDIC round
static const float CORDIC_ANGLES[SoftKernel::CORDIC_ITERATIONS] = {
    0.7853982f,        0.4636476f,        0.24497867f,       0.124354996f,
    0.06241881f,       0.031239834f,      0.015623729f,      0.007812341f,
    0.0039062302f,     0.0019531226f,     0.0009765622f,     0.00048828122f,
    0.00024414063f,    0.00012207031f,    0.000061035156f,   0.000030517578f,
    0.00001525878906f, 0.00000762939453f, 0.00000381469727f, 0.00000190734863f,
    0.00000095367432f, 0.00000047683716f, 0.00000023841858f, 0.00000011920929f,
    0.00000005960464f, 0.00000002980232f, 0.00000001490116f, 0.00000000745058f
};

// Product of the CORDIC round gains, pre-applied to the start vector
static constexpr float CORDIC_GAIN = 0.60725293500888f;

SinCos SoftKernel::sin_cos(float angle) {
    if (is_nan(angle) || is_infinite(angle)) {
        return SinCos{ NOT_A_NUMBER, NOT_A_NUMBER };
    }

    // Drop whole turns. The magnitude shrinks every pass, so this ends even
    // where float spacing exceeds a full turn (the angle then collapses to 0).
    while (abs(angle) > TWO_PI) {
        float reduced = angle - TWO_PI * trunc(angle / TWO_PI);
        if (!(abs(reduced) < abs(angle))) {
            angle = 0.0f;
            break;
        }
        angle = reduced;
    }

    // Reflect through PI into [-PI/2, PI/2]; each reflection negates both results
    bool negate = false;
    while (angle < -PI_OVER_2 || angle > PI_OVER_2) {
        angle += (angle < 0.0f) ? PI : -PI;
        negate = !negate;
    }

    float cosine = CORDIC_GAIN;
    float sine = 0.0f;
    float remaining = angle;
    float step = 1.0f;

    for (int i = 0; i < CORDIC_ITERATIONS; i++) {
        float direction = (remaining <= 0.0f) ? -1.0f : 1.0f;
        float next_cosine = cosine - sine * direction * step;
        float next_sine = sine + cosine * direction * step;

        cosine = next_cosine;
        sine = next_sine;
        remaining -= direction * CORDIC_ANGLES[i];
        step *= 0.5f;
    }

    if (negate) return SinCos{ -sine, -cosine };
    return SinCos{ sine, cosine };
}

float SoftKernel::tan(float angle) {
    SinCos sc = sin_cos(angle);
    return sc.sin / sc.cos;
}

// Shared cubic for asin/acos: approximates acos(x) / sqrt(1 - x) on [0, 1]
static float arc_polynomial(float x) {
    float angle = -0.0187293f;
    angle = angle * x + 0.0742610f;
    angle = angle * x - 0.2121144f;
    angle = angle * x + PI_OVER_2;
    return angle;
}

float SoftKernel::asin(float value) {
    if (value < -1.0f || value > 1.0f) return NOT_A_NUMBER;

    float negate = (value < 0.0f) ? 1.0f : 0.0f;
    float x = abs(value);
    float angle = PI * 0.5f - sqrt(1.0f - x) * arc_polynomial(x);

    return angle - 2.0f * negate * angle;
}

float SoftKernel::acos(float value) {
    if (value < -1.0f || value > 1.0f) return NOT_A_NUMBER;

    float negate = (value < 0.0f) ? 1.0f : 0.0f;
    float x = abs(value);
    float angle = arc_polynomial(x) * sqrt(1.0f - x);
    angle -= 2.0f * negate * angle;

    return negate * PI + angle;
}

float SoftKernel::atan(float value) {
    return atan2(value, 1.0f);
}

float SoftKernel::atan2(float y, float x) {
    // Undefined direction, pinned to zero
    if (x == 0.0f && y == 0.0f) return 0.0f;

    float abs_x = abs(x);
    float abs_y = abs(y);
    float ratio = min(abs_x, abs_y) / max(abs_x, abs_y);
    float ratio2 = ratio * ratio;

    float poly = -0.013480470f;
    poly = poly * ratio2 + 0.057477314f;
    poly = poly * ratio2 - 0.121239071f;
    poly = poly * ratio2 + 0.195635925f;
    poly = poly * ratio2 - 0.332994597f;
    poly = poly * ratio2 + 0.999995630f;

    float angle = ratio * poly;

    if (abs_y > abs_x) angle = PI_OVER_2 - angle;
    if (x < 0.0f) angle = PI - angle;
    if (y < 0.0f) angle = -angle;

    return angle;
}

// ============================================================================
// Hyperbolic
// ============================================================================

float SoftKernel::sinh(float value) {
    float e = exp(value);
    if (is_infinite(e) || is_nan(e)) {
        return (value > 0.0f) ? INF : -INF;
    }
    return (e - 1.0f / e) * 0.5f;
}

float SoftKernel::cosh(float value) {
    float e = exp(value);
    if (is_infinite(e) || is_nan(e)) return INF;
    return (e + 1.0f / e) * 0.5f;
}

float SoftKernel::tanh(float value) {
    float e = exp(2.0f * value);
    if (is_infinite(e) || is_nan(e)) {
        return (value > 0.0f) ? 1.0f : -1.0f;
    }
    return (e - 1.0f) / (e + 1.0f);
}

float SoftKernel::asinh(float value) {
    // Odd function; evaluating the positive side avoids cancellation
    if (value < 0.0f) return -asinh(-value);
    // value * value overflows; asinh(x) == ln(2x) to float precision up here
    if (value > ASINH_LARGE) return ln(value) + LN2;
    return ln(value + sqrt(value * value + 1.0f));
}

float SoftKernel::acosh(float value) {
    if (value < 1.0f) return NOT_A_NUMBER;
    return ln(value + sqrt(value * value - 1.0f));
}

float SoftKernel::atanh(float value) {
    if (value >= 1.0f) return INF;
    if (value <= -1.0f) return -INF;
    return 0.5f * ln((1.0f + value) / (1.0f - value));
}

// ============================================================================
// Exponential / Logarithmic
// ============================================================================

float SoftKernel::exp(float value) {
    if (value < 0.0f) return 1.0f / exp(-value);

    float result = 1.0f;
    float term = 1.0f;
    for (int n = 1; n <= EXP_TERMS; n++) {
        term *= value / static_cast<float>(n);
        result += term;
    }

    return result;
}

float SoftKernel::exp2(float value) {
    return exp(value * LN2);
}

float SoftKernel::ln(float value) {
    if (is_nan(value)) return value;
    if (value == 0.0f) return -INF;
    if (value < 0.0f) return NOT_A_NUMBER;
    if (value < 1.0f) {
        // 1 / value overflows below ~2.9e-39; lift tiny inputs by whole decades first
        float lifted = value;
        float decades = 0.0f;
        while (lifted < 1e-30f) {
            lifted *= 10.0f;
            decades += 1.0f;
        }
        return -ln(1.0f / lifted) - decades * LN10;
    }
    if (is_infinite(value)) return INF;
    if (value == 1.0f) return 0.0f;

    float x = value;
    float twos = 0.0f;
    float tens = 0.0f;

    while (x > 10.0f) {
        x /= 10.0f;
        tens += 1.0f;
    }
    while (x >= 2.0f) {
        x *= 0.5f;
        twos += 1.0f;
    }
    // Fold [1.5, 2) onto [0.75, 1) so |x - 1| <= 0.5 and the series converges
    if (x >= 1.5f) {
        x *= 0.5f;
        twos += 1.0f;
    }

    float correction = twos * LN2 + tens * LN10;
    if (x == 1.0f) return correction;

    float t = x - 1.0f;
    float power = t;
    float sum = t;
    float sign = -1.0f;

    for (int i = 2; i <= LN_SERIES_DEGREE; i++) {
        power *= t;
        sum += sign * (power / static_cast<float>(i));
        sign = -sign;
    }

    return sum + correction;
}

float SoftKernel::ln_1p(float value) {
    return ln(value + 1.0f);
}

float SoftKernel::log2(float value) {
    return ln(value) * (1.0f / LN2);
}

float SoftKernel::log10(float value) {
    return ln(value) * (1.0f / LN10);
}

float SoftKernel::pow(float value, float power) {
    return exp(power * ln(value));
}

float SoftKernel::pow_i32(float value, int32_t power) {
    if (power == 0) return 1.0f;
    if (is_nan(value)) return value;

    // Widened so that -INT32_MIN does not overflow
    int64_t count = power;
    if (count < 0) count = -count;

    bool negative = value < 0.0f && (count % 2) == 1;
    float magnitude = abs(value);
    float result = magnitude;

    if (magnitude != 1.0f) {
        for (int64_t i = 1; i < count; i++) {
            result *= magnitude;
            // 0 and infinity are fixed points of further multiplication
            if (result == 0.0f || is_infinite(result)) break;
        }
    }

    if (negative) result = -result;
    if (power < 0) return 1.0f / result;
    return result;
}

} // namespace kernel
} // namespace math
} // namespace portmath
