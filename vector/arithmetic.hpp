/*
 * arithmetic.hpp - Arithmetic capability mixins for value types
 *
 * A value type opts into the operator set by deriving from these templates
 * (CRTP) and implementing the hook members they call:
 *
 *   AddSubArithmetic<T>   T add(const T&) const, T subtract(const T&) const,
 *                         T negate() const
 *   MulDivScalar<T>       T multiply_scalar(float) const,
 *                         T divide_scalar(float) const,
 *                         T reciprocal_scalar(float) const   (for float / T)
 *
 * The operators are hidden friends, found only through argument-dependent
 * lookup on T. Bases are empty, so they add no storage to the value type.
 */

#ifndef PORTMATH_VECTOR_ARITHMETIC_HPP
#define PORTMATH_VECTOR_ARITHMETIC_HPP

// MSVC only collapses one empty base unless asked to
#if defined(_MSC_VER)
#define PORTMATH_EMPTY_BASES __declspec(empty_bases)
#else
#define PORTMATH_EMPTY_BASES
#endif

namespace portmath {
namespace math {

template<typename T>
struct AddSubArithmetic {
    friend T operator+(const T& lhs, const T& rhs) { return lhs.add(rhs); }
    friend T operator-(const T& lhs, const T& rhs) { return lhs.subtract(rhs); }
    friend T operator-(const T& value)             { return value.negate(); }

    friend T& operator+=(T& lhs, const T& rhs) { lhs = lhs.add(rhs); return lhs; }
    friend T& operator-=(T& lhs, const T& rhs) { lhs = lhs.subtract(rhs); return lhs; }
};

template<typename T>
struct MulDivScalar {
    friend T operator*(const T& lhs, float rhs) { return lhs.multiply_scalar(rhs); }
    friend T operator*(float lhs, const T& rhs) { return rhs.multiply_scalar(lhs); }
    friend T operator/(const T& lhs, float rhs) { return lhs.divide_scalar(rhs); }
    friend T operator/(float lhs, const T& rhs) { return rhs.reciprocal_scalar(lhs); }

    friend T& operator*=(T& lhs, float rhs) { lhs = lhs.multiply_scalar(rhs); return lhs; }
    friend T& operator/=(T& lhs, float rhs) { lhs = lhs.divide_scalar(rhs); return lhs; }
};

} // namespace math
} // namespace portmath

#endif // PORTMATH_VECTOR_ARITHMETIC_HPP
