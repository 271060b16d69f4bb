#ifndef POWSER_SCALAR_TRAITS_HPP
#define POWSER_SCALAR_TRAITS_HPP

#include "powser/errors.hpp"

#include <boost/multiprecision/number.hpp> // For is_number / number_category
#include <boost/rational.hpp>
#include <cmath>
#include <complex>
#include <cstddef>
#include <string>
#include <type_traits>

namespace powser {

// --- Type Trait Helpers for Scalar Detection ---

template<typename T>
struct is_complex : std::false_type {};

template<typename R>
struct is_complex<std::complex<R>> : std::true_type {};

template<typename T>
struct is_boost_rational : std::false_type {};

template<typename I>
struct is_boost_rational<boost::rational<I>> : std::true_type {};

// Boost.Multiprecision number whose category is `kind` (rational, floating point, ...)
template<typename T, int kind, typename = void>
struct is_multiprecision_kind : std::false_type {};

template<typename T, int kind>
struct is_multiprecision_kind<T, kind, std::enable_if_t<boost::multiprecision::is_number<T>::value>>
  : std::integral_constant<bool, boost::multiprecision::number_category<T>::value == kind> {};

template<typename T>
struct dependent_false : std::false_type {};

// --- End Helpers ---

// Exact zero test, no tolerance
template<typename T>
bool
is_zero(const T &value) {
    return value == T(0);
}

// Lift an index (exponent, derivative order, integration divisor) into T
template<typename T>
T
from_index(std::size_t n) {
    return T(static_cast<long long>(n));
}

template<typename T>
T
checked_divide(const T &numerator, const T &denominator, const std::string &operation) {
    if (is_zero(denominator)) { throw DivisionByZero(operation); }
    return T(numerator / denominator);
}

/**
 * @brief Exact integer square root.
 *
 * @return true and sets root when value is a perfect square, false otherwise.
 *         Works for builtin integers and Boost.Multiprecision integers.
 */
template<typename I>
bool
exact_integer_sqrt(const I &value, I &root) {
    if (value < I(0)) { return false; }
    if (value < I(2)) {
        root = value;
        return true;
    }
    // Newton iteration from above converges to floor(sqrt(value)). Every
    // intermediate stays within value, so fixed-width types do not overflow.
    I x = value;
    I y = I(x / I(2) + x % I(2));
    while (y < x) {
        x = y;
        y = I((x + value / x) / I(2));
    }
    root = x;
    return root == I(value / root) && I(value % root) == I(0);
}

/**
 * @brief Principal square root of a scalar.
 *
 * Real floating point: negative input has no root.
 * Complex: principal branch, always defined.
 * Exact rationals: only perfect squares (numerator and denominator) have a root.
 *
 * @throws NoPrincipalRoot when no root exists in the scalar domain.
 */
template<typename T>
T
principal_sqrt(const T &value, const std::string &operation) {
    if constexpr (is_complex<T>::value) {
        return std::sqrt(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (value < T(0)) { throw NoPrincipalRoot(operation); }
        return std::sqrt(value);
    } else if constexpr (is_boost_rational<T>::value) {
        using Int = typename T::int_type;
        Int num_root;
        Int den_root;
        if (value < T(0) || !exact_integer_sqrt(value.numerator(), num_root) ||
            !exact_integer_sqrt(value.denominator(), den_root)) {
            throw NoPrincipalRoot(operation);
        }
        return T(num_root, den_root);
    } else if constexpr (is_multiprecision_kind<T, boost::multiprecision::number_kind_rational>::value) {
        // numerator()/denominator() are found by ADL in the backend's namespace
        using Int = std::decay_t<decltype(numerator(value))>;
        Int const num = numerator(value);
        Int const den = denominator(value);
        Int num_root;
        Int den_root;
        if (value < T(0) || !exact_integer_sqrt(num, num_root) || !exact_integer_sqrt(den, den_root)) {
            throw NoPrincipalRoot(operation);
        }
        return T(num_root) / T(den_root);
    } else if constexpr (is_multiprecision_kind<T, boost::multiprecision::number_kind_floating_point>::value) {
        if (value < T(0)) { throw NoPrincipalRoot(operation); }
        using std::sqrt;
        return T(sqrt(value));
    } else {
        static_assert(dependent_false<T>::value, "principal_sqrt: unsupported scalar type");
    }
}

} // namespace powser

#endif // POWSER_SCALAR_TRAITS_HPP
