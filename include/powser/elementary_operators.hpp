#ifndef POWSER_ELEMENTARY_OPERATORS_HPP
#define POWSER_ELEMENTARY_OPERATORS_HPP

#include "powser/errors.hpp"
#include "powser/scalar_traits.hpp"
#include "powser/series.hpp"

#include <cstddef>

namespace powser {

// Scalar arguments use Series<T>::value_type so that only the Series argument
// drives template deduction (e.g. scale(F, 2) with F a Series<double>).

//-----------------------------------------------------------------------------
// Construction helpers
//-----------------------------------------------------------------------------

// k + 0x + 0x^2 + ...
template<typename T>
Series<T>
constant(const T &k) {
    return Series<T>{ k };
}

// k * x^power
template<typename T>
Series<T>
monomial(std::size_t power, const T &k = T(1)) {
    return Series<T>::from_rule([power, k](std::size_t n) -> T { return n == power ? k : T(0); });
}

// The series x, identity for composition
template<typename T>
Series<T>
identity() {
    return monomial<T>(1);
}

//-----------------------------------------------------------------------------
// Head / tail / shift
//-----------------------------------------------------------------------------

template<typename T>
T
head(const Series<T> &f) {
    return f.head();
}

template<typename T>
Series<T>
tail(const Series<T> &f) {
    return f.tail();
}

// x * F. Inverse of tail() up to the constant term: F == head(F) + x*tail(F).
template<typename T>
Series<T>
shift_by_x(const Series<T> &f) {
    return Series<T>::from_rule([f](std::size_t n) -> T { return n == 0 ? T(0) : f.coefficient(n - 1); });
}

//-----------------------------------------------------------------------------
// Linear operations
//-----------------------------------------------------------------------------

template<typename T>
Series<T>
add_scalar(const Series<T> &f, const typename Series<T>::value_type &k) {
    return Series<T>::from_rule([f, k](std::size_t n) -> T {
        if (n == 0) { return T(f.coefficient(0) + k); }
        return f.coefficient(n);
    });
}

template<typename T>
Series<T>
scale(const Series<T> &f, const typename Series<T>::value_type &k) {
    return Series<T>::from_rule([f, k](std::size_t n) -> T { return T(k * f.coefficient(n)); });
}

template<typename T>
Series<T>
add(const Series<T> &f, const Series<T> &g) {
    return Series<T>::from_rule([f, g](std::size_t n) -> T { return T(f.coefficient(n) + g.coefficient(n)); });
}

template<typename T>
Series<T>
negate(const Series<T> &f) {
    return Series<T>::from_rule([f](std::size_t n) -> T { return T(-f.coefficient(n)); });
}

template<typename T>
Series<T>
subtract(const Series<T> &f, const Series<T> &g) {
    return Series<T>::from_rule([f, g](std::size_t n) -> T { return T(f.coefficient(n) - g.coefficient(n)); });
}

// F / k. The divisor is checked when the operator is applied.
template<typename T>
Series<T>
divide_scalar(const Series<T> &f, const typename Series<T>::value_type &k) {
    T const inv_k = checked_divide(T(1), k, "divide_scalar");
    return scale(f, inv_k);
}

//-----------------------------------------------------------------------------
// Calculus
//-----------------------------------------------------------------------------

// d/dx: coefficient n is (n+1) * f_{n+1}
template<typename T>
Series<T>
differentiate(const Series<T> &f) {
    return Series<T>::from_rule(
      [f](std::size_t n) -> T { return T(from_index<T>(n + 1) * f.coefficient(n + 1)); });
}

/**
 * @brief Integral from 0 with the given constant of integration.
 *
 * Coefficient 0 is the constant and is available without reading F at all.
 * This is what lets exp, log and the trigonometric series refer to themselves
 * through an integral.
 */
template<typename T>
Series<T>
integrate(const Series<T> &f, const typename Series<T>::value_type &constant_term = T(0)) {
    return Series<T>::from_rule([f, constant_term](std::size_t n) -> T {
        if (n == 0) { return constant_term; }
        return T(f.coefficient(n - 1) / from_index<T>(n));
    });
}

} // namespace powser

#endif // POWSER_ELEMENTARY_OPERATORS_HPP
