#ifndef POWSER_ELEMENTARY_FUNCTIONS_HPP
#define POWSER_ELEMENTARY_FUNCTIONS_HPP

#include "powser/elementary_operators.hpp"
#include "powser/recursive_operators.hpp"
#include "powser/scalar_traits.hpp"
#include "powser/series.hpp"

#include <cstddef>

// Maclaurin series of the elementary functions. Where a function satisfies a
// simple differential equation the series is defined through that equation
// and refers to itself through an integral; no factorials are evaluated.

namespace powser {
namespace functions {

//-----------------------------------------------------------------------------
// Closed-form coefficient rules
//-----------------------------------------------------------------------------

// c/(1-x) = c + c*x + c*x^2 + ...
template<typename T>
Series<T>
constant_series(const T &c) {
    return Series<T>::from_rule([c](std::size_t) -> T { return c; });
}

// c/(1+x) = c - c*x + c*x^2 - ...
template<typename T>
Series<T>
alternating_constant_series(const T &c) {
    return Series<T>::from_rule([c](std::size_t n) -> T { return n % 2 == 0 ? c : T(-c); });
}

// 0, 1, 2, 3, ...  (x/(1-x)^2)
template<typename T>
Series<T>
natural_numbers() {
    return Series<T>::from_rule([](std::size_t n) -> T { return from_index<T>(n); });
}

// -ln(1-x) = x + x^2/2 + x^3/3 + ...
template<typename T>
Series<T>
harmonic_series() {
    return Series<T>::from_rule([](std::size_t n) -> T {
        if (n == 0) { return T(0); }
        return T(T(1) / from_index<T>(n));
    });
}

// ln(1+x) = x - x^2/2 + x^3/3 - ...
template<typename T>
Series<T>
alternating_harmonic_series() {
    return Series<T>::from_rule([](std::size_t n) -> T {
        if (n == 0) { return T(0); }
        T const sign = n % 2 == 1 ? T(1) : T(-1);
        return T(sign / from_index<T>(n));
    });
}

//-----------------------------------------------------------------------------
// Series defined by differential equations
//-----------------------------------------------------------------------------

// y' = y, y(0) = 1
template<typename T>
Series<T>
exp_series() {
    return Series<T>::recursive([](const Series<T> &self) -> Series<T> { return integrate(self, T(1)); });
}

// y'' = -y, y(0) = 0, y'(0) = 1
template<typename T>
Series<T>
sin_series() {
    return Series<T>::recursive(
      [](const Series<T> &self) -> Series<T> { return integrate(integrate(negate(self), T(1)), T(0)); });
}

// y'' = -y, y(0) = 1, y'(0) = 0
template<typename T>
Series<T>
cos_series() {
    return Series<T>::recursive(
      [](const Series<T> &self) -> Series<T> { return integrate(integrate(negate(self), T(0)), T(1)); });
}

// y' = 1 + y^2, y(0) = 0
template<typename T>
Series<T>
tan_series() {
    return Series<T>::recursive(
      [](const Series<T> &self) -> Series<T> { return integrate(add_scalar(multiply(self, self), T(1)), T(0)); });
}

// y' = y * tan, y(0) = 1
template<typename T>
Series<T>
sec_series() {
    Series<T> const tan = tan_series<T>();
    return Series<T>::recursive(
      [tan](const Series<T> &self) -> Series<T> { return integrate(multiply(self, tan), T(1)); });
}

// y'' = y, y(0) = 0, y'(0) = 1
template<typename T>
Series<T>
sinh_series() {
    return Series<T>::recursive(
      [](const Series<T> &self) -> Series<T> { return integrate(integrate(self, T(1)), T(0)); });
}

// y'' = y, y(0) = 1, y'(0) = 0
template<typename T>
Series<T>
cosh_series() {
    return Series<T>::recursive(
      [](const Series<T> &self) -> Series<T> { return integrate(integrate(self, T(0)), T(1)); });
}

// y' = 1 - y^2, y(0) = 0
template<typename T>
Series<T>
tanh_series() {
    return Series<T>::recursive([](const Series<T> &self) -> Series<T> {
        return integrate(add_scalar(negate(multiply(self, self)), T(1)), T(0));
    });
}

// y' = -y * tanh, y(0) = 1
template<typename T>
Series<T>
sech_series() {
    Series<T> const tanh = tanh_series<T>();
    return Series<T>::recursive(
      [tanh](const Series<T> &self) -> Series<T> { return integrate(negate(multiply(self, tanh)), T(1)); });
}

//-----------------------------------------------------------------------------
// Inverse functions as integrals of algebraic series
//-----------------------------------------------------------------------------

// integral of 1/sqrt(1 - x^2)
template<typename T>
Series<T>
arcsin_series() {
    Series<T> const one_minus_x2 = add_scalar(negate(monomial<T>(2)), T(1));
    return integrate(reciprocal(sqrt(one_minus_x2)), T(0));
}

// integral of 1/(1 + x^2)
template<typename T>
Series<T>
arctan_series() {
    return integrate(reciprocal(add_scalar(monomial<T>(2), T(1))), T(0));
}

// integral of 1/sqrt(1 + x^2)
template<typename T>
Series<T>
arcsinh_series() {
    return integrate(reciprocal(sqrt(add_scalar(monomial<T>(2), T(1)))), T(0));
}

// integral of 1/(1 - x^2)
template<typename T>
Series<T>
arctanh_series() {
    Series<T> const one_minus_x2 = add_scalar(negate(monomial<T>(2)), T(1));
    return integrate(reciprocal(one_minus_x2), T(0));
}

} // namespace functions
} // namespace powser

#endif // POWSER_ELEMENTARY_FUNCTIONS_HPP
