#ifndef POWSER_SERIES_OPERATORS_HPP
#define POWSER_SERIES_OPERATORS_HPP

#include "powser/elementary_operators.hpp"
#include "powser/recursive_operators.hpp"
#include "powser/series.hpp"

namespace powser {

// ====== Series arithmetic operators for natural expression syntax ======

// Addition operators
template<typename T>
Series<T>
operator+(const Series<T> &lhs, const Series<T> &rhs) {
    return add(lhs, rhs);
}

template<typename T>
Series<T>
operator+(const Series<T> &lhs, const typename Series<T>::value_type &rhs) {
    return add_scalar(lhs, rhs);
}

template<typename T>
Series<T>
operator+(const typename Series<T>::value_type &lhs, const Series<T> &rhs) {
    return add_scalar(rhs, lhs);
}

// Subtraction operators
template<typename T>
Series<T>
operator-(const Series<T> &lhs, const Series<T> &rhs) {
    return subtract(lhs, rhs);
}

template<typename T>
Series<T>
operator-(const Series<T> &lhs, const typename Series<T>::value_type &rhs) {
    return add_scalar(lhs, T(-rhs));
}

template<typename T>
Series<T>
operator-(const typename Series<T>::value_type &lhs, const Series<T> &rhs) {
    return add_scalar(negate(rhs), lhs);
}

// Unary negation
template<typename T>
Series<T>
operator-(const Series<T> &f) {
    return negate(f);
}

// Multiplication operators
template<typename T>
Series<T>
operator*(const Series<T> &lhs, const Series<T> &rhs) {
    return multiply(lhs, rhs);
}

template<typename T>
Series<T>
operator*(const Series<T> &lhs, const typename Series<T>::value_type &rhs) {
    return scale(lhs, rhs);
}

template<typename T>
Series<T>
operator*(const typename Series<T>::value_type &lhs, const Series<T> &rhs) {
    return scale(rhs, lhs);
}

// Division operators
template<typename T>
Series<T>
operator/(const Series<T> &lhs, const Series<T> &rhs) {
    return divide(lhs, rhs);
}

template<typename T>
Series<T>
operator/(const Series<T> &lhs, const typename Series<T>::value_type &rhs) {
    return divide_scalar(lhs, rhs);
}

// k / F = k * (1/F)
template<typename T>
Series<T>
operator/(const typename Series<T>::value_type &lhs, const Series<T> &rhs) {
    return scale(reciprocal(rhs), lhs);
}

} // namespace powser

#endif // POWSER_SERIES_OPERATORS_HPP
