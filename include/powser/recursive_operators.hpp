#ifndef POWSER_RECURSIVE_OPERATORS_HPP
#define POWSER_RECURSIVE_OPERATORS_HPP

#include "powser/elementary_operators.hpp"
#include "powser/errors.hpp"
#include "powser/scalar_traits.hpp"
#include "powser/series.hpp"

#include <cstddef>

// Operators whose coefficient n is defined through the result itself or through
// the same operator applied to tails. Each definition reads only coefficients
// below n of any series it refers to recursively, so every request terminates.
//
// Preconditions are checked when coefficient 0 of the result is first
// requested (coefficient 1 for the first-order term of inverse), never when the
// operator is applied. Operands may therefore be series still under
// construction, including the self handle of Series::recursive.

namespace powser {

template<typename T>
Series<T>
reciprocal(const Series<T> &f);

/**
 * @brief Product F*G.
 *
 * F*G = f0*g0 + x*(f0*G1 + g0*F1 + x*(F1*G1)) with F1, G1 the tails. The
 * product of the tails is only built once an index above zero is requested.
 * Terms with an exactly zero scalar factor are skipped.
 */
template<typename T>
Series<T>
multiply(const Series<T> &f, const Series<T> &g) {
    return detail::cons<T>([f, g]() -> T { return T(f.head() * g.head()); },
                           [f, g]() -> Series<T> {
                               T const f0 = f.head();
                               T const g0 = g.head();
                               Series<T> const f1 = f.tail();
                               Series<T> const g1 = g.tail();

                               Series<T> rest = shift_by_x(multiply(f1, g1));
                               if (!is_zero(f0)) { rest = add(rest, scale(g1, f0)); }
                               if (!is_zero(g0)) { rest = add(rest, scale(f1, g0)); }
                               return rest;
                           });
}

/**
 * @brief Composition F(G).
 *
 * F(G) = f0 + x*(G1 * F1(G)). Requires g0 == 0, otherwise the constant term
 * would be an infinite sum. g0 is checked with coefficient 0 of the result,
 * before F is read.
 *
 * @throws ZeroConstantRequired if the inner series has a nonzero constant term.
 */
template<typename T>
Series<T>
compose(const Series<T> &f, const Series<T> &g) {
    return detail::cons<T>(
      [f, g]() -> T {
          if (!is_zero(g.head())) { throw ZeroConstantRequired("compose"); }
          return f.head();
      },
      [f, g]() -> Series<T> { return multiply(g.tail(), compose(f.tail(), g)); });
}

/**
 * @brief e^F, from dE/dx = E * dF/dx with E(0) = 1.
 *
 * @throws ZeroConstantRequired if F has a nonzero constant term.
 */
template<typename T>
Series<T>
exp(const Series<T> &f) {
    Series<T> const df = differentiate(f);
    Series<T> const e = Series<T>::recursive(
      [df](const Series<T> &self) -> Series<T> { return integrate(multiply(self, df), T(1)); });
    return detail::checked<T>(
      [f]() {
          if (!is_zero(f.head())) { throw ZeroConstantRequired("exp"); }
      },
      e);
}

/**
 * @brief 1/F.
 *
 * R = r0 * (1 - x*F1*R) with r0 = 1/f0.
 *
 * @throws NonzeroConstantRequired if F has a zero constant term.
 */
template<typename T>
Series<T>
reciprocal(const Series<T> &f) {
    return Series<T>::recursive([f](const Series<T> &self) -> Series<T> {
        return detail::cons<T>(
          [f]() -> T {
              T const f0 = f.head();
              if (is_zero(f0)) { throw NonzeroConstantRequired("reciprocal"); }
              return T(T(1) / f0);
          },
          [f, self]() -> Series<T> {
              T const r0 = self.head();
              return scale(multiply(f.tail(), self), T(-r0));
          });
    });
}

// F/G = F * (1/G)
template<typename T>
Series<T>
divide(const Series<T> &f, const Series<T> &g) {
    return detail::checked<T>(
      [g]() {
          if (is_zero(g.head())) { throw NonzeroConstantRequired("divide"); }
      },
      multiply(f, reciprocal(g)));
}

/**
 * @brief Functional inverse I with F(I(x)) = x.
 *
 * With F = x*F1 and I = x*I1: I1 = (1/f1) * (1 - x*I1*I1*F2(I)), F2 the tail of
 * F1. f0 is checked with coefficient 0 of I, f1 with coefficient 1.
 *
 * @throws ZeroConstantRequired if F has a nonzero constant term.
 * @throws DegenerateInverse if the first-order coefficient of F is zero.
 */
template<typename T>
Series<T>
inverse(const Series<T> &f) {
    return Series<T>::recursive([f](const Series<T> &self) -> Series<T> {
        auto const constant_term = [f]() -> T {
            if (!is_zero(f.head())) { throw ZeroConstantRequired("inverse"); }
            return T(0);
        };
        auto const make_i1 = [f, self]() -> Series<T> {
            return detail::cons<T>(
              [f]() -> T {
                  T const first_order = f.tail().head();
                  if (is_zero(first_order)) { throw DegenerateInverse("inverse"); }
                  return T(T(1) / first_order);
              },
              [f, self]() -> Series<T> {
                  Series<T> const i1 = self.tail();
                  T const recip = i1.head();
                  Series<T> const f2 = f.tail().tail();
                  return scale(multiply(multiply(i1, i1), compose(f2, self)), T(-recip));
              });
        };
        return detail::cons<T>(constant_term, make_i1);
    });
}

/**
 * @brief Principal square root.
 *
 * S = s0 + x*S1 with S1 = F1 / (s0 + S). Because of that division f0 must be
 * nonzero even when the scalar type has a root of zero.
 *
 * @throws NonzeroConstantRequired if F has a zero constant term.
 * @throws NoPrincipalRoot if f0 has no square root in the scalar domain.
 */
template<typename T>
Series<T>
sqrt(const Series<T> &f) {
    return Series<T>::recursive([f](const Series<T> &self) -> Series<T> {
        return detail::cons<T>(
          [f]() -> T {
              T const f0 = f.head();
              if (is_zero(f0)) { throw NonzeroConstantRequired("sqrt"); }
              return principal_sqrt(f0, "sqrt");
          },
          [f, self]() -> Series<T> {
              T const s0 = self.head();
              return multiply(f.tail(), reciprocal(add_scalar(self, s0)));
          });
    });
}

/**
 * @brief log(1 + F) = integral of F' / (1 + F), constant 0.
 *
 * @throws ZeroConstantRequired if F has a nonzero constant term.
 */
template<typename T>
Series<T>
log1p(const Series<T> &f) {
    return detail::checked<T>(
      [f]() {
          if (!is_zero(f.head())) { throw ZeroConstantRequired("log1p"); }
      },
      integrate(divide(differentiate(f), add_scalar(f, T(1))), T(0)));
}

} // namespace powser

#endif // POWSER_RECURSIVE_OPERATORS_HPP
