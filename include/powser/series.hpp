#ifndef POWSER_SERIES_HPP
#define POWSER_SERIES_HPP

#include "powser/errors.hpp"
#include "powser/settings.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iostream> // For debug output
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace powser {

namespace detail {

//-----------------------------------------------------------------------------
// SeriesCell: memo table + coefficient rule
//-----------------------------------------------------------------------------
// Coefficients are appended strictly in index order. The rule for index n is
// only ever invoked after indices 0..n-1 are stored, so a rule may read lower
// indices of its own cell but never index n or above.
template<typename T>
class SeriesCell {
  public:
    using Rule = std::function<T(std::size_t)>;

    // Unresolved cell; reading it before bind() is an evaluation cycle.
    SeriesCell() = default;

    explicit SeriesCell(Rule rule)
      : rule_(std::move(rule)) {}

    SeriesCell(const SeriesCell &) = delete;
    SeriesCell &operator=(const SeriesCell &) = delete;

    void bind(Rule rule) {
        if (rule_) { throw std::logic_error("SeriesCell::bind called on a cell that already has a rule."); }
        rule_ = std::move(rule);
    }

    T coefficient(std::size_t n) {
        while (memo_.size() <= n) {
            std::size_t const next = memo_.size();
            if (evaluating_) {
                if (settings().debug_print) {
                    std::cerr << "[DEBUG SeriesCell::coefficient] cycle detected on cell " << this << " at index "
                              << next << " (requested " << n << ")" << std::endl;
                }
                throw EvaluationCycleError(next);
            }
            if (!rule_) { throw EvaluationCycleError(next, "series read before its definition was bound."); }

            T value;
            {
                EvaluationGuard const guard(evaluating_);
                value = rule_(next);
            }
            memo_.push_back(std::move(value));

            if (settings().debug_print) {
                std::cerr << "[DEBUG SeriesCell::coefficient] cell " << this << " c[" << next << "] = " << memo_.back()
                          << std::endl;
            }
        }
        return memo_[n];
    }

    [[nodiscard]] std::size_t cached_terms() const { return memo_.size(); }

  private:
    // Marks the cell busy for the duration of one rule invocation, including
    // when the rule throws.
    struct EvaluationGuard {
        bool &flag;
        explicit EvaluationGuard(bool &f)
          : flag(f) {
            flag = true;
        }
        ~EvaluationGuard() { flag = false; }
    };

    Rule rule_;
    std::vector<T> memo_;
    bool evaluating_ = false;
};

} // namespace detail

//-----------------------------------------------------------------------------
// Series
//-----------------------------------------------------------------------------
/**
 * @brief Lazily extended, memoized formal power series sum c_n x^n.
 *
 * A Series is a cheap handle: copies share the same memo table. tail() returns
 * a view offset by one index into the same table, so nothing is recomputed or
 * copied. Coefficients are computed on demand, in index order, and cached
 * forever once computed.
 *
 * @tparam T Scalar type supporting +, -, *, / and exact comparison with zero.
 */
template<typename T>
class Series {
  public:
    using value_type = T;
    using Rule = std::function<T(std::size_t)>;
    using Generator = std::function<std::optional<T>()>;

    // The zero series
    Series()
      : Series(make_cell([](std::size_t) -> T { return T(0); }), 0) {}

    // Finite literal, zero beyond its length
    Series(std::initializer_list<T> coeffs)
      : Series(std::vector<T>(coeffs)) {}

    explicit Series(std::vector<T> coeffs)
      : Series(make_cell([coeffs = std::move(coeffs)](std::size_t n) -> T {
          return n < coeffs.size() ? coeffs[n] : T(0);
      }),
               0) {}

    /**
     * @brief Series whose coefficient n is rule(n).
     *
     * The rule is invoked at most once per index, in increasing index order.
     */
    static Series from_rule(Rule rule) { return Series(make_cell(std::move(rule)), 0); }

    /**
     * @brief Series fed by a sequential producer.
     *
     * next() is called once per index, in order. Once it returns an empty
     * optional the series continues with zeros.
     */
    static Series from_generator(Generator next) {
        return from_rule([next = std::move(next), exhausted = false](std::size_t) mutable -> T {
            if (!exhausted) {
                std::optional<T> term = next();
                if (term) { return *term; }
                exhausted = true;
            }
            return T(0);
        });
    }

    /**
     * @brief Builds a self-referential series.
     *
     * body receives a handle to the series being defined and returns its
     * defining expression. The handle is non-owning, so the result is released
     * normally once the last external handle goes away. The expression must
     * only read index n of the handle while computing index n+1 or later;
     * anything else raises EvaluationCycleError.
     */
    static Series recursive(const std::function<Series(const Series &self)> &body) {
        auto cell = std::make_shared<detail::SeriesCell<T>>();
        std::weak_ptr<detail::SeriesCell<T>> weak = cell;

        Series const self = from_rule([weak](std::size_t n) -> T {
            std::shared_ptr<detail::SeriesCell<T>> target = weak.lock();
            if (!target) {
                if (settings().debug_print) {
                    std::cerr << "[DEBUG Series::recursive] self handle read after release at index " << n
                              << std::endl;
                }
                throw ReleasedSeriesError(n);
            }
            return target->coefficient(n);
        });

        Series const definition = body(self);
        cell->bind([definition](std::size_t n) -> T { return definition.coefficient(n); });
        return Series(cell, 0);
    }

    /**
     * @brief Series whose defining expression is built by make() on the first
     *        coefficient request.
     *
     * Nothing is built until a coefficient is needed. If make() throws,
     * nothing is stored and the next request calls it again.
     */
    static Series deferred(std::function<Series()> make) {
        return from_rule([make = std::move(make), built = std::optional<Series>()](std::size_t n) mutable -> T {
            if (!built) { built = make(); }
            return built->coefficient(n);
        });
    }

    // --- Access ---

    [[nodiscard]] T coefficient(std::size_t n) const { return cell_->coefficient(n + offset_); }

    T operator[](std::size_t n) const { return coefficient(n); }

    // Constant term
    [[nodiscard]] T head() const { return coefficient(0); }

    // The series with the constant term dropped, divided by x
    [[nodiscard]] Series tail() const { return Series(cell_, offset_ + 1); }

    // First `count` coefficients
    [[nodiscard]] std::vector<T> take(std::size_t count) const {
        std::vector<T> terms;
        terms.reserve(count);
        for (std::size_t i = 0; i < count; ++i) { terms.push_back(coefficient(i)); }
        return terms;
    }

    // Number of coefficients stored in the underlying memo table (views included)
    [[nodiscard]] std::size_t cached_terms() const {
        std::size_t const stored = cell_->cached_terms();
        return stored > offset_ ? stored - offset_ : 0;
    }

    // Composition: f(g). Defined in recursive_operators.hpp.
    Series operator()(const Series &inner) const { return compose(*this, inner); }

  private:
    Series(std::shared_ptr<detail::SeriesCell<T>> cell, std::size_t offset)
      : cell_(std::move(cell))
      , offset_(offset) {}

    static std::shared_ptr<detail::SeriesCell<T>> make_cell(Rule rule) {
        return std::make_shared<detail::SeriesCell<T>>(std::move(rule));
    }

    std::shared_ptr<detail::SeriesCell<T>> cell_;
    std::size_t offset_ = 0;
};

/**
 * @brief Termwise comparison of the first `count` coefficients.
 *
 * Two series can only be compared up to a truncation index.
 */
template<typename T>
bool
equal_terms(const Series<T> &lhs, const Series<T> &rhs, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        if (!(lhs.coefficient(i) == rhs.coefficient(i))) { return false; }
    }
    return true;
}

template<typename T>
bool
equal_terms(const Series<T> &lhs, const Series<T> &rhs) {
    return equal_terms(lhs, rhs, settings().comparison_terms);
}

namespace detail {

// c(0) = head(); c(n) = make_rest().coefficient(n - 1). The rest is built on
// the first request for an index above zero, after c(0) has been stored.
template<typename T>
Series<T>
cons(std::function<T()> head, std::function<Series<T>()> make_rest) {
    return Series<T>::from_rule(
      [head = std::move(head), make_rest = std::move(make_rest), rest = std::optional<Series<T>>()](
        std::size_t n) mutable -> T {
          if (n == 0) { return head(); }
          if (!rest) { rest = make_rest(); }
          return rest->coefficient(n - 1);
      });
}

// Same coefficients as s. check() runs when coefficient 0 is requested, before
// s is read, so an operator can validate an operand that is still under
// construction when the operator is applied.
template<typename T>
Series<T>
checked(std::function<void()> check, const Series<T> &s) {
    return Series<T>::from_rule([check = std::move(check), s](std::size_t n) -> T {
        if (n == 0) { check(); }
        return s.coefficient(n);
    });
}

} // namespace detail

} // namespace powser

#endif // POWSER_SERIES_HPP
