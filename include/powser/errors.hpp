#ifndef POWSER_ERRORS_HPP
#define POWSER_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace powser {

/**
 * @brief Base class for every failure raised by the series engine.
 *
 * Errors are precondition violations detected while a specific coefficient is
 * being computed. They never leave a partially computed value in a memo table.
 */
class SeriesError : public std::runtime_error {
  public:
    explicit SeriesError(const std::string &what_arg);
};

// compose (inner argument), exp, inverse, log1p
class ZeroConstantRequired : public SeriesError {
  public:
    explicit ZeroConstantRequired(const std::string &operation);
};

// Exact zero divisor in a scalar division.
class DivisionByZero : public SeriesError {
  public:
    explicit DivisionByZero(const std::string &operation);

  protected:
    DivisionByZero(const std::string &operation, const std::string &detail);
};

// reciprocal, divide, sqrt
class NonzeroConstantRequired : public DivisionByZero {
  public:
    explicit NonzeroConstantRequired(const std::string &operation);
};

class NoPrincipalRoot : public SeriesError {
  public:
    explicit NoPrincipalRoot(const std::string &operation);
};

class DegenerateInverse : public SeriesError {
  public:
    explicit DegenerateInverse(const std::string &operation);
};

/**
 * @brief Raised when computing coefficient n of a series requires coefficient n
 *        of the same series before it has been stored.
 *
 * Also raised when a series created through Series::recursive is read before
 * its defining expression has been bound.
 */
class EvaluationCycleError : public SeriesError {
  public:
    explicit EvaluationCycleError(std::size_t index);
    EvaluationCycleError(std::size_t index, const std::string &detail);

    [[nodiscard]] std::size_t index() const noexcept { return index_; }

  private:
    std::size_t index_;
};

// A non-owning self handle outlived the series it refers to.
class ReleasedSeriesError : public SeriesError {
  public:
    explicit ReleasedSeriesError(std::size_t index);
};

} // namespace powser

#endif // POWSER_ERRORS_HPP
