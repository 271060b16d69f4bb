#include "powser/errors.hpp"

namespace powser {

SeriesError::SeriesError(const std::string &what_arg)
  : std::runtime_error(what_arg) {}

ZeroConstantRequired::ZeroConstantRequired(const std::string &operation)
  : SeriesError("[" + operation + "] constant term of the series must be exactly zero.") {}

DivisionByZero::DivisionByZero(const std::string &operation)
  : SeriesError("[" + operation + "] division by an exact zero.") {}

DivisionByZero::DivisionByZero(const std::string &operation, const std::string &detail)
  : SeriesError("[" + operation + "] " + detail) {}

NonzeroConstantRequired::NonzeroConstantRequired(const std::string &operation)
  : DivisionByZero(operation, "constant term of the series must be nonzero.") {}

NoPrincipalRoot::NoPrincipalRoot(const std::string &operation)
  : SeriesError("[" + operation + "] constant term has no square root in the scalar domain.") {}

DegenerateInverse::DegenerateInverse(const std::string &operation)
  : SeriesError("[" + operation + "] first-order coefficient is zero; no functional inverse exists.") {}

EvaluationCycleError::EvaluationCycleError(std::size_t index)
  : EvaluationCycleError(index, "coefficient depends on itself before it was computed.") {}

EvaluationCycleError::EvaluationCycleError(std::size_t index, const std::string &detail)
  : SeriesError("[Series::coefficient] index " + std::to_string(index) + ": " + detail)
  , index_(index) {}

ReleasedSeriesError::ReleasedSeriesError(std::size_t index)
  : SeriesError("[Series::coefficient] index " + std::to_string(index) +
                ": self reference used after its series was released.") {}

} // namespace powser
