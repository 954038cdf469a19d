/// @file functional.cpp
/// @brief Finite-difference gradient and CallbackFunctional.

#include "asub/functional.h"

#include <utility>

#include "asub/errors.h"
#include "asub/sample_set.h"

namespace asub {

DoubleVec Functional::Gradient(const DoubleVec& x, const SampleSet& /*context*/,
                               const GradientOptions& options) const {
  return FiniteDifference(x, options);
}

DoubleVec Functional::FiniteDifference(const DoubleVec& x,
                                       const GradientOptions& options) const {
  if (!(options.step > 0.0)) {
    throw ConfigurationError(
        fmt::format("finite-difference step must be positive, got {}", options.step));
  }
  if (static_cast<size_t>(x.size()) != m_) {
    throw ShapeError(fmt::format("sample has length {}, expected {}", x.size(), m_));
  }

  const double h = options.step;
  DoubleVec grad(m_);
  DoubleVec shifted = x;

  // The centre value is shared by every one-sided difference.
  double f0 = 0.0;
  if (options.scheme != FiniteDifferenceScheme::Central) {
    f0 = Value(x);
  }

  for (size_t j = 0; j < m_; ++j) {
    switch (options.scheme) {
      case FiniteDifferenceScheme::Forward:
        shifted(j) = x(j) + h;
        grad(j) = (Value(shifted) - f0) / h;
        break;
      case FiniteDifferenceScheme::Backward:
        shifted(j) = x(j) - h;
        grad(j) = (f0 - Value(shifted)) / h;
        break;
      case FiniteDifferenceScheme::Central: {
        shifted(j) = x(j) + h;
        const double f_plus = Value(shifted);
        shifted(j) = x(j) - h;
        const double f_minus = Value(shifted);
        grad(j) = (f_plus - f_minus) / (2.0 * h);
        break;
      }
    }
    shifted(j) = x(j);
  }
  return grad;
}

CallbackFunctional::CallbackFunctional(size_t m, ValueFn value,
                                       GradientFn gradient)
    : Functional(m), value_(std::move(value)), gradient_(std::move(gradient)) {
  if (m == 0) {
    throw ConfigurationError("functional dimension must be greater than 0");
  }
  if (!value_) {
    throw ConfigurationError("functional needs a value callback");
  }
}

DoubleVec CallbackFunctional::Gradient(const DoubleVec& x,
                                       const SampleSet& context,
                                       const GradientOptions& options) const {
  if (!gradient_) {
    return Functional::Gradient(x, context, options);
  }
  return gradient_(x);
}

}  // namespace asub
