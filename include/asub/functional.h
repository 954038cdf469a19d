#pragma once

/// @file functional.h
/// @brief Quantity of interest seen by the estimator: a scalar function of
///        a normalized sample with an analytic or finite-difference gradient.

#include <atomic>
#include <functional>

#include "asub/config.h"
#include "asub/defines.h"

namespace asub {

class SampleSet;

/// @brief Scalar quantity of interest over [-1,1]^m.
///
/// Evaluate() may trigger an expensive external solve. Gradient() defaults to
/// a finite difference of Evaluate() in normalized coordinates; override it
/// when derivatives are available analytically. Both are treated as
/// side-effect free by the estimator.
class Functional {
 public:
  explicit Functional(size_t m) : m_(m) {}
  virtual ~Functional() = default;

  Functional(const Functional&) = delete;
  Functional& operator=(const Functional&) = delete;

  size_t Dim() const { return m_; }

  virtual double Evaluate(const DoubleVec& x) const = 0;

  /// @param x Normalized sample.
  /// @param context Set the sample belongs to (bounds, neighbours).
  virtual DoubleVec Gradient(const DoubleVec& x, const SampleSet& context,
                             const GradientOptions& options) const;

  /// @brief Evaluate() with call counting; the library only calls this.
  double Value(const DoubleVec& x) const {
    ++num_evaluations_;
    return Evaluate(x);
  }

  /// @brief Number of Value() calls so far.
  size_t NumEvaluations() const { return num_evaluations_.load(); }

 protected:
  DoubleVec FiniteDifference(const DoubleVec& x,
                             const GradientOptions& options) const;

 private:
  size_t m_;
  mutable std::atomic<size_t> num_evaluations_{0};
};

/// @brief Functional backed by callables.
class CallbackFunctional : public Functional {
 public:
  using ValueFn = std::function<double(const DoubleVec&)>;
  using GradientFn = std::function<DoubleVec(const DoubleVec&)>;

  /// @param gradient Analytic gradient; finite differences when empty.
  /// @throws ConfigurationError if `value` is empty or m is zero.
  CallbackFunctional(size_t m, ValueFn value, GradientFn gradient = nullptr);

  double Evaluate(const DoubleVec& x) const override { return value_(x); }

  DoubleVec Gradient(const DoubleVec& x, const SampleSet& context,
                     const GradientOptions& options) const override;

  bool HasAnalyticGradient() const { return static_cast<bool>(gradient_); }

 private:
  ValueFn value_;
  GradientFn gradient_;
};

}  // namespace asub
