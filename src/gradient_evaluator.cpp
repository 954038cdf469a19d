/// @file gradient_evaluator.cpp
/// @brief Implementation of EvaluateGradients.

#include "asub/gradient_evaluator.h"

#include "asub/errors.h"

namespace asub {

DoubleRowMat EvaluateGradients(const SampleSet& samples,
                               const Functional& functional,
                               const GradientOptions& options,
                               CallGuard* guard) {
  const size_t M = samples.M();
  const size_t m = samples.m();
  if (functional.Dim() != m) {
    throw ShapeError(fmt::format("functional has dimension {}, samples have {}",
                                 functional.Dim(), m));
  }

  DirectCallGuard direct;
  CallGuard* invoker = guard ? guard : &direct;

  DoubleRowMat gradients(M, m);
  for (size_t i = 0; i < M; ++i) {
    const DoubleVec x = samples.Extract(i);
    DoubleVec g = invoker->Invoke(
        i, [&]() { return functional.Gradient(x, samples, options); });
    if (static_cast<size_t>(g.size()) != m) {
      throw ShapeError(fmt::format("gradient at sample {} has length {}, expected {}",
                                   i, g.size(), m));
    }
    if (!g.allFinite()) {
      throw NumericalError(fmt::format("non-finite gradient at sample {}", i));
    }
    gradients.row(i) = g.transpose();
  }

  if (samples.Bounds()) {
    const DoubleVec half_widths = samples.HalfWidths();
    gradients = gradients * half_widths.asDiagonal();
  }
  return gradients;
}

}  // namespace asub
