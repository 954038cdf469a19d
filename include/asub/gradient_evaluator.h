#pragma once

/// @file gradient_evaluator.h
/// @brief Gradient matrix of a Functional over a SampleSet.

#include "asub/call_guard.h"
#include "asub/config.h"
#include "asub/defines.h"
#include "asub/functional.h"
#include "asub/sample_set.h"

namespace asub {

/// @brief Evaluate the gradient of `functional` at every sample.
///
/// Row i of the result is the gradient at sample i. When the set declares
/// physical bounds, column j is multiplied by (upper_j - lower_j) / 2, the
/// chain-rule factor of the map from the physical domain to [-1,1].
///
/// @param guard Wraps every call; nullptr means a DirectCallGuard.
/// @return (M, m) gradient matrix.
/// @throws ShapeError if the functional dimension or a gradient length does
///         not match m; NumericalError on a non-finite gradient; whatever
///         the guard or the functional throws.
DoubleRowMat EvaluateGradients(const SampleSet& samples,
                               const Functional& functional,
                               const GradientOptions& options,
                               CallGuard* guard = nullptr);

}  // namespace asub
