#pragma once

/// @file covariance.h
/// @brief Monte Carlo estimate of E[grad f grad f^T].

#include "asub/defines.h"

namespace asub {

/// @brief (1/M) * sum_i g_i g_i^T over the rows g_i of `gradients`.
/// @param gradients (M, m) matrix, one gradient per row.
/// @return (m, m) symmetric matrix.
/// @throws ShapeError if `gradients` has no rows or no columns.
Eigen::MatrixXd ComputeCovariance(const DoubleRowMat& gradients);

}  // namespace asub
