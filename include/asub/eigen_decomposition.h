#pragma once

/// @file eigen_decomposition.h
/// @brief Deterministically ordered and oriented eigenpairs of a symmetric
///        matrix.

#include "asub/config.h"
#include "asub/defines.h"

namespace asub {

/// @brief Eigenpairs sorted by descending eigenvalue magnitude.
struct EigenDecomposition {
  DoubleVec eigenvalues;         // (m), |lambda|, non-increasing
  Eigen::MatrixXd eigenvectors;  // (m, m), column j belongs to eigenvalues(j)

  // Diagnostics of the absolute-value policy.
  size_t num_negative = 0;    // eigenvalues below zero before taking |.|
  double most_negative = 0.0; // smallest raw eigenvalue if negative, else 0
};

/// @brief Eigendecomposition with magnitude ordering and sign normalization.
///
/// 1. SelfAdjointEigenSolver on the lower triangle of `matrix`.
/// 2. Eigenvalues are replaced by their absolute value, which suppresses
///    the small negative eigenvalues a finite-sample covariance can have.
///    A negative eigenvalue larger than `config.negative_tolerance` times the
///    largest magnitude is logged as a warning, it points at a broken
///    covariance rather than noise.
/// 3. Pairs are sorted by descending eigenvalue (stable).
/// 4. Every eigenvector is flipped so that its first coordinate is >= 0.
///
/// The orientation is deterministic but not canonical: within a
/// (near-)degenerate eigenspace the basis is whatever the solver returns,
/// and a first coordinate near zero makes the sign sensitive to rounding.
///
/// @throws ShapeError if `matrix` is not square or empty.
/// @throws NumericalError if the solver does not converge.
EigenDecomposition CalculateEigenpairs(const Eigen::MatrixXd& matrix,
                                       const EigenConfig& config = EigenConfig());

}  // namespace asub
