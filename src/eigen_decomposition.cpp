/// @file eigen_decomposition.cpp
/// @brief Implementation of CalculateEigenpairs.
///
/// Uses Eigen's SelfAdjointEigenSolver, which works on any dimension and
/// returns eigenvalues in ascending order.

#include "asub/eigen_decomposition.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

#include "asub/errors.h"

namespace asub {

EigenDecomposition CalculateEigenpairs(const Eigen::MatrixXd& matrix,
                                       const EigenConfig& config) {
  if (matrix.rows() == 0 || matrix.rows() != matrix.cols()) {
    throw ShapeError(fmt::format("matrix has shape ({}, {}), expected a non-empty square matrix",
                                 matrix.rows(), matrix.cols()));
  }
  const Eigen::Index m = matrix.rows();

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix);
  if (solver.info() != Eigen::Success) {
    throw NumericalError("symmetric eigendecomposition did not converge");
  }
  const DoubleVec& raw = solver.eigenvalues();
  const Eigen::MatrixXd& vectors = solver.eigenvectors();

  EigenDecomposition result;

  // --- Step 1: magnitude policy and its diagnostic ---
  const double largest = raw.cwiseAbs().maxCoeff();
  for (Eigen::Index j = 0; j < m; ++j) {
    if (raw(j) < 0.0) {
      ++result.num_negative;
      result.most_negative = std::min(result.most_negative, raw(j));
    }
  }
  const double threshold = config.negative_tolerance * largest;
  LOG_IF(WARNING, result.most_negative < -threshold)
      << fmt::format("Negative eigenvalue {:.3e} exceeds the noise tolerance {:.1e} * {:.3e}; "
                     "the matrix may not be a gradient covariance",
                     result.most_negative, config.negative_tolerance, largest);
  const DoubleVec magnitudes = raw.cwiseAbs();

  // --- Step 2: descending order ---
  std::vector<Eigen::Index> order(m);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
    return magnitudes(a) > magnitudes(b);
  });

  // --- Step 3: permute and orient ---
  result.eigenvalues.resize(m);
  result.eigenvectors.resize(m, m);
  for (Eigen::Index k = 0; k < m; ++k) {
    const Eigen::Index src = order[k];
    result.eigenvalues(k) = magnitudes(src);
    const double sign = vectors(0, src) < 0.0 ? -1.0 : 1.0;
    result.eigenvectors.col(k) = sign * vectors.col(src);
  }
  DCHECK_GE(result.eigenvalues.minCoeff(), 0.0);
  return result;
}

}  // namespace asub
