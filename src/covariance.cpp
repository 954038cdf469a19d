/// @file covariance.cpp
/// @brief Implementation of ComputeCovariance.

#include "asub/covariance.h"

#include <algorithm>

#include "asub/errors.h"

namespace asub {

Eigen::MatrixXd ComputeCovariance(const DoubleRowMat& gradients) {
  const Eigen::Index M = gradients.rows();
  const Eigen::Index m = gradients.cols();
  if (M == 0 || m == 0) {
    throw ShapeError(fmt::format("gradient matrix has shape ({}, {})", M, m));
  }

  // Accumulate G^T G block by block, only the lower triangle is formed.
  Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(m, m);
  constexpr Eigen::Index kBlockSize = 256;
  for (Eigen::Index start = 0; start < M; start += kBlockSize) {
    const Eigen::Index block_n = std::min(kBlockSize, M - start);
    cov.selfadjointView<Eigen::Lower>().rankUpdate(
        gradients.middleRows(start, block_n).transpose());
  }
  cov /= static_cast<double>(M);

  Eigen::MatrixXd full = cov.selfadjointView<Eigen::Lower>();
  return full;
}

}  // namespace asub
