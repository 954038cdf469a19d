#pragma once

/// @file bootstrap.h
/// @brief Bootstrap bounds for the eigenvalues and the subspace distances.

#include "asub/config.h"
#include "asub/defines.h"

namespace asub {

/// @brief Per-dimension aggregates over B bootstrap replicates.
struct BootstrapResult {
  DoubleVec eigenvalue_min;  // (m)
  DoubleVec eigenvalue_max;  // (m)

  // Index j is the distance for an active subspace of dimension j + 1.
  DoubleVec distance_min;   // (m - 1)
  DoubleVec distance_max;   // (m - 1)
  DoubleVec distance_mean;  // (m - 1)

  Eigen::MatrixXd replicate_eigenvalues;  // (m, B)
  Eigen::MatrixXd replicate_distances;    // (m - 1, B)

  size_t NumReplicates() const {
    return static_cast<size_t>(replicate_eigenvalues.cols());
  }
};

/// @brief Resample gradient rows with replacement and re-estimate.
///
/// Each replicate draws M row indices uniformly with replacement, forms the
/// covariance of the resampled rows and its eigendecomposition, and records
/// its eigenvalues and, for j in [0, m-1), the subspace distance
/// ||W[:, :j+1]^T U[:, j+1:]||_2 between the reference eigenvectors W and
/// the replicate eigenvectors U. Replicate i uses a generator seeded with
/// config.seed + i, so the result is independent of the thread count.
///
/// @param gradients (M, m) gradient matrix, read only.
/// @param eigenvectors (m, m) reference eigenvectors.
/// @throws ConfigurationError if config.num_replicates is zero or
///         config.num_threads is below 1.
/// @throws ShapeError if the shapes disagree.
BootstrapResult RunBootstrap(const DoubleRowMat& gradients,
                             const Eigen::MatrixXd& eigenvectors,
                             const BootstrapConfig& config,
                             const EigenConfig& eigen_config = EigenConfig());

}  // namespace asub
