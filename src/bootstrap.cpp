/// @file bootstrap.cpp
/// @brief Implementation of RunBootstrap.

#include "asub/bootstrap.h"

#include <cstdint>
#include <exception>
#include <random>

#include "asub/covariance.h"
#include "asub/eigen_decomposition.h"
#include "asub/errors.h"
#include "asub/tools.h"

#ifdef ASUB_USE_OPENMP
#include <omp.h>
#endif

namespace asub {

namespace {

DoubleRowMat Resample(const DoubleRowMat& gradients, uint64_t seed) {
  const Eigen::Index M = gradients.rows();
  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<Eigen::Index> pick(0, M - 1);
  DoubleRowMat replicate(M, gradients.cols());
  for (Eigen::Index i = 0; i < M; ++i) {
    replicate.row(i) = gradients.row(pick(rng));
  }
  return replicate;
}

}  // anonymous namespace

BootstrapResult RunBootstrap(const DoubleRowMat& gradients,
                             const Eigen::MatrixXd& eigenvectors,
                             const BootstrapConfig& config,
                             const EigenConfig& eigen_config) {
  if (config.num_replicates == 0) {
    throw ConfigurationError("number of bootstrap replicates must be greater than 0");
  }
  if (config.num_threads < 1) {
    throw ConfigurationError(
        fmt::format("number of bootstrap threads must be at least 1, got {}", config.num_threads));
  }
  const Eigen::Index m = gradients.cols();
  if (gradients.rows() == 0 || m == 0) {
    throw ShapeError(fmt::format("gradient matrix has shape ({}, {})",
                                 gradients.rows(), m));
  }
  if (eigenvectors.rows() != m || eigenvectors.cols() != m) {
    throw ShapeError(fmt::format("eigenvectors have shape ({}, {}), expected ({}, {})",
                                 eigenvectors.rows(), eigenvectors.cols(), m, m));
  }

  const int64_t B = static_cast<int64_t>(config.num_replicates);
  BootstrapResult result;
  result.replicate_eigenvalues.resize(m, B);
  result.replicate_distances = Eigen::MatrixXd::Zero(m - 1, B);

  // Replicates are independent; each writes its own column.
  std::exception_ptr failure = nullptr;
#ifdef ASUB_USE_OPENMP
  #pragma omp parallel for schedule(dynamic) num_threads(config.num_threads)
#endif
  for (int64_t i = 0; i < B; ++i) {
    try {
      const DoubleRowMat replicate = Resample(gradients, config.seed + static_cast<uint64_t>(i));
      const EigenDecomposition eig = CalculateEigenpairs(ComputeCovariance(replicate), eigen_config);
      CHECK_EQ(eig.eigenvectors.cols(), m);
      result.replicate_eigenvalues.col(i) = eig.eigenvalues;
      for (Eigen::Index j = 0; j + 1 < m; ++j) {
        result.replicate_distances(j, i) =
            subspace_distance(eigenvectors, eig.eigenvectors, static_cast<size_t>(j));
      }
    } catch (...) {
#ifdef ASUB_USE_OPENMP
      #pragma omp critical(asub_bootstrap_failure)
#endif
      if (!failure) {
        failure = std::current_exception();
      }
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }

  result.eigenvalue_min = result.replicate_eigenvalues.rowwise().minCoeff();
  result.eigenvalue_max = result.replicate_eigenvalues.rowwise().maxCoeff();
  if (m > 1) {
    result.distance_min = result.replicate_distances.rowwise().minCoeff();
    result.distance_max = result.replicate_distances.rowwise().maxCoeff();
    result.distance_mean = result.replicate_distances.rowwise().mean();
  } else {
    result.distance_min.resize(0);
    result.distance_max.resize(0);
    result.distance_mean.resize(0);
  }
  return result;
}

}  // namespace asub
