#pragma once

/// @file active_subspace.h
/// @brief Active subspace estimation by the random sampling algorithm
///        (gradient covariance + eigendecomposition) with bootstrap bounds.

#include <optional>
#include <string>

#include "asub/bootstrap.h"
#include "asub/call_guard.h"
#include "asub/config.h"
#include "asub/defines.h"
#include "asub/eigen_decomposition.h"
#include "asub/functional.h"
#include "asub/partition.h"
#include "asub/sample_set.h"

namespace asub {

/// Furthest step of an estimation run whose results are current.
///
/// Partition() and Bootstrap() only move the stage forward, so re-partitioning
/// after a bootstrap stays at kBootstrapComputed. EvaluateGradients() and
/// Estimate() discard everything downstream and move it back.
enum class EstimationStage {
  kInitialized,
  kGradientsReady,
  kSubspaceEstimated,
  kPartitioned,
  kBootstrapComputed,
};

std::string ToString(EstimationStage stage);

/// @brief Active variables and QoI values of every sample.
struct SufficientSummary {
  DoubleRowMat active_variables;  // (M, n), samples projected onto W1
  DoubleVec values;               // (M)
};

/// @brief One estimation run over a SampleSet and a Functional.
///
/// The run owns every derived array (gradients, eigenpairs, partition,
/// bootstrap result) and hands out copies. It keeps references to the
/// samples and the functional, which must outlive it. The direction of an
/// eigenvector (positive or negative impact on the QoI) is not known in
/// advance; only the first-coordinate sign convention is applied.
///
/// Not safe for concurrent use.
class ActiveSubspace {
 public:
  /// @throws ConfigurationError if config.k is 0 or exceeds m, or the
  ///         functional dimension differs from m.
  ActiveSubspace(const Functional& functional, const SampleSet& samples,
                 EstimatorConfig config = EstimatorConfig());

  ActiveSubspace(const ActiveSubspace&) = delete;
  ActiveSubspace& operator=(const ActiveSubspace&) = delete;

  /// @brief Guard wrapped around every Functional call; nullptr restores the
  ///        default blocking call. Not owned.
  void SetCallGuard(CallGuard* guard) { guard_ = guard; }

  /// @brief Evaluate and cache the gradient matrix.
  ///
  /// Re-evaluation discards the eigenpairs, partition and bootstrap result
  /// computed from the previous gradients and logs a warning.
  /// @return Copy of the (M, m) gradient matrix.
  DoubleRowMat EvaluateGradients();

  /// @brief Random sampling algorithm: covariance of the cached gradients
  ///        (evaluated first if absent) and its eigendecomposition.
  /// @return Copy of the eigendecomposition.
  EigenDecomposition Estimate();

  /// @brief Split the eigenvectors into W1 (m, n) and W2 (m, m - n).
  /// @throws StateError before Estimate(); ConfigurationError unless 1 <= n <= m.
  SubspacePartition Partition(size_t n);

  /// @brief Bootstrap bounds with config().bootstrap.num_replicates replicates.
  ///
  /// Gradients and eigenpairs are computed on demand.
  BootstrapResult Bootstrap();
  BootstrapResult Bootstrap(size_t num_replicates);

  /// @brief Normalized samples projected onto W1, shape (M, n).
  /// @throws StateError before Partition().
  DoubleRowMat ActiveVariables() const;

  /// @brief Active variables and values; values come from the SampleSet when
  ///        assigned, otherwise from the Functional.
  SufficientSummary SummarizeSamples() const;

  EstimationStage Stage() const { return stage_; }
  const EstimatorConfig& config() const { return config_; }

  bool HasGradients() const { return gradients_.has_value(); }
  bool HasEigenpairs() const { return eigen_.has_value(); }
  bool HasPartition() const { return partition_.has_value(); }
  bool HasBootstrap() const { return bootstrap_.has_value(); }

  /// Copies of the cached state; each throws StateError when absent.
  DoubleRowMat Gradients() const;
  DoubleVec Eigenvalues() const;
  Eigen::MatrixXd Eigenvectors() const;
  Eigen::MatrixXd ActiveBasis() const;
  BootstrapResult BootstrapBounds() const;

  /// Covariance of an arbitrary gradient matrix.
  static Eigen::MatrixXd Covariance(const DoubleRowMat& gradients);

 private:
  void Advance(EstimationStage stage);
  void Rewind(EstimationStage stage);

  const Functional& functional_;
  const SampleSet& samples_;
  EstimatorConfig config_;
  CallGuard* guard_ = nullptr;

  EstimationStage stage_ = EstimationStage::kInitialized;
  std::optional<DoubleRowMat> gradients_;
  std::optional<EigenDecomposition> eigen_;
  std::optional<SubspacePartition> partition_;
  std::optional<BootstrapResult> bootstrap_;
};

}  // namespace asub
