/// @file active_subspace.cpp
/// @brief Implementation of the ActiveSubspace estimation run.

#include "asub/active_subspace.h"

#include <utility>

#include "asub/covariance.h"
#include "asub/errors.h"
#include "asub/gradient_evaluator.h"
#include "asub/stopw.h"

namespace asub {

std::string ToString(EstimationStage stage) {
  switch (stage) {
    case EstimationStage::kInitialized:
      return "initialized";
    case EstimationStage::kGradientsReady:
      return "gradients-ready";
    case EstimationStage::kSubspaceEstimated:
      return "subspace-estimated";
    case EstimationStage::kPartitioned:
      return "partitioned";
    case EstimationStage::kBootstrapComputed:
      return "bootstrap-computed";
  }
  return "unknown";
}

ActiveSubspace::ActiveSubspace(const Functional& functional,
                               const SampleSet& samples, EstimatorConfig config)
    : functional_(functional), samples_(samples), config_(std::move(config)) {
  if (config_.k == 0 || config_.k > samples_.m()) {
    throw ConfigurationError(fmt::format(
        "number of eigenvalues of interest {} must lie in [1, {}]", config_.k, samples_.m()));
  }
  if (functional_.Dim() != samples_.m()) {
    throw ConfigurationError(fmt::format("functional has dimension {}, samples have {}",
                                         functional_.Dim(), samples_.m()));
  }
}

DoubleRowMat ActiveSubspace::EvaluateGradients() {
  if (gradients_) {
    LOG(WARNING) << "Gradients already evaluated, re-evaluating them and discarding the "
                    "eigenpairs, partition and bootstrap bounds derived from them";
  }
  LOG_IF(INFO, config_.verbose) << fmt::format(
      "Evaluating gradients at {} samples ({})", samples_.M(),
      config_.gradient.toString());

  StopW timer;
  DoubleRowMat gradients =
      asub::EvaluateGradients(samples_, functional_, config_.gradient, guard_);
  LOG_IF(INFO, config_.verbose) << fmt::format("Gradients evaluated in {:.1f} ms",
                                               timer.getElapsedTimeMili());

  gradients_ = std::move(gradients);
  eigen_.reset();
  partition_.reset();
  bootstrap_.reset();
  Rewind(EstimationStage::kGradientsReady);
  return *gradients_;
}

EigenDecomposition ActiveSubspace::Estimate() {
  LOG_IF(INFO, config_.verbose)
      << "Constructing the active subspace using the random sampling algorithm";
  if (!gradients_) {
    EvaluateGradients();
  } else {
    LOG(WARNING) << "Gradients already evaluated, reusing them. Make sure they are up to date.";
  }

  eigen_ = CalculateEigenpairs(ComputeCovariance(*gradients_), config_.eigen);
  partition_.reset();
  bootstrap_.reset();
  Rewind(EstimationStage::kSubspaceEstimated);

  if (config_.verbose) {
    std::string log = fmt::format("Active subspace constructed, leading {} eigenvalues:", config_.k);
    for (size_t i = 0; i < config_.k; ++i) {
      log += fmt::format(" {:.4e}", eigen_->eigenvalues(static_cast<Eigen::Index>(i)));
    }
    LOG(INFO) << log;
  }
  return *eigen_;
}

SubspacePartition ActiveSubspace::Partition(size_t n) {
  if (!eigen_) {
    throw StateError("eigenvalues not calculated yet, run Estimate() first");
  }
  SubspacePartition partition = SplitSubspace(eigen_->eigenvectors, n);
  LOG_IF(WARNING, partition_.has_value())
      << fmt::format("Replacing the active subspace of dimension {} with one of dimension {}",
                     partition_->W1.cols(), n);
  partition_ = partition;
  Advance(EstimationStage::kPartitioned);
  return partition;
}

BootstrapResult ActiveSubspace::Bootstrap() {
  return Bootstrap(config_.bootstrap.num_replicates);
}

BootstrapResult ActiveSubspace::Bootstrap(size_t num_replicates) {
  if (!eigen_) {
    Estimate();
  }

  BootstrapConfig bootstrap_config = config_.bootstrap;
  bootstrap_config.num_replicates = num_replicates;

  StopW timer;
  bootstrap_ = RunBootstrap(*gradients_, eigen_->eigenvectors, bootstrap_config, config_.eigen);
  LOG_IF(INFO, config_.verbose) << fmt::format(
      "Bootstrap values calculated ({} replicates, {:.1f} ms)", num_replicates,
      timer.getElapsedTimeMili());
  Advance(EstimationStage::kBootstrapComputed);
  return *bootstrap_;
}

DoubleRowMat ActiveSubspace::ActiveVariables() const {
  if (!partition_) {
    throw StateError("the active subspace is not partitioned yet, call Partition() first");
  }
  return samples_.Samples() * partition_->W1;
}

SufficientSummary ActiveSubspace::SummarizeSamples() const {
  SufficientSummary summary;
  summary.active_variables = ActiveVariables();
  if (samples_.HasValues()) {
    summary.values = samples_.Values();
  } else {
    summary.values.resize(static_cast<Eigen::Index>(samples_.M()));
    for (size_t i = 0; i < samples_.M(); ++i) {
      summary.values(static_cast<Eigen::Index>(i)) = functional_.Value(samples_.Extract(i));
    }
  }
  return summary;
}

DoubleRowMat ActiveSubspace::Gradients() const {
  if (!gradients_) {
    throw StateError("gradients not evaluated yet");
  }
  return *gradients_;
}

DoubleVec ActiveSubspace::Eigenvalues() const {
  if (!eigen_) {
    throw StateError("eigenvalues not calculated yet, run Estimate() first");
  }
  return eigen_->eigenvalues;
}

Eigen::MatrixXd ActiveSubspace::Eigenvectors() const {
  if (!eigen_) {
    throw StateError("eigenvectors not calculated yet, run Estimate() first");
  }
  return eigen_->eigenvectors;
}

Eigen::MatrixXd ActiveSubspace::ActiveBasis() const {
  if (!partition_) {
    throw StateError("the active subspace is not partitioned yet, call Partition() first");
  }
  return partition_->W1;
}

BootstrapResult ActiveSubspace::BootstrapBounds() const {
  if (!bootstrap_) {
    throw StateError("bootstrap bounds not computed yet, run Bootstrap() first");
  }
  return *bootstrap_;
}

Eigen::MatrixXd ActiveSubspace::Covariance(const DoubleRowMat& gradients) {
  return ComputeCovariance(gradients);
}

void ActiveSubspace::Advance(EstimationStage stage) {
  if (stage <= stage_) {
    return;
  }
  VLOG(1) << "Estimation stage " << ToString(stage_) << " -> " << ToString(stage);
  stage_ = stage;
}

void ActiveSubspace::Rewind(EstimationStage stage) {
  VLOG(1) << "Estimation stage " << ToString(stage_) << " -> " << ToString(stage)
          << " (downstream results discarded)";
  stage_ = stage;
}

}  // namespace asub
