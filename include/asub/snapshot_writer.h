#pragma once

/// @file snapshot_writer.h
/// @brief Plot-ready text data and gnuplot scripts for estimation results.
///
/// Works on copies handed out by ActiveSubspace; the estimator itself never
/// depends on this component.

#include <optional>
#include <string>

#include "asub/active_subspace.h"
#include "asub/bootstrap.h"
#include "asub/defines.h"

namespace asub {

/// @brief Snapshot of an estimation run for plotting.
struct SpectrumSnapshot {
  DoubleVec eigenvalues;
  Eigen::MatrixXd eigenvectors;
  std::optional<BootstrapResult> bootstrap;
  std::optional<DoubleVec> true_eigenvalues;  // reference spectrum, if known
  size_t k = 0;                               // number of leading entries to plot
};

/// @brief Take a snapshot of whatever `run` has computed so far.
/// @throws StateError before Estimate().
SpectrumSnapshot TakeSnapshot(const ActiveSubspace& run);

/// @brief Writes `<id>.dat` and `<id>.gp` pairs into one directory.
///
/// Running `gnuplot <id>.gp` inside the directory renders `<id>.png`.
class SnapshotWriter {
 public:
  /// @brief Creates `output_dir` when missing.
  /// @throws IOError if the directory cannot be created.
  explicit SnapshotWriter(std::string output_dir);

  /// Eigenvalues 1..k on a log scale, with the bootstrap band when present.
  /// @throws ShapeError if the reference spectrum or the band has fewer
  ///         than k entries.
  /// @return Path of the script.
  std::string WriteEigenvalues(const SpectrumSnapshot& snapshot) const;

  /// Mean subspace distance for active dimensions 1..k-1 with its band.
  /// @throws StateError without bootstrap result; ShapeError if its bounds
  ///         are shorter than the mean.
  std::string WriteSubspaceDistances(const SpectrumSnapshot& snapshot) const;

  /// Components of the leading `n` eigenvectors (k when n is 0).
  std::string WriteEigenvectors(const SpectrumSnapshot& snapshot, size_t n = 0) const;

  /// QoI against the first (and, for n >= 2, second) active variable.
  std::string WriteSufficientSummary(const SufficientSummary& summary) const;

  const std::string& OutputDir() const { return output_dir_; }

 private:
  std::string WriteFiles(const std::string& id, const std::string& data,
                         const std::string& script) const;

  std::string output_dir_;
};

}  // namespace asub
