#pragma once

/// @file clustering.h
/// @brief k-means clustering of the samples of a SampleSet.

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "asub/defines.h"
#include "asub/sample_record.h"
#include "asub/sample_set.h"

namespace asub {

/// @brief k-means over the samples of an owned SampleSet.
///
/// Holds the sample set plus its own centroid and cluster-assignment state;
/// the sampling operations are reached through Samples() or the delegating
/// accessors. Usage:
///
///   KMeansClustering kmeans(SampleSet::Uniform(100, 2), 5);
///   kmeans.Detect();
///   auto clusters = kmeans.Clusters();
class KMeansClustering {
 public:
  /// @throws ConfigurationError unless 0 < k < M or if max_iter is 0.
  KMeansClustering(SampleSet samples, size_t k, size_t max_iter = 1000,
                   uint64_t seed = kDefaultSeed);

  /// @brief Lloyd iterations from centroids drawn uniformly in
  ///        [min, max] of the sample coordinates, until the centroids stop
  ///        moving or max_iter is reached.
  /// @return Number of iterations performed.
  size_t Detect();

  /// @brief Index lists of the rows of `data` closest to each centroid.
  /// @throws StateError without centroids; ShapeError if data has != m columns.
  std::vector<IndexList> AssignClusters(const DoubleRowMat& data) const;

  /// @brief Index of the centroid closest to `x` (first on ties).
  size_t ClusterIndex(const DoubleVec& x) const;

  /// @brief Move every centroid to the mean of its cluster; a centroid with
  ///        an empty cluster stays where it is.
  void UpdateCentroids(const std::vector<IndexList>& clusters);

  /// @throws ShapeError unless `centroids` is (k, m).
  void SetCentroids(const DoubleRowMat& centroids);

  /// @throws StateError before Detect(), SetCentroids() or Load().
  DoubleRowMat Centroids() const;
  std::vector<IndexList> Clusters() const;

  bool HasCentroids() const { return centroids_.has_value(); }
  bool HasClusters() const { return clusters_.has_value(); }

  size_t k() const { return k_; }
  size_t M() const { return samples_.M(); }
  size_t m() const { return samples_.m(); }
  DoubleVec Extract(size_t index) const { return samples_.Extract(index); }
  const SampleSet& Samples() const { return samples_; }
  SampleSet& MutableSamples() { return samples_; }

  /// @brief Sample arrays plus centroids and clusters.
  SampleRecord ToRecord() const;

  /// @brief Samples are always replaced; centroids and clusters only when
  ///        absent or `overwrite` is set.
  /// @throws StateError, ShapeError.
  void Load(const SampleRecord& record, bool overwrite = false);

 private:
  void RequireCentroids() const;

  SampleSet samples_;
  size_t k_;
  size_t max_iter_;
  std::mt19937_64 rng_;

  std::optional<DoubleRowMat> centroids_;         // (k, m)
  std::optional<std::vector<IndexList>> clusters_;  // k lists
};

}  // namespace asub
