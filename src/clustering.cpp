/// @file clustering.cpp
/// @brief Implementation of KMeansClustering.

#include "asub/clustering.h"

#include <utility>

#include "asub/errors.h"

namespace asub {

KMeansClustering::KMeansClustering(SampleSet samples, size_t k,
                                   size_t max_iter, uint64_t seed)
    : samples_(std::move(samples)), k_(k), max_iter_(max_iter), rng_(seed) {
  if (k_ == 0 || k_ >= samples_.M()) {
    throw ConfigurationError(fmt::format(
        "number of clusters {} must be greater than 0 and less than the number of samples {}",
        k_, samples_.M()));
  }
  if (max_iter_ == 0) {
    throw ConfigurationError("k-means needs at least one iteration");
  }
}

size_t KMeansClustering::Detect() {
  const DoubleRowMat data = samples_.Samples();
  std::uniform_real_distribution<double> dist(data.minCoeff(), data.maxCoeff());
  DoubleRowMat initial(k_, samples_.m());
  for (Eigen::Index i = 0; i < initial.size(); ++i) {
    initial.data()[i] = dist(rng_);
  }
  centroids_ = std::move(initial);

  std::vector<IndexList> clusters;
  size_t iter = 0;
  DoubleRowMat previous;
  do {
    previous = *centroids_;
    clusters = AssignClusters(data);
    UpdateCentroids(clusters);
    ++iter;
  } while (*centroids_ != previous && iter < max_iter_);

  LOG_IF(WARNING, *centroids_ != previous)
      << fmt::format("k-means did not converge in {} iterations", max_iter_);
  clusters_ = std::move(clusters);
  return iter;
}

std::vector<IndexList> KMeansClustering::AssignClusters(const DoubleRowMat& data) const {
  RequireCentroids();
  if (static_cast<size_t>(data.cols()) != samples_.m()) {
    throw ShapeError(fmt::format("data has {} columns, the parameter space has dimension {}",
                                 data.cols(), samples_.m()));
  }
  std::vector<IndexList> clusters(k_);
  for (Eigen::Index i = 0; i < data.rows(); ++i) {
    clusters[ClusterIndex(data.row(i).transpose())].push_back(static_cast<size_t>(i));
  }
  return clusters;
}

size_t KMeansClustering::ClusterIndex(const DoubleVec& x) const {
  RequireCentroids();
  if (static_cast<size_t>(x.size()) != samples_.m()) {
    throw ShapeError(fmt::format("sample has length {}, expected {}", x.size(), samples_.m()));
  }
  Eigen::Index best = 0;
  (centroids_->rowwise() - x.transpose()).rowwise().squaredNorm().minCoeff(&best);
  return static_cast<size_t>(best);
}

void KMeansClustering::UpdateCentroids(const std::vector<IndexList>& clusters) {
  RequireCentroids();
  if (clusters.size() != k_) {
    throw ShapeError(fmt::format("got {} clusters, expected {}", clusters.size(), k_));
  }
  for (size_t c = 0; c < k_; ++c) {
    if (clusters[c].empty()) {
      continue;
    }
    DoubleVec sum = DoubleVec::Zero(static_cast<Eigen::Index>(samples_.m()));
    for (size_t idx : clusters[c]) {
      sum += samples_.Extract(idx);
    }
    centroids_->row(static_cast<Eigen::Index>(c)) =
        sum.transpose() / static_cast<double>(clusters[c].size());
  }
}

void KMeansClustering::SetCentroids(const DoubleRowMat& centroids) {
  if (static_cast<size_t>(centroids.rows()) != k_ ||
      static_cast<size_t>(centroids.cols()) != samples_.m()) {
    throw ShapeError(fmt::format("centroids have shape ({}, {}), expected ({}, {})",
                                 centroids.rows(), centroids.cols(), k_, samples_.m()));
  }
  centroids_ = centroids;
}

DoubleRowMat KMeansClustering::Centroids() const {
  RequireCentroids();
  return *centroids_;
}

std::vector<IndexList> KMeansClustering::Clusters() const {
  if (!clusters_) {
    throw StateError("clusters have not been detected or loaded yet");
  }
  return *clusters_;
}

SampleRecord KMeansClustering::ToRecord() const {
  SampleRecord record = samples_.ToRecord();
  record.centroids = centroids_;
  if (clusters_) {
    record.clusters = *clusters_;
  }
  return record;
}

void KMeansClustering::Load(const SampleRecord& record, bool overwrite) {
  if (!record.centroids) {
    throw ShapeError("record carries no centroids");
  }
  if (centroids_ && !overwrite) {
    throw StateError("centroids have already been initialized, pass overwrite=true to replace them");
  }
  if (clusters_ && !overwrite) {
    throw StateError("clusters have already been initialized, pass overwrite=true to replace them");
  }
  if (record.clusters.size() != k_) {
    throw ShapeError(fmt::format("record has {} clusters, expected {}", record.clusters.size(), k_));
  }
  for (const auto& cluster : record.clusters) {
    for (size_t idx : cluster) {
      if (idx >= samples_.M()) {
        throw BoundsError(fmt::format("cluster member {} out of bounds [0, {})", idx, samples_.M()));
      }
    }
  }
  // Validate the centroid shape before touching any state.
  if (static_cast<size_t>(record.centroids->rows()) != k_ ||
      static_cast<size_t>(record.centroids->cols()) != samples_.m()) {
    throw ShapeError(fmt::format("centroids have shape ({}, {}), expected ({}, {})",
                                 record.centroids->rows(), record.centroids->cols(), k_,
                                 samples_.m()));
  }

  samples_.Load(record, /*overwrite=*/true);
  centroids_ = *record.centroids;
  clusters_ = record.clusters;
}

void KMeansClustering::RequireCentroids() const {
  if (!centroids_) {
    throw StateError("centroids have not been initialized");
  }
}

}  // namespace asub
