/// @file partition.cpp
/// @brief Implementation of SplitSubspace.

#include "asub/partition.h"

#include "asub/errors.h"

namespace asub {

SubspacePartition SplitSubspace(const Eigen::MatrixXd& eigenvectors, size_t n) {
  const size_t m = static_cast<size_t>(eigenvectors.cols());
  if (n == 0 || n > m) {
    throw ConfigurationError(
        fmt::format("active subspace dimension {} must lie in [1, {}]", n, m));
  }
  const Eigen::Index lead = static_cast<Eigen::Index>(n);
  SubspacePartition partition;
  partition.W1 = eigenvectors.leftCols(lead);
  partition.W2 = eigenvectors.rightCols(eigenvectors.cols() - lead);
  CHECK_EQ(partition.W1.cols() + partition.W2.cols(), eigenvectors.cols());
  return partition;
}

}  // namespace asub
