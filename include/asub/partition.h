#pragma once

/// @file partition.h
/// @brief Split of the ordered eigenvectors into active and inactive blocks.

#include "asub/defines.h"

namespace asub {

struct SubspacePartition {
  Eigen::MatrixXd W1;  // (m, n), leading eigenvectors
  Eigen::MatrixXd W2;  // (m, m - n), remaining eigenvectors
};

/// @brief W1 = first n columns of `eigenvectors`, W2 = the rest.
/// @throws ConfigurationError unless 1 <= n <= m.
SubspacePartition SplitSubspace(const Eigen::MatrixXd& eigenvectors, size_t n);

}  // namespace asub
