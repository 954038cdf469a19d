#pragma once
#define EIGEN_DONT_PARALLELIZE

#include <stdint.h>

#include <cstddef>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Core>

#include <glog/logging.h>
#include <fmt/core.h>

namespace asub {

constexpr uint64_t kDefaultSeed = 42;

// Lower and upper edge of the canonical sampling domain.
constexpr double kDomainLower = -1.0;
constexpr double kDomainUpper = 1.0;

/// Row-major so that one sample (or one gradient) is one contiguous row.
using DoubleRowMat = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using DoubleVec = Eigen::VectorXd;
using IndexList = std::vector<size_t>;

} // namespace asub
