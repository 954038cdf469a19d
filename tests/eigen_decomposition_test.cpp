/// @file eigen_decomposition_test.cpp
/// @brief Tests for the covariance estimator, the eigendecomposition with its
///        orientation rules, and the subspace split.

#include "asub/covariance.h"
#include "asub/eigen_decomposition.h"
#include "asub/partition.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

#include "asub/errors.h"

namespace {

constexpr double kEpsilon = 1e-10;

Eigen::MatrixXd RandomSymmetric(Eigen::Index m, std::mt19937& rng) {
  std::normal_distribution<double> dist(0.0, 1.0);
  Eigen::MatrixXd A(m, m);
  for (Eigen::Index i = 0; i < A.size(); ++i) {
    A.data()[i] = dist(rng);
  }
  return 0.5 * (A + A.transpose());
}

asub::DoubleRowMat RandomGradients(Eigen::Index M, Eigen::Index m, std::mt19937& rng) {
  std::normal_distribution<double> dist(0.0, 1.0);
  asub::DoubleRowMat G(M, m);
  for (Eigen::Index i = 0; i < G.size(); ++i) {
    G.data()[i] = dist(rng);
  }
  return G;
}

// Test 1: covariance equals the averaged sum of outer products
bool TestCovarianceDefinition() {
  std::cout << "TestCovarianceDefinition: ";

  std::mt19937 rng(1);
  // More rows than one accumulation block.
  auto G = RandomGradients(300, 4, rng);
  Eigen::MatrixXd expected = Eigen::MatrixXd::Zero(4, 4);
  for (Eigen::Index i = 0; i < G.rows(); ++i) {
    Eigen::VectorXd g = G.row(i).transpose();
    expected += g * g.transpose();
  }
  expected /= static_cast<double>(G.rows());

  Eigen::MatrixXd cov = asub::ComputeCovariance(G);
  if ((cov - expected).cwiseAbs().maxCoeff() > kEpsilon) {
    std::cout << "FAILED - covariance differs from sum of outer products\n";
    return false;
  }
  if ((cov - cov.transpose()).cwiseAbs().maxCoeff() != 0.0) {
    std::cout << "FAILED - covariance not exactly symmetric\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 2: reordering the gradient rows leaves the covariance unchanged
bool TestCovariancePermutationInvariance() {
  std::cout << "TestCovariancePermutationInvariance: ";

  std::mt19937 rng(2);
  auto G = RandomGradients(120, 5, rng);
  std::vector<Eigen::Index> perm(G.rows());
  std::iota(perm.begin(), perm.end(), 0);
  std::shuffle(perm.begin(), perm.end(), rng);
  asub::DoubleRowMat P(G.rows(), G.cols());
  for (Eigen::Index i = 0; i < G.rows(); ++i) {
    P.row(i) = G.row(perm[i]);
  }

  double diff = (asub::ComputeCovariance(G) - asub::ComputeCovariance(P)).cwiseAbs().maxCoeff();
  if (diff > kEpsilon) {
    std::cout << "FAILED - permuted covariance differs by " << diff << "\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 3: ordering, non-negativity, orthonormality and sign on random input
bool TestEigenpairProperties() {
  std::cout << "TestEigenpairProperties: ";

  std::mt19937 rng(3);
  for (Eigen::Index m : {1, 2, 3, 7, 16}) {
    for (int trial = 0; trial < 5; ++trial) {
      Eigen::MatrixXd A = RandomSymmetric(m, rng);
      auto eig = asub::CalculateEigenpairs(A);

      for (Eigen::Index j = 0; j < m; ++j) {
        if (eig.eigenvalues(j) < 0.0) {
          std::cout << "FAILED - negative eigenvalue " << eig.eigenvalues(j) << "\n";
          return false;
        }
        if (j > 0 && eig.eigenvalues(j) > eig.eigenvalues(j - 1)) {
          std::cout << "FAILED - eigenvalues not descending at " << j << "\n";
          return false;
        }
        if (eig.eigenvectors(0, j) < 0.0) {
          std::cout << "FAILED - eigenvector " << j << " has negative first coordinate\n";
          return false;
        }
      }

      Eigen::MatrixXd gram = eig.eigenvectors.transpose() * eig.eigenvectors;
      if ((gram - Eigen::MatrixXd::Identity(m, m)).cwiseAbs().maxCoeff() > 1e-10) {
        std::cout << "FAILED - eigenvectors not orthonormal (m=" << m << ")\n";
        return false;
      }

      // Every column is still an eigenvector: A w = +-|lambda| w.
      for (Eigen::Index j = 0; j < m; ++j) {
        Eigen::VectorXd w = eig.eigenvectors.col(j);
        double lambda = w.dot(A * w);
        if (std::abs(std::abs(lambda) - eig.eigenvalues(j)) > 1e-9 ||
            (A * w - lambda * w).norm() > 1e-9) {
          std::cout << "FAILED - column " << j << " is not an eigenvector\n";
          return false;
        }
      }
    }
  }

  std::cout << "OK\n";
  return true;
}

// Test 4: a known spectrum comes back sorted with the expected vectors
bool TestKnownSpectrum() {
  std::cout << "TestKnownSpectrum: ";

  Eigen::MatrixXd A = Eigen::MatrixXd::Zero(3, 3);
  A(0, 0) = 1.0;
  A(1, 1) = 5.0;
  A(2, 2) = 3.0;
  auto eig = asub::CalculateEigenpairs(A);

  Eigen::Vector3d expected(5.0, 3.0, 1.0);
  if ((eig.eigenvalues - expected).norm() > kEpsilon) {
    std::cout << "FAILED - eigenvalues " << eig.eigenvalues.transpose() << "\n";
    return false;
  }
  // Unit vectors e1, e2, e0; first coordinate of e1 and e2 is exactly zero,
  // so the rule keeps whatever sign the solver produced. Compare magnitudes.
  const Eigen::Index expected_axis[3] = {1, 2, 0};
  for (Eigen::Index j = 0; j < 3; ++j) {
    if (std::abs(std::abs(eig.eigenvectors(expected_axis[j], j)) - 1.0) > kEpsilon) {
      std::cout << "FAILED - eigenvector " << j << " not on axis " << expected_axis[j] << "\n";
      return false;
    }
  }
  if (std::abs(eig.eigenvectors(0, 2) - 1.0) > kEpsilon) {
    std::cout << "FAILED - eigenvector along e0 must point to +e0\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 5: the sign rule flips a vector with a negative first coordinate
bool TestSignNormalization() {
  std::cout << "TestSignNormalization: ";

  // Eigenvectors (1, -1)/sqrt2 -> 3 and (1, 1)/sqrt2 -> 1.
  Eigen::Matrix2d A;
  A << 2.0, -1.0,
      -1.0, 2.0;
  auto eig = asub::CalculateEigenpairs(A);
  const double s = 1.0 / std::sqrt(2.0);
  if (std::abs(eig.eigenvalues(0) - 3.0) > kEpsilon || std::abs(eig.eigenvalues(1) - 1.0) > kEpsilon) {
    std::cout << "FAILED - eigenvalues " << eig.eigenvalues.transpose() << "\n";
    return false;
  }
  if (std::abs(eig.eigenvectors(0, 0) - s) > kEpsilon || std::abs(eig.eigenvectors(1, 0) + s) > kEpsilon ||
      std::abs(eig.eigenvectors(0, 1) - s) > kEpsilon || std::abs(eig.eigenvectors(1, 1) - s) > kEpsilon) {
    std::cout << "FAILED - orientation\n" << eig.eigenvectors << "\n";
    return false;
  }

  auto again = asub::CalculateEigenpairs(A);
  if (again.eigenvectors != eig.eigenvectors) {
    std::cout << "FAILED - orientation not deterministic\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 6: the absolute-value policy hides a genuinely negative eigenvalue
// but the diagnostics record it
bool TestNegativeEigenvalueMasking() {
  std::cout << "TestNegativeEigenvalueMasking: ";

  // Not a covariance: eigenvalues 4 and -6.
  Eigen::Matrix2d A;
  A << 4.0, 0.0,
       0.0, -6.0;
  auto eig = asub::CalculateEigenpairs(A);
  if (std::abs(eig.eigenvalues(0) - 6.0) > kEpsilon || std::abs(eig.eigenvalues(1) - 4.0) > kEpsilon) {
    std::cout << "FAILED - magnitudes " << eig.eigenvalues.transpose() << "\n";
    return false;
  }
  // The leading direction belongs to the negative eigenvalue.
  if (std::abs(std::abs(eig.eigenvectors(1, 0)) - 1.0) > kEpsilon) {
    std::cout << "FAILED - leading vector should be e1\n";
    return false;
  }
  if (eig.num_negative != 1 || std::abs(eig.most_negative + 6.0) > kEpsilon) {
    std::cout << "FAILED - diagnostics num_negative=" << eig.num_negative
              << " most_negative=" << eig.most_negative << "\n";
    return false;
  }

  // A valid covariance records no negative eigenvalue above zero.
  Eigen::Matrix2d C;
  C << 2.0, 1.0,
       1.0, 2.0;
  auto clean = asub::CalculateEigenpairs(C);
  if (clean.num_negative != 0 || clean.most_negative != 0.0) {
    std::cout << "FAILED - clean covariance flagged\n";
    return false;
  }

  std::cout << "OK\n";
  return true;
}

// Test 7: invalid input shapes
bool TestInvalidInput() {
  std::cout << "TestInvalidInput: ";

  try {
    asub::CalculateEigenpairs(Eigen::MatrixXd::Zero(2, 3));
    std::cout << "FAILED - non-square matrix accepted\n";
    return false;
  } catch (const asub::ShapeError&) {
  }
  try {
    asub::ComputeCovariance(asub::DoubleRowMat(0, 3));
    std::cout << "FAILED - empty gradient matrix accepted\n";
    return false;
  } catch (const asub::ShapeError&) {
  }

  std::cout << "OK\n";
  return true;
}

// Test 8: W1 | W2 reproduces the eigenvectors, n == m gives empty W2
bool TestPartition() {
  std::cout << "TestPartition: ";

  std::mt19937 rng(8);
  auto eig = asub::CalculateEigenpairs(RandomSymmetric(5, rng));
  for (size_t n = 1; n <= 5; ++n) {
    auto part = asub::SplitSubspace(eig.eigenvectors, n);
    if (part.W1.cols() != static_cast<Eigen::Index>(n) || part.W2.cols() != static_cast<Eigen::Index>(5 - n)) {
      std::cout << "FAILED - block widths for n=" << n << "\n";
      return false;
    }
    Eigen::MatrixXd joined(5, 5);
    joined << part.W1, part.W2;
    if (joined != eig.eigenvectors) {
      std::cout << "FAILED - [W1 W2] differs from eigenvectors for n=" << n << "\n";
      return false;
    }
  }

  auto full = asub::SplitSubspace(eig.eigenvectors, 5);
  if (full.W2.cols() != 0 || full.W2.rows() != 5 || full.W1 != eig.eigenvectors) {
    std::cout << "FAILED - n == m\n";
    return false;
  }

  for (size_t bad : {size_t{0}, size_t{6}}) {
    try {
      asub::SplitSubspace(eig.eigenvectors, bad);
      std::cout << "FAILED - n=" << bad << " accepted\n";
      return false;
    } catch (const asub::ConfigurationError&) {
    }
  }

  std::cout << "OK\n";
  return true;
}

}  // namespace

int main() {
  int failed = 0;

  if (!TestCovarianceDefinition()) ++failed;
  if (!TestCovariancePermutationInvariance()) ++failed;
  if (!TestEigenpairProperties()) ++failed;
  if (!TestKnownSpectrum()) ++failed;
  if (!TestSignNormalization()) ++failed;
  if (!TestNegativeEigenvalueMasking()) ++failed;
  if (!TestInvalidInput()) ++failed;
  if (!TestPartition()) ++failed;

  if (failed == 0) {
    std::cout << "\nAll eigendecomposition tests passed!\n";
    return 0;
  } else {
    std::cout << "\n" << failed << " test(s) failed.\n";
    return 1;
  }
}
