#pragma once

#include "asub/defines.h"

namespace asub {

/// Largest singular value of A (0 for an empty matrix).
inline double spectral_norm(const Eigen::MatrixXd &A) {
    if (A.size() == 0) {
        return 0.0;
    }
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(A);
    return svd.singularValues()(0);
}

/// ||W[:, :j+1]^T U[:, j+1:]||_2, overlap between the leading j+1 directions
/// of W and the trailing directions of U. 0 when both splits agree.
inline double subspace_distance(const Eigen::MatrixXd &W, const Eigen::MatrixXd &U, size_t j) {
    const Eigen::Index lead = static_cast<Eigen::Index>(j) + 1;
    return spectral_norm(W.leftCols(lead).transpose() * U.rightCols(U.cols() - lead));
}

} // namespace asub
