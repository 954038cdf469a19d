#pragma once

#include <cstdlib>
#include <string>

#include <fmt/core.h>

#include "asub/defines.h"

namespace asub {

enum class FiniteDifferenceScheme {
    Forward,
    Backward,
    Central,
};

struct GradientOptions {
    FiniteDifferenceScheme scheme = FiniteDifferenceScheme::Central; // only used without analytic gradient
    double step = 1e-6;                                              // finite-difference step in normalized coordinates

    std::string toString() const {
        std::string args_str;
        switch (scheme) {
        case FiniteDifferenceScheme::Forward:
            args_str += "fd_forward";
            break;
        case FiniteDifferenceScheme::Backward:
            args_str += "fd_backward";
            break;
        case FiniteDifferenceScheme::Central:
            args_str += "fd_central";
            break;
        }
        args_str += fmt::format("_h{:.1e}", step);
        return args_str;
    }
};

struct EigenConfig {
    // Negative eigenvalues whose magnitude exceeds this fraction of the largest
    // eigenvalue magnitude are reported as a broken covariance, not noise.
    double negative_tolerance = 1e-8;
};

struct BootstrapConfig {
    size_t num_replicates = 100; // B, number of resamplings
    uint64_t seed = kDefaultSeed; // replicate i uses seed + i
    int num_threads = 1;          // only honoured with ASUB_USE_OPENMP

    std::string toString() const {
        std::string args_str = fmt::format("_B{}_seed{}", num_replicates, seed);
        if (num_threads > 1) {
            args_str += fmt::format("_t{}", num_threads);
        }
        return args_str;
    }
};

struct EstimatorConfig {
    size_t k = 1;          // number of eigenvalues of interest
    bool verbose = false;  // INFO logging of every pipeline step

    GradientOptions gradient;
    EigenConfig eigen;
    BootstrapConfig bootstrap;

    std::string toString() const {
        std::string args_str = fmt::format("k{}_{}", k, gradient.toString());
        args_str += bootstrap.toString();
        if (eigen.negative_tolerance != EigenConfig().negative_tolerance) {
            args_str += fmt::format("_negtol{:.1e}", eigen.negative_tolerance);
        }
        return args_str;
    }
};

} // namespace asub
