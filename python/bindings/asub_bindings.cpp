/// @file asub_bindings.cpp
/// @brief Python bindings for the asub library using pybind11.
///
/// Uses pybind11/eigen.h for numpy <-> Eigen conversion and
/// pybind11/functional.h so that Python callables can act as the QoI.

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "asub/active_subspace.h"
#include "asub/clustering.h"
#include "asub/config.h"
#include "asub/errors.h"
#include "asub/functional.h"
#include "asub/sample_record.h"
#include "asub/sample_set.h"

namespace py = pybind11;
using namespace asub;

PYBIND11_MODULE(_asub_core, m) {
    m.doc() = "asub: active subspace estimation (C++ core)";

    // ---- Errors ----
    auto base = py::register_exception<Error>(m, "Error");
    py::register_exception<ConfigurationError>(m, "ConfigurationError", base);
    py::register_exception<StateError>(m, "StateError", base);
    py::register_exception<ShapeError>(m, "ShapeError", base);
    py::register_exception<BoundsError>(m, "BoundsError", base);
    py::register_exception<NotFoundError>(m, "NotFoundError", base);
    py::register_exception<DomainError>(m, "DomainError", base);
    py::register_exception<NumericalError>(m, "NumericalError", base);
    py::register_exception<IOError>(m, "IOError", base);
    py::register_exception<CancelledError>(m, "CancelledError", base);

    // ---- Config ----
    py::enum_<FiniteDifferenceScheme>(m, "FiniteDifferenceScheme")
        .value("Forward", FiniteDifferenceScheme::Forward)
        .value("Backward", FiniteDifferenceScheme::Backward)
        .value("Central", FiniteDifferenceScheme::Central)
        .export_values();

    py::class_<GradientOptions>(m, "GradientOptions")
        .def(py::init<>())
        .def_readwrite("scheme", &GradientOptions::scheme)
        .def_readwrite("step", &GradientOptions::step);

    py::class_<EigenConfig>(m, "EigenConfig")
        .def(py::init<>())
        .def_readwrite("negative_tolerance", &EigenConfig::negative_tolerance);

    py::class_<BootstrapConfig>(m, "BootstrapConfig")
        .def(py::init<>())
        .def_readwrite("num_replicates", &BootstrapConfig::num_replicates)
        .def_readwrite("seed", &BootstrapConfig::seed)
        .def_readwrite("num_threads", &BootstrapConfig::num_threads);

    py::class_<EstimatorConfig>(m, "EstimatorConfig")
        .def(py::init<>())
        .def_readwrite("k", &EstimatorConfig::k)
        .def_readwrite("verbose", &EstimatorConfig::verbose)
        .def_readwrite("gradient", &EstimatorConfig::gradient)
        .def_readwrite("eigen", &EstimatorConfig::eigen)
        .def_readwrite("bootstrap", &EstimatorConfig::bootstrap)
        .def("__repr__", &EstimatorConfig::toString);

    // ---- SampleRecord ----
    py::class_<SampleRecord>(m, "SampleRecord")
        .def(py::init<>())
        .def_readwrite("samples", &SampleRecord::samples)
        .def_readwrite("values", &SampleRecord::values)
        .def_readwrite("bounds", &SampleRecord::bounds)
        .def_readwrite("centroids", &SampleRecord::centroids)
        .def_readwrite("clusters", &SampleRecord::clusters);
    m.def("save_record", &SaveRecord, py::arg("filename"), py::arg("record"));
    m.def("load_record", &LoadRecord, py::arg("filename"));

    // ---- SampleSet ----
    py::class_<SampleSet>(m, "SampleSet")
        .def(py::init<size_t, size_t, uint64_t>(),
             py::arg("M"), py::arg("m"), py::arg("seed") = kDefaultSeed,
             "Empty set of M samples in dimension m.")
        .def_static("uniform", &SampleSet::Uniform,
                    py::arg("M"), py::arg("m"), py::arg("seed") = kDefaultSeed)
        .def_property_readonly("M", &SampleSet::M)
        .def_property_readonly("m", &SampleSet::m)
        .def("random_uniform", &SampleSet::RandomUniform, py::arg("overwrite") = false)
        .def("extract", &SampleSet::Extract, py::arg("index"))
        .def("replace", &SampleSet::Replace, py::arg("index"), py::arg("sample"))
        .def("add_sample", &SampleSet::AddSample, py::arg("sample") = std::nullopt)
        .def("samples", &SampleSet::Samples)
        .def("assign_values", &SampleSet::AssignValues, py::arg("f"))
        .def("assign_value", &SampleSet::AssignValue, py::arg("index"), py::arg("value"))
        .def("extract_value", &SampleSet::ExtractValue, py::arg("index"))
        .def("values", &SampleSet::Values)
        .def("index", &SampleSet::Index, py::arg("sample"))
        .def("set_bounds", &SampleSet::SetBounds, py::arg("bounds"))
        .def("bounds", &SampleSet::Bounds)
        .def("to_record", &SampleSet::ToRecord)
        .def("load", &SampleSet::Load, py::arg("record"), py::arg("overwrite") = false);

    // ---- Functional ----
    py::class_<Functional>(m, "FunctionalBase")
        .def_property_readonly("dim", &Functional::Dim)
        .def("evaluate", &Functional::Value, py::arg("x"))
        .def_property_readonly("num_evaluations", &Functional::NumEvaluations);

    py::class_<CallbackFunctional, Functional>(m, "Functional")
        .def(py::init<size_t, CallbackFunctional::ValueFn, CallbackFunctional::GradientFn>(),
             py::arg("m"), py::arg("f"), py::arg("df") = nullptr,
             "QoI from a Python callable, with optional analytic gradient.")
        .def("gradient",
             [](const CallbackFunctional &self, const DoubleVec &x, const SampleSet &context,
                const GradientOptions &options) { return self.Gradient(x, context, options); },
             py::arg("x"), py::arg("context"), py::arg("options") = GradientOptions());

    // ---- Results ----
    py::class_<EigenDecomposition>(m, "EigenDecomposition")
        .def_readonly("eigenvalues", &EigenDecomposition::eigenvalues)
        .def_readonly("eigenvectors", &EigenDecomposition::eigenvectors)
        .def_readonly("num_negative", &EigenDecomposition::num_negative)
        .def_readonly("most_negative", &EigenDecomposition::most_negative);

    py::class_<SubspacePartition>(m, "SubspacePartition")
        .def_readonly("W1", &SubspacePartition::W1)
        .def_readonly("W2", &SubspacePartition::W2);

    py::class_<BootstrapResult>(m, "BootstrapResult")
        .def_readonly("eigenvalue_min", &BootstrapResult::eigenvalue_min)
        .def_readonly("eigenvalue_max", &BootstrapResult::eigenvalue_max)
        .def_readonly("distance_min", &BootstrapResult::distance_min)
        .def_readonly("distance_max", &BootstrapResult::distance_max)
        .def_readonly("distance_mean", &BootstrapResult::distance_mean)
        .def_readonly("replicate_eigenvalues", &BootstrapResult::replicate_eigenvalues)
        .def_readonly("replicate_distances", &BootstrapResult::replicate_distances);

    py::class_<SufficientSummary>(m, "SufficientSummary")
        .def_readonly("active_variables", &SufficientSummary::active_variables)
        .def_readonly("values", &SufficientSummary::values);

    m.def("calculate_eigenpairs", &CalculateEigenpairs,
          py::arg("matrix"), py::arg("config") = EigenConfig());

    // ---- ActiveSubspace ----
    py::enum_<EstimationStage>(m, "EstimationStage")
        .value("Initialized", EstimationStage::kInitialized)
        .value("GradientsReady", EstimationStage::kGradientsReady)
        .value("SubspaceEstimated", EstimationStage::kSubspaceEstimated)
        .value("Partitioned", EstimationStage::kPartitioned)
        .value("BootstrapComputed", EstimationStage::kBootstrapComputed);

    py::class_<ActiveSubspace>(m, "ActiveSubspace")
        .def(py::init<const Functional &, const SampleSet &, EstimatorConfig>(),
             py::arg("functional"), py::arg("samples"), py::arg("config") = EstimatorConfig(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("evaluate_gradients", &ActiveSubspace::EvaluateGradients)
        .def("estimation", &ActiveSubspace::Estimate)
        .def("partition", &ActiveSubspace::Partition, py::arg("n"))
        .def("bootstrap", py::overload_cast<size_t>(&ActiveSubspace::Bootstrap),
             py::arg("num_replicates"))
        .def_static("covariance", &ActiveSubspace::Covariance, py::arg("gradients"))
        .def("active_variables", &ActiveSubspace::ActiveVariables)
        .def("summarize_samples", &ActiveSubspace::SummarizeSamples)
        .def("eigenvalues", &ActiveSubspace::Eigenvalues)
        .def("eigenvectors", &ActiveSubspace::Eigenvectors)
        .def("gradients", &ActiveSubspace::Gradients)
        .def_property_readonly("stage", &ActiveSubspace::Stage);

    // ---- KMeansClustering ----
    py::class_<KMeansClustering>(m, "KMeansClustering")
        .def(py::init<SampleSet, size_t, size_t, uint64_t>(),
             py::arg("samples"), py::arg("k"), py::arg("max_iter") = 1000,
             py::arg("seed") = kDefaultSeed)
        .def("detect", &KMeansClustering::Detect)
        .def("assign_clusters", &KMeansClustering::AssignClusters, py::arg("data"))
        .def("cluster_index", &KMeansClustering::ClusterIndex, py::arg("x"))
        .def("update_centroids", &KMeansClustering::UpdateCentroids, py::arg("clusters"))
        .def("centroids", &KMeansClustering::Centroids)
        .def("clusters", &KMeansClustering::Clusters)
        .def("samples", &KMeansClustering::Samples, py::return_value_policy::reference_internal)
        .def("to_record", &KMeansClustering::ToRecord)
        .def("load", &KMeansClustering::Load, py::arg("record"), py::arg("overwrite") = false);
}
