/// @file snapshot_writer_test.cpp
/// @brief Tests for the gnuplot snapshot writer.

#include "asub/snapshot_writer.h"

#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "asub/errors.h"

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

size_t CountDataLines(const std::string& content) {
  size_t lines = 0;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] != '#') {
      ++lines;
    }
  }
  return lines;
}

double Quadratic(const asub::DoubleVec& x) { return x.squaredNorm(); }

void TestWritesAllPlots() {
  printf("Test: writes all plots...\n");

  const auto dir = std::filesystem::temp_directory_path() / "asub_snapshot_test";
  std::filesystem::remove_all(dir);

  auto samples = asub::SampleSet::Uniform(30, 4, 8);
  asub::CallbackFunctional f(4, Quadratic, [](const asub::DoubleVec& x) { return (2.0 * x).eval(); });
  asub::EstimatorConfig config;
  config.k = 3;
  asub::ActiveSubspace ss(f, samples, config);
  ss.Estimate();

  // Without bootstrap only the eigenvalue and eigenvector plots are possible.
  asub::SpectrumSnapshot bare = asub::TakeSnapshot(ss);
  assert(!bare.bootstrap);
  asub::SnapshotWriter writer(dir.string());
  assert(std::filesystem::is_directory(dir));
  bool threw = false;
  try {
    writer.WriteSubspaceDistances(bare);
  } catch (const asub::StateError&) {
    threw = true;
  }
  assert(threw);

  ss.Partition(2);
  ss.Bootstrap(5);
  asub::SpectrumSnapshot snapshot = asub::TakeSnapshot(ss);
  snapshot.true_eigenvalues = asub::DoubleVec::Constant(4, 4.0 / 3.0);

  std::string script = writer.WriteEigenvalues(snapshot);
  assert(script == (dir / "eigenvalues.gp").string());
  std::string data = ReadFile((dir / "eigenvalues.dat").string());
  assert(CountDataLines(data) == 3);
  assert(ReadFile(script).find("set output 'eigenvalues.png'") != std::string::npos);

  writer.WriteSubspaceDistances(snapshot);
  assert(CountDataLines(ReadFile((dir / "subspace.dat").string())) == 2);

  writer.WriteEigenvectors(snapshot, 2);
  assert(CountDataLines(ReadFile((dir / "eigenvectors.dat").string())) == 4);

  writer.WriteSufficientSummary(ss.SummarizeSamples());
  assert(CountDataLines(ReadFile((dir / "sufficient_summary.dat").string())) == 30);
  assert(ReadFile((dir / "sufficient_summary.gp").string()).find("palette") != std::string::npos);

  std::filesystem::remove_all(dir);
  printf("  PASSED\n");
}

void TestRejectsMalformedSummary() {
  printf("Test: rejects malformed summary...\n");

  const auto dir = std::filesystem::temp_directory_path() / "asub_snapshot_bad";
  asub::SnapshotWriter writer(dir.string());
  asub::SufficientSummary summary;
  summary.active_variables = asub::DoubleRowMat::Zero(5, 1);
  summary.values = asub::DoubleVec::Zero(4);
  bool threw = false;
  try {
    writer.WriteSufficientSummary(summary);
  } catch (const asub::ShapeError&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
  printf("  PASSED\n");
}

void TestRejectsShortReferenceSpectrum() {
  printf("Test: rejects short reference spectrum and band...\n");

  const auto dir = std::filesystem::temp_directory_path() / "asub_snapshot_short";
  asub::SnapshotWriter writer(dir.string());

  asub::SpectrumSnapshot snapshot;
  snapshot.k = 3;
  snapshot.eigenvalues = asub::DoubleVec::LinSpaced(3, 3.0, 1.0);
  snapshot.eigenvectors = Eigen::MatrixXd::Identity(3, 3);
  snapshot.true_eigenvalues = asub::DoubleVec::Ones(1);
  bool threw = false;
  try {
    writer.WriteEigenvalues(snapshot);
  } catch (const asub::ShapeError&) {
    threw = true;
  }
  assert(threw);

  snapshot.true_eigenvalues.reset();
  asub::BootstrapResult band;
  band.eigenvalue_min = asub::DoubleVec::Ones(2);
  band.eigenvalue_max = asub::DoubleVec::Ones(2);
  band.distance_mean = asub::DoubleVec::Zero(2);
  band.distance_min = asub::DoubleVec::Zero(1);
  band.distance_max = asub::DoubleVec::Zero(1);
  snapshot.bootstrap = band;
  threw = false;
  try {
    writer.WriteEigenvalues(snapshot);
  } catch (const asub::ShapeError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    writer.WriteSubspaceDistances(snapshot);
  } catch (const asub::ShapeError&) {
    threw = true;
  }
  assert(threw);

  // A complete snapshot of the same size is accepted.
  snapshot.bootstrap->eigenvalue_min = asub::DoubleVec::Ones(3);
  snapshot.bootstrap->eigenvalue_max = asub::DoubleVec::Ones(3);
  snapshot.bootstrap->distance_min = asub::DoubleVec::Zero(2);
  snapshot.bootstrap->distance_max = asub::DoubleVec::Zero(2);
  snapshot.true_eigenvalues = asub::DoubleVec::Ones(3);
  writer.WriteEigenvalues(snapshot);
  writer.WriteSubspaceDistances(snapshot);

  std::filesystem::remove_all(dir);
  printf("  PASSED\n");
}

}  // namespace

int main() {
  printf("=== SnapshotWriter Tests ===\n\n");

  TestWritesAllPlots();
  TestRejectsMalformedSummary();
  TestRejectsShortReferenceSpectrum();

  printf("\nAll SnapshotWriter tests passed!\n");
  return 0;
}
