/// @file snapshot_writer.cpp
/// @brief Implementation of SnapshotWriter.

#include "asub/snapshot_writer.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "asub/errors.h"

namespace asub {

namespace {

std::string ScriptHeader(const std::string& id, const std::string& xlabel,
                         const std::string& ylabel) {
  std::string script;
  script += "set terminal pngcairo size 800,600 enhanced\n";
  script += fmt::format("set output '{}.png'\n", id);
  script += fmt::format("set xlabel '{}'\n", xlabel);
  script += fmt::format("set ylabel '{}'\n", ylabel);
  script += "set grid\n";
  script += "set key top right\n";
  return script;
}

}  // anonymous namespace

SpectrumSnapshot TakeSnapshot(const ActiveSubspace& run) {
  SpectrumSnapshot snapshot;
  snapshot.eigenvalues = run.Eigenvalues();
  snapshot.eigenvectors = run.Eigenvectors();
  if (run.HasBootstrap()) {
    snapshot.bootstrap = run.BootstrapBounds();
  }
  snapshot.k = run.config().k;
  return snapshot;
}

SnapshotWriter::SnapshotWriter(std::string output_dir)
    : output_dir_(std::move(output_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    throw IOError(fmt::format("cannot create {}: {}", output_dir_, ec.message()));
  }
}

std::string SnapshotWriter::WriteEigenvalues(const SpectrumSnapshot& snapshot) const {
  const Eigen::Index k = std::min<Eigen::Index>(snapshot.k, snapshot.eigenvalues.size());
  const bool has_true = snapshot.true_eigenvalues.has_value();
  const bool has_band = snapshot.bootstrap.has_value();
  if (has_true && snapshot.true_eigenvalues->size() < k) {
    throw ShapeError(fmt::format("reference spectrum has {} entries, {} are plotted",
                                 snapshot.true_eigenvalues->size(), k));
  }
  if (has_band && (snapshot.bootstrap->eigenvalue_min.size() < k ||
                   snapshot.bootstrap->eigenvalue_max.size() < k)) {
    throw ShapeError(fmt::format("bootstrap eigenvalue bounds have {} entries, {} are plotted",
                                 snapshot.bootstrap->eigenvalue_min.size(), k));
  }

  // index, estimate, [true], [lower, upper]
  std::string data = "# index estimate";
  data += has_true ? " true" : "";
  data += has_band ? " lower upper\n" : "\n";
  for (Eigen::Index i = 0; i < k; ++i) {
    data += fmt::format("{} {:.12e}", i + 1, snapshot.eigenvalues(i));
    if (has_true) {
      data += fmt::format(" {:.12e}", (*snapshot.true_eigenvalues)(i));
    }
    if (has_band) {
      data += fmt::format(" {:.12e} {:.12e}", snapshot.bootstrap->eigenvalue_min(i),
                          snapshot.bootstrap->eigenvalue_max(i));
    }
    data += "\n";
  }

  std::string script = ScriptHeader("eigenvalues", "Index", "Eigenvalue");
  script += "set logscale y\nset xtics 1\n";
  std::string plot = "plot ";
  const int band_col = has_true ? 4 : 3;
  if (has_band) {
    plot += fmt::format("'eigenvalues.dat' using 1:{}:{} with filledcurves fs transparent solid 0.5 "
                        "title 'BI', ",
                        band_col, band_col + 1);
  }
  if (has_true) {
    plot += "'eigenvalues.dat' using 1:3 with linespoints pt 6 title 'True', ";
  }
  plot += "'eigenvalues.dat' using 1:2 with linespoints pt 2 title 'Est'\n";
  script += plot;
  return WriteFiles("eigenvalues", data, script);
}

std::string SnapshotWriter::WriteSubspaceDistances(const SpectrumSnapshot& snapshot) const {
  if (!snapshot.bootstrap) {
    throw StateError("subspace distances need a bootstrap result");
  }
  const BootstrapResult& boot = *snapshot.bootstrap;
  const Eigen::Index count =
      std::min<Eigen::Index>(static_cast<Eigen::Index>(snapshot.k) - 1, boot.distance_mean.size());
  if (boot.distance_min.size() < count || boot.distance_max.size() < count) {
    throw ShapeError(fmt::format("bootstrap distance bounds have {} entries, {} are plotted",
                                 boot.distance_min.size(), count));
  }

  std::string data = "# dimension mean lower upper\n";
  for (Eigen::Index j = 0; j < count; ++j) {
    data += fmt::format("{} {:.12e} {:.12e} {:.12e}\n", j + 1, boot.distance_mean(j),
                        boot.distance_min(j), boot.distance_max(j));
  }

  std::string script = ScriptHeader("subspace", "Subspace Dimension", "Subspace Error");
  script += "set logscale y\nset xtics 1\n";
  script += "plot 'subspace.dat' using 1:3:4 with filledcurves fs transparent solid 0.5 title 'BI', "
            "'subspace.dat' using 1:2 with linespoints pt 2 title 'Est'\n";
  return WriteFiles("subspace", data, script);
}

std::string SnapshotWriter::WriteEigenvectors(const SpectrumSnapshot& snapshot, size_t n) const {
  const Eigen::Index cols = std::min<Eigen::Index>(
      static_cast<Eigen::Index>(n == 0 ? snapshot.k : n), snapshot.eigenvectors.cols());

  std::string data = "# component";
  for (Eigen::Index c = 0; c < cols; ++c) {
    data += fmt::format(" w{}", c + 1);
  }
  data += "\n";
  for (Eigen::Index r = 0; r < snapshot.eigenvectors.rows(); ++r) {
    data += fmt::format("{}", r + 1);
    for (Eigen::Index c = 0; c < cols; ++c) {
      data += fmt::format(" {:.12e}", snapshot.eigenvectors(r, c));
    }
    data += "\n";
  }

  std::string script = ScriptHeader("eigenvectors", "Index", "Eigenvector");
  script += "set yrange [-1:1]\nset xtics 1\nplot ";
  for (Eigen::Index c = 0; c < cols; ++c) {
    script += fmt::format("{}'eigenvectors.dat' using 1:{} with linespoints title 'Est ({})'",
                          c == 0 ? "" : ", ", c + 2, c + 1);
  }
  script += "\n";
  return WriteFiles("eigenvectors", data, script);
}

std::string SnapshotWriter::WriteSufficientSummary(const SufficientSummary& summary) const {
  const Eigen::Index M = summary.active_variables.rows();
  const Eigen::Index n = summary.active_variables.cols();
  if (summary.values.size() != M || n == 0) {
    throw ShapeError(fmt::format("summary has {} values for a ({}, {}) active variable array",
                                 summary.values.size(), M, n));
  }

  std::string data = n >= 2 ? "# y1 y2 value\n" : "# y1 value\n";
  for (Eigen::Index i = 0; i < M; ++i) {
    if (n >= 2) {
      data += fmt::format("{:.12e} {:.12e} {:.12e}\n", summary.active_variables(i, 0),
                          summary.active_variables(i, 1), summary.values(i));
    } else {
      data += fmt::format("{:.12e} {:.12e}\n", summary.active_variables(i, 0), summary.values(i));
    }
  }

  std::string script;
  if (n >= 2) {
    script = ScriptHeader("sufficient_summary", "Active Variable 1", "Active Variable 2");
    script += "set size ratio -1\nset palette rgb 33,13,10\n";
    script += "plot 'sufficient_summary.dat' using 1:2:3 with points pt 7 palette notitle\n";
  } else {
    script = ScriptHeader("sufficient_summary", "Active Variable", "Function Value");
    script += "plot 'sufficient_summary.dat' using 1:2 with points pt 7 notitle\n";
  }
  return WriteFiles("sufficient_summary", data, script);
}

std::string SnapshotWriter::WriteFiles(const std::string& id, const std::string& data,
                                       const std::string& script) const {
  const std::filesystem::path dir(output_dir_);
  const std::string data_file = (dir / (id + ".dat")).string();
  const std::string script_file = (dir / (id + ".gp")).string();

  std::ofstream dout(data_file);
  if (!dout.is_open()) {
    throw IOError(fmt::format("failed to open file for writing: {}", data_file));
  }
  dout << data;

  std::ofstream sout(script_file);
  if (!sout.is_open()) {
    throw IOError(fmt::format("failed to open file for writing: {}", script_file));
  }
  sout << script;

  if (!dout || !sout) {
    throw IOError(fmt::format("failed to write {} snapshot", id));
  }
  return script_file;
}

}  // namespace asub
