/// @file sample_record_test.cpp
/// @brief Tests for the binary sample record format.

#include "asub/sample_record.h"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "asub/errors.h"
#include "asub/sample_set.h"

namespace {

std::string TempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

bool ThrowsIOError(const std::string& path) {
  try {
    asub::LoadRecord(path);
  } catch (const asub::IOError&) {
    return true;
  }
  return false;
}

void TestFileRoundtrip() {
  printf("Test: file round trip...\n");

  auto samples = asub::SampleSet::Uniform(12, 3, 4);
  samples.AssignValues([](const asub::DoubleVec& x) { return x.sum(); });
  asub::DoubleRowMat bounds(3, 2);
  bounds << 0.0, 1.0,
            -5.0, 5.0,
            100.0, 300.0;
  samples.SetBounds(bounds);

  asub::SampleRecord record = samples.ToRecord();
  record.centroids = asub::DoubleRowMat::Constant(2, 3, 0.5);
  record.clusters = {{0, 2, 4}, {1, 3, 5, 6, 7, 8, 9, 10, 11}};

  const std::string path = TempPath("asub_record_roundtrip.bin");
  asub::SaveRecord(path, record);
  asub::SampleRecord loaded = asub::LoadRecord(path);

  assert(loaded.samples == record.samples);
  assert(loaded.values && *loaded.values == *record.values);
  assert(loaded.bounds && *loaded.bounds == bounds);
  assert(loaded.centroids && *loaded.centroids == *record.centroids);
  assert(loaded.clusters == record.clusters);

  asub::SampleSet restored(12, 3);
  restored.Load(loaded);
  assert(restored.Samples() == samples.Samples());
  assert(restored.Values() == samples.Values());
  assert(std::abs(restored.HalfWidths()(2) - 100.0) < 1e-12);

  std::filesystem::remove(path);
  printf("  PASSED\n");
}

void TestOptionalFieldsAbsent() {
  printf("Test: optional fields absent...\n");

  asub::SampleRecord record;
  record.samples = asub::DoubleRowMat::Zero(4, 2);
  const std::string path = TempPath("asub_record_minimal.bin");
  asub::SaveRecord(path, record);
  asub::SampleRecord loaded = asub::LoadRecord(path);

  assert(loaded.samples.rows() == 4 && loaded.samples.cols() == 2);
  assert(!loaded.values);
  assert(!loaded.bounds);
  assert(!loaded.centroids);
  assert(loaded.clusters.empty());

  std::filesystem::remove(path);
  printf("  PASSED\n");
}

void TestCorruptFiles() {
  printf("Test: corrupt files...\n");

  assert(ThrowsIOError(TempPath("asub_record_does_not_exist.bin")));

  const std::string bad_magic = TempPath("asub_record_bad_magic.bin");
  {
    std::ofstream out(bad_magic, std::ios::binary);
    out << "NOPE and some more bytes";
  }
  assert(ThrowsIOError(bad_magic));
  std::filesystem::remove(bad_magic);

  // Valid header, truncated body.
  asub::SampleRecord record;
  record.samples = asub::DoubleRowMat::Zero(50, 4);
  const std::string truncated = TempPath("asub_record_truncated.bin");
  asub::SaveRecord(truncated, record);
  std::filesystem::resize_file(truncated, 64);
  assert(ThrowsIOError(truncated));
  std::filesystem::remove(truncated);

  // Valid magic and version, array header far larger than the file.
  const std::string oversized = TempPath("asub_record_oversized.bin");
  {
    std::ofstream out(oversized, std::ios::binary);
    const uint32_t version = 1;
    const uint64_t rows = uint64_t{1} << 40;
    const uint64_t cols = 4;
    const double payload[4] = {0.0, 0.0, 0.0, 0.0};
    out.write("ASUB", 4);
    out.write(reinterpret_cast<const char*>(&version), sizeof(version));
    out.write(reinterpret_cast<const char*>(&rows), sizeof(rows));
    out.write(reinterpret_cast<const char*>(&cols), sizeof(cols));
    out.write(reinterpret_cast<const char*>(payload), sizeof(payload));
  }
  assert(ThrowsIOError(oversized));
  std::filesystem::remove(oversized);

  // Intact arrays followed by a cluster count no file could hold.
  const std::string bad_clusters = TempPath("asub_record_bad_clusters.bin");
  record.samples = asub::DoubleRowMat::Zero(2, 2);
  record.clusters = {{0}, {1}};
  asub::SaveRecord(bad_clusters, record);
  {
    // The first cluster list starts after the 8-byte cluster count at the
    // end of the arrays; overwrite its length.
    const auto size = std::filesystem::file_size(bad_clusters);
    std::fstream io(bad_clusters, std::ios::binary | std::ios::in | std::ios::out);
    const uint64_t huge = uint64_t{1} << 50;
    io.seekp(static_cast<std::streamoff>(size - 2 * (2 * sizeof(uint64_t))));
    io.write(reinterpret_cast<const char*>(&huge), sizeof(huge));
  }
  assert(ThrowsIOError(bad_clusters));
  std::filesystem::remove(bad_clusters);

  printf("  PASSED\n");
}

void TestLoadRejectsForeignShapes() {
  printf("Test: load rejects mismatched records...\n");

  asub::SampleSet samples(5, 2);
  asub::SampleRecord record;
  record.samples = asub::DoubleRowMat::Zero(4, 2);
  bool threw = false;
  try {
    samples.Load(record);
  } catch (const asub::ShapeError&) {
    threw = true;
  }
  assert(threw);

  record.samples = asub::DoubleRowMat::Constant(5, 2, 1.5);
  threw = false;
  try {
    samples.Load(record);
  } catch (const asub::DomainError&) {
    threw = true;
  }
  assert(threw);
  assert(!samples.HasSamples());

  printf("  PASSED\n");
}

}  // namespace

int main() {
  printf("=== SampleRecord Tests ===\n\n");

  TestFileRoundtrip();
  TestOptionalFieldsAbsent();
  TestCorruptFiles();
  TestLoadRejectsForeignShapes();

  printf("\nAll SampleRecord tests passed!\n");
  return 0;
}
