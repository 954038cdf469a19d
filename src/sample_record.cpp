/// @file sample_record.cpp
/// @brief Binary codec for SampleRecord.
///
/// Layout: magic, version, samples, then a flag byte followed by the array
/// for each optional field, then the cluster index lists.

#include "asub/sample_record.h"

#include <cstring>
#include <fstream>
#include <utility>

#include "asub/errors.h"
#include "asub/io_utils.h"

namespace asub {

namespace {

constexpr char kMagic[4] = {'A', 'S', 'U', 'B'};
constexpr uint32_t kVersion = 1;

template <class M>
void SaveOptional(std::ofstream& output, const std::optional<M>& mat) {
  char flag = mat ? 1 : 0;
  output.write(&flag, sizeof(char));
  if (mat) {
    save_matrix(output, *mat);
  }
}

template <class M>
void LoadOptional(std::ifstream& input, std::optional<M>& mat) {
  if (load_scalar<char>(input)) {
    M loaded;
    load_matrix(input, loaded);
    mat = std::move(loaded);
  } else {
    mat.reset();
  }
}

}  // anonymous namespace

void SaveRecord(const std::string& filename, const SampleRecord& record) {
  std::ofstream output(filename, std::ios::binary);
  if (!output.is_open()) {
    throw IOError(fmt::format("failed to open file for writing: {}", filename));
  }
  output.write(kMagic, sizeof(kMagic));
  save_scalar(output, kVersion);
  save_matrix(output, record.samples);
  SaveOptional(output, record.values);
  SaveOptional(output, record.bounds);
  SaveOptional(output, record.centroids);

  save_scalar<uint64_t>(output, record.clusters.size());
  for (const auto& cluster : record.clusters) {
    std::vector<uint64_t> indices(cluster.begin(), cluster.end());
    save_vector(output, indices);
  }
  if (!output) {
    throw IOError(fmt::format("failed to write {}", filename));
  }
}

SampleRecord LoadRecord(const std::string& filename) {
  std::ifstream input(filename, std::ios::binary);
  if (!input.is_open()) {
    throw IOError(fmt::format("failed to open file for reading: {}", filename));
  }
  char magic[sizeof(kMagic)];
  input.read(magic, sizeof(magic));
  if (!input || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
    throw IOError(fmt::format("{} is not a sample record", filename));
  }
  auto version = load_scalar<uint32_t>(input);
  if (version != kVersion) {
    throw IOError(fmt::format("{} has record version {}, expected {}", filename, version, kVersion));
  }

  SampleRecord record;
  load_matrix(input, record.samples);
  LoadOptional(input, record.values);
  LoadOptional(input, record.bounds);
  LoadOptional(input, record.centroids);

  auto num_clusters = load_scalar<uint64_t>(input);
  record.clusters.resize(num_clusters);
  for (auto& cluster : record.clusters) {
    std::vector<uint64_t> indices;
    load_vector(input, indices);
    cluster.assign(indices.begin(), indices.end());
  }
  return record;
}

}  // namespace asub
