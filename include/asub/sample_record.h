#pragma once

/// @file sample_record.h
/// @brief Mapping-of-arrays form of a SampleSet (and of a clustering) used
///        for persistence.

#include <optional>
#include <string>
#include <vector>

#include "asub/defines.h"

namespace asub {

/// @brief Persisted arrays of a SampleSet, optionally with clustering state.
///
/// `samples` has shape (M, m). `values`, when present, has length M.
/// `bounds` has shape (m, 2). `centroids` has shape (k, m) and `clusters`
/// holds one list of sample indices per centroid.
struct SampleRecord {
  DoubleRowMat samples;
  std::optional<DoubleVec> values;
  std::optional<DoubleRowMat> bounds;
  std::optional<DoubleRowMat> centroids;
  std::vector<IndexList> clusters;
};

/// @brief Write a record to a binary file.
/// @throws IOError if the file cannot be opened or written.
void SaveRecord(const std::string& filename, const SampleRecord& record);

/// @brief Read a record written by SaveRecord.
/// @throws IOError on a missing file, bad header or truncated content.
SampleRecord LoadRecord(const std::string& filename);

}  // namespace asub
