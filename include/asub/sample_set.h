#pragma once

/// @file sample_set.h
/// @brief M samples of an m-dimensional parameter space normalized to
///        [-1,1]^m, with optional scalar values.

#include <cstdint>
#include <functional>
#include <optional>
#include <random>

#include "asub/defines.h"
#include "asub/sample_record.h"

namespace asub {

/// @brief Container of normalized samples.
///
/// Whatever density produced them, samples are stored normalized to the
/// canonical domain [-1,1]^m. Physical bounds, when declared, only define
/// the affine map between the canonical and the physical domain; the
/// gradient evaluator uses them for the chain-rule rescaling.
///
/// Coordinates and values are absent until generated, loaded or assigned.
/// Every accessor returns a copy.
class SampleSet {
 public:
  /// @brief Create an empty set of M samples of dimension m.
  /// @throws ConfigurationError if M or m is zero.
  SampleSet(size_t M, size_t m, uint64_t seed = kDefaultSeed);

  /// @brief Create a set and draw its samples uniformly in [-1,1]^m.
  static SampleSet Uniform(size_t M, size_t m, uint64_t seed = kDefaultSeed);

  size_t M() const { return M_; }
  size_t m() const { return m_; }

  bool HasSamples() const { return samples_.has_value(); }
  bool HasValues() const { return values_.has_value(); }

  /// @brief Draw all M samples uniformly in [-1,1]^m.
  /// @throws StateError if samples exist and overwrite is false.
  void RandomUniform(bool overwrite = false);

  /// @brief Copy of sample `index`.
  /// @throws BoundsError, StateError.
  DoubleVec Extract(size_t index) const;

  /// @brief Replace sample `index` in place.
  /// @throws BoundsError, ShapeError, DomainError, StateError.
  void Replace(size_t index, const DoubleVec& sample);

  /// @brief Append a sample (drawn uniformly when none is given); grows M.
  void AddSample(const std::optional<DoubleVec>& sample = std::nullopt);

  /// @brief Copy of the (M, m) coordinate array.
  DoubleRowMat Samples() const;

  /// @brief Assign f(sample) to every sample.
  void AssignValues(const std::function<double(const DoubleVec&)>& f);

  /// @brief Assign a value to one sample; unassigned values start at zero.
  void AssignValue(size_t index, double value);

  /// @throws BoundsError, StateError if no values are assigned.
  double ExtractValue(size_t index) const;

  /// @throws StateError if no values are assigned.
  DoubleVec Values() const;

  /// @brief Index of the first sample equal to `sample`.
  /// @throws ShapeError, NotFoundError.
  size_t Index(const DoubleVec& sample) const;

  /// @brief Declare the physical domain of each input, shape (m, 2).
  /// @throws ShapeError, DomainError if a lower bound is not below its upper.
  void SetBounds(const DoubleRowMat& bounds);
  std::optional<DoubleRowMat> Bounds() const { return bounds_; }

  /// @brief Half width of every physical interval (ones without bounds).
  DoubleVec HalfWidths() const;

  /// @brief Map a normalized sample to the physical domain.
  DoubleVec ToPhysical(const DoubleVec& sample) const;

  /// @brief Map a physical point to the normalized domain.
  DoubleVec ToNormalized(const DoubleVec& point) const;

  /// @brief Mapping-of-arrays form of this set.
  SampleRecord ToRecord() const;

  /// @brief Replace coordinates (and values, bounds when present) from a record.
  /// @throws ShapeError if the array is not (M, m); StateError if samples
  ///         exist and overwrite is false.
  void Load(const SampleRecord& record, bool overwrite = false);

 private:
  void CheckIndex(size_t index) const;
  void CheckSample(const DoubleVec& sample) const;
  const DoubleRowMat& RequireSamples() const;

  size_t M_;
  size_t m_;
  std::mt19937_64 rng_;

  std::optional<DoubleRowMat> samples_;  // (M, m)
  std::optional<DoubleVec> values_;      // (M)
  std::optional<DoubleRowMat> bounds_;   // (m, 2)
};

}  // namespace asub
