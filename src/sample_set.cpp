/// @file sample_set.cpp
/// @brief Implementation of SampleSet.

#include "asub/sample_set.h"

#include <cmath>
#include <limits>
#include <utility>

#include "asub/errors.h"

namespace asub {

namespace {

DoubleRowMat DrawUniform(std::mt19937_64& rng, size_t rows, size_t cols) {
  std::uniform_real_distribution<double> dist(kDomainLower, kDomainUpper);
  DoubleRowMat out(rows, cols);
  for (size_t i = 0; i < rows; ++i) {
    for (size_t j = 0; j < cols; ++j) {
      out(i, j) = dist(rng);
    }
  }
  return out;
}

bool InDomain(double x) { return x >= kDomainLower && x <= kDomainUpper; }

}  // anonymous namespace

SampleSet::SampleSet(size_t M, size_t m, uint64_t seed)
    : M_(M), m_(m), rng_(seed) {
  if (M == 0) {
    throw ConfigurationError("number of samples must be greater than 0");
  }
  if (m == 0) {
    throw ConfigurationError("dimension of the parameter space must be greater than 0");
  }
}

SampleSet SampleSet::Uniform(size_t M, size_t m, uint64_t seed) {
  SampleSet set(M, m, seed);
  set.RandomUniform();
  return set;
}

void SampleSet::RandomUniform(bool overwrite) {
  if (samples_ && !overwrite) {
    throw StateError("samples already exist, pass overwrite=true to redraw them");
  }
  samples_ = DrawUniform(rng_, M_, m_);
}

DoubleVec SampleSet::Extract(size_t index) const {
  CheckIndex(index);
  return RequireSamples().row(index).transpose();
}

void SampleSet::Replace(size_t index, const DoubleVec& sample) {
  CheckIndex(index);
  RequireSamples();
  CheckSample(sample);
  samples_->row(index) = sample.transpose();
}

void SampleSet::AddSample(const std::optional<DoubleVec>& sample) {
  RequireSamples();
  DoubleVec row;
  if (sample) {
    CheckSample(*sample);
    row = *sample;
  } else {
    row = DrawUniform(rng_, 1, m_).row(0).transpose();
  }

  samples_->conservativeResize(M_ + 1, Eigen::NoChange);
  samples_->row(M_) = row.transpose();
  if (values_) {
    LOG(WARNING) << fmt::format("Sample {} appended to a set with assigned values, its value is NaN "
                                "until assigned",
                                M_);
    values_->conservativeResize(M_ + 1);
    (*values_)(M_) = std::numeric_limits<double>::quiet_NaN();
  }
  ++M_;
}

DoubleRowMat SampleSet::Samples() const { return RequireSamples(); }

void SampleSet::AssignValues(const std::function<double(const DoubleVec&)>& f) {
  if (!f) {
    throw ConfigurationError("value function is empty");
  }
  const DoubleRowMat& samples = RequireSamples();
  DoubleVec values(M_);
  for (size_t i = 0; i < M_; ++i) {
    values(i) = f(samples.row(i).transpose());
  }
  values_ = std::move(values);
}

void SampleSet::AssignValue(size_t index, double value) {
  CheckIndex(index);
  if (!values_) {
    values_ = DoubleVec::Zero(M_);
  }
  (*values_)(index) = value;
}

double SampleSet::ExtractValue(size_t index) const {
  CheckIndex(index);
  if (!values_) {
    throw StateError("values have not been assigned yet");
  }
  return (*values_)(index);
}

DoubleVec SampleSet::Values() const {
  if (!values_) {
    throw StateError("values have not been assigned yet");
  }
  return *values_;
}

size_t SampleSet::Index(const DoubleVec& sample) const {
  if (static_cast<size_t>(sample.size()) != m_) {
    throw ShapeError(fmt::format("sample has length {}, expected {}", sample.size(), m_));
  }
  const DoubleRowMat& samples = RequireSamples();
  for (size_t i = 0; i < M_; ++i) {
    if (samples.row(i) == sample.transpose()) {
      return i;
    }
  }
  throw NotFoundError("sample is not in the sampling array");
}

void SampleSet::SetBounds(const DoubleRowMat& bounds) {
  if (static_cast<size_t>(bounds.rows()) != m_ || bounds.cols() != 2) {
    throw ShapeError(fmt::format("bounds have shape ({}, {}), expected ({}, 2)",
                                 bounds.rows(), bounds.cols(), m_));
  }
  for (size_t j = 0; j < m_; ++j) {
    if (!(bounds(j, 0) < bounds(j, 1))) {
      throw DomainError(fmt::format("bounds of input {} are [{}, {}], lower must be below upper",
                                    j, bounds(j, 0), bounds(j, 1)));
    }
  }
  bounds_ = bounds;
}

DoubleVec SampleSet::HalfWidths() const {
  if (!bounds_) {
    return DoubleVec::Ones(m_);
  }
  return 0.5 * (bounds_->col(1) - bounds_->col(0));
}

DoubleVec SampleSet::ToPhysical(const DoubleVec& sample) const {
  if (static_cast<size_t>(sample.size()) != m_) {
    throw ShapeError(fmt::format("sample has length {}, expected {}", sample.size(), m_));
  }
  if (!bounds_) {
    return sample;
  }
  // x = lower + (s + 1) * (upper - lower) / 2
  DoubleVec lower = bounds_->col(0);
  return (lower.array() + (sample.array() + 1.0) * HalfWidths().array()).matrix();
}

DoubleVec SampleSet::ToNormalized(const DoubleVec& point) const {
  if (static_cast<size_t>(point.size()) != m_) {
    throw ShapeError(fmt::format("point has length {}, expected {}", point.size(), m_));
  }
  if (!bounds_) {
    return point;
  }
  DoubleVec lower = bounds_->col(0);
  return ((point - lower).array() / HalfWidths().array() - 1.0).matrix();
}

SampleRecord SampleSet::ToRecord() const {
  SampleRecord record;
  record.samples = RequireSamples();
  record.values = values_;
  record.bounds = bounds_;
  return record;
}

void SampleSet::Load(const SampleRecord& record, bool overwrite) {
  if (static_cast<size_t>(record.samples.rows()) != M_ ||
      static_cast<size_t>(record.samples.cols()) != m_) {
    throw ShapeError(fmt::format("array has shape ({}, {}), expected ({}, {})",
                                 record.samples.rows(), record.samples.cols(), M_, m_));
  }
  if (record.values && static_cast<size_t>(record.values->size()) != M_) {
    throw ShapeError(fmt::format("values have length {}, expected {}", record.values->size(), M_));
  }
  if (samples_ && !overwrite) {
    throw StateError("samples already exist, pass overwrite=true to replace them");
  }
  for (Eigen::Index i = 0; i < record.samples.size(); ++i) {
    if (!InDomain(record.samples.data()[i])) {
      throw DomainError(fmt::format("loaded coordinate {} lies outside [-1, 1]",
                                    record.samples.data()[i]));
    }
  }
  if (record.bounds) {
    SetBounds(*record.bounds);
  }

  samples_ = record.samples;
  if (record.values) {
    values_ = record.values;
  }
}

void SampleSet::CheckIndex(size_t index) const {
  if (index >= M_) {
    throw BoundsError(fmt::format("index {} out of bounds [0, {})", index, M_));
  }
}

void SampleSet::CheckSample(const DoubleVec& sample) const {
  if (static_cast<size_t>(sample.size()) != m_) {
    throw ShapeError(fmt::format("sample has length {}, expected {}", sample.size(), m_));
  }
  for (Eigen::Index j = 0; j < sample.size(); ++j) {
    if (!InDomain(sample(j))) {
      throw DomainError(fmt::format("coordinate {} of the sample is {}, outside [-1, 1]",
                                    j, sample(j)));
    }
  }
}

const DoubleRowMat& SampleSet::RequireSamples() const {
  if (!samples_) {
    throw StateError("samples have not been generated or loaded yet");
  }
  return *samples_;
}

}  // namespace asub
