#pragma once

#include <fstream>
#include <limits>
#include <stdint.h>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <fmt/core.h>

#include "asub/errors.h"

namespace asub {

template <typename T>
void save_scalar(std::ofstream &output, const T &value) {
    output.write(reinterpret_cast<const char *>(&value), sizeof(T));
}

template <typename T>
T load_scalar(std::ifstream &input) {
    T value;
    input.read(reinterpret_cast<char *>(&value), sizeof(T));
    if (!input) {
        throw IOError("unexpected end of file");
    }
    return value;
}

/// Bytes between the read position and the end of the stream.
inline uint64_t remaining_bytes(std::ifstream &input) {
    const std::streampos pos = input.tellg();
    input.seekg(0, std::ios::end);
    const std::streampos end = input.tellg();
    input.seekg(pos);
    if (pos < 0 || end < pos || !input) {
        throw IOError("cannot determine the size of the input stream");
    }
    return static_cast<uint64_t>(end - pos);
}

template <typename T>
void save_vector(std::ofstream &output, const std::vector<T> &vec) {
    save_scalar<uint64_t>(output, vec.size());
    for (const auto &item : vec) {
        output.write(reinterpret_cast<const char *>(&item), sizeof(T));
    }
}

template <typename T>
void load_vector(std::ifstream &input, std::vector<T> &vec) {
    auto size = load_scalar<uint64_t>(input);
    if (size > remaining_bytes(input) / sizeof(T)) {
        throw IOError(fmt::format("list of {} entries exceeds the remaining file size", size));
    }
    vec.clear();
    vec.resize(size);
    for (size_t i = 0; i < size; ++i) {
        vec[i] = load_scalar<T>(input);
    }
}

/// Writes rows, cols, then the coefficients in the matrix' own storage order.
template <class M>
void save_matrix(std::ofstream &output, const M &mat) {
    using Scalar = typename M::Scalar;
    save_scalar<uint64_t>(output, static_cast<uint64_t>(mat.rows()));
    save_scalar<uint64_t>(output, static_cast<uint64_t>(mat.cols()));
    output.write(reinterpret_cast<const char *>(mat.data()),
                 static_cast<std::streamsize>(sizeof(Scalar) * mat.size()));
}

template <class M>
void load_matrix(std::ifstream &input, M &mat) {
    using Scalar = typename M::Scalar;
    auto rows = load_scalar<uint64_t>(input);
    auto cols = load_scalar<uint64_t>(input);
    if (M::ColsAtCompileTime == 1 && cols != 1) {
        throw IOError(fmt::format("expected a column vector, found {} columns", cols));
    }
    // The header is untrusted: never allocate more than the file can fill.
    const uint64_t available = remaining_bytes(input) / sizeof(Scalar);
    const auto max_index = static_cast<uint64_t>(std::numeric_limits<Eigen::Index>::max());
    if (rows > max_index || cols > max_index || (rows != 0 && cols > available / rows)) {
        throw IOError(fmt::format("({}, {}) array exceeds the remaining file size", rows, cols));
    }
    mat.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    input.read(reinterpret_cast<char *>(mat.data()),
               static_cast<std::streamsize>(sizeof(Scalar) * mat.size()));
    if (!input) {
        throw IOError(fmt::format("truncated ({}, {}) array", rows, cols));
    }
}

} // namespace asub
