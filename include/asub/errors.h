#pragma once

/// @file errors.h
/// @brief Exception types thrown at the asub API boundary.

#include <stdexcept>
#include <string>

namespace asub {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &message) : std::runtime_error(message) {}
};

/// Invalid construction parameters (M, m, k, cluster count, replicate count).
class ConfigurationError : public Error {
  public:
    explicit ConfigurationError(const std::string &message)
        : Error("configuration error: " + message) {}
};

/// An operation was called before the state it needs exists.
class StateError : public Error {
  public:
    explicit StateError(const std::string &message) : Error("state error: " + message) {}
};

class ShapeError : public Error {
  public:
    explicit ShapeError(const std::string &message) : Error("shape error: " + message) {}
};

class BoundsError : public Error {
  public:
    explicit BoundsError(const std::string &message) : Error("bounds error: " + message) {}
};

class NotFoundError : public Error {
  public:
    explicit NotFoundError(const std::string &message) : Error("not found: " + message) {}
};

/// A coordinate outside [-1,1], or physical bounds with lower >= upper.
class DomainError : public Error {
  public:
    explicit DomainError(const std::string &message) : Error("domain error: " + message) {}
};

class NumericalError : public Error {
  public:
    explicit NumericalError(const std::string &message) : Error("numerical error: " + message) {}
};

class IOError : public Error {
  public:
    explicit IOError(const std::string &message) : Error("io error: " + message) {}
};

/// Raised by a CallGuard that refused to start a Functional call.
class CancelledError : public Error {
  public:
    explicit CancelledError(const std::string &message) : Error("cancelled: " + message) {}
};

} // namespace asub
