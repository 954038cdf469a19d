#pragma once

/// @file call_guard.h
/// @brief Hooks wrapped around every Functional call made by the gradient
///        evaluator.

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>

#include "asub/defines.h"

namespace asub {

/// @brief Runs one Functional invocation for sample `index`.
///
/// A guard may refuse to start a call by throwing; it never interrupts a
/// call already in flight.
class CallGuard {
 public:
  virtual ~CallGuard() = default;

  virtual DoubleVec Invoke(size_t index,
                           const std::function<DoubleVec()>& call) = 0;
};

/// @brief Calls straight through and blocks until the call returns.
class DirectCallGuard : public CallGuard {
 public:
  DoubleVec Invoke(size_t /*index*/,
                   const std::function<DoubleVec()>& call) override {
    return call();
  }
};

/// @brief Cooperative cancellation and deadline.
///
/// Before each call the guard checks the cancel token and, when a budget was
/// given, the wall time elapsed since construction. Either condition throws
/// CancelledError.
class CancellationGuard : public CallGuard {
 public:
  using Clock = std::chrono::steady_clock;

  /// @param token Observed, not owned; must outlive the guard.
  explicit CancellationGuard(
      const std::atomic<bool>& token,
      std::optional<Clock::duration> budget = std::nullopt);

  DoubleVec Invoke(size_t index,
                   const std::function<DoubleVec()>& call) override;

  /// @brief Number of calls the guard let through.
  size_t NumCalls() const { return num_calls_; }

 private:
  const std::atomic<bool>& token_;
  std::optional<Clock::time_point> deadline_;
  size_t num_calls_ = 0;
};

}  // namespace asub
