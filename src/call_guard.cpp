/// @file call_guard.cpp
/// @brief Implementation of CancellationGuard.

#include "asub/call_guard.h"

#include "asub/errors.h"

namespace asub {

CancellationGuard::CancellationGuard(const std::atomic<bool>& token,
                                     std::optional<Clock::duration> budget)
    : token_(token) {
  if (budget) {
    deadline_ = Clock::now() + *budget;
  }
}

DoubleVec CancellationGuard::Invoke(size_t index,
                                    const std::function<DoubleVec()>& call) {
  if (token_.load()) {
    throw CancelledError(
        fmt::format("cancel requested before evaluating sample {}", index));
  }
  if (deadline_ && Clock::now() >= *deadline_) {
    throw CancelledError(
        fmt::format("time budget exhausted before evaluating sample {}", index));
  }
  ++num_calls_;
  return call();
}

}  // namespace asub
