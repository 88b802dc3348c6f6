#include "runtime/cancellation.h"

#include <utility>

namespace fimgate {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() const { state_->cancelled.store(true); }

bool CancellationToken::IsCancelled() const {
  if (state_->cancelled.load()) {
    return true;
  }
  std::lock_guard<std::mutex> lock(state_->probe_mutex);
  if (state_->probe && state_->probe()) {
    state_->cancelled.store(true);
    return true;
  }
  return false;
}

void CancellationToken::SetProbe(std::function<bool()> probe) {
  std::lock_guard<std::mutex> lock(state_->probe_mutex);
  state_->probe = std::move(probe);
}

const char *CancelReasonString(CancelReason reason) {
  switch (reason) {
  case CancelReason::kNone:
    return "none";
  case CancelReason::kDeadline:
    return "deadline";
  case CancelReason::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

CancellationScope::CancellationScope(CancellationToken parent,
                                     std::chrono::milliseconds timeout)
    : parent_(std::move(parent)), started_(Clock::now()),
      deadline_(started_ + timeout) {}

void CancellationScope::Cancel() { local_cancel_.store(true); }

bool CancellationScope::Done() const { return Reason() != CancelReason::kNone; }

CancelReason CancellationScope::Reason() const {
  int latched = latched_.load();
  if (latched != static_cast<int>(CancelReason::kNone)) {
    return static_cast<CancelReason>(latched);
  }
  CancelReason reason = CancelReason::kNone;
  if (local_cancel_.load() || parent_.IsCancelled()) {
    reason = CancelReason::kCancelled;
  } else if (Clock::now() >= deadline_) {
    reason = CancelReason::kDeadline;
  }
  if (reason != CancelReason::kNone) {
    // First observed reason wins.
    int expected = static_cast<int>(CancelReason::kNone);
    latched_.compare_exchange_strong(expected, static_cast<int>(reason));
    return static_cast<CancelReason>(latched_.load());
  }
  return reason;
}

std::chrono::nanoseconds CancellationScope::Elapsed() const {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() -
                                                              started_);
}

std::chrono::milliseconds CancellationScope::Remaining() const {
  auto now = Clock::now();
  if (now >= deadline_) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ -
                                                               now);
}

} // namespace fimgate
