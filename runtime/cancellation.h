#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace fimgate {

// Inbound cancellation handle. Copies share state, so the HTTP front can hold
// one copy while the relay and backend observe another. An optional probe
// (e.g. "has the client hung up?") is polled by IsCancelled() and latches the
// token once it reports true.
class CancellationToken {
 public:
  CancellationToken();

  void Cancel() const;
  bool IsCancelled() const;
  void SetProbe(std::function<bool()> probe);

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex probe_mutex;
    std::function<bool()> probe;
  };
  std::shared_ptr<State> state_;
};

enum class CancelReason { kNone, kDeadline, kCancelled };

const char *CancelReasonString(CancelReason reason);

// Deadline bound to a parent token. Done() fires when either the wall-clock
// timeout elapses, the parent is cancelled, or Cancel() is called locally.
class CancellationScope {
 public:
  using Clock = std::chrono::steady_clock;

  CancellationScope(CancellationToken parent,
                    std::chrono::milliseconds timeout);

  void Cancel();
  bool Done() const;
  CancelReason Reason() const;

  Clock::time_point Started() const { return started_; }
  Clock::time_point Deadline() const { return deadline_; }
  std::chrono::nanoseconds Elapsed() const;
  // Time left before the deadline, never negative.
  std::chrono::milliseconds Remaining() const;

 private:
  CancellationToken parent_;
  Clock::time_point started_;
  Clock::time_point deadline_;
  std::atomic<bool> local_cancel_{false};
  mutable std::atomic<int> latched_{static_cast<int>(CancelReason::kNone)};
};

// One-shot gate. Fire() returns true for exactly one caller.
class CompletionGate {
 public:
  bool Fire() { return !fired_.exchange(true); }
  bool Fired() const { return fired_.load(); }

 private:
  std::atomic<bool> fired_{false};
};

} // namespace fimgate
