#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace fimgate {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 50, 100, 250, 500, 1000, 2500, 10000,
  // 60000, +Inf. Streams are long-lived, so the tail buckets reach the
  // relay deadline.
  static constexpr std::array<double, 8> kBuckets{
      50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 10000.0, 60000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Process metrics. Owned by main() and handed to components by pointer; a
// null pointer disables recording.
class MetricsRegistry {
public:
  void SetModel(const std::string &model);

  // Completion relay outcomes.
  void RecordCompletionRequest();
  void RecordCompleted();
  void RecordCancelled(bool deadline);
  void RecordFailed(int status);
  void RecordStreamRecord();
  void RecordSuppressedFragment();
  void RecordBackendEval(int prompt_tokens, int completion_tokens);

  // HTTP front.
  void RecordResponse(int status);
  void RecordLatency(double request_ms);
  void IncrementConnections();
  void DecrementConnections();

  // Connection proxy.
  void RecordProxyAccept();
  void RecordProxyDialFailure();
  void RecordProxyBytes(std::size_t bytes);

  uint64_t CompletedCount() const { return completed_.load(); }
  uint64_t CancelledCount() const {
    return cancelled_deadline_.load() + cancelled_other_.load();
  }
  uint64_t FailedCount() const { return failed_.load(); }
  int ActiveConnections() const { return active_connections_.load(); }

  std::string RenderPrometheus() const;

private:
  mutable std::mutex model_mutex_;
  std::string model_{"unknown"};

  // Counters.
  std::atomic<uint64_t> completion_requests_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> cancelled_deadline_{0};
  std::atomic<uint64_t> cancelled_other_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> failed_client_{0};
  std::atomic<uint64_t> stream_records_{0};
  std::atomic<uint64_t> suppressed_fragments_{0};
  std::atomic<uint64_t> prompt_tokens_{0};
  std::atomic<uint64_t> completion_tokens_{0};
  std::array<std::atomic<uint64_t>, 6> responses_by_class_{}; // 0xx..5xx
  std::atomic<uint64_t> proxy_accepts_{0};
  std::atomic<uint64_t> proxy_dial_failures_{0};
  std::atomic<uint64_t> proxy_bytes_{0};

  LatencyHistogram request_latency_;

  // Gauges.
  std::atomic<int> active_connections_{0};
};

} // namespace fimgate
