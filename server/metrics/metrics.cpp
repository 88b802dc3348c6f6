#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fimgate {

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetModel(const std::string &model) {
  std::lock_guard<std::mutex> lock(model_mutex_);
  model_ = model;
}

void MetricsRegistry::RecordCompletionRequest() {
  completion_requests_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordCompleted() {
  completed_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordCancelled(bool deadline) {
  if (deadline) {
    cancelled_deadline_.fetch_add(1, std::memory_order_relaxed);
  } else {
    cancelled_other_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordFailed(int status) {
  failed_.fetch_add(1, std::memory_order_relaxed);
  if (status >= 400 && status < 500) {
    failed_client_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordStreamRecord() {
  stream_records_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordSuppressedFragment() {
  suppressed_fragments_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordBackendEval(int prompt_tokens,
                                        int completion_tokens) {
  prompt_tokens_.fetch_add(static_cast<uint64_t>(std::max(0, prompt_tokens)),
                           std::memory_order_relaxed);
  completion_tokens_.fetch_add(
      static_cast<uint64_t>(std::max(0, completion_tokens)),
      std::memory_order_relaxed);
}

void MetricsRegistry::RecordResponse(int status) {
  int cls = status / 100;
  if (cls < 0 || cls >= static_cast<int>(responses_by_class_.size())) {
    cls = 0;
  }
  responses_by_class_[static_cast<std::size_t>(cls)].fetch_add(
      1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordProxyAccept() {
  proxy_accepts_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordProxyDialFailure() {
  proxy_dial_failures_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordProxyBytes(std::size_t bytes) {
  proxy_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::string model;
  {
    std::lock_guard<std::mutex> lock(model_mutex_);
    model = model_;
  }
  std::ostringstream out;

  // --- Relay counters ---
  out << "# HELP fimgate_completion_requests_total Completion requests received\n";
  out << "# TYPE fimgate_completion_requests_total counter\n";
  out << "fimgate_completion_requests_total{model=\"" << model << "\"} "
      << completion_requests_.load() << "\n";

  out << "# HELP fimgate_completions_total Completion relays by terminal state\n";
  out << "# TYPE fimgate_completions_total counter\n";
  out << "fimgate_completions_total{model=\"" << model
      << "\",state=\"completed\"} " << completed_.load() << "\n";
  out << "fimgate_completions_total{model=\"" << model
      << "\",state=\"cancelled\",reason=\"deadline\"} "
      << cancelled_deadline_.load() << "\n";
  out << "fimgate_completions_total{model=\"" << model
      << "\",state=\"cancelled\",reason=\"other\"} "
      << cancelled_other_.load() << "\n";
  out << "fimgate_completions_total{model=\"" << model
      << "\",state=\"failed\"} " << failed_.load() << "\n";

  out << "# HELP fimgate_completion_client_errors_total Relays rejected before the backend call\n";
  out << "# TYPE fimgate_completion_client_errors_total counter\n";
  out << "fimgate_completion_client_errors_total{model=\"" << model << "\"} "
      << failed_client_.load() << "\n";

  out << "# HELP fimgate_stream_records_total Stream records written to clients\n";
  out << "# TYPE fimgate_stream_records_total counter\n";
  out << "fimgate_stream_records_total{model=\"" << model << "\"} "
      << stream_records_.load() << "\n";

  out << "# HELP fimgate_suppressed_fragments_total Backend fragments dropped by the artifact filter\n";
  out << "# TYPE fimgate_suppressed_fragments_total counter\n";
  out << "fimgate_suppressed_fragments_total{model=\"" << model << "\"} "
      << suppressed_fragments_.load() << "\n";

  out << "# HELP fimgate_prompt_tokens_total Prompt tokens reported by the backend\n";
  out << "# TYPE fimgate_prompt_tokens_total counter\n";
  out << "fimgate_prompt_tokens_total{model=\"" << model << "\"} "
      << prompt_tokens_.load() << "\n";

  out << "# HELP fimgate_completion_tokens_total Completion tokens reported by the backend\n";
  out << "# TYPE fimgate_completion_tokens_total counter\n";
  out << "fimgate_completion_tokens_total{model=\"" << model << "\"} "
      << completion_tokens_.load() << "\n";

  // --- HTTP ---
  out << "# HELP fimgate_http_responses_total HTTP responses by status class\n";
  out << "# TYPE fimgate_http_responses_total counter\n";
  for (std::size_t cls = 1; cls < responses_by_class_.size(); ++cls) {
    out << "fimgate_http_responses_total{code=\"" << cls << "xx\"} "
        << responses_by_class_[cls].load() << "\n";
  }

  out << "# HELP fimgate_request_duration_ms End-to-end HTTP request latency\n";
  out << "# TYPE fimgate_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "fimgate_request_duration_ms_bucket{le=\"" << std::fixed
        << std::setprecision(0) << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "fimgate_request_duration_ms_bucket{le=\"+Inf\"} "
      << request_latency_.counts[LatencyHistogram::kBuckets.size()].load()
      << "\n";
  out << "fimgate_request_duration_ms_sum " << request_latency_.sum_ms.load()
      << "\n";
  out << "fimgate_request_duration_ms_count " << request_latency_.total.load()
      << "\n";

  // --- Proxy ---
  out << "# HELP fimgate_proxy_connections_total Connections accepted on public ports\n";
  out << "# TYPE fimgate_proxy_connections_total counter\n";
  out << "fimgate_proxy_connections_total " << proxy_accepts_.load() << "\n";

  out << "# HELP fimgate_proxy_dial_failures_total Upstream connects that failed\n";
  out << "# TYPE fimgate_proxy_dial_failures_total counter\n";
  out << "fimgate_proxy_dial_failures_total " << proxy_dial_failures_.load()
      << "\n";

  out << "# HELP fimgate_proxy_bytes_total Bytes relayed in either direction\n";
  out << "# TYPE fimgate_proxy_bytes_total counter\n";
  out << "fimgate_proxy_bytes_total " << proxy_bytes_.load() << "\n";

  // --- Gauges ---
  out << "# HELP fimgate_active_connections Current number of active HTTP connections\n";
  out << "# TYPE fimgate_active_connections gauge\n";
  out << "fimgate_active_connections " << active_connections_.load() << "\n";

  return out.str();
}

} // namespace fimgate
