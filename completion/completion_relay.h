#pragma once

#include "completion/chunk_filter.h"
#include "completion/prompt_builder.h"
#include "completion/response_channel.h"
#include "runtime/backends/generation_backend.h"
#include "runtime/cancellation.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace fimgate {

struct RelayConfig {
  std::string model{"qwen3-coder:30b"};
  GenerationLimits limits;
  PromptWindow window;
  std::chrono::milliseconds stream_timeout{60000};
};

enum class RelayState {
  kReceived,
  kBuilding,
  kStreaming,
  kCompleted,
  kCancelled,
  kFailed,
};

const char *RelayStateString(RelayState state);

struct RelayOutcome {
  RelayState state{RelayState::kReceived};
  // Status written to the client (200 once streaming started).
  int http_status{0};
  std::size_t records{0};
  std::size_t suppressed{0};
  bool terminal_record{false};
  std::string reason;
};

// Serves one completion call end to end: decode, build the prompt and options,
// drive a single streaming backend call under a deadline, filter and emit one
// record per accepted fragment, and guarantee the stream ends with a terminal
// record. Holds only configuration, so one instance serves all requests
// concurrently.
class CompletionRelay {
 public:
  CompletionRelay(RelayConfig config, PromptTemplate prompt_template,
                  std::shared_ptr<GenerationBackend> backend,
                  std::shared_ptr<ChunkFilterFactory> filters,
                  std::shared_ptr<Logger> logger,
                  MetricsRegistry *metrics = nullptr);

  RelayOutcome Handle(const std::string &body, ResponseChannel &channel,
                      const CancellationToken &token) const;

  const RelayConfig &Config() const { return config_; }

 private:
  RelayOutcome Fail(ResponseChannel &channel, int status,
                    const std::string &message) const;

  RelayConfig config_;
  PromptTemplate prompt_template_;
  std::shared_ptr<GenerationBackend> backend_;
  std::shared_ptr<ChunkFilterFactory> filters_;
  std::shared_ptr<Logger> logger_;
  MetricsRegistry *metrics_;
};

} // namespace fimgate
