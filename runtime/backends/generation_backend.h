#pragma once

#include "runtime/backends/generation_options.h"
#include "runtime/cancellation.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace fimgate {

struct GenerateRequest {
  std::string model;
  std::string prompt;
  std::string system;
  GenerationOptions options;
};

// Engine-side timing and token counters. Durations are nanoseconds.
struct EngineCounters {
  int64_t total_duration{0};
  int64_t load_duration{0};
  int64_t prompt_eval_count{0};
  int64_t prompt_eval_duration{0};
  int64_t eval_count{0};
  int64_t eval_duration{0};
};

// One incremental text fragment. `final` marks the last fragment of a
// generation; counters are only populated on that fragment.
struct StreamChunk {
  std::string text;
  bool final{false};
  EngineCounters counters;
};

struct GenerateResult {
  enum class Status {
    kCompleted,        // final fragment delivered
    kEndOfStream,      // backend closed the stream without a final fragment
    kCancelled,        // parent token or local cancel fired
    kDeadlineExceeded, // scope deadline elapsed
    kConnectFailed,    // backend unreachable; no fragment delivered
    kBackendError,     // non-200 status or in-band error
  };

  Status status{Status::kCompleted};
  int http_status{0};
  std::string error;
  std::size_t chunks{0};
};

const char *GenerateStatusString(GenerateResult::Status status);

// Streaming text generation engine. Implementations deliver fragments to
// `on_chunk` on the calling thread, in arrival order, and must return promptly
// once `scope` is done. No retries.
class GenerationBackend {
 public:
  using ChunkCallback = std::function<void(const StreamChunk &)>;

  virtual ~GenerationBackend() = default;

  virtual std::string Name() const = 0;
  virtual GenerateResult Generate(const GenerateRequest &request,
                                  CancellationScope &scope,
                                  const ChunkCallback &on_chunk) = 0;
};

} // namespace fimgate
