#pragma once

#include "net/http_client.h"
#include "runtime/backends/generation_backend.h"
#include "server/logging/logger.h"

#include <memory>
#include <string>

namespace fimgate {

struct OllamaBackendConfig {
  // Accepts OLLAMA_HOST forms: "host", "host:port", "http://host:port/".
  std::string base_url{"http://127.0.0.1:11434"};
  // Upper bound on how long a read waits before cancellation is re-checked.
  int poll_interval_ms{50};
};

// Streams /api/generate from a local Ollama daemon. Each NDJSON line of the
// response becomes one StreamChunk.
class OllamaBackend : public GenerationBackend {
 public:
  OllamaBackend(OllamaBackendConfig config, std::shared_ptr<Logger> logger);

  std::string Name() const override { return "ollama"; }
  const std::string &BaseUrl() const { return base_url_; }

  // GET /api/version. Fills `version` on success and `error` otherwise.
  bool Probe(std::string *version, std::string *error) const;

  GenerateResult Generate(const GenerateRequest &request,
                          CancellationScope &scope,
                          const ChunkCallback &on_chunk) override;

  // Normalizes an OLLAMA_HOST value to "scheme://host:port" with no trailing
  // slash. An empty value yields the loopback default.
  static std::string NormalizeBaseUrl(const std::string &raw);

  // Decodes one NDJSON line. Returns false with `error` set when the line is
  // malformed or carries an in-band {"error": ...}.
  static bool ParseStreamLine(const std::string &line, StreamChunk *chunk,
                              std::string *error);

 private:
  std::string base_url_;
  int poll_interval_ms_;
  std::shared_ptr<Logger> logger_;
  HttpClient client_;
};

} // namespace fimgate
