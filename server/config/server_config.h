#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace fimgate {

struct ServerConfig {
  // Internal application listeners.
  std::string http_addr{":11437"};
  std::string https_addr{":11436"};
  // Public ports relayed byte-for-byte to the listeners above.
  bool proxy_enabled{true};
  std::string proxy_http_addr{":11438"};
  std::string proxy_https_addr{":11435"};

  // PEM pair for the TLS listener. Both empty means a self-issued certificate.
  std::string tls_cert_path;
  std::string tls_key_path;

  // Empty means OLLAMA_HOST, then the loopback default.
  std::string backend_url;
  int backend_poll_interval_ms{50};
  bool backend_probe{true};

  std::string model{"qwen3-coder:30b"};
  int num_predict{200};
  std::string prompt_template{
      "<|fim_prefix|> {{.Prefix}} <|fim_suffix|>{{.Suffix}} <|fim_middle|>"};
  int stream_timeout_ms{60000};
  int prefix_lines{60};
  int suffix_lines{60};
  std::string reserved_stop{"<|im_end|>"};
  std::string filter{"artifact"}; // "artifact" or "none"
  std::vector<std::string> artifacts{"```", "python"};
  bool suppress_language_hint{false};

  std::string log_format{"text"}; // "text" or "json"
  bool verbose{false};

  std::map<std::string, std::string> response_headers;
};

using EnvLookup = std::function<const char *(const char *)>;

// Reads `path` over the defaults. A missing file keeps the defaults; a
// malformed one keeps them too and appends a message to `warnings`.
ServerConfig LoadServerConfig(const std::string &path,
                              std::vector<std::string> *warnings);

// Applies FIMGATE_* variables (and OLLAMA_HOST when no backend URL is set).
// Unparsable numeric values are skipped with a warning.
void ApplyEnvOverrides(ServerConfig *config, std::vector<std::string> *warnings,
                       const EnvLookup &lookup = EnvLookup());

// Returns one message per invalid setting; empty when the config is usable.
std::vector<std::string> ValidateServerConfig(const ServerConfig &config);

} // namespace fimgate
