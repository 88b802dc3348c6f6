#include "server/config/server_config.h"

#include "completion/prompt_builder.h"
#include "net/socket_address.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>

namespace fimgate {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool ParseBool(const std::string &value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

template <typename T> void Read(const YAML::Node &node, const char *key, T *out) {
  if (node && node[key]) {
    *out = node[key].as<T>();
  }
}

void ReadInt(const EnvLookup &lookup, const char *name, int *out,
             std::vector<std::string> *warnings) {
  const char *value = lookup(name);
  if (!value) {
    return;
  }
  try {
    *out = std::stoi(value);
  } catch (const std::exception &) {
    if (warnings) {
      warnings->push_back(std::string("ignoring ") + name + "=" + value +
                          ": not an integer");
    }
  }
}

void ReadString(const EnvLookup &lookup, const char *name, std::string *out) {
  if (const char *value = lookup(name)) {
    *out = value;
  }
}

} // namespace

ServerConfig LoadServerConfig(const std::string &path,
                              std::vector<std::string> *warnings) {
  ServerConfig config;
  if (path.empty() || !std::filesystem::exists(path)) {
    return config;
  }
  try {
    YAML::Node root = YAML::LoadFile(path);

    if (auto listeners = root["listeners"]) {
      Read(listeners, "http", &config.http_addr);
      Read(listeners, "https", &config.https_addr);
      Read(listeners, "proxy_enabled", &config.proxy_enabled);
      Read(listeners, "proxy_http", &config.proxy_http_addr);
      Read(listeners, "proxy_https", &config.proxy_https_addr);
    }
    if (auto tls = root["tls"]) {
      Read(tls, "cert_path", &config.tls_cert_path);
      Read(tls, "key_path", &config.tls_key_path);
    }
    if (auto backend = root["backend"]) {
      Read(backend, "url", &config.backend_url);
      Read(backend, "poll_interval_ms", &config.backend_poll_interval_ms);
      Read(backend, "probe", &config.backend_probe);
    }
    if (auto completion = root["completion"]) {
      Read(completion, "model", &config.model);
      Read(completion, "num_predict", &config.num_predict);
      Read(completion, "prompt_template", &config.prompt_template);
      Read(completion, "stream_timeout_ms", &config.stream_timeout_ms);
      Read(completion, "prefix_lines", &config.prefix_lines);
      Read(completion, "suffix_lines", &config.suffix_lines);
      Read(completion, "reserved_stop", &config.reserved_stop);
      Read(completion, "filter", &config.filter);
      Read(completion, "artifacts", &config.artifacts);
      Read(completion, "suppress_language_hint", &config.suppress_language_hint);
    }
    if (auto logging = root["logging"]) {
      Read(logging, "format", &config.log_format);
      Read(logging, "verbose", &config.verbose);
    }
    if (auto http = root["http"]) {
      Read(http, "response_headers", &config.response_headers);
    }
  } catch (const YAML::Exception &e) {
    if (warnings) {
      warnings->push_back("error parsing config file " + path + ": " + e.what());
    }
    return ServerConfig();
  }
  return config;
}

void ApplyEnvOverrides(ServerConfig *config, std::vector<std::string> *warnings,
                       const EnvLookup &lookup) {
  EnvLookup env = lookup ? lookup : EnvLookup([](const char *name) {
    return static_cast<const char *>(std::getenv(name));
  });

  ReadString(env, "FIMGATE_HTTP_ADDR", &config->http_addr);
  ReadString(env, "FIMGATE_HTTPS_ADDR", &config->https_addr);
  ReadString(env, "FIMGATE_PROXY_HTTP_ADDR", &config->proxy_http_addr);
  ReadString(env, "FIMGATE_PROXY_HTTPS_ADDR", &config->proxy_https_addr);
  ReadString(env, "FIMGATE_TLS_CERT_PATH", &config->tls_cert_path);
  ReadString(env, "FIMGATE_TLS_KEY_PATH", &config->tls_key_path);
  ReadString(env, "FIMGATE_BACKEND_URL", &config->backend_url);
  if (config->backend_url.empty()) {
    ReadString(env, "OLLAMA_HOST", &config->backend_url);
  }
  ReadString(env, "FIMGATE_MODEL", &config->model);
  ReadInt(env, "FIMGATE_NUM_PREDICT", &config->num_predict, warnings);
  ReadString(env, "FIMGATE_PROMPT_TEMPLATE", &config->prompt_template);
  ReadInt(env, "FIMGATE_STREAM_TIMEOUT_MS", &config->stream_timeout_ms, warnings);
  ReadString(env, "FIMGATE_LOG_FORMAT", &config->log_format);
  if (const char *verbose = env("FIMGATE_VERBOSE")) {
    config->verbose = ParseBool(verbose);
  }
}

std::vector<std::string> ValidateServerConfig(const ServerConfig &config) {
  std::vector<std::string> errors;
  if (config.num_predict <= 0) {
    errors.push_back("completion.num_predict must be positive");
  }
  if (config.stream_timeout_ms <= 0) {
    errors.push_back("completion.stream_timeout_ms must be positive");
  }
  if (config.prefix_lines <= 0 || config.suffix_lines <= 0) {
    errors.push_back("completion.prefix_lines and suffix_lines must be positive");
  }
  if (config.backend_poll_interval_ms <= 0) {
    errors.push_back("backend.poll_interval_ms must be positive");
  }

  std::vector<std::pair<const char *, const std::string *>> addresses = {
      {"listeners.http", &config.http_addr},
      {"listeners.https", &config.https_addr}};
  if (config.proxy_enabled) {
    addresses.emplace_back("listeners.proxy_http", &config.proxy_http_addr);
    addresses.emplace_back("listeners.proxy_https", &config.proxy_https_addr);
  }
  for (const auto &[key, value] : addresses) {
    if (!ParseSocketAddress(*value, "0.0.0.0")) {
      errors.push_back(std::string(key) + " is not a valid address: " + *value);
    }
  }

  if (config.tls_cert_path.empty() != config.tls_key_path.empty()) {
    errors.push_back("tls.cert_path and tls.key_path must be set together");
  }
  auto parsed = PromptTemplate::Parse(config.prompt_template);
  if (!parsed.ok) {
    errors.push_back("completion.prompt_template: " + parsed.error);
  }
  if (config.filter != "artifact" && config.filter != "none") {
    errors.push_back("completion.filter must be \"artifact\" or \"none\"");
  }
  auto format = ToLower(config.log_format);
  if (format != "text" && format != "json") {
    errors.push_back("logging.format must be \"text\" or \"json\"");
  }
  return errors;
}

} // namespace fimgate
