#include "completion/chunk_filter.h"
#include "completion/completion_relay.h"
#include "net/connection_proxy.h"
#include "net/socket_address.h"
#include "runtime/backends/ollama/ollama_backend.h"
#include "server/config/server_config.h"
#include "server/http/api_handlers.h"
#include "server/http/http_server.h"
#include "server/http/router.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/tls/certificate_issuer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void PrintUsage(const char *argv0) {
  std::cout << "usage: " << argv0 << " [--config <path>] [--verbose]\n"
            << "  --config <path>  YAML configuration (default config/server.yaml)\n"
            << "  --verbose        enable debug logging" << std::endl;
}

// Listener address as seen by a local dialer: wildcard hosts become loopback.
fimgate::SocketAddress LoopbackTarget(const std::string &listen_addr) {
  auto address = fimgate::ParseSocketAddress(listen_addr, "127.0.0.1");
  if (address->host == "0.0.0.0" || address->host.empty()) {
    address->host = "127.0.0.1";
  } else if (address->host == "::") {
    address->host = "::1";
  }
  return *address;
}

} // namespace

int main(int argc, char **argv) {
  std::string config_path = "config/server.yaml";
  bool verbose_flag = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--verbose") {
      verbose_flag = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg << std::endl;
      PrintUsage(argv[0]);
      return 1;
    }
  }

  std::vector<std::string> warnings;
  fimgate::ServerConfig config = fimgate::LoadServerConfig(config_path, &warnings);
  fimgate::ApplyEnvOverrides(&config, &warnings);
  if (verbose_flag) {
    config.verbose = true;
  }

  auto logger = std::make_shared<fimgate::Logger>(
      std::cerr, config.log_format == "json",
      config.verbose ? fimgate::Logger::Level::DEBUG : fimgate::Logger::Level::INFO);
  for (const auto &warning : warnings) {
    logger->Warn("config", warning);
  }
  auto errors = fimgate::ValidateServerConfig(config);
  if (!errors.empty()) {
    for (const auto &error : errors) {
      logger->Error("config", error);
    }
    return 1;
  }

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  fimgate::MetricsRegistry metrics;
  metrics.SetModel(config.model);

  fimgate::OllamaBackendConfig backend_config;
  backend_config.base_url = config.backend_url;
  backend_config.poll_interval_ms = config.backend_poll_interval_ms;
  auto backend = std::make_shared<fimgate::OllamaBackend>(backend_config, logger);

  std::string unavailable_reason;
  if (config.backend_probe) {
    std::string version;
    std::string probe_error;
    if (backend->Probe(&version, &probe_error)) {
      logger->Info("backend", "connected to " + backend->BaseUrl(),
                   "version=" + version);
    } else {
      unavailable_reason = "backend unavailable: " + probe_error;
      logger->Error("backend", "initialization failed for " + backend->BaseUrl(),
                    probe_error);
    }
  }

  std::shared_ptr<const fimgate::CompletionRelay> relay;
  if (unavailable_reason.empty()) {
    fimgate::RelayConfig relay_config;
    relay_config.model = config.model;
    relay_config.limits.num_predict_ceiling = config.num_predict;
    relay_config.limits.reserved_stop = config.reserved_stop;
    relay_config.window.prefix_lines = config.prefix_lines;
    relay_config.window.suffix_lines = config.suffix_lines;
    relay_config.stream_timeout = std::chrono::milliseconds(config.stream_timeout_ms);

    fimgate::ArtifactFilterConfig filter_config;
    filter_config.artifacts = config.artifacts;
    filter_config.suppress_language_hint = config.suppress_language_hint;

    auto parsed = fimgate::PromptTemplate::Parse(config.prompt_template);
    relay = std::make_shared<fimgate::CompletionRelay>(
        relay_config, parsed.prompt_template, backend,
        fimgate::MakeChunkFilterFactory(config.filter, filter_config), logger,
        &metrics);
  }

  fimgate::Router router;
  fimgate::RegisterApiRoutes(router, relay, &metrics, unavailable_reason);
  fimgate::RouteHandler handler = fimgate::WithRequestLogging(
      fimgate::WithHeaderStamping(router.AsHandler(), config.response_headers),
      logger, &metrics);

  std::unique_ptr<fimgate::HttpServer> http_server;
  std::unique_ptr<fimgate::HttpServer> https_server;
  std::vector<std::unique_ptr<fimgate::ConnectionProxy>> proxies;
  try {
    fimgate::HttpServer::TlsConfig tls_config;
    tls_config.enabled = true;
    if (!config.tls_cert_path.empty()) {
      tls_config.cert_path = config.tls_cert_path;
      tls_config.key_path = config.tls_key_path;
    } else {
      fimgate::CertificateIssuer issuer(logger);
      tls_config.certificate = issuer.IssueSelfSigned();
    }

    http_server = std::make_unique<fimgate::HttpServer>(
        "http", *fimgate::ParseSocketAddress(config.http_addr, "0.0.0.0"), handler,
        logger, &metrics);
    https_server = std::make_unique<fimgate::HttpServer>(
        "https", *fimgate::ParseSocketAddress(config.https_addr, "0.0.0.0"),
        handler, logger, &metrics, tls_config);
    http_server->Start();
    https_server->Start();

    if (config.proxy_enabled) {
      proxies.push_back(std::make_unique<fimgate::ConnectionProxy>(
          "proxy-http", *fimgate::ParseSocketAddress(config.proxy_http_addr, "0.0.0.0"),
          LoopbackTarget(config.http_addr), logger, &metrics));
      proxies.push_back(std::make_unique<fimgate::ConnectionProxy>(
          "proxy-https",
          *fimgate::ParseSocketAddress(config.proxy_https_addr, "0.0.0.0"),
          LoopbackTarget(config.https_addr), logger, &metrics));
      for (auto &proxy : proxies) {
        proxy->Start();
      }
    }
  } catch (const fimgate::CertificateGenerationError &e) {
    logger->Error("tls", "error self-issuing certificate", e.what());
    return 1;
  } catch (const fimgate::ListenerBindError &e) {
    logger->Error("net", "error starting listener", e.what());
    return 1;
  } catch (const std::exception &e) {
    logger->Error("server", "startup failed", e.what());
    return 1;
  }

  logger->Info("server", "fimgate ready",
               "model=" + config.model + " backend=" + backend->BaseUrl());

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  logger->Info("server", "shutting down");
  for (auto &proxy : proxies) {
    proxy->Stop();
  }
  https_server->Stop();
  http_server->Stop();
  return 0;
}
