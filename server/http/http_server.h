#pragma once

#include "net/socket_address.h"
#include "server/http/router.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/tls/certificate_issuer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <openssl/ssl.h>

namespace fimgate {

struct HttpTlsConfig {
  bool enabled{false};
  // PEM files. Used when both are set.
  std::string cert_path;
  std::string key_path;
  // In-memory material, used when no PEM pair is given.
  std::optional<Certificate> certificate;
};

// HTTP/1.1 listener: one thread per connection, one request per connection,
// responses always close the connection. Optionally TLS 1.3 only.
class HttpServer {
 public:
  using TlsConfig = HttpTlsConfig;

  HttpServer(std::string name, SocketAddress address, RouteHandler handler,
             std::shared_ptr<Logger> logger, MetricsRegistry *metrics = nullptr,
             HttpTlsConfig tls_config = HttpTlsConfig());
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  // Binds synchronously. Throws ListenerBindError, or std::runtime_error when
  // the TLS material cannot be loaded.
  void Start();
  // Stops accepting, cancels in-flight requests and waits for their threads.
  void Stop();
  // Idle limit for each read from a client. Call before Start().
  void SetReadTimeout(std::chrono::milliseconds timeout) {
    read_timeout_ = timeout;
  }

  int BoundPort() const { return bound_port_.load(); }
  bool TlsEnabled() const { return ssl_ctx_ != nullptr; }
  int ActiveSessions() const;

 private:
  void InitTls();
  void Run();
  void Serve(int client_fd, std::string remote);

  std::string name_;
  SocketAddress address_;
  RouteHandler handler_;
  std::shared_ptr<Logger> logger_;
  MetricsRegistry *metrics_;
  TlsConfig tls_config_;
  std::chrono::milliseconds read_timeout_{std::chrono::seconds(30)};
  SSL_CTX *ssl_ctx_{nullptr};

  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  std::atomic<int> bound_port_{-1};
  std::thread accept_thread_;

  mutable std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  // Live client sockets and the cancel token of the request they carry.
  std::map<int, CancellationToken> sessions_;
};

} // namespace fimgate
