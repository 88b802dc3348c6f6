#include "server/http/http_server.h"

#include "net/chunked_decoder.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include <openssl/err.h>

namespace fimgate {

namespace {

constexpr std::size_t kInitialBuf = 4096;
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kMaxRequest = 16 * 1024 * 1024; // 16 MB hard limit

struct ClientSession {
  int fd{-1};
  SSL *ssl{nullptr};
};

std::string OpenSslError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

const char *StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string &value) {
  auto s = value.find_first_not_of(" \t");
  auto e = value.find_last_not_of(" \t\r\n");
  return s == std::string::npos ? "" : value.substr(s, e - s + 1);
}

bool SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.data();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    ssize_t sent = 0;
    if (session.ssl) {
      int n = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (n <= 0) {
        // The socket is blocking, so WANT_* only means a timeout fired.
        return false;
      }
      sent = n;
    } else {
      sent = ::send(session.fd, data, remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        if (sent < 0 && errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t Receive(ClientSession &session, char *buffer, std::size_t length) {
  if (session.ssl) {
    int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
    if (received > 0) {
      return received;
    }
    // WANT_READ on a blocking socket means SO_RCVTIMEO expired.
    int err = SSL_get_error(session.ssl, received);
    return err == SSL_ERROR_ZERO_RETURN ? 0 : -1;
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

// True once the peer has closed or reset its side of the connection.
bool PeerClosed(int fd) {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLRDHUP;
  int rc = ::poll(&pfd, 1, 0);
  return rc > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0;
}

// Response side of one connection. Headers are buffered until the first
// Respond() or BeginStream().
class SessionChannel : public ResponseChannel {
 public:
  explicit SessionChannel(ClientSession &session) : session_(session) {}

  void AddHeader(const std::string &name, const std::string &value) override {
    if (!committed_) {
      extra_headers_.emplace_back(name, value);
    }
  }

  bool Respond(int status, const std::string &content_type,
               const std::string &body) override {
    if (committed_) {
      return false;
    }
    std::string head = StatusLine(status);
    head += "Content-Type: " + content_type + "\r\n";
    head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    head += HeaderBlock();
    return Write(head + body);
  }

  bool BeginStream(int status,
                   const std::map<std::string, std::string> &headers) override {
    if (committed_) {
      return false;
    }
    std::string head = StatusLine(status);
    for (const auto &[name, value] : headers) {
      head += name + ": " + value + "\r\n";
    }
    head += HeaderBlock();
    return Write(head);
  }

  bool SendRecord(const std::string &record) override {
    if (!committed_) {
      return false;
    }
    return Write(record);
  }

  bool Committed() const override { return committed_; }
  int Status() const override { return status_; }

 private:
  std::string StatusLine(int status) {
    committed_ = true;
    status_ = status;
    return "HTTP/1.1 " + std::to_string(status) + " " + StatusText(status) + "\r\n";
  }

  std::string HeaderBlock() const {
    std::string block;
    for (const auto &[name, value] : extra_headers_) {
      block += name + ": " + value + "\r\n";
    }
    block += "Connection: close\r\n\r\n";
    return block;
  }

  bool Write(const std::string &payload) {
    if (broken_) {
      return false;
    }
    if (!SendAll(session_, payload)) {
      broken_ = true;
    }
    return !broken_;
  }

  ClientSession &session_;
  std::vector<std::pair<std::string, std::string>> extra_headers_;
  bool committed_{false};
  bool broken_{false};
  int status_{0};
};

// Reads one request. Returns 0 on success, an HTTP status to answer with on a
// malformed request, or -1 when the peer went away.
int ReadRequest(ClientSession &session, HttpRequest *out) {
  std::string request;
  std::size_t header_end_pos = std::string::npos;
  char buffer[kInitialBuf];

  while (header_end_pos == std::string::npos) {
    if (request.size() > kMaxHeaderBytes) {
      return 413;
    }
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return -1;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
    header_end_pos = request.find("\r\n\r\n");
  }

  std::string headers = request.substr(0, header_end_pos);
  std::string body = request.substr(header_end_pos + 4);

  auto first_line_end = headers.find("\r\n");
  std::string first_line = headers.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  auto target_end = method_end == std::string::npos
                        ? std::string::npos
                        : first_line.find(' ', method_end + 1);
  if (method_end == std::string::npos || target_end == std::string::npos) {
    return 400;
  }
  out->method = first_line.substr(0, method_end);
  std::string target = first_line.substr(method_end + 1, target_end - method_end - 1);
  auto query = target.find('?');
  out->path = target.substr(0, query);
  out->query = query == std::string::npos ? "" : target.substr(query + 1);

  std::size_t pos = first_line_end == std::string::npos ? headers.size()
                                                        : first_line_end + 2;
  while (pos < headers.size()) {
    auto end = headers.find("\r\n", pos);
    std::string line = headers.substr(pos, end == std::string::npos
                                               ? std::string::npos
                                               : end - pos);
    pos = end == std::string::npos ? headers.size() : end + 2;
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    out->headers[Lower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
  }

  if (Lower(out->Header("Transfer-Encoding")).find("chunked") != std::string::npos) {
    ChunkedDecoder decoder;
    std::string decoded;
    if (!decoder.Feed(body.data(), body.size(), &decoded)) {
      return 400;
    }
    while (!decoder.Finished()) {
      if (decoded.size() > kMaxRequest) {
        return 413;
      }
      ssize_t bytes = Receive(session, buffer, sizeof(buffer));
      if (bytes <= 0) {
        return -1;
      }
      if (!decoder.Feed(buffer, static_cast<std::size_t>(bytes), &decoded)) {
        return 400;
      }
    }
    out->body = std::move(decoded);
    return 0;
  }

  std::size_t content_length = 0;
  std::string length_header = out->Header("Content-Length");
  if (!length_header.empty()) {
    try {
      content_length = std::stoull(length_header);
    } catch (const std::exception &) {
      return 400;
    }
  }
  if (content_length > kMaxRequest) {
    return 413;
  }
  while (body.size() < content_length) {
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return -1;
    }
    body.append(buffer, static_cast<std::size_t>(bytes));
  }
  body.resize(content_length);
  out->body = std::move(body);
  return 0;
}

std::string RemoteAddress(const sockaddr_storage &addr) {
  char host[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    const auto *in = reinterpret_cast<const sockaddr_in *>(&addr);
    ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
    return std::string(host) + ":" + std::to_string(ntohs(in->sin_port));
  }
  if (addr.ss_family == AF_INET6) {
    const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    return "[" + std::string(host) + "]:" + std::to_string(ntohs(in6->sin6_port));
  }
  return "unknown";
}

} // namespace

HttpServer::HttpServer(std::string name, SocketAddress address,
                       RouteHandler handler, std::shared_ptr<Logger> logger,
                       MetricsRegistry *metrics, TlsConfig tls_config)
    : name_(std::move(name)), address_(std::move(address)),
      handler_(std::move(handler)), logger_(std::move(logger)),
      metrics_(metrics), tls_config_(std::move(tls_config)) {}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::InitTls() {
  std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(
      SSL_CTX_new(TLS_server_method()), &SSL_CTX_free);
  if (!ctx) {
    throw std::runtime_error("failed to initialize TLS context: " + OpenSslError());
  }
  SSL_CTX_set_min_proto_version(ctx.get(), TLS1_3_VERSION);
  SSL_CTX_set_max_proto_version(ctx.get(), TLS1_3_VERSION);

  bool from_files = !tls_config_.cert_path.empty() && !tls_config_.key_path.empty();
  if (from_files) {
    if (SSL_CTX_use_certificate_chain_file(ctx.get(),
                                           tls_config_.cert_path.c_str()) <= 0) {
      throw std::runtime_error("failed to load TLS certificate " +
                               tls_config_.cert_path + ": " + OpenSslError());
    }
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), tls_config_.key_path.c_str(),
                                    SSL_FILETYPE_PEM) <= 0) {
      throw std::runtime_error("failed to load TLS key " + tls_config_.key_path +
                               ": " + OpenSslError());
    }
  } else if (tls_config_.certificate) {
    if (SSL_CTX_use_certificate(ctx.get(), tls_config_.certificate->x509()) <= 0 ||
        SSL_CTX_use_PrivateKey(ctx.get(),
                               tls_config_.certificate->private_key()) <= 0) {
      throw std::runtime_error("failed to install issued certificate: " +
                               OpenSslError());
    }
  } else {
    throw std::runtime_error("TLS enabled without certificate material");
  }
  if (SSL_CTX_check_private_key(ctx.get()) != 1) {
    throw std::runtime_error("TLS private key does not match certificate");
  }
  ssl_ctx_ = ctx.release();
  logger_->Info("http", name_ + " TLS 1.3 enabled",
                from_files ? "cert=" + tls_config_.cert_path
                           : std::string("cert=self-issued"));
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  if (tls_config_.enabled && !ssl_ctx_) {
    InitTls();
  }
  int fd = BindListener(address_);
  server_fd_.store(fd);
  bound_port_.store(LocalPort(fd));
  running_ = true;
  accept_thread_ = std::thread(&HttpServer::Run, this);
  logger_->Info("http", name_ + " listening on " + address_.ToString(),
                "port=" + std::to_string(bound_port_.load()));
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  std::unique_lock<std::mutex> lock(sessions_mutex_);
  for (auto &[client_fd, token] : sessions_) {
    token.Cancel();
    ::shutdown(client_fd, SHUT_RDWR);
  }
  sessions_cv_.wait(lock, [this] { return sessions_.empty(); });
}

int HttpServer::ActiveSessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return static_cast<int>(sessions_.size());
}

void HttpServer::Run() {
  bool accept_failing = false;
  while (running_) {
    int fd = server_fd_.load();
    if (fd < 0) {
      break;
    }
    sockaddr_storage client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      int error = errno;
      if (!running_) {
        break;
      }
      if (error == EINTR || error == ECONNABORTED) {
        continue;
      }
      if (!IsTransientAcceptError(error)) {
        logger_->Error("http", name_ + " accept loop terminated",
                       std::strerror(error));
        break;
      }
      if (!accept_failing) {
        logger_->Warn("http", name_ + " accept failed, retrying",
                      std::strerror(error));
        accept_failing = true;
      }
      std::this_thread::sleep_for(
          std::chrono::milliseconds(kAcceptRetryDelayMs));
      continue;
    }
    if (accept_failing) {
      logger_->Info("http", name_ + " accept recovered");
      accept_failing = false;
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      sessions_.emplace(client_fd, CancellationToken());
    }
    std::thread(&HttpServer::Serve, this, client_fd, RemoteAddress(client_addr))
        .detach();
  }
}

void HttpServer::Serve(int client_fd, std::string remote) {
  if (metrics_) {
    metrics_->IncrementConnections();
  }
  CancellationToken token;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    token = sessions_.at(client_fd);
  }

  auto timeout_us = std::chrono::duration_cast<std::chrono::microseconds>(
                        read_timeout_)
                        .count();
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout_us / 1000000);
  tv.tv_usec = static_cast<suseconds_t>(timeout_us % 1000000);
  ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  ClientSession session;
  session.fd = client_fd;
  bool ready = true;
  if (ssl_ctx_) {
    session.ssl = SSL_new(ssl_ctx_);
    if (!session.ssl) {
      ready = false;
    } else {
      SSL_set_fd(session.ssl, client_fd);
      if (SSL_accept(session.ssl) != 1) {
        logger_->Debug("http", name_ + " TLS handshake failed",
                       "remote=" + remote + " error=" + OpenSslError());
        SSL_free(session.ssl);
        session.ssl = nullptr;
        ready = false;
      }
    }
  }

  if (ready) {
    HttpRequest request;
    request.remote = remote;
    request.cancel = token;
    int status = ReadRequest(session, &request);
    SessionChannel channel(session);
    if (status > 0) {
      RespondError(channel, status, StatusText(status));
      if (metrics_) {
        metrics_->RecordResponse(status);
      }
    } else if (status == 0) {
      token.SetProbe([client_fd] { return PeerClosed(client_fd); });
      try {
        handler_(request, channel);
      } catch (const std::exception &ex) {
        logger_->Error("http", "unhandled error", ex.what());
        if (!channel.Committed()) {
          RespondError(channel, 500, "internal_error");
        }
      }
    }
  }

  if (metrics_) {
    metrics_->DecrementConnections();
  }
  // Closed under the lock so Stop() never shuts down a reused descriptor.
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  CloseSession(session);
  sessions_.erase(client_fd);
  sessions_cv_.notify_all();
}

} // namespace fimgate
