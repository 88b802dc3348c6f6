#include "net/http_client.h"

#include "net/chunked_decoder.h"
#include "net/socket_address.h"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fimgate {
namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string TrimSpaces(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

int CreateSocket(const HttpClient::ParsedUrl &parsed) {
  SocketAddress address;
  address.host = parsed.host;
  address.port = parsed.port;
  int sock = DialTcp(address);
  if (sock == -1)
    throw std::runtime_error("failed to connect to " + address.ToString());
  struct timeval tv;
  tv.tv_sec = 30;
  tv.tv_usec = 0;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return sock;
}

std::string BuildRequest(const HttpClient::ParsedUrl &parsed,
                         const std::string &method, const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << ":" << parsed.port << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  bool has_content_type = false;
  for (const auto &[key, value] : headers) {
    has_content_type = has_content_type || Lower(key) == "content-type";
    request << key << ": " << value << "\r\n";
  }
  if (!body.empty() && !has_content_type) {
    request << "Content-Type: application/json\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}
} // namespace

bool HttpResponseHead::Chunked() const {
  auto it = headers.find("transfer-encoding");
  return it != headers.end() &&
         Lower(it->second).find("chunked") != std::string::npos;
}

long long HttpResponseHead::ContentLength() const {
  auto it = headers.find("content-length");
  if (it == headers.end()) {
    return -1;
  }
  try {
    return std::stoll(it->second);
  } catch (const std::exception &) {
    return -1;
  }
}

bool ParseResponseHead(const std::string &head, HttpResponseHead *out) {
  std::istringstream stream(head);
  std::string line;
  if (!std::getline(stream, line)) {
    return false;
  }
  // "HTTP/1.1 200 OK"
  auto sp = line.find(' ');
  if (line.compare(0, 5, "HTTP/") != 0 || sp == std::string::npos) {
    return false;
  }
  try {
    out->status = std::stoi(line.substr(sp + 1));
  } catch (const std::exception &) {
    return false;
  }
  out->headers.clear();
  while (std::getline(stream, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    out->headers[Lower(TrimSpaces(line.substr(0, colon)))] =
        TrimSpaces(line.substr(colon + 1));
  }
  return true;
}

HttpClient::ParsedUrl HttpClient::ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  // "[::1]:11434" keeps its colons inside the brackets.
  std::size_t colon = std::string::npos;
  if (!host_port.empty() && host_port.front() == '[') {
    auto close = host_port.find(']');
    if (close == std::string::npos) {
      throw std::runtime_error("invalid URL host");
    }
    if (close + 1 < host_port.size() && host_port[close + 1] != ':') {
      throw std::runtime_error("invalid URL host");
    }
    colon = close + 1 < host_port.size() ? close + 1 : std::string::npos;
    host_port.erase(close, 1);
    host_port.erase(0, 1);
    if (colon != std::string::npos) {
      colon -= 2;
    }
  } else {
    colon = host_port.find(':');
  }
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw std::runtime_error("invalid URL port");
    }
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

HttpClient::HttpClient() {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

HttpClient::RawConnection
HttpClient::SendRaw(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  RawConnection conn;
  conn.sock = CreateSocket(parsed);
  auto payload = BuildRequest(parsed, method, body, headers);
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();

  auto close_connection = [&](const char *message) {
    CloseRaw(conn);
    throw std::runtime_error(message);
  };

  if (parsed.use_tls) {
    if (!tls_ready_) {
      close_connection("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      close_connection("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(conn.ssl, parsed.host.c_str());
    SSL_set1_host(conn.ssl, parsed.host.c_str());
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      close_connection("TLS handshake failed");
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      close_connection("TLS certificate verification failed");
    }
    while (send_remaining > 0) {
      int sent =
          SSL_write(conn.ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        close_connection("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  } else {
    while (send_remaining > 0) {
      ssize_t sent = ::send(conn.sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        if (sent < 0 && errno == EINTR) {
          continue;
        }
        close_connection("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  }

  return conn;
}

ssize_t HttpClient::RecvRaw(RawConnection &conn, char *buffer,
                            std::size_t length) const {
  if (conn.ssl) {
    while (true) {
      int received = SSL_read(conn.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(conn.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

int HttpClient::PollRaw(RawConnection &conn, int timeout_ms) const {
  if (conn.ssl && SSL_pending(conn.ssl) > 0) {
    return 1;
  }
  pollfd pfd{};
  pfd.fd = conn.sock;
  pfd.events = POLLIN;
  while (true) {
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc < 0) {
      return -1;
    }
    // Hang-ups are reported as readable so the caller observes EOF via recv.
    return rc == 0 ? 0 : 1;
  }
}

void HttpClient::CloseRaw(RawConnection &conn) const {
  if (conn.ssl) {
    SSL_shutdown(conn.ssl);
    SSL_free(conn.ssl);
    conn.ssl = nullptr;
  }
  if (conn.sock >= 0) {
    ::close(conn.sock);
    conn.sock = -1;
  }
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto conn = SendRaw(method, url, body, headers);
  std::string response;
  char buffer[4096];
  ssize_t read_bytes = 0;
  while ((read_bytes = RecvRaw(conn, buffer, sizeof(buffer))) > 0) {
    response.append(buffer, buffer + read_bytes);
  }
  CloseRaw(conn);

  HttpResponse http_response;
  auto header_end = response.find("\r\n\r\n");
  std::string header = header_end == std::string::npos
                           ? response
                           : response.substr(0, header_end);
  HttpResponseHead head;
  if (!ParseResponseHead(header, &head)) {
    throw std::runtime_error("malformed response from " + url);
  }
  http_response.status = head.status;
  if (header_end == std::string::npos) {
    return http_response;
  }
  std::string body_bytes = response.substr(header_end + 4);
  if (head.Chunked()) {
    ChunkedDecoder decoder;
    if (!decoder.Feed(body_bytes.data(), body_bytes.size(), &http_response.body)) {
      throw std::runtime_error("malformed chunked response from " + url);
    }
  } else {
    long long length = head.ContentLength();
    if (length >= 0 && static_cast<std::size_t>(length) < body_bytes.size()) {
      body_bytes.resize(static_cast<std::size_t>(length));
    }
    http_response.body = std::move(body_bytes);
  }
  return http_response;
}

} // namespace fimgate
