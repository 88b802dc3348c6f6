#pragma once

#include <map>
#include <string>

#include <openssl/ssl.h>

namespace fimgate {

struct HttpResponse {
  int status{0};
  std::string body;
};

// Status line and headers of a response. Header names are lower-cased.
struct HttpResponseHead {
  int status{0};
  std::map<std::string, std::string> headers;

  bool Chunked() const;
  // -1 when absent.
  long long ContentLength() const;
};

bool ParseResponseHead(const std::string &head, HttpResponseHead *out);

class HttpClient {
public:
  struct ParsedUrl {
    std::string scheme{"http"};
    std::string host;
    std::string path{"/"};
    int port{80};
    bool use_tls{false};
  };

  struct RawConnection {
    int sock{-1};
    SSL *ssl{nullptr};
  };

  HttpClient();
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Throws std::runtime_error when the host part is empty or the port is not
  // numeric.
  static ParsedUrl ParseUrl(const std::string &url);

  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;

  // Returns the raw socket for streaming reads. Caller owns the socket and
  // releases it with CloseRaw().
  RawConnection
  SendRaw(const std::string &method, const std::string &url,
          const std::string &body,
          const std::map<std::string, std::string> &headers) const;
  ssize_t RecvRaw(RawConnection &conn, char *buffer, std::size_t length) const;
  // Waits up to timeout_ms for readable data. Returns 1 when readable, 0 on
  // timeout and -1 on error.
  int PollRaw(RawConnection &conn, int timeout_ms) const;
  void CloseRaw(RawConnection &conn) const;

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace fimgate
