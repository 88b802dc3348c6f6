#pragma once

#include "completion/response_channel.h"
#include "runtime/cancellation.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace fimgate {

struct HttpRequest {
  std::string method;
  std::string path;  // without query string
  std::string query;
  std::map<std::string, std::string> headers; // names lower-cased
  std::string body;
  std::string remote;
  // Tripped when the client disconnects or the server stops.
  CancellationToken cancel;

  // Empty when absent. `name` is matched case-insensitively.
  std::string Header(const std::string &name) const;
};

using RouteHandler = std::function<void(const HttpRequest &, ResponseChannel &)>;

// Exact-path dispatch. Handlers see every method; unknown paths get 404.
class Router {
 public:
  void Handle(const std::string &path, RouteHandler handler);
  bool Has(const std::string &path) const;
  void Dispatch(const HttpRequest &request, ResponseChannel &channel) const;

  // Dispatch as a plain handler, ready to be wrapped in decorators.
  RouteHandler AsHandler() const;

 private:
  std::unordered_map<std::string, RouteHandler> routes_;
};

// Writes a JSON error body {"error":{"message","code"}}.
bool RespondError(ResponseChannel &channel, int status, const std::string &message);

// 405 with an Allow header for any method other than `method`.
RouteHandler RequireMethod(const std::string &method, RouteHandler handler);

// Logs method, path, status and duration for every request and records the
// response class and latency. A handler exception becomes a 500 when nothing
// was written yet.
RouteHandler WithRequestLogging(RouteHandler next, std::shared_ptr<Logger> logger,
                                MetricsRegistry *metrics);

// Stamps X-Request-Id (echoing the client's value when present) and the
// configured static headers onto every response.
RouteHandler WithHeaderStamping(RouteHandler next,
                                std::map<std::string, std::string> headers);

} // namespace fimgate
