#include "server/http/router.h"

#include "completion/completion_types.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <utility>

using json = nlohmann::json;

namespace fimgate {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

std::string HttpRequest::Header(const std::string &name) const {
  auto it = headers.find(Lower(name));
  return it == headers.end() ? std::string() : it->second;
}

void Router::Handle(const std::string &path, RouteHandler handler) {
  routes_[path] = std::move(handler);
}

bool Router::Has(const std::string &path) const {
  return routes_.count(path) > 0;
}

void Router::Dispatch(const HttpRequest &request, ResponseChannel &channel) const {
  auto it = routes_.find(request.path);
  if (it == routes_.end()) {
    RespondError(channel, 404, "not_found");
    return;
  }
  it->second(request, channel);
}

RouteHandler Router::AsHandler() const {
  return [this](const HttpRequest &request, ResponseChannel &channel) {
    Dispatch(request, channel);
  };
}

bool RespondError(ResponseChannel &channel, int status, const std::string &message) {
  json body = {{"error", {{"message", message}, {"code", status}}}};
  return channel.Respond(status, "application/json", body.dump());
}

RouteHandler RequireMethod(const std::string &method, RouteHandler handler) {
  return [method, handler = std::move(handler)](const HttpRequest &request,
                                                ResponseChannel &channel) {
    if (request.method != method) {
      channel.AddHeader("Allow", method);
      RespondError(channel, 405, "method_not_allowed");
      return;
    }
    handler(request, channel);
  };
}

RouteHandler WithRequestLogging(RouteHandler next, std::shared_ptr<Logger> logger,
                                MetricsRegistry *metrics) {
  return [next = std::move(next), logger = std::move(logger),
          metrics](const HttpRequest &request, ResponseChannel &channel) {
    auto start = std::chrono::steady_clock::now();
    try {
      next(request, channel);
    } catch (const std::exception &ex) {
      logger->Error("http", "handler failed", std::string("path=") +
                                                  request.path + " error=" +
                                                  ex.what());
      if (!channel.Committed()) {
        RespondError(channel, 500, "internal_error");
      }
    }
    double ms = std::chrono::duration<double, std::milli>(
                    std::chrono::steady_clock::now() - start)
                    .count();
    int status = channel.Status();
    if (metrics) {
      metrics->RecordResponse(status);
      metrics->RecordLatency(ms);
    }
    logger->Info("http", request.method + " " + request.path,
                 "status=" + std::to_string(status) +
                     " duration_ms=" + std::to_string(static_cast<long long>(ms)) +
                     " remote=" + request.remote);
  };
}

RouteHandler WithHeaderStamping(RouteHandler next,
                                std::map<std::string, std::string> headers) {
  return [next = std::move(next), headers = std::move(headers)](
             const HttpRequest &request, ResponseChannel &channel) {
    std::string request_id = request.Header("X-Request-Id");
    if (request_id.empty()) {
      request_id = NewCompletionId();
    }
    channel.AddHeader("X-Request-Id", request_id);
    for (const auto &[name, value] : headers) {
      channel.AddHeader(name, value);
    }
    next(request, channel);
  };
}

} // namespace fimgate
