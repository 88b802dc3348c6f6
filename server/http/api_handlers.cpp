#include "server/http/api_handlers.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <utility>

using json = nlohmann::json;

namespace fimgate {

namespace {

constexpr int kTokenLifetimeSeconds = 1800;
constexpr int kTokenRefreshSeconds = 1500;

} // namespace

const std::vector<std::string> &CompletionRoutes() {
  static const std::vector<std::string> routes = {
      "/v1/engines/copilot-codex/completions",
      "/v1/engines/chat-control/completions",
      "/v1/engines/gpt-4o-copilot/completions",
  };
  return routes;
}

RouteHandler MakeHealthHandler() {
  return [](const HttpRequest &, ResponseChannel &channel) {
    channel.Respond(200, "application/json", json({{"status", "ok"}}).dump());
  };
}

RouteHandler MakeTokenHandler() {
  return [](const HttpRequest &, ResponseChannel &channel) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    json body = {{"token", "fimgate-local-token"},
                 {"expires_at", now + kTokenLifetimeSeconds},
                 {"refresh_in", kTokenRefreshSeconds}};
    channel.Respond(200, "application/json", body.dump());
  };
}

RouteHandler MakeMetricsHandler(const MetricsRegistry *metrics) {
  return [metrics](const HttpRequest &, ResponseChannel &channel) {
    channel.Respond(200, "text/plain; version=0.0.4",
                    metrics ? metrics->RenderPrometheus() : std::string());
  };
}

RouteHandler MakeCompletionHandler(std::shared_ptr<const CompletionRelay> relay) {
  return RequireMethod(
      "POST", [relay = std::move(relay)](const HttpRequest &request,
                                         ResponseChannel &channel) {
        relay->Handle(request.body, channel, request.cancel);
      });
}

RouteHandler MakeUnavailableHandler(std::string reason) {
  return RequireMethod(
      "POST", [reason = std::move(reason)](const HttpRequest &,
                                           ResponseChannel &channel) {
        RespondError(channel, 503, reason);
      });
}

void RegisterApiRoutes(Router &router, std::shared_ptr<const CompletionRelay> relay,
                       const MetricsRegistry *metrics,
                       const std::string &unavailable_reason) {
  router.Handle("/health", MakeHealthHandler());
  router.Handle("/copilot_internal/v2/token", MakeTokenHandler());
  router.Handle("/metrics", MakeMetricsHandler(metrics));
  for (const auto &path : CompletionRoutes()) {
    router.Handle(path, relay ? MakeCompletionHandler(relay)
                              : MakeUnavailableHandler(unavailable_reason));
  }
}

} // namespace fimgate
