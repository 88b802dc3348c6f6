#include <catch2/catch_test_macros.hpp>

#include "server/http/api_handlers.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

using fimgate::HttpRequest;
using fimgate::testing::CapturedLog;
using fimgate::testing::Fragment;
using fimgate::testing::RecordingChannel;
using fimgate::testing::ScriptedBackend;
using json = nlohmann::json;

namespace {

HttpRequest MakeRequest(const std::string &method, const std::string &path,
                        const std::string &body = "") {
  HttpRequest request;
  request.method = method;
  request.path = path;
  request.body = body;
  return request;
}

} // namespace

TEST_CASE("Health handler reports ok", "[api]") {
  RecordingChannel channel;
  fimgate::MakeHealthHandler()(MakeRequest("GET", "/health"), channel);
  REQUIRE(channel.Status() == 200);
  REQUIRE(json::parse(channel.body) == json({{"status", "ok"}}));
}

TEST_CASE("Token stub returns an expiring token", "[api]") {
  RecordingChannel channel;
  fimgate::MakeTokenHandler()(MakeRequest("GET", "/copilot_internal/v2/token"),
                              channel);
  REQUIRE(channel.Status() == 200);
  auto body = json::parse(channel.body);
  REQUIRE(body["token"].is_string());
  REQUIRE(body["refresh_in"] == 1500);
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  auto expires = body["expires_at"].get<long long>();
  REQUIRE(expires >= now + 1790);
  REQUIRE(expires <= now + 1810);
}

TEST_CASE("Metrics handler renders the registry", "[api]") {
  fimgate::MetricsRegistry metrics;
  metrics.RecordCompleted();
  RecordingChannel channel;
  fimgate::MakeMetricsHandler(&metrics)(MakeRequest("GET", "/metrics"), channel);
  REQUIRE(channel.Status() == 200);
  REQUIRE(channel.headers["Content-Type"].rfind("text/plain", 0) == 0);
  REQUIRE(channel.body.find("state=\"completed\"} 1") != std::string::npos);
}

TEST_CASE("Unavailable handler answers 503 for POST only", "[api]") {
  auto handler = fimgate::MakeUnavailableHandler("backend unreachable");

  RecordingChannel post;
  handler(MakeRequest("POST", "/v1/engines/copilot-codex/completions"), post);
  REQUIRE(post.Status() == 503);
  REQUIRE(json::parse(post.body)["error"]["message"] == "backend unreachable");

  RecordingChannel get;
  handler(MakeRequest("GET", "/v1/engines/copilot-codex/completions"), get);
  REQUIRE(get.Status() == 405);
}

TEST_CASE("Registered routes serve every completion alias", "[api]") {
  CapturedLog log;
  auto backend = std::make_shared<ScriptedBackend>();
  backend->script = {Fragment("x = 1", true)};
  auto parsed = fimgate::PromptTemplate::Parse("{{.Prefix}}");
  REQUIRE(parsed.ok);
  auto relay = std::make_shared<const fimgate::CompletionRelay>(
      fimgate::RelayConfig{}, parsed.prompt_template, backend,
      std::make_shared<fimgate::ArtifactFilterFactory>(), log.logger);

  fimgate::Router router;
  fimgate::RegisterApiRoutes(router, relay, nullptr);
  REQUIRE(router.Has("/health"));
  REQUIRE(router.Has("/copilot_internal/v2/token"));
  REQUIRE(router.Has("/metrics"));

  for (const auto &path : fimgate::CompletionRoutes()) {
    RecordingChannel channel;
    router.Dispatch(MakeRequest("POST", path, R"({"prompt":"x ="})"), channel);
    REQUIRE(channel.Status() == 200);
    REQUIRE(channel.streaming);
    REQUIRE(channel.records.size() == 1);
  }
  REQUIRE(backend->calls == 3);

  RecordingChannel wrong_method;
  router.Dispatch(MakeRequest("GET", fimgate::CompletionRoutes().front()),
                  wrong_method);
  REQUIRE(wrong_method.Status() == 405);
  REQUIRE(backend->calls == 3);
}

TEST_CASE("Without a relay completion aliases answer 503", "[api]") {
  fimgate::Router router;
  fimgate::RegisterApiRoutes(router, nullptr, nullptr, "ollama not reachable");
  RecordingChannel channel;
  router.Dispatch(
      MakeRequest("POST", "/v1/engines/gpt-4o-copilot/completions", "{}"),
      channel);
  REQUIRE(channel.Status() == 503);
  REQUIRE(json::parse(channel.body)["error"]["message"] == "ollama not reachable");
}
