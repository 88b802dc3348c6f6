#include "completion/completion_relay.h"

#include "completion/completion_types.h"

#include <nlohmann/json.hpp>

#include <utility>

using json = nlohmann::json;

namespace fimgate {

namespace {

const std::map<std::string, std::string> &StreamHeaders() {
  static const std::map<std::string, std::string> headers = {
      {"Content-Type", "text/event-stream"},
      {"Cache-Control", "no-cache"},
  };
  return headers;
}

int64_t UnixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

long long ToMillis(std::chrono::nanoseconds elapsed) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

} // namespace

const char *RelayStateString(RelayState state) {
  switch (state) {
  case RelayState::kReceived:
    return "received";
  case RelayState::kBuilding:
    return "building";
  case RelayState::kStreaming:
    return "streaming";
  case RelayState::kCompleted:
    return "completed";
  case RelayState::kCancelled:
    return "cancelled";
  case RelayState::kFailed:
    return "failed";
  }
  return "unknown";
}

CompletionRelay::CompletionRelay(RelayConfig config, PromptTemplate prompt_template,
                                 std::shared_ptr<GenerationBackend> backend,
                                 std::shared_ptr<ChunkFilterFactory> filters,
                                 std::shared_ptr<Logger> logger,
                                 MetricsRegistry *metrics)
    : config_(std::move(config)), prompt_template_(std::move(prompt_template)),
      backend_(std::move(backend)), filters_(std::move(filters)),
      logger_(std::move(logger)), metrics_(metrics) {}

RelayOutcome CompletionRelay::Fail(ResponseChannel &channel, int status,
                                   const std::string &message) const {
  RelayOutcome outcome;
  outcome.state = RelayState::kFailed;
  outcome.http_status = status;
  outcome.reason = message;
  json body = {{"error", {{"message", message}, {"code", status}}}};
  if (!channel.Respond(status, "application/json",
                       body.dump(-1, ' ', false, json::error_handler_t::replace))) {
    logger_->Debug("relay", "client went away before error response");
  }
  if (metrics_) {
    metrics_->RecordFailed(status);
  }
  return outcome;
}

RelayOutcome CompletionRelay::Handle(const std::string &body,
                                     ResponseChannel &channel,
                                     const CancellationToken &token) const {
  if (metrics_) {
    metrics_->RecordCompletionRequest();
  }

  auto decoded = DecodeCompletionRequest(body);
  if (!decoded.ok) {
    logger_->Warn("relay", "failed to decode request", decoded.error);
    return Fail(channel, 400, decoded.error);
  }
  const CompletionRequest &request = decoded.request;
  logger_->Debug("relay", "incoming completion request",
                 "language=" + request.language +
                     " max_tokens=" + std::to_string(request.max_tokens) +
                     " n=" + std::to_string(request.n) +
                     " prompt_bytes=" + std::to_string(request.prompt.size()) +
                     " suffix_bytes=" + std::to_string(request.suffix.size()));

  auto options = BuildGenerationOptions(config_.limits, request.temperature,
                                        request.top_p, request.stop,
                                        request.max_tokens);
  if (!options.ok) {
    logger_->Warn("relay", "rejected generation options", options.error);
    return Fail(channel, 400, options.error);
  }
  auto prompt = BuildTaskPrompt(request.prompt, request.suffix, prompt_template_,
                                config_.window, request.language);
  if (!prompt.ok) {
    logger_->Error("relay", "prompt template failed", prompt.error);
    return Fail(channel, 500, "prompt template failed: " + prompt.error);
  }

  GenerateRequest generate;
  generate.model = config_.model;
  generate.prompt = std::move(prompt.text);
  generate.system = BuildSystemPrompt(request.language);
  generate.options = std::move(options.options);

  CancellationScope scope(token, config_.stream_timeout);
  std::unique_ptr<ChunkFilter> filter =
      filters_ ? filters_->Create(request.language)
               : std::make_unique<PassthroughFilter>();
  CompletionGate gate;
  RelayOutcome outcome;
  outcome.state = RelayState::kStreaming;
  bool client_gone = false;

  auto begin_stream = [&]() {
    if (!channel.Committed() && !channel.BeginStream(200, StreamHeaders())) {
      client_gone = true;
    }
    outcome.http_status = 200;
  };

  auto on_chunk = [&](const StreamChunk &chunk) {
    if (gate.Fired()) {
      return;
    }
    std::string text;
    if (filter->Apply(chunk.text, &text)) {
      auto record = FormatStreamRecord(MakeCompletionEnvelope(
          NewCompletionId(), UnixNow(), text, chunk.final ? "stop" : ""));
      begin_stream();
      if (!client_gone && channel.SendRecord(record)) {
        ++outcome.records;
        if (metrics_) {
          metrics_->RecordStreamRecord();
        }
      } else if (!client_gone) {
        client_gone = true;
      }
      if (client_gone) {
        scope.Cancel();
      }
    } else {
      ++outcome.suppressed;
      if (metrics_) {
        metrics_->RecordSuppressedFragment();
      }
      logger_->Debug("relay", "suppressed fragment", "text=" + chunk.text);
    }
    if (chunk.final && gate.Fire()) {
      outcome.state = RelayState::kCompleted;
      if (metrics_) {
        metrics_->RecordBackendEval(
            static_cast<int>(chunk.counters.prompt_eval_count),
            static_cast<int>(chunk.counters.eval_count));
      }
    }
  };

  GenerateResult result = backend_->Generate(generate, scope, on_chunk);

  if (gate.Fired()) {
    begin_stream();
    if (metrics_) {
      metrics_->RecordCompleted();
    }
    logger_->Info("relay", "completion finished",
                  "records=" + std::to_string(outcome.records) +
                      " suppressed=" + std::to_string(outcome.suppressed) +
                      " elapsed_ms=" + std::to_string(ToMillis(scope.Elapsed())));
    return outcome;
  }

  if (!channel.Committed() &&
      (result.status == GenerateResult::Status::kConnectFailed ||
       result.status == GenerateResult::Status::kBackendError)) {
    logger_->Error("relay", "backend call failed",
                   std::string("status=") + GenerateStatusString(result.status) +
                       " error=" + result.error);
    auto failed = Fail(channel, 502, "backend unavailable: " + result.error);
    failed.suppressed = outcome.suppressed;
    return failed;
  }

  // Headers are committed (or about to be), so the stream can only be closed
  // in-band.
  outcome.state = RelayState::kCancelled;
  outcome.reason = client_gone ? "client_disconnect"
                               : GenerateStatusString(result.status);
  begin_stream();
  auto terminal = FormatStreamRecord(MakeTerminalRecord(
      config_.model, std::chrono::system_clock::now(), scope.Elapsed()));
  if (!client_gone && channel.SendRecord(terminal)) {
    outcome.terminal_record = true;
  }
  if (metrics_) {
    metrics_->RecordCancelled(result.status ==
                              GenerateResult::Status::kDeadlineExceeded);
  }
  logger_->Warn("relay", "generator ended before final fragment",
                "reason=" + outcome.reason + " records=" +
                    std::to_string(outcome.records) + " elapsed_ms=" +
                    std::to_string(ToMillis(scope.Elapsed())) +
                    (result.error.empty() ? "" : " error=" + result.error));
  return outcome;
}

} // namespace fimgate
