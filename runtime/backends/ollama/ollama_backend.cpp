#include "runtime/backends/ollama/ollama_backend.h"

#include "net/chunked_decoder.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace fimgate {

namespace {

constexpr int kDefaultOllamaPort = 11434;
constexpr std::size_t kMaxErrorBody = 64 * 1024;

GenerateResult Interrupted(const CancellationScope &scope, std::size_t chunks) {
  GenerateResult result;
  result.status = scope.Reason() == CancelReason::kDeadline
                      ? GenerateResult::Status::kDeadlineExceeded
                      : GenerateResult::Status::kCancelled;
  result.chunks = chunks;
  result.error = CancelReasonString(scope.Reason());
  return result;
}

GenerateResult Failure(GenerateResult::Status status, std::string error,
                       std::size_t chunks, int http_status = 0) {
  GenerateResult result;
  result.status = status;
  result.error = std::move(error);
  result.chunks = chunks;
  result.http_status = http_status;
  return result;
}

std::string ErrorFromBody(int status, const std::string &body) {
  try {
    auto j = json::parse(body);
    if (j.is_object() && j.contains("error") && j["error"].is_string()) {
      return j["error"].get<std::string>();
    }
  } catch (const json::exception &) {
  }
  return "backend returned HTTP " + std::to_string(status);
}

int64_t CounterField(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return 0;
  }
  return it->get<int64_t>();
}

} // namespace

OllamaBackend::OllamaBackend(OllamaBackendConfig config,
                             std::shared_ptr<Logger> logger)
    : base_url_(NormalizeBaseUrl(config.base_url)),
      poll_interval_ms_(std::max(1, config.poll_interval_ms)),
      logger_(std::move(logger)) {}

std::string OllamaBackend::NormalizeBaseUrl(const std::string &raw) {
  std::string value = raw;
  while (!value.empty() && (value.front() == ' ' || value.front() == '"' ||
                            value.front() == '\'')) {
    value.erase(value.begin());
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '"' ||
                            value.back() == '\'' || value.back() == '/')) {
    value.pop_back();
  }
  if (value.empty()) {
    return "http://127.0.0.1:" + std::to_string(kDefaultOllamaPort);
  }

  std::string scheme = "http";
  bool explicit_scheme = false;
  auto scheme_end = value.find("://");
  if (scheme_end != std::string::npos) {
    scheme = value.substr(0, scheme_end);
    value = value.substr(scheme_end + 3);
    explicit_scheme = true;
  }

  std::string path;
  auto slash = value.find('/');
  if (slash != std::string::npos) {
    path = value.substr(slash);
    value = value.substr(0, slash);
  }

  bool has_port = false;
  if (!value.empty() && value.front() == '[') {
    has_port = value.find("]:") != std::string::npos;
  } else {
    has_port = value.find(':') != std::string::npos;
  }
  std::string host = has_port && value.front() != '['
                         ? value.substr(0, value.find(':'))
                         : value;
  if (host.empty() || host == "0.0.0.0") {
    value = "127.0.0.1" + value.substr(host.size());
  }
  if (!has_port) {
    int port = kDefaultOllamaPort;
    if (explicit_scheme) {
      port = scheme == "https" ? 443 : 80;
    }
    value += ":" + std::to_string(port);
  }
  return scheme + "://" + value + path;
}

bool OllamaBackend::ParseStreamLine(const std::string &line, StreamChunk *chunk,
                                    std::string *error) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::exception &ex) {
    if (error) {
      *error = std::string("malformed stream line: ") + ex.what();
    }
    return false;
  }
  if (!j.is_object()) {
    if (error) {
      *error = "stream line is not an object";
    }
    return false;
  }
  if (j.contains("error")) {
    if (error) {
      *error = j["error"].is_string() ? j["error"].get<std::string>()
                                      : j["error"].dump();
    }
    return false;
  }

  StreamChunk out;
  if (j.contains("response") && j["response"].is_string()) {
    out.text = j["response"].get<std::string>();
  }
  out.final = j.value("done", false);
  if (out.final) {
    out.counters.total_duration = CounterField(j, "total_duration");
    out.counters.load_duration = CounterField(j, "load_duration");
    out.counters.prompt_eval_count = CounterField(j, "prompt_eval_count");
    out.counters.prompt_eval_duration = CounterField(j, "prompt_eval_duration");
    out.counters.eval_count = CounterField(j, "eval_count");
    out.counters.eval_duration = CounterField(j, "eval_duration");
  }
  *chunk = std::move(out);
  return true;
}

bool OllamaBackend::Probe(std::string *version, std::string *error) const {
  HttpResponse response;
  try {
    response = client_.Get(base_url_ + "/api/version");
  } catch (const std::exception &ex) {
    if (error) {
      *error = ex.what();
    }
    return false;
  }
  if (response.status != 200) {
    if (error) {
      *error = ErrorFromBody(response.status, response.body);
    }
    return false;
  }
  try {
    auto j = json::parse(response.body);
    if (version) {
      *version = j.value("version", std::string());
    }
  } catch (const json::exception &ex) {
    if (error) {
      *error = std::string("malformed version response: ") + ex.what();
    }
    return false;
  }
  return true;
}

GenerateResult OllamaBackend::Generate(const GenerateRequest &request,
                                       CancellationScope &scope,
                                       const ChunkCallback &on_chunk) {
  json payload = {
      {"model", request.model},
      {"prompt", request.prompt},
      {"system", request.system},
      {"stream", true},
      {"options",
       {{"temperature", request.options.temperature},
        {"top_p", request.options.top_p},
        {"stop", request.options.stop},
        {"num_predict", request.options.num_predict}}}};

  if (scope.Done()) {
    return Interrupted(scope, 0);
  }

  HttpClient::RawConnection conn;
  try {
    conn = client_.SendRaw("POST", base_url_ + "/api/generate", payload.dump(),
                           {{"Accept", "application/x-ndjson"}});
  } catch (const std::exception &ex) {
    if (logger_) {
      logger_->Warn("ollama", "connect failed", ex.what());
    }
    return Failure(GenerateResult::Status::kConnectFailed, ex.what(), 0);
  }

  struct ConnectionCloser {
    const HttpClient &client;
    HttpClient::RawConnection &conn;
    ~ConnectionCloser() { client.CloseRaw(conn); }
  } closer{client_, conn};

  std::string head_buffer;
  HttpResponseHead head;
  bool head_done = false;
  bool chunked = false;
  ChunkedDecoder decoder;
  std::string error_body;
  std::string pending;
  std::size_t delivered = 0;
  char buffer[16384];

  // Splits complete lines out of `pending` and hands them to the caller.
  // Returns true once a terminal condition was reached and `result` is set.
  GenerateResult result;
  auto drain_lines = [&](bool flush_tail) -> bool {
    std::size_t start = 0;
    while (true) {
      auto newline = pending.find('\n', start);
      std::string line;
      if (newline == std::string::npos) {
        if (!flush_tail || start >= pending.size()) {
          break;
        }
        line = pending.substr(start);
        start = pending.size();
      } else {
        line = pending.substr(start, newline - start);
        start = newline + 1;
      }
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      StreamChunk chunk;
      std::string line_error;
      if (!ParseStreamLine(line, &chunk, &line_error)) {
        result = Failure(GenerateResult::Status::kBackendError, line_error,
                         delivered, 200);
        return true;
      }
      if (scope.Done()) {
        result = Interrupted(scope, delivered);
        return true;
      }
      ++delivered;
      on_chunk(chunk);
      if (chunk.final) {
        result.status = GenerateResult::Status::kCompleted;
        result.http_status = 200;
        result.chunks = delivered;
        return true;
      }
    }
    pending.erase(0, start);
    return false;
  };

  while (true) {
    if (scope.Done()) {
      return Interrupted(scope, delivered);
    }
    int wait_ms = static_cast<int>(
        std::min<long long>(poll_interval_ms_, scope.Remaining().count()));
    int ready = client_.PollRaw(conn, std::max(wait_ms, 1));
    if (ready < 0) {
      return Failure(GenerateResult::Status::kBackendError, "poll failed",
                     delivered, head.status);
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = client_.RecvRaw(conn, buffer, sizeof(buffer));
    if (n < 0) {
      return Failure(GenerateResult::Status::kBackendError,
                     "read from backend failed", delivered, head.status);
    }
    if (n == 0) {
      if (!head_done) {
        return Failure(GenerateResult::Status::kBackendError,
                       "backend closed connection before response", delivered);
      }
      if (head.status != 200) {
        return Failure(GenerateResult::Status::kBackendError,
                       ErrorFromBody(head.status, error_body), delivered,
                       head.status);
      }
      if (drain_lines(true)) {
        return result;
      }
      GenerateResult eos;
      eos.status = GenerateResult::Status::kEndOfStream;
      eos.http_status = 200;
      eos.chunks = delivered;
      eos.error = "backend closed the stream";
      return eos;
    }

    const char *data = buffer;
    std::size_t length = static_cast<std::size_t>(n);
    std::string body_bytes;
    if (!head_done) {
      head_buffer.append(buffer, length);
      auto header_end = head_buffer.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        continue;
      }
      if (!ParseResponseHead(head_buffer.substr(0, header_end), &head)) {
        return Failure(GenerateResult::Status::kBackendError,
                       "malformed backend response head", delivered);
      }
      head_done = true;
      chunked = head.Chunked();
      body_bytes = head_buffer.substr(header_end + 4);
      head_buffer.clear();
      data = body_bytes.data();
      length = body_bytes.size();
    }

    std::string decoded;
    if (chunked) {
      if (!decoder.Feed(data, length, &decoded)) {
        return Failure(GenerateResult::Status::kBackendError,
                       "malformed chunked encoding", delivered, head.status);
      }
    } else {
      decoded.assign(data, length);
    }

    if (head.status != 200) {
      if (error_body.size() < kMaxErrorBody) {
        error_body.append(decoded);
      }
      if (chunked && decoder.Finished()) {
        return Failure(GenerateResult::Status::kBackendError,
                       ErrorFromBody(head.status, error_body), delivered,
                       head.status);
      }
      continue;
    }

    pending.append(decoded);
    if (drain_lines(chunked && decoder.Finished())) {
      return result;
    }
    if (chunked && decoder.Finished()) {
      GenerateResult eos;
      eos.status = GenerateResult::Status::kEndOfStream;
      eos.http_status = 200;
      eos.chunks = delivered;
      eos.error = "backend closed the stream";
      return eos;
    }
  }
}

} // namespace fimgate
