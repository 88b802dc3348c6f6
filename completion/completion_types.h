#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fimgate {

// Inbound completion call as sent by IDE integrations. `prompt` is the text
// before the cursor, `suffix` the text after it.
struct CompletionRequest {
  std::string prompt;
  std::string suffix;
  std::string language;
  // Windowing hints. Accepted and logged, not used for windowing.
  int next_indent{0};
  int prompt_tokens{0};
  int suffix_tokens{0};
  bool trim_by_indentation{false};

  int max_tokens{0}; // <= 0 means no client limit
  int n{1};
  std::vector<std::string> stop;
  bool stream{true};
  double temperature{0.0};
  double top_p{1.0};
};

struct DecodeResult {
  bool ok{false};
  CompletionRequest request;
  std::string error;
};

// Parses a JSON request body. Unknown fields are ignored; wrongly typed known
// fields are decode errors.
DecodeResult DecodeCompletionRequest(const std::string &body);

// Random RFC 4122 version 4 identifier.
std::string NewCompletionId();

// RFC 3339 UTC timestamp with nanosecond precision.
std::string FormatRfc3339Nano(std::chrono::system_clock::time_point when);

// {id, created, choices:[{text, index:0, finish_reason?}]}
nlohmann::json MakeCompletionEnvelope(const std::string &id, int64_t created,
                                      const std::string &text,
                                      const std::string &finish_reason = {});

// Synthetic record closing a stream that ended before the backend's final
// fragment. Only total_duration carries a value.
nlohmann::json MakeTerminalRecord(const std::string &model,
                                  std::chrono::system_clock::time_point ended,
                                  std::chrono::nanoseconds elapsed);

// Frames one stream record: "data: <json>\n\n".
std::string FormatStreamRecord(const nlohmann::json &payload);

} // namespace fimgate
