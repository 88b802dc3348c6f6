#include "completion/completion_types.h"

#include <array>
#include <cstdio>
#include <cstdint>
#include <ctime>
#include <limits>
#include <stdexcept>

#include <openssl/rand.h>

using json = nlohmann::json;

namespace fimgate {

namespace {

template <typename T>
void ReadField(const json &object, const char *key, T *out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return;
  }
  *out = it->get<T>();
}

// Integer fields accept only JSON integers that fit in an int.
void ReadField(const json &object, const char *key, int *out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument(std::string(key) + " must be an integer");
  }
  bool in_range = it->is_number_unsigned()
                      ? it->get<uint64_t>() <=
                            static_cast<uint64_t>(std::numeric_limits<int>::max())
                      : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
                            it->get<int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    throw std::invalid_argument(std::string(key) + " is out of range");
  }
  *out = static_cast<int>(it->get<int64_t>());
}

} // namespace

DecodeResult DecodeCompletionRequest(const std::string &body) {
  DecodeResult result;
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error &ex) {
    result.error = std::string("invalid JSON: ") + ex.what();
    return result;
  }
  if (!j.is_object()) {
    result.error = "request body must be a JSON object";
    return result;
  }

  CompletionRequest &req = result.request;
  try {
    ReadField(j, "prompt", &req.prompt);
    ReadField(j, "suffix", &req.suffix);
    ReadField(j, "max_tokens", &req.max_tokens);
    ReadField(j, "n", &req.n);
    ReadField(j, "stop", &req.stop);
    ReadField(j, "stream", &req.stream);
    ReadField(j, "temperature", &req.temperature);
    ReadField(j, "top_p", &req.top_p);
    auto extra = j.find("extra");
    if (extra != j.end() && !extra->is_null()) {
      if (!extra->is_object()) {
        result.error = "extra must be an object";
        return result;
      }
      ReadField(*extra, "language", &req.language);
      ReadField(*extra, "next_indent", &req.next_indent);
      ReadField(*extra, "prompt_tokens", &req.prompt_tokens);
      ReadField(*extra, "suffix_tokens", &req.suffix_tokens);
      ReadField(*extra, "trim_by_indentation", &req.trim_by_indentation);
    }
  } catch (const json::exception &ex) {
    result.error = std::string("invalid field: ") + ex.what();
    return result;
  } catch (const std::invalid_argument &ex) {
    result.error = std::string("invalid field: ") + ex.what();
    return result;
  }
  result.ok = true;
  return result;
}

std::string NewCompletionId() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  static const char *kHex = "0123456789abcdef";
  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      id.push_back('-');
    }
    id.push_back(kHex[bytes[i] >> 4]);
    id.push_back(kHex[bytes[i] & 0x0F]);
  }
  return id;
}

std::string FormatRfc3339Nano(std::chrono::system_clock::time_point when) {
  auto since_epoch = when.time_since_epoch();
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
  std::time_t t = static_cast<std::time_t>(seconds.count());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%09lldZ", date,
                static_cast<long long>(nanos.count()));
  return out;
}

json MakeCompletionEnvelope(const std::string &id, int64_t created,
                            const std::string &text,
                            const std::string &finish_reason) {
  json choice = {{"text", text}, {"index", 0}};
  if (!finish_reason.empty()) {
    choice["finish_reason"] = finish_reason;
  }
  return {{"id", id}, {"created", created}, {"choices", json::array({choice})}};
}

json MakeTerminalRecord(const std::string &model,
                        std::chrono::system_clock::time_point ended,
                        std::chrono::nanoseconds elapsed) {
  return {{"chunk",
           {{"model", model},
            {"created_at", FormatRfc3339Nano(ended)},
            {"response", ""},
            {"done", true},
            {"context", json::array()},
            {"total_duration", static_cast<int64_t>(elapsed.count())},
            {"load_duration", 0},
            {"prompt_eval_count", 0},
            {"prompt_eval_duration", 0},
            {"eval_count", 0},
            {"eval_duration", 0}}}};
}

std::string FormatStreamRecord(const json &payload) {
  // Backend fragments can split a multi-byte sequence; replace rather than
  // throw on invalid UTF-8.
  return "data: " + payload.dump(-1, ' ', false, json::error_handler_t::replace) +
         "\n\n";
}

} // namespace fimgate
