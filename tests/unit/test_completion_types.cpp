#include <catch2/catch_test_macros.hpp>

#include "completion/completion_types.h"

#include <chrono>
#include <regex>
#include <set>
#include <string>

using json = nlohmann::json;

TEST_CASE("DecodeCompletionRequest reads the IDE request shape", "[types]") {
  const std::string body = R"({
    "extra": {"language": "python", "next_indent": 4, "prompt_tokens": 120,
              "suffix_tokens": 30, "trim_by_indentation": true},
    "max_tokens": 500, "n": 1, "prompt": "def add(a, b):\n",
    "stop": ["\n\n"], "stream": true, "suffix": "\nprint(add(1, 2))",
    "temperature": 0.1, "top_p": 1
  })";
  auto result = fimgate::DecodeCompletionRequest(body);
  REQUIRE(result.ok);
  const auto &req = result.request;
  REQUIRE(req.language == "python");
  REQUIRE(req.next_indent == 4);
  REQUIRE(req.prompt_tokens == 120);
  REQUIRE(req.suffix_tokens == 30);
  REQUIRE(req.trim_by_indentation);
  REQUIRE(req.max_tokens == 500);
  REQUIRE(req.prompt == "def add(a, b):\n");
  REQUIRE(req.suffix == "\nprint(add(1, 2))");
  REQUIRE(req.stop.size() == 1);
  REQUIRE(req.temperature == 0.1);
  REQUIRE(req.top_p == 1.0);
}

TEST_CASE("DecodeCompletionRequest applies defaults for absent fields",
          "[types]") {
  auto result = fimgate::DecodeCompletionRequest(R"({"prompt": "x"})");
  REQUIRE(result.ok);
  REQUIRE(result.request.max_tokens == 0);
  REQUIRE(result.request.top_p == 1.0);
  REQUIRE(result.request.language.empty());
  REQUIRE(result.request.stop.empty());
}

TEST_CASE("DecodeCompletionRequest rejects malformed bodies", "[types]") {
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest("{not json").ok);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest("[1, 2]").ok);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest(R"({"prompt": 42})").ok);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest(R"({"stop": "\n"})").ok);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest(R"({"extra": "python"})").ok);
  auto result = fimgate::DecodeCompletionRequest("");
  REQUIRE_FALSE(result.ok);
  REQUIRE_FALSE(result.error.empty());
}

TEST_CASE("Integer fields reject fractional and out-of-range numbers",
          "[types]") {
  auto huge = fimgate::DecodeCompletionRequest(R"({"max_tokens": 1e20})");
  REQUIRE_FALSE(huge.ok);
  REQUIRE(huge.error.find("max_tokens") != std::string::npos);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest(R"({"max_tokens": 12.5})").ok);
  REQUIRE_FALSE(
      fimgate::DecodeCompletionRequest(R"({"max_tokens": 4294967296})").ok);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest(R"({"n": -3000000000})").ok);
  REQUIRE_FALSE(fimgate::DecodeCompletionRequest(
                    R"({"extra": {"next_indent": 18446744073709551615}})")
                    .ok);

  auto edge = fimgate::DecodeCompletionRequest(
      R"({"max_tokens": 2147483647, "n": -2147483648})");
  REQUIRE(edge.ok);
  REQUIRE(edge.request.max_tokens == 2147483647);
  REQUIRE(edge.request.n == -2147483647 - 1);
}

TEST_CASE("NewCompletionId produces distinct version 4 UUIDs", "[types]") {
  const std::regex uuid_v4(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    auto id = fimgate::NewCompletionId();
    REQUIRE(std::regex_match(id, uuid_v4));
    seen.insert(id);
  }
  REQUIRE(seen.size() == 100);
}

TEST_CASE("Completion envelope carries one choice at index 0", "[types]") {
  auto envelope = fimgate::MakeCompletionEnvelope("id-1", 1700000000, "pass");
  REQUIRE(envelope["id"] == "id-1");
  REQUIRE(envelope["created"] == 1700000000);
  REQUIRE(envelope["choices"].size() == 1);
  REQUIRE(envelope["choices"][0]["text"] == "pass");
  REQUIRE(envelope["choices"][0]["index"] == 0);
  REQUIRE_FALSE(envelope["choices"][0].contains("finish_reason"));

  auto last = fimgate::MakeCompletionEnvelope("id-2", 1, "", "stop");
  REQUIRE(last["choices"][0]["finish_reason"] == "stop");
}

TEST_CASE("Stream records are framed as data lines", "[types]") {
  auto record = fimgate::FormatStreamRecord(json{{"a", 1}});
  REQUIRE(record == "data: {\"a\":1}\n\n");
}

TEST_CASE("Terminal record zeroes every engine counter but total_duration",
          "[types]") {
  auto ended = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)) +
               std::chrono::nanoseconds(123);
  auto record = fimgate::MakeTerminalRecord("qwen3-coder:30b", ended,
                                            std::chrono::milliseconds(1500));
  const auto &chunk = record["chunk"];
  REQUIRE(chunk["model"] == "qwen3-coder:30b");
  REQUIRE(chunk["created_at"] == "2023-11-14T22:13:20.000000123Z");
  REQUIRE(chunk["response"] == "");
  REQUIRE(chunk["done"] == true);
  REQUIRE(chunk["context"].is_array());
  REQUIRE(chunk["context"].empty());
  REQUIRE(chunk["total_duration"] == 1500000000LL);
  for (const char *key : {"load_duration", "prompt_eval_count",
                          "prompt_eval_duration", "eval_count", "eval_duration"}) {
    REQUIRE(chunk[key] == 0);
  }
}
