#include <catch2/catch_test_macros.hpp>

#include "net/socket_address.h"
#include "runtime/backends/ollama/ollama_backend.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

using fimgate::GenerateResult;
using fimgate::OllamaBackend;
using fimgate::testing::CapturedLog;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

void WriteAll(int fd, const std::string &data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    ssize_t n = ::send(fd, data.data() + offset, data.size() - offset,
                       MSG_NOSIGNAL);
    if (n <= 0) {
      return;
    }
    offset += static_cast<std::size_t>(n);
  }
}

std::string ReadRequest(int fd) {
  std::string data;
  char buf[4096];
  std::size_t body_start = std::string::npos;
  std::size_t content_length = 0;
  while (true) {
    if (body_start == std::string::npos) {
      auto end = data.find("\r\n\r\n");
      if (end != std::string::npos) {
        body_start = end + 4;
        auto pos = data.find("Content-Length: ");
        if (pos != std::string::npos && pos < end) {
          content_length = std::stoul(data.substr(pos + 16));
        }
      }
    }
    if (body_start != std::string::npos &&
        data.size() >= body_start + content_length) {
      return data;
    }
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) {
      return data;
    }
    data.append(buf, static_cast<std::size_t>(n));
  }
}

void WaitForClose(int fd) {
  char buf[256];
  while (::recv(fd, buf, sizeof(buf), 0) > 0) {
  }
}

std::string Chunk(const std::string &payload) {
  char size[32];
  std::snprintf(size, sizeof(size), "%zx\r\n", payload.size());
  return size + payload + "\r\n";
}

// Minimal stand-in for the Ollama daemon: accepts connections on loopback and
// hands each one, with its request already read, to `respond`.
class FakeOllama {
 public:
  using Responder = std::function<void(int fd, const std::string &request)>;

  explicit FakeOllama(Responder respond) : respond_(std::move(respond)) {
    fd_ = fimgate::BindListener({"127.0.0.1", 0});
    port_ = fimgate::LocalPort(fd_);
    thread_ = std::thread([this] {
      while (true) {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
          return;
        }
        std::string request = ReadRequest(client);
        {
          std::lock_guard<std::mutex> lock(mutex_);
          requests_.push_back(request);
        }
        respond_(client, request);
        ::close(client);
      }
    });
  }

  ~FakeOllama() {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    thread_.join();
  }

  std::string Url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::string LastRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.empty() ? std::string() : requests_.back();
  }

 private:
  Responder respond_;
  int fd_{-1};
  int port_{0};
  std::thread thread_;
  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
};

fimgate::GenerateRequest SampleRequest() {
  fimgate::GenerateRequest request;
  request.model = "qwen3-coder:30b";
  request.prompt = "def add(a, b):";
  request.system = "system text";
  request.options.temperature = 0.2;
  request.options.top_p = 0.9;
  request.options.stop = {"\n\n", "<|im_end|>"};
  request.options.num_predict = 64;
  return request;
}

struct Collected {
  std::vector<fimgate::StreamChunk> chunks;
  fimgate::ChunkCallback Callback() {
    return [this](const fimgate::StreamChunk &chunk) { chunks.push_back(chunk); };
  }
};

const char *kFinalLine =
    R"({"model":"m","response":"","done":true,"total_duration":900,)"
    R"("load_duration":10,"prompt_eval_count":12,"prompt_eval_duration":20,)"
    R"("eval_count":3,"eval_duration":30})";

} // namespace

TEST_CASE("NormalizeBaseUrl accepts OLLAMA_HOST forms", "[ollama]") {
  REQUIRE(OllamaBackend::NormalizeBaseUrl("") == "http://127.0.0.1:11434");
  REQUIRE(OllamaBackend::NormalizeBaseUrl("localhost") ==
          "http://localhost:11434");
  REQUIRE(OllamaBackend::NormalizeBaseUrl("example.com:8080") ==
          "http://example.com:8080");
  REQUIRE(OllamaBackend::NormalizeBaseUrl("http://example.com") ==
          "http://example.com:80");
  REQUIRE(OllamaBackend::NormalizeBaseUrl("https://example.com/") ==
          "https://example.com:443");
  REQUIRE(OllamaBackend::NormalizeBaseUrl("\"0.0.0.0:11434\"") ==
          "http://127.0.0.1:11434");
  REQUIRE(OllamaBackend::NormalizeBaseUrl(" http://10.0.0.2:1234/ ") ==
          "http://10.0.0.2:1234");
  REQUIRE(OllamaBackend::NormalizeBaseUrl("https://example.com/ollama") ==
          "https://example.com:443/ollama");
}

TEST_CASE("ParseStreamLine decodes fragments and final counters", "[ollama]") {
  fimgate::StreamChunk chunk;
  std::string error;

  REQUIRE(OllamaBackend::ParseStreamLine(R"({"response":"ret","done":false})",
                                         &chunk, &error));
  REQUIRE(chunk.text == "ret");
  REQUIRE_FALSE(chunk.final);
  REQUIRE(chunk.counters.eval_count == 0);

  REQUIRE(OllamaBackend::ParseStreamLine(kFinalLine, &chunk, &error));
  REQUIRE(chunk.final);
  REQUIRE(chunk.text.empty());
  REQUIRE(chunk.counters.total_duration == 900);
  REQUIRE(chunk.counters.prompt_eval_count == 12);
  REQUIRE(chunk.counters.eval_count == 3);
  REQUIRE(chunk.counters.eval_duration == 30);
}

TEST_CASE("ParseStreamLine rejects malformed and error lines", "[ollama]") {
  fimgate::StreamChunk chunk;
  std::string error;
  REQUIRE_FALSE(OllamaBackend::ParseStreamLine("{not json", &chunk, &error));
  REQUIRE(error.find("malformed stream line") != std::string::npos);
  REQUIRE_FALSE(OllamaBackend::ParseStreamLine("[1,2]", &chunk, &error));
  REQUIRE_FALSE(OllamaBackend::ParseStreamLine(
      R"({"error":"model 'x' not found"})", &chunk, &error));
  REQUIRE(error == "model 'x' not found");
}

TEST_CASE("Generate streams a chunked NDJSON response", "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    WriteAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: application/x-ndjson\r\n"
                 "Transfer-Encoding: chunked\r\n\r\n");
    // The first line is split across chunks.
    WriteAll(fd, Chunk(R"({"response":"ret)"));
    WriteAll(fd, Chunk("urn a\",\"done\":false}\n"));
    WriteAll(fd, Chunk(R"({"response":" + b","done":false})" "\n" +
                       std::string(kFinalLine) + "\n"));
    WriteAll(fd, "0\r\n\r\n");
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 5s);
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());

  REQUIRE(result.status == GenerateResult::Status::kCompleted);
  REQUIRE(result.http_status == 200);
  REQUIRE(result.chunks == 3);
  REQUIRE(collected.chunks.size() == 3);
  REQUIRE(collected.chunks[0].text == "return a");
  REQUIRE(collected.chunks[1].text == " + b");
  REQUIRE(collected.chunks[2].final);
  REQUIRE(collected.chunks[2].counters.prompt_eval_count == 12);

  auto request = server.LastRequest();
  REQUIRE(request.rfind("POST /api/generate HTTP/1.1\r\n", 0) == 0);
  REQUIRE(request.find("Accept: application/x-ndjson") != std::string::npos);
  auto body = json::parse(request.substr(request.find("\r\n\r\n") + 4));
  REQUIRE(body["model"] == "qwen3-coder:30b");
  REQUIRE(body["prompt"] == "def add(a, b):");
  REQUIRE(body["system"] == "system text");
  REQUIRE(body["stream"] == true);
  REQUIRE(body["options"]["num_predict"] == 64);
  REQUIRE(body["options"]["top_p"] == 0.9);
  REQUIRE(body["options"]["stop"] == json::array({"\n\n", "<|im_end|>"}));
}

TEST_CASE("Generate reads a close-delimited response", "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    WriteAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: application/x-ndjson\r\n\r\n");
    WriteAll(fd, std::string(R"({"response":"x","done":false})") + "\n" +
                     kFinalLine);
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 5s);
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());

  REQUIRE(result.status == GenerateResult::Status::kCompleted);
  REQUIRE(collected.chunks.size() == 2);
  REQUIRE(collected.chunks.back().final);
}

TEST_CASE("Generate reports a stream that ends without a final line",
          "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    WriteAll(fd, "HTTP/1.1 200 OK\r\n\r\n");
    WriteAll(fd, std::string(R"({"response":"x","done":false})") + "\n");
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 5s);
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());

  REQUIRE(result.status == GenerateResult::Status::kEndOfStream);
  REQUIRE(collected.chunks.size() == 1);
}

TEST_CASE("Generate surfaces HTTP errors from the backend", "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    std::string body = R"({"error":"model 'nope' not found"})";
    WriteAll(fd, "HTTP/1.1 404 Not Found\r\nContent-Type: application/json\r\n"
                 "Content-Length: " +
                     std::to_string(body.size()) + "\r\n\r\n" + body);
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 5s);
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());

  REQUIRE(result.status == GenerateResult::Status::kBackendError);
  REQUIRE(result.http_status == 404);
  REQUIRE(result.error == "model 'nope' not found");
  REQUIRE(collected.chunks.empty());
}

TEST_CASE("Generate treats an in-band error line as a backend error",
          "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    WriteAll(fd, "HTTP/1.1 200 OK\r\n\r\n");
    WriteAll(fd, std::string(R"({"response":"a","done":false})") + "\n" +
                     R"({"error":"out of memory"})" + "\n");
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 5s);
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());

  REQUIRE(result.status == GenerateResult::Status::kBackendError);
  REQUIRE(result.error == "out of memory");
  REQUIRE(result.chunks == 1);
}

TEST_CASE("Generate stops at the deadline while the backend stalls",
          "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    WriteAll(fd, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n");
    WriteAll(fd, Chunk(std::string(R"({"response":"a","done":false})") + "\n"));
    WaitForClose(fd);
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 100ms);
  Collected collected;
  auto started = std::chrono::steady_clock::now();
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());
  auto waited = std::chrono::steady_clock::now() - started;

  REQUIRE(result.status == GenerateResult::Status::kDeadlineExceeded);
  REQUIRE(collected.chunks.size() == 1);
  REQUIRE(waited >= 100ms);
  REQUIRE(waited < 3s);
}

TEST_CASE("Generate observes caller cancellation", "[ollama]") {
  FakeOllama server([](int fd, const std::string &) {
    WriteAll(fd, "HTTP/1.1 200 OK\r\n\r\n");
    WaitForClose(fd);
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  fimgate::CancellationToken token;
  fimgate::CancellationScope scope(token, 10s);
  std::thread canceller([token]() {
    std::this_thread::sleep_for(50ms);
    token.Cancel();
  });
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());
  canceller.join();

  REQUIRE(result.status == GenerateResult::Status::kCancelled);
}

TEST_CASE("Generate reports an unreachable backend as a connect failure",
          "[ollama]") {
  int fd = fimgate::BindListener({"127.0.0.1", 0});
  int port = fimgate::LocalPort(fd);
  ::close(fd);

  CapturedLog log;
  OllamaBackend backend({"127.0.0.1:" + std::to_string(port), 10}, log.logger);
  fimgate::CancellationScope scope(fimgate::CancellationToken(), 1s);
  Collected collected;
  auto result = backend.Generate(SampleRequest(), scope, collected.Callback());

  REQUIRE(result.status == GenerateResult::Status::kConnectFailed);
  REQUIRE_FALSE(result.error.empty());
  REQUIRE(log.Text().find("connect failed") != std::string::npos);
}

TEST_CASE("Probe reads the daemon version", "[ollama]") {
  FakeOllama server([](int fd, const std::string &request) {
    std::string body = request.rfind("GET /api/version", 0) == 0
                           ? R"({"version":"0.6.2"})"
                           : "{}";
    WriteAll(fd, "HTTP/1.1 200 OK\r\nContent-Length: " +
                     std::to_string(body.size()) + "\r\n\r\n" + body);
  });

  CapturedLog log;
  OllamaBackend backend({server.Url(), 10}, log.logger);
  std::string version;
  std::string error;
  REQUIRE(backend.Probe(&version, &error));
  REQUIRE(version == "0.6.2");
}
