#include <catch2/catch_test_macros.hpp>

#include "server/config/server_config.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class TempConfigFile {
 public:
  explicit TempConfigFile(const std::string &contents) {
    path_ = fs::temp_directory_path() /
            ("fimgate_config_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter_++) + ".yaml");
    std::ofstream out(path_);
    out << contents;
  }
  ~TempConfigFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  std::string Path() const { return path_.string(); }

 private:
  static inline int counter_ = 0;
  fs::path path_;
};

fimgate::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const char *name) -> const char * {
    auto it = values.find(name);
    return it == values.end() ? nullptr : it->second.c_str();
  };
}

} // namespace

TEST_CASE("Missing config file keeps the defaults", "[config]") {
  std::vector<std::string> warnings;
  auto config = fimgate::LoadServerConfig("/nonexistent/fimgate.yaml", &warnings);
  REQUIRE(warnings.empty());
  REQUIRE(config.http_addr == ":11437");
  REQUIRE(config.https_addr == ":11436");
  REQUIRE(config.proxy_http_addr == ":11438");
  REQUIRE(config.proxy_https_addr == ":11435");
  REQUIRE(config.model == "qwen3-coder:30b");
  REQUIRE(config.num_predict == 200);
  REQUIRE(config.stream_timeout_ms == 60000);
  REQUIRE(config.prefix_lines == 60);
  REQUIRE(config.suffix_lines == 60);
  REQUIRE(config.artifacts == std::vector<std::string>{"```", "python"});
  REQUIRE(fimgate::ValidateServerConfig(config).empty());
}

TEST_CASE("YAML file overrides defaults section by section", "[config]") {
  TempConfigFile file(R"(
listeners:
  http: "127.0.0.1:9000"
  proxy_enabled: false
tls:
  cert_path: /etc/fimgate/cert.pem
  key_path: /etc/fimgate/key.pem
backend:
  url: http://gpu-box:11434
  probe: false
completion:
  model: codellama:7b-code
  num_predict: 64
  prompt_template: "<PRE> {{.Prefix}} <SUF>{{.Suffix}} <MID>"
  stream_timeout_ms: 15000
  filter: none
  artifacts: ["```", "go"]
logging:
  format: json
  verbose: true
http:
  response_headers:
    X-Frame-Options: DENY
)");
  std::vector<std::string> warnings;
  auto config = fimgate::LoadServerConfig(file.Path(), &warnings);

  REQUIRE(warnings.empty());
  REQUIRE(config.http_addr == "127.0.0.1:9000");
  REQUIRE(config.https_addr == ":11436");
  REQUIRE_FALSE(config.proxy_enabled);
  REQUIRE(config.tls_cert_path == "/etc/fimgate/cert.pem");
  REQUIRE(config.backend_url == "http://gpu-box:11434");
  REQUIRE_FALSE(config.backend_probe);
  REQUIRE(config.model == "codellama:7b-code");
  REQUIRE(config.num_predict == 64);
  REQUIRE(config.prompt_template == "<PRE> {{.Prefix}} <SUF>{{.Suffix}} <MID>");
  REQUIRE(config.stream_timeout_ms == 15000);
  REQUIRE(config.filter == "none");
  REQUIRE(config.artifacts == std::vector<std::string>{"```", "go"});
  REQUIRE(config.log_format == "json");
  REQUIRE(config.verbose);
  REQUIRE(config.response_headers.at("X-Frame-Options") == "DENY");
  REQUIRE(fimgate::ValidateServerConfig(config).empty());
}

TEST_CASE("Malformed YAML falls back to defaults with a warning", "[config]") {
  TempConfigFile file("completion: [unterminated\n  model: x\n");
  std::vector<std::string> warnings;
  auto config = fimgate::LoadServerConfig(file.Path(), &warnings);
  REQUIRE(warnings.size() == 1);
  REQUIRE(warnings[0].find("error parsing config file") != std::string::npos);
  REQUIRE(config.model == "qwen3-coder:30b");
}

TEST_CASE("Environment variables override the file", "[config]") {
  fimgate::ServerConfig config;
  std::vector<std::string> warnings;
  fimgate::ApplyEnvOverrides(
      &config, &warnings,
      FakeEnv({{"FIMGATE_HTTP_ADDR", ":8080"},
               {"FIMGATE_MODEL", "starcoder2:3b"},
               {"FIMGATE_NUM_PREDICT", "128"},
               {"FIMGATE_STREAM_TIMEOUT_MS", "soon"},
               {"FIMGATE_VERBOSE", "yes"}}));

  REQUIRE(config.http_addr == ":8080");
  REQUIRE(config.model == "starcoder2:3b");
  REQUIRE(config.num_predict == 128);
  REQUIRE(config.stream_timeout_ms == 60000);
  REQUIRE(config.verbose);
  REQUIRE(warnings.size() == 1);
  REQUIRE(warnings[0].find("FIMGATE_STREAM_TIMEOUT_MS") != std::string::npos);
}

TEST_CASE("OLLAMA_HOST applies only when no backend URL is set", "[config]") {
  std::vector<std::string> warnings;

  fimgate::ServerConfig unset;
  fimgate::ApplyEnvOverrides(&unset, &warnings,
                             FakeEnv({{"OLLAMA_HOST", "0.0.0.0:11434"}}));
  REQUIRE(unset.backend_url == "0.0.0.0:11434");

  fimgate::ServerConfig from_file;
  from_file.backend_url = "http://gpu-box:11434";
  fimgate::ApplyEnvOverrides(&from_file, &warnings,
                             FakeEnv({{"OLLAMA_HOST", "elsewhere:1"}}));
  REQUIRE(from_file.backend_url == "http://gpu-box:11434");

  fimgate::ServerConfig explicit_env;
  fimgate::ApplyEnvOverrides(
      &explicit_env, &warnings,
      FakeEnv({{"FIMGATE_BACKEND_URL", "http://a:1"}, {"OLLAMA_HOST", "b:2"}}));
  REQUIRE(explicit_env.backend_url == "http://a:1");
}

TEST_CASE("Validation reports every invalid setting", "[config]") {
  fimgate::ServerConfig config;
  config.num_predict = 0;
  config.stream_timeout_ms = -1;
  config.http_addr = "nowhere";
  config.tls_cert_path = "/only/cert.pem";
  config.prompt_template = "{{.Prefix";
  config.filter = "regex";
  config.log_format = "xml";

  auto errors = fimgate::ValidateServerConfig(config);
  REQUIRE(errors.size() == 7);
  auto mentions = [&errors](const std::string &needle) {
    for (const auto &error : errors) {
      if (error.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  };
  REQUIRE(mentions("num_predict"));
  REQUIRE(mentions("stream_timeout_ms"));
  REQUIRE(mentions("listeners.http"));
  REQUIRE(mentions("tls.cert_path"));
  REQUIRE(mentions("prompt_template"));
  REQUIRE(mentions("completion.filter"));
  REQUIRE(mentions("logging.format"));
}

TEST_CASE("Disabled proxy skips public address validation", "[config]") {
  fimgate::ServerConfig config;
  config.proxy_enabled = false;
  config.proxy_http_addr = "bogus";
  REQUIRE(fimgate::ValidateServerConfig(config).empty());
}
