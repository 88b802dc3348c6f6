#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <chrono>

using json = nlohmann::json;

namespace fimgate {

Logger::Logger(std::ostream &out, bool json_mode, Level min_level)
    : out_(out), json_mode_(json_mode), min_level_(min_level) {}

const char *Logger::LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::SetJsonMode(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  json_mode_ = enabled;
}

bool Logger::IsJsonMode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return json_mode_;
}

void Logger::SetMinLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

Logger::Level Logger::MinLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

bool Logger::Enabled(Level level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(Level level, const std::string &component,
                 const std::string &message, const std::string &extra) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (json_mode_) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelString(level);
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelString(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }
  out_ << line << "\n";
  out_.flush();
}

} // namespace fimgate
