#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace fimgate {

// Line-oriented application logger. Components receive a shared handle at
// construction; nothing logs through process-wide state.
class Logger {
 public:
  enum class Level { DEBUG, INFO, WARN, ERROR };

  // Default mode is plain text: "[LEVEL] component: message | extra".
  // JSON mode writes one object per line: {ts, level, component, message}.
  explicit Logger(std::ostream &out = std::cerr, bool json_mode = false,
                  Level min_level = Level::INFO);

  void SetJsonMode(bool enabled);
  bool IsJsonMode() const;
  void SetMinLevel(Level level);
  Level MinLevel() const;
  bool Enabled(Level level) const;

  // `component` identifies the subsystem ("relay", "proxy", "http").
  // `extra` is an optional key=value string (ignored when empty).
  void Log(Level level, const std::string &component,
           const std::string &message, const std::string &extra = {});

  void Debug(const std::string &component, const std::string &message,
             const std::string &extra = {}) {
    Log(Level::DEBUG, component, message, extra);
  }
  void Info(const std::string &component, const std::string &message,
            const std::string &extra = {}) {
    Log(Level::INFO, component, message, extra);
  }
  void Warn(const std::string &component, const std::string &message,
            const std::string &extra = {}) {
    Log(Level::WARN, component, message, extra);
  }
  void Error(const std::string &component, const std::string &message,
             const std::string &extra = {}) {
    Log(Level::ERROR, component, message, extra);
  }

  static const char *LevelString(Level level);

 private:
  std::ostream &out_;
  bool json_mode_;
  Level min_level_;
  mutable std::mutex mutex_;
};

} // namespace fimgate
