#pragma once

#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace pulsecam::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

// Accepted spellings, matched case-insensitively. "warning" is an alias.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  struct NamedLevel {
    std::string_view name;
    LogLevel level;
  };
  static constexpr std::array<NamedLevel, 5> kNames{{{"debug", LogLevel::kDebug},
                                                     {"info", LogLevel::kInfo},
                                                     {"warn", LogLevel::kWarn},
                                                     {"warning", LogLevel::kWarn},
                                                     {"error", LogLevel::kError}}};
  constexpr std::string_view kExpected = " (expected debug|info|warn|error)";

  error.clear();
  if (raw.empty()) {
    error = "missing log level" + std::string(kExpected);
    return false;
  }

  std::string lowered;
  lowered.reserve(raw.size());
  for (const unsigned char c : raw) {
    lowered.push_back(static_cast<char>(std::tolower(c)));
  }
  for (const NamedLevel& entry : kNames) {
    if (entry.name == lowered) {
      level = entry.level;
      return true;
    }
  }

  error = "invalid log level '" + std::string(raw) + "'" + std::string(kExpected);
  return false;
}

// Reads `PULSECAM_LOG_LEVEL`. Unset or invalid values leave `level` untouched
// and report the problem through `error` so the CLI can warn once.
inline bool LogLevelFromEnvironment(LogLevel& level, std::string& error) {
  error.clear();
  const char* raw = std::getenv("PULSECAM_LOG_LEVEL");
  if (raw == nullptr || *raw == '\0') {
    return false;
  }
  LogLevel parsed = level;
  if (!ParseLogLevel(raw, parsed, error)) {
    error = "PULSECAM_LOG_LEVEL: " + error;
    return false;
  }
  level = parsed;
  return true;
}

// Line-oriented key=value logger shared by the session queue, the frame
// delivery thread and the presentation drain thread. Each line is built
// first and written under one lock, so concurrent emitters never interleave.
//
//   ts_utc=2026-01-01T00:00:00.000Z level=INFO component="preview" msg="..." k="v"
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
  }

  void SetComponent(std::string component) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_ = std::move(component);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
      return;
    }

    std::string line = "ts_utc=";
    AppendUtcTimestamp(line, std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " component=";
    AppendQuoted(line, component_);
    line += " msg=";
    AppendQuoted(line, message);
    for (const LogFieldView& field : fields) {
      line += ' ';
      line += field.key;
      line += '=';
      AppendQuoted(line, field.value);
    }
    line += '\n';

    out_ << line;
    out_.flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  // ISO-8601 UTC with milliseconds; nothing is appended if the clock cannot
  // be converted.
  static void AppendUtcTimestamp(std::string& line, std::chrono::system_clock::time_point ts) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(ts);
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
      return;
    }

    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    line.append(buffer, written);

    const int ms = static_cast<int>((millis % 1000 + 1000) % 1000);
    line += '.';
    line += static_cast<char>('0' + ms / 100);
    line += static_cast<char>('0' + (ms / 10) % 10);
    line += static_cast<char>('0' + ms % 10);
    line += 'Z';
  }

  static void AppendQuoted(std::string& line, std::string_view raw) {
    line += '"';
    for (const char c : raw) {
      switch (c) {
      case '\\':
        line += "\\\\";
        break;
      case '"':
        line += "\\\"";
        break;
      case '\n':
        line += "\\n";
        break;
      case '\r':
        line += "\\r";
        break;
      case '\t':
        line += "\\t";
        break;
      default:
        line += c;
        break;
      }
    }
    line += '"';
  }

  std::mutex mutex_;
  LogLevel min_level_;
  std::ostream& out_;
  std::string component_ = "-";
};

} // namespace pulsecam::core::logging
