#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace camkit::core::logging {

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

// Case-insensitive `debug|info|warn|error`; `warning` is accepted for `warn`.
// Used by `--log-level` and the `log_level` config key.
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  constexpr std::pair<std::string_view, LogLevel> kNames[] = {
      {"debug", LogLevel::kDebug}, {"info", LogLevel::kInfo},   {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
  };

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& [name, value] : kNames) {
    if (normalized == name) {
      level = value;
      error.clear();
      return true;
    }
  }

  error = raw.empty() ? std::string("missing log level")
                      : "invalid log level '" + std::string(raw) + "'";
  error += " (expected debug|info|warn|error)";
  return false;
}

// Values are written bare when they are a single safe token and quoted
// otherwise. Control bytes become \xNN so one record is always one line.
inline void AppendLogValue(std::string& line, std::string_view value) {
  const bool bare = !value.empty() && std::all_of(value.begin(), value.end(), [](const char c) {
    const auto u = static_cast<unsigned char>(c);
    return u > 0x20U && u < 0x7FU && c != '"' && c != '=' && c != '\\';
  });
  if (bare) {
    line += value;
    return;
  }

  line.push_back('"');
  for (const char c : value) {
    const auto u = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') {
      line.push_back('\\');
      line.push_back(c);
    } else if (c == '\n') {
      line += "\\n";
    } else if (u < 0x20U || u == 0x7FU) {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\x%02X", u);
      line += escaped;
    } else {
      line.push_back(c);
    }
  }
  line.push_back('"');
}

// `2026-01-02T03:04:05.678Z`; empty if the clock cannot be converted.
inline std::string FormatUtcTimestamp(const std::chrono::system_clock::time_point ts) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc{};
#if defined(_WIN32)
  if (gmtime_s(&utc, &seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&seconds, &utc) == nullptr) {
    return "";
  }
#endif
  char text[32];
  const std::size_t length = std::strftime(text, sizeof(text), "%Y-%m-%dT%H:%M:%S", &utc);
  char fraction[8];
  std::snprintf(fraction, sizeof(fraction), ".%03dZ", static_cast<int>((millis % 1000 + 1000) % 1000));
  return std::string(text, length) + fraction;
}

// One record without the trailing newline:
//   [ts=<utc> ]level=<LEVEL> component=<name> msg=<text> key=value ...
inline std::string FormatLogLine(std::string_view timestamp, LogLevel level,
                                 std::string_view component, std::string_view message,
                                 std::initializer_list<LogFieldView> fields) {
  std::string line;
  if (!timestamp.empty()) {
    line += "ts=";
    line += timestamp;
    line.push_back(' ');
  }
  line += "level=";
  line += ToString(level);
  line += " component=";
  AppendLogValue(line, component);
  line += " msg=";
  AppendLogValue(line, message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    AppendLogValue(line, field.value);
  }
  return line;
}

// Structured key=value logger for sessions, cameras and the CLI. Writes one
// line per record to the stream it was given (stderr by default); the stream
// must outlive the logger.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }
  LogLevel min_level() const {
    return min_level_;
  }

  void SetComponent(std::string component) {
    component_ = std::move(component);
  }
  const std::string& component() const {
    return component_;
  }

  // Tests turn timestamps off to compare whole lines.
  void SetTimestamps(bool enabled) {
    timestamps_ = enabled;
  }

  bool Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!Enabled(level)) {
      return;
    }
    const std::string timestamp =
        timestamps_ ? FormatUtcTimestamp(std::chrono::system_clock::now()) : std::string();
    (*out_) << FormatLogLine(timestamp, level, component_, message, fields) << '\n';
    out_->flush();
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
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string component_ = "camkit";
  bool timestamps_ = true;
};

} // namespace camkit::core::logging
