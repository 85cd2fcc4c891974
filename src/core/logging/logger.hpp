#pragma once

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cupkit::core::logging {

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

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

// Case-insensitive; "warning" is accepted as an alias of "warn".
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string lowered;
  lowered.reserve(raw.size());
  for (const char c : raw) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  static constexpr std::array<std::pair<std::string_view, LogLevel>, 5> kNames = {{
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
  }};
  for (const auto& [name, value] : kNames) {
    if (lowered == name) {
      level = value;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Diagnostics for cup operations, one `key="value"` line per event:
//
//   ts_utc=... level=INFO op="clone" msg="cup cloned" root="..." from="spring"
//
// Context fields (set once per command) follow `msg`, then the call's own
// fields. Each line is assembled first and written with a single insertion,
// always to a diagnostic stream (stderr by default) so stdout stays reserved
// for command output.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  // Operation label stamped on every line, e.g. "clone".
  void SetOperation(std::string operation) {
    operation_ = std::move(operation);
  }

  const std::string& Operation() const {
    return operation_;
  }

  // Adds or replaces a field carried by every later line.
  void SetContext(std::string key, std::string value) {
    for (auto& field : context_) {
      if (field.first == key) {
        field.second = std::move(value);
        return;
      }
    }
    context_.emplace_back(std::move(key), std::move(value));
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = "ts_utc=" + FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    AppendField(line, "op", operation_);
    AppendField(line, "msg", message);
    for (const auto& [key, value] : context_) {
      AppendField(line, key, value);
    }
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line += '\n';

    (*out_) << line;
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
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line += ' ';
    line += key;
    line += "=\"";
    AppendEscapedJson(line, value);
    line += '"';
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string operation_ = "-";
  std::vector<std::pair<std::string, std::string>> context_;
};

// Sink for library calls made without a caller-provided logger.
inline Logger& NullLogger() {
  static std::ostream null_stream(nullptr);
  static Logger logger(LogLevel::kError, null_stream);
  return logger;
}

} // namespace cupkit::core::logging
