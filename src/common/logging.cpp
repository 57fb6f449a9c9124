#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace palisade {
namespace common {

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "trace")
    return LogLevel::TRACE;
  if (lowered == "debug")
    return LogLevel::DEBUG;
  if (lowered == "info")
    return LogLevel::INFO;
  if (lowered == "warn" || lowered == "warning")
    return LogLevel::WARN;
  if (lowered == "error")
    return LogLevel::ERROR;
  if (lowered == "critical")
    return LogLevel::CRITICAL;
  return std::nullopt;
}

std::string Logger::level_to_string(LogLevel level) const {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::escape_json_string(const std::string &input) const {
  std::ostringstream escaped;
  for (char c : input) {
    switch (c) {
    case '"':
      escaped << "\\\"";
      break;
    case '\\':
      escaped << "\\\\";
      break;
    case '\b':
      escaped << "\\b";
      break;
    case '\f':
      escaped << "\\f";
      break;
    case '\n':
      escaped << "\\n";
      break;
    case '\r':
      escaped << "\\r";
      break;
    case '\t':
      escaped << "\\t";
      break;
    default:
      if (c >= 0 && c < 32) {
        // Control characters - escape as unicode
        escaped << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                << static_cast<int>(c);
      } else {
        escaped << c;
      }
      break;
    }
  }
  return escaped.str();
}

std::string Logger::format_json(const LogEntry &entry) const {
  std::ostringstream json;

  // ISO 8601, UTC, millisecond precision
  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;
  std::tm utc{};
  gmtime_r(&time_t, &utc);

  json << "{" << "\"timestamp\":\""
       << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setfill('0') << std::setw(3) << ms.count() << "Z\","
       << "\"level\":\"" << level_to_string(entry.level) << "\","
       << "\"module\":\"" << escape_json_string(entry.module) << "\","
       << "\"message\":\"" << escape_json_string(entry.message) << "\"";

  if (!entry.error_code.empty()) {
    json << ",\"error_code\":\"" << escape_json_string(entry.error_code)
         << "\"";
  }

  if (!entry.context.empty()) {
    json << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        json << ",";
      json << "\"" << escape_json_string(key) << "\":\""
           << escape_json_string(value) << "\"";
      first = false;
    }
    json << "}";
  }

  json << "}";
  return json.str();
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm local{};
  localtime_r(&time_t, &local);

  text << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] " << "["
       << level_to_string(entry.level) << "] " << "[" << entry.module << "] "
       << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    text << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

} // namespace common
} // namespace palisade
