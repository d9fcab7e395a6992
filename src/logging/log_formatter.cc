#include "realmlink/logging/log_formatter.h"

#include <ctime>
#include <iterator>

#include <fmt/format.h>

namespace realmlink {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", date, static_cast<int>(ms.count()));
}

std::string connectionPrefix(const LogMessage& msg) {
  if (msg.server_type.empty() && msg.zone.empty()) {
    return std::string();
  }
  return fmt::format("[{}][{}] ", msg.server_type, msg.zone);
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level));

  if (with_location_ && msg.file && msg.line > 0) {
    fmt::format_to(it, "[{}:{}] ", msg.file, msg.line);
  }

  fmt::format_to(it, "{}{}", connectionPrefix(msg), msg.message);

  if (!msg.key_values.empty()) {
    fmt::format_to(it, " {{");
    bool first = true;
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}{}={}", first ? "" : ", ", kv.first, kv.second);
      first = false;
    }
    fmt::format_to(it, "}}");
  }

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "{{\"timestamp\":\"{}\",\"level\":\"{}\",\"logger\":\"{}\"",
                 formatTimestamp(msg.timestamp), logLevelToString(msg.level),
                 escapeJson(msg.logger_name));

  if (msg.process_id > 0) {
    fmt::format_to(it, ",\"pid\":{}", msg.process_id);
  }

  if (msg.component != Component::Root) {
    fmt::format_to(it, ",\"component\":\"{}\"",
                   componentToString(msg.component));
  }

  if (!msg.server_type.empty()) {
    fmt::format_to(it, ",\"server_type\":\"{}\"", escapeJson(msg.server_type));
  }
  if (!msg.zone.empty()) {
    fmt::format_to(it, ",\"zone\":\"{}\"", escapeJson(msg.zone));
  }

  if (msg.file) {
    fmt::format_to(it, ",\"file\":\"{}\",\"line\":{}", escapeJson(msg.file),
                   msg.line);
  }

  fmt::format_to(it, ",\"message\":\"{}\"", escapeJson(msg.message));

  if (!msg.key_values.empty()) {
    fmt::format_to(it, ",\"metadata\":{{");
    bool first = true;
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}\"{}\":\"{}\"", first ? "" : ",",
                     escapeJson(kv.first), escapeJson(kv.second));
      first = false;
    }
    fmt::format_to(it, "}}");
  }

  fmt::format_to(it, "}}");
  return fmt::to_string(out);
}

std::string JsonFormatter::escapeJson(const std::string& str) const {
  std::string out;
  out.reserve(str.size());

  for (char c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          // UTF-8 continuation bytes pass through untouched
          out += c;
        }
        break;
    }
  }

  return out;
}

}  // namespace logging
}  // namespace realmlink
