#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace realmlink {
namespace logging {

// Syslog-style severities (RFC-5424 order)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

enum class LogMode {
  Sync,  // Write straight through to the sink
  NoOp   // Drop everything
};

// Top-level logger name prefixes. A logger called "protocol.engine" belongs
// to Component::Protocol.
enum class Component {
  Root,
  Event,
  Transport,
  Protocol,
  Login,
  Directory,
  Gateway,
  Config,
  Http,
  Count
};

enum class SinkType { File, Stdio };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

// Case-insensitive; unknown names map to Info
inline LogLevel stringToLogLevel(const std::string& str) {
  std::string s = str;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "notice") return LogLevel::Notice;
  if (s == "warning" || s == "warn") return LogLevel::Warning;
  if (s == "error") return LogLevel::Error;
  if (s == "critical") return LogLevel::Critical;
  if (s == "alert") return LogLevel::Alert;
  if (s == "emergency") return LogLevel::Emergency;
  if (s == "off") return LogLevel::Off;
  return LogLevel::Info;
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "root";
    case Component::Event: return "event";
    case Component::Transport: return "transport";
    case Component::Protocol: return "protocol";
    case Component::Login: return "login";
    case Component::Directory: return "directory";
    case Component::Gateway: return "gateway";
    case Component::Config: return "config";
    case Component::Http: return "http";
    default: return "unknown";
  }
}

}  // namespace logging
}  // namespace realmlink
