#pragma once

#include <mutex>
#include <regex>
#include <unordered_map>
#include <vector>

#include "realmlink/logging/logger.h"

namespace realmlink {
namespace logging {

// Glob-style level override ("protocol.*" = debug)
struct LogPattern {
  std::string glob;
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& g, LogLevel lvl)
      : glob(g), pattern(globToRegex(g)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  // Get or create logger; new loggers share the default sink
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(Component component, LogLevel level);

  // Later patterns win over earlier ones
  void setPattern(const std::string& pattern, LogLevel level);
  void clearPatterns();

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  // Replace the sink of every registered logger
  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink();

  std::vector<std::string> getLoggerNames() const;

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  void initializeDefaults();

  // Assumes mutex_ is held
  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<Component, LogLevel> component_levels_;

  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

/**
 * Logger bound to one connection. Every line it emits carries the
 * connection's server type and zone, which the formatters render as the
 * "[EP][de1]" prefix.
 */
class ConnectionLogger {
 public:
  ConnectionLogger(Component component,
                   const std::string& server_type,
                   const std::string& zone)
      : logger_(LoggerRegistry::instance().getOrCreateLogger(
            componentToString(component))) {
    ctx_.component = component;
    ctx_.server_type = server_type;
    ctx_.zone = zone;
  }

  template <typename... Args>
  void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      logger_->logWithContext(level, ctx_, fmt, std::forward<Args>(args)...);
    }
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Warning, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Error, fmt, std::forward<Args>(args)...);
  }

  const std::string& serverType() const { return ctx_.server_type; }
  const std::string& zone() const { return ctx_.zone; }

 private:
  std::shared_ptr<Logger> logger_;
  LogContext ctx_;
};

}  // namespace logging
}  // namespace realmlink
