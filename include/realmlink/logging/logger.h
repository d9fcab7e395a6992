#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "realmlink/logging/log_level.h"
#include "realmlink/logging/log_message.h"
#include "realmlink/logging/log_sink.h"

namespace realmlink {
namespace logging {

class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name, LogMode mode = LogMode::Sync)
      : name_(name), mode_(mode) {}

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Debug)) {
      logImpl(LogLevel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Info)) {
      logImpl(LogLevel::Info, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Warning)) {
      logImpl(LogLevel::Warning, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (shouldLog(LogLevel::Error)) {
      logImpl(LogLevel::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      fmt::format_string<Args...> fmt,
                      Args&&... args) {
    if (shouldLog(level)) {
      auto msg =
          ctx.toLogMessage(level, fmt::format(fmt, std::forward<Args>(args)...));
      msg.logger_name = name_;
      logMessage(msg);
    }
  }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           fmt::format_string<Args...> fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = fmt::format(fmt, std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  void setMode(LogMode mode) { mode_ = mode; }

  bool shouldLog(LogLevel level) const {
    if (mode_ == LogMode::NoOp) {
      return false;
    }
    LogLevel current = effective_level_.load(std::memory_order_relaxed);
    return current != LogLevel::Off && level >= current;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 protected:
  void logImpl(LogLevel level, const std::string& msg) {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.logger_name = name_;
    logMessage(log_msg);
  }

  void logMessage(const LogMessage& msg) {
    if (mode_ == LogMode::NoOp) {
      return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

 private:
  std::atomic<LogLevel> effective_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::string name_;
  std::atomic<LogMode> mode_;
  mutable std::mutex sink_mutex_;
};

using LoggerSharedPtr = std::shared_ptr<Logger>;

}  // namespace logging
}  // namespace realmlink
