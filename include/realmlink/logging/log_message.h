#pragma once

#include <unistd.h>

#include <chrono>
#include <map>
#include <string>
#include <thread>

#include "realmlink/logging/log_level.h"

namespace realmlink {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Connection identity ("EP", "de1") when the line belongs to one
  std::string server_type;
  std::string zone;

  std::map<std::string, std::string> key_values;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Context carried by a caller that logs on behalf of one connection
class LogContext {
 public:
  std::string server_type;
  std::string zone;
  Component component{Component::Root};
  std::map<std::string, std::string> key_values;

  void setLocation(const char* file, int line, const char* func) {
    source_file_ = file;
    source_line_ = line;
    source_function_ = func;
  }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.component = component;
    log_msg.file = source_file_;
    log_msg.line = source_line_;
    log_msg.function = source_function_;
    log_msg.server_type = server_type;
    log_msg.zone = zone;
    log_msg.key_values = key_values;
    return log_msg;
  }

 private:
  const char* source_file_{nullptr};
  int source_line_{0};
  const char* source_function_{nullptr};
};

}  // namespace logging
}  // namespace realmlink
