#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "realmlink/logging/log_formatter.h"
#include "realmlink/logging/log_message.h"

namespace realmlink {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  virtual bool supportsRotation() const { return false; }
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink (stdout/stderr)
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

// File sink with size and age based rotation
class RotatingFileSink : public LogSink {
 public:
  struct Config {
    std::string base_filename;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
    std::chrono::seconds rotation_period{std::chrono::hours(24)};
    bool auto_flush = true;
  };

  explicit RotatingFileSink(const Config& config);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::File; }
  bool supportsRotation() const override { return true; }

 private:
  void openFile();
  void closeFile();
  void rotate();

  Config config_;
  std::ofstream file_;
  std::chrono::system_clock::time_point last_rotation_;
  size_t current_size_{0};
  std::mutex mutex_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createFileSink(const std::string& filename);
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
};

}  // namespace logging
}  // namespace realmlink
