#pragma once

#include <string>

#include "realmlink/logging/log_message.h"

namespace realmlink {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [2025-01-01 12:00:00.000] [INFO] [EP][de1] message
class DefaultFormatter : public Formatter {
 public:
  explicit DefaultFormatter(bool with_location = false)
      : with_location_(with_location) {}

  std::string format(const LogMessage& msg) const override;

 private:
  bool with_location_;
};

// One JSON object per line
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;

 private:
  std::string escapeJson(const std::string& str) const;
};

}  // namespace logging
}  // namespace realmlink
