/**
 * @file parse_error.h
 * @brief Configuration parse errors with field and file context
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace realmlink {
namespace config {

/**
 * Configuration parse error carrying the dotted field path and the file it
 * came from. what() renders all of it, message() only the cause.
 */
class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& message,
                   const std::string& field = "",
                   const std::string& file = "",
                   int line = -1)
      : std::runtime_error(formatError(message, field, file, line)),
        message_(message),
        field_(field),
        file_(file),
        line_(line) {}

  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }
  int line() const { return line_; }
  const std::string& message() const { return message_; }

 private:
  static std::string formatError(const std::string& msg,
                                 const std::string& field,
                                 const std::string& file,
                                 int line) {
    std::ostringstream oss;
    oss << "Configuration parse error";

    if (!file.empty()) {
      oss << " in " << file;
      if (line > 0) {
        oss << ":" << line;
      }
    }

    if (!field.empty()) {
      oss << " at field '" << field << "'";
    }

    oss << ": " << msg;
    return oss.str();
  }

  std::string message_;
  std::string field_;
  std::string file_;
  int line_;
};

/**
 * Tracks the field path while a document is walked so errors can name the
 * offending key.
 */
class ParseContext {
 public:
  ParseContext() = default;
  explicit ParseContext(const std::string& file) : current_file_(file) {}

  void pushField(const std::string& field) { path_stack_.push_back(field); }

  void popField() {
    if (!path_stack_.empty()) {
      path_stack_.pop_back();
    }
  }

  std::string getCurrentPath() const {
    std::ostringstream oss;
    for (size_t i = 0; i < path_stack_.size(); ++i) {
      if (i > 0)
        oss << ".";
      oss << path_stack_[i];
    }
    return oss.str();
  }

  void setFile(const std::string& file) { current_file_ = file; }
  const std::string& getFile() const { return current_file_; }

  ConfigParseError createError(const std::string& message) const {
    return ConfigParseError(message, getCurrentPath(), current_file_);
  }

  class FieldScope {
   public:
    FieldScope(ParseContext& ctx, const std::string& field) : ctx_(ctx) {
      ctx_.pushField(field);
    }

    ~FieldScope() { ctx_.popField(); }

   private:
    ParseContext& ctx_;
  };

 private:
  std::vector<std::string> path_stack_;
  std::string current_file_;
};

/**
 * Read an optional field. Returns false when the key is absent or null,
 * throws ConfigParseError when it has the wrong type.
 */
template <typename T>
bool getOptionalJsonField(const nlohmann::json& j,
                          const std::string& field,
                          T& value,
                          ParseContext& ctx) {
  if (!j.is_object() || !j.contains(field) || j.at(field).is_null()) {
    return false;
  }

  ParseContext::FieldScope scope(ctx, field);

  try {
    value = j.at(field).get<T>();
    return true;
  } catch (const nlohmann::json::exception& e) {
    throw ctx.createError(std::string("Invalid value: ") + e.what());
  }
}

}  // namespace config
}  // namespace realmlink
