#include "realmlink/logging/logger_registry.h"

#include <algorithm>

namespace realmlink {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() { initializeDefaults(); }

void LoggerRegistry::initializeDefaults() {
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default", LogMode::Sync);
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);

  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name, LogMode::Sync);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;

  // Recompute so pattern and component overrides keep precedence
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[component] = level;

  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);

  for (auto& entry : loggers_) {
    if (std::regex_match(entry.first, patterns_.back().pattern)) {
      entry.second->setLevel(level);
    }
  }
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Names without a logger get the level a new logger would be given
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel effective = getEffectiveLevelLocked(name);
  return effective != LogLevel::Off && level >= effective;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  std::string comp_str = name.substr(0, name.find('.'));
  for (int i = 0; i < static_cast<int>(Component::Count); ++i) {
    Component comp = static_cast<Component>(i);
    if (comp_str == componentToString(comp)) {
      auto it = component_levels_.find(comp);
      if (it != component_levels_.end()) {
        return it->second;
      }
      break;
    }
  }

  return global_level_;
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

std::string LoggerRegistry::getComponentPath(Component comp,
                                             const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace realmlink
