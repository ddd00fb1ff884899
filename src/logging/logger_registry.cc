#include "bodyroute/logging/logger_registry.h"

namespace bodyroute {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() : global_level_(LogLevel::Info) {
  initializeDefaults();
}

void LoggerRegistry::initializeDefaults() {
  default_logger_ = std::make_shared<Logger>("default", LogMode::Sync);
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
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

  for (auto& [name, logger] : loggers_) {
    bool has_pattern = false;
    for (const auto& pattern : patterns_) {
      if (std::regex_match(name, pattern.pattern)) {
        has_pattern = true;
        break;
      }
    }

    if (!has_pattern) {
      logger->setLevel(level);
    }
  }
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);

  patterns_.emplace_back(pattern, level);

  for (auto& [name, logger] : loggers_) {
    if (std::regex_match(name, patterns_.back().pattern)) {
      logger->setLevel(level);
    }
  }
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = sink;
  for (auto& [name, logger] : loggers_) {
    logger->setSink(sink);
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  return level >= getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  // Later patterns override earlier ones
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }
  return global_level_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());

  for (const auto& [name, logger] : loggers_) {
    names.push_back(name);
  }

  return names;
}

std::string ComponentLogger::getComponentPath(Component comp,
                                              const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace bodyroute
