#pragma once

#include <mutex>
#include <regex>
#include <unordered_map>
#include <vector>

#include "bodyroute/logging/logger.h"

namespace bodyroute {
namespace logging {

// Pattern for glob-style log level control, e.g. "filter.*"
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

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
  // Singleton instance with zero-configuration defaults
  static LoggerRegistry& instance();

  // Get or create a named logger sharing the default sink
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  // Set global log level; loggers matched by a pattern keep their level
  void setGlobalLevel(LogLevel level);

  // Pattern-based log level control
  void setPattern(const std::string& pattern, LogLevel level);

  // Replace the sink of every logger, existing and future
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  std::vector<std::string> getLoggerNames() const;

 private:
  LoggerRegistry();

  void initializeDefaults();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;

  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

// Logger bound to a component, named "<Component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component), name_(name) {
    logger_ = LoggerRegistry::instance().getOrCreateLogger(
        getComponentPath(component, name));
  }

  template <typename... Args>
  void log(LogLevel level, const char* fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      LogContext ctx;
      ctx.component = component_;
      ctx.component_name = name_;
      logger_->logWithContext(level, ctx, fmt, std::forward<Args>(args)...);
    }
  }

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  Component component_;
  std::string name_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace bodyroute
