#pragma once

#include <cstdint>
#include <string>

namespace bodyroute {
namespace logging {

// Severity levels, lowest to highest (RFC-5424 ordering)
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Off = 6
};

// Logging mode selection
enum class LogMode {
  Sync,  // Direct logging through the sink
  NoOp   // Drop everything (hot paths, benchmarks)
};

// Component identifiers for hierarchical logging
enum class Component {
  Root,
  Filter,
  Config,
  Json,
  Host,
  Count
};

// Sink types
enum class SinkType { Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

inline LogLevel stringToLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "NOTICE" || str == "notice") return LogLevel::Notice;
  if (str == "WARNING" || str == "warning") return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return LogLevel::Info; // Default
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "Root";
    case Component::Filter: return "Filter";
    case Component::Config: return "Config";
    case Component::Json: return "Json";
    case Component::Host: return "Host";
    default: return "Unknown";
  }
}

} // namespace logging
} // namespace bodyroute
