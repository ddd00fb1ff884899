#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>

#include "bodyroute/logging/log_level.h"

namespace bodyroute {
namespace logging {

// A single log record with its metadata
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Component information
  Component component{Component::Root};
  std::string component_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  std::thread::id thread_id;

  // Correlation
  std::string request_id;

  // Routing fields
  std::string route_id;
  size_t bytes_processed{0};

  std::map<std::string, std::string> key_values;

  // Logger information
  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        thread_id(std::this_thread::get_id()) {}
};

// Context that travels with a single request through the filter
class LogContext {
 public:
  std::string request_id;

  Component component{Component::Root};
  std::string component_name;

  std::string route_id;
  size_t bytes_processed{0};

  std::map<std::string, std::string> metadata;

  // Timestamp and thread are those of the caller, not of the context's
  // creation
  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;

    log_msg.component = component;
    log_msg.component_name = component_name;

    log_msg.request_id = request_id;
    log_msg.route_id = route_id;
    log_msg.bytes_processed = bytes_processed;
    log_msg.key_values = metadata;

    return log_msg;
  }
};

}  // namespace logging
}  // namespace bodyroute
