#include "bodyroute/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace bodyroute {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";
  oss << "[T:" << msg.thread_id << "] ";

  if (msg.component != Component::Root) {
    oss << '[' << componentToString(msg.component);
    if (!msg.component_name.empty()) {
      oss << '.' << msg.component_name;
    }
    oss << "] ";
  }

  oss << '[' << msg.logger_name << "] ";

  if (msg.file && msg.line > 0) {
    oss << '[' << msg.file << ':' << msg.line;
    if (msg.function) {
      oss << " " << msg.function << "()";
    }
    oss << "] ";
  }

  if (!msg.request_id.empty()) {
    oss << "[req:" << msg.request_id << "] ";
  }

  oss << msg.message;

  if (!msg.route_id.empty()) {
    oss << " route=" << msg.route_id;
  }
  if (msg.bytes_processed > 0) {
    oss << " bytes=" << msg.bytes_processed;
  }

  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << "{";
  oss << "\"timestamp\":\"" << formatTimestamp(msg.timestamp) << "\"";
  oss << ",\"level\":\"" << logLevelToString(msg.level) << "\"";
  oss << ",\"logger\":\"" << escapeJson(msg.logger_name) << "\"";
  oss << ",\"thread\":\"" << msg.thread_id << "\"";

  if (msg.component != Component::Root) {
    oss << ",\"component\":\"" << componentToString(msg.component) << "\"";
    if (!msg.component_name.empty()) {
      oss << ",\"component_name\":\"" << escapeJson(msg.component_name) << "\"";
    }
  }

  if (msg.file) {
    oss << ",\"file\":\"" << escapeJson(msg.file) << "\"";
    oss << ",\"line\":" << msg.line;
    if (msg.function) {
      oss << ",\"function\":\"" << escapeJson(msg.function) << "\"";
    }
  }

  if (!msg.request_id.empty()) {
    oss << ",\"request_id\":\"" << escapeJson(msg.request_id) << "\"";
  }

  oss << ",\"message\":\"" << escapeJson(msg.message) << "\"";

  if (!msg.route_id.empty()) {
    oss << ",\"route_id\":\"" << escapeJson(msg.route_id) << "\"";
  }
  if (msg.bytes_processed > 0) {
    oss << ",\"bytes_processed\":" << msg.bytes_processed;
  }

  if (!msg.key_values.empty()) {
    oss << ",\"metadata\":{";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ",";
      oss << "\"" << escapeJson(kv.first) << "\":\"" << escapeJson(kv.second)
          << "\"";
      first = false;
    }
    oss << "}";
  }

  oss << "}";

  return oss.str();
}

std::string JsonFormatter::escapeJson(const std::string& str) const {
  std::ostringstream oss;

  for (char c : str) {
    switch (c) {
      case '"':
        oss << "\\\"";
        break;
      case '\\':
        oss << "\\\\";
        break;
      case '\b':
        oss << "\\b";
        break;
      case '\f':
        oss << "\\f";
        break;
      case '\n':
        oss << "\\n";
        break;
      case '\r':
        oss << "\\r";
        break;
      case '\t':
        oss << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<unsigned>(static_cast<unsigned char>(c))
              << std::dec;
        } else {
          // Multi-byte UTF-8 sequences pass through unchanged
          oss << c;
        }
        break;
    }
  }

  return oss.str();
}

}  // namespace logging
}  // namespace bodyroute
