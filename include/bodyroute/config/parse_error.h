/**
 * @file parse_error.h
 * @brief Error type and path tracking for filter configuration parsing
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bodyroute {
namespace config {

/**
 * @brief Configuration parse error carrying the offending field path
 */
class ConfigParseError : public std::runtime_error {
 public:
  explicit ConfigParseError(const std::string& message,
                            const std::string& field = "")
      : std::runtime_error(formatError(message, field)),
        message_(message),
        field_(field) {}

  const std::string& field() const { return field_; }
  const std::string& message() const { return message_; }

 private:
  static std::string formatError(const std::string& msg,
                                 const std::string& field) {
    std::ostringstream oss;
    oss << "Configuration parse error";
    if (!field.empty()) {
      oss << " at field '" << field << "'";
    }
    oss << ": " << msg;
    return oss.str();
  }

  std::string message_;
  std::string field_;
};

/**
 * @brief Tracks the field path being parsed, e.g. "rules.1.route"
 */
class ParseContext {
 public:
  ParseContext() = default;

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

  ConfigParseError createError(const std::string& message) const {
    return ConfigParseError(message, getCurrentPath());
  }

  /**
   * @brief RAII helper for field context
   */
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
};

}  // namespace config
}  // namespace bodyroute
