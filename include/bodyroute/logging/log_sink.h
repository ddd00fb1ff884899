#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <mutex>

#include "bodyroute/logging/log_formatter.h"
#include "bodyroute/logging/log_message.h"

namespace bodyroute {
namespace logging {

// Base sink interface
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink (stdout/stderr)
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream << formatter_->format(msg) << std::endl;
  }

  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream.flush();
  }

  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Forwards formatted records to the embedding proxy's own log facility
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(callback) {}

  void log(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg.level, msg.logger_name, formatter_->format(msg));
    }
  }

  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createExternalSink(
      ExternalSink::LogCallback callback) {
    return std::make_unique<ExternalSink>(callback);
  }
};

}  // namespace logging
}  // namespace bodyroute
