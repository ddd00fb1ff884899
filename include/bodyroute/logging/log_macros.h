#pragma once

#include "bodyroute/logging/logger_registry.h"

#ifdef BODYROUTE_LOG_DISABLE
#define BODYROUTE_LOG(level, ...) ((void)0)
#define BODYROUTE_LOG_WITH_CONTEXT(level, context, ...) ((void)0)
#else
#define BODYROUTE_LOG(level, ...)                                           \
  do {                                                                      \
    if (::bodyroute::logging::LoggerRegistry::instance().shouldLog(         \
            BODYROUTE_LOG_COMPONENT,                                        \
            ::bodyroute::logging::LogLevel::level)) {                       \
      ::bodyroute::logging::LoggerRegistry::instance()                      \
          .getOrCreateLogger(BODYROUTE_LOG_COMPONENT)                       \
          ->log(::bodyroute::logging::LogLevel::level, __FILE__, __LINE__,  \
                __FUNCTION__, __VA_ARGS__);                                 \
    }                                                                       \
  } while (0)

// Context-aware logging; the context carries the request id
#define BODYROUTE_LOG_WITH_CONTEXT(level, context, ...)                      \
  do {                                                                       \
    auto logger =                                                            \
        ::bodyroute::logging::LoggerRegistry::instance().getOrCreateLogger(  \
            BODYROUTE_LOG_COMPONENT);                                        \
    if (logger->shouldLog(::bodyroute::logging::LogLevel::level)) {          \
      logger->logWithContext(::bodyroute::logging::LogLevel::level, context, \
                             __VA_ARGS__);                                   \
    }                                                                        \
  } while (0)
#endif

// Component must be defined before using BODYROUTE_LOG
#ifndef BODYROUTE_LOG_COMPONENT
#define BODYROUTE_LOG_COMPONENT "default"
#endif

#define COMPONENT_LOG(component, level, ...)                     \
  ::bodyroute::logging::ComponentLogger(                         \
      ::bodyroute::logging::Component::component, #component)    \
      .log(::bodyroute::logging::LogLevel::level, __VA_ARGS__)
