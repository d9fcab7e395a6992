#pragma once

#include "realmlink/logging/logger_registry.h"

// Zero-configuration logging on the default logger
#define LOG(level, ...)                                                      \
  do {                                                                       \
    auto logger__ =                                                          \
        ::realmlink::logging::LoggerRegistry::instance().getDefaultLogger(); \
    if (logger__->shouldLog(::realmlink::logging::LogLevel::level)) {        \
      logger__->log(::realmlink::logging::LogLevel::level, __FILE__,         \
                    __LINE__, __FUNCTION__, __VA_ARGS__);                    \
    }                                                                        \
  } while (0)

#define LOG_DEBUG(...) LOG(Debug, __VA_ARGS__)
#define LOG_INFO(...) LOG(Info, __VA_ARGS__)
#define LOG_NOTICE(...) LOG(Notice, __VA_ARGS__)
#define LOG_WARNING(...) LOG(Warning, __VA_ARGS__)
#define LOG_ERROR(...) LOG(Error, __VA_ARGS__)
#define LOG_CRITICAL(...) LOG(Critical, __VA_ARGS__)

// Component must be defined before including this header
#ifndef REALMLINK_LOG_COMPONENT
#define REALMLINK_LOG_COMPONENT "root"
#endif

#ifdef REALMLINK_LOG_DISABLE
#define REALMLINK_LOG(level, ...) ((void)0)
#else
#define REALMLINK_LOG(level, ...)                                         \
  do {                                                                    \
    if (::realmlink::logging::LoggerRegistry::instance().shouldLog(       \
            REALMLINK_LOG_COMPONENT,                                      \
            ::realmlink::logging::LogLevel::level)) {                     \
      ::realmlink::logging::LoggerRegistry::instance()                    \
          .getOrCreateLogger(REALMLINK_LOG_COMPONENT)                     \
          ->log(::realmlink::logging::LogLevel::level, __FILE__, __LINE__, \
                __FUNCTION__, __VA_ARGS__);                               \
    }                                                                     \
  } while (0)
#endif
