// src/core/Log.h
#pragma once

#include <cstdarg>
#include <filesystem>
#include <string>
#include <string_view>

#if defined(__GNUC__) || defined(__clang__)
  #define HILLCLIMB_PRINTF_ATTR(fmtIdx, argIdx) __attribute__((format(printf, fmtIdx, argIdx)))
#else
  #define HILLCLIMB_PRINTF_ATTR(fmtIdx, argIdx)
#endif

namespace hillclimb::core {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

struct LogOptions {
    LogLevel              level = LogLevel::Info;
    std::filesystem::path file;          // empty => console only
    bool                  color = true;
};

// Installs the "hillclimb" logger as the spdlog default (stderr + optional file).
// Calling it again replaces the previous sinks.
void LogInit(const LogOptions& opt);
void LogShutdown();

void SetLogLevel(LogLevel level);

// Accepts trace|debug|info|warn|warning|error|critical|off (case-insensitive).
bool ParseLogLevel(std::string_view text, LogLevel& out) noexcept;
const char* LogLevelName(LogLevel level) noexcept;

// Printf-style logging entry point (thread-safe).
void LogMessage(LogLevel level, const char* fmt, ...) HILLCLIMB_PRINTF_ATTR(2, 3);

// va_list variant to enable adapter wrappers and forwarding
void LogMessageV(LogLevel level, const char* fmt, va_list args);

// Cheap check so callers can skip building expensive trace arguments.
bool ShouldLog(LogLevel level) noexcept;

} // namespace hillclimb::core

#ifndef HILLCLIMB_LOG_TRACE
  #define HILLCLIMB_LOG_TRACE(...)    ::hillclimb::core::LogMessage(::hillclimb::core::LogLevel::Trace,    __VA_ARGS__)
#endif
#ifndef HILLCLIMB_LOG_DEBUG
  #define HILLCLIMB_LOG_DEBUG(...)    ::hillclimb::core::LogMessage(::hillclimb::core::LogLevel::Debug,    __VA_ARGS__)
#endif
#ifndef HILLCLIMB_LOG_INFO
  #define HILLCLIMB_LOG_INFO(...)     ::hillclimb::core::LogMessage(::hillclimb::core::LogLevel::Info,     __VA_ARGS__)
#endif
#ifndef HILLCLIMB_LOG_WARN
  #define HILLCLIMB_LOG_WARN(...)     ::hillclimb::core::LogMessage(::hillclimb::core::LogLevel::Warn,     __VA_ARGS__)
#endif
#ifndef HILLCLIMB_LOG_ERROR
  #define HILLCLIMB_LOG_ERROR(...)    ::hillclimb::core::LogMessage(::hillclimb::core::LogLevel::Error,    __VA_ARGS__)
#endif
#ifndef HILLCLIMB_LOG_CRITICAL
  #define HILLCLIMB_LOG_CRITICAL(...) ::hillclimb::core::LogMessage(::hillclimb::core::LogLevel::Critical, __VA_ARGS__)
#endif
