// src/core/Log.h
#pragma once

#include <cstdarg>
#include <filesystem>
#include <string_view>

#if defined(__GNUC__) || defined(__clang__)
  #define OUTPOST_PRINTF_ATTR(fmtIdx, argIdx) __attribute__((format(printf, fmtIdx, argIdx)))
#else
  #define OUTPOST_PRINTF_ATTR(fmtIdx, argIdx)
#endif

namespace outpost::core {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical };

[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

// Accepts trace/debug/info/warn/warning/error/critical (case-insensitive).
[[nodiscard]] bool LogLevelFromName(std::string_view name, LogLevel& out) noexcept;

// Installs the "outpost" spdlog logger (rotating outpost.log under `logDir` + stderr)
// as the default logger. Safe to call more than once; the previous logger is replaced.
void LogInit(const std::filesystem::path& logDir);
void LogShutdown();

void SetLogLevel(LogLevel level);

// Printf-style logging entry point (thread-safe).
// Messages logged before LogInit go to spdlog's default logger.
void LogMessage(LogLevel level, const char* fmt, ...) OUTPOST_PRINTF_ATTR(2, 3);

// va_list variant to enable adapter wrappers and forwarding
void LogMessageV(LogLevel level, const char* fmt, va_list args);

} // namespace outpost::core

#ifndef LOG_TRACE
  #define LOG_TRACE(...)    ::outpost::core::LogMessage(::outpost::core::LogLevel::Trace,    __VA_ARGS__)
#endif
#ifndef LOG_DEBUG
  #define LOG_DEBUG(...)    ::outpost::core::LogMessage(::outpost::core::LogLevel::Debug,    __VA_ARGS__)
#endif
#ifndef LOG_INFO
  #define LOG_INFO(...)     ::outpost::core::LogMessage(::outpost::core::LogLevel::Info,     __VA_ARGS__)
#endif
#ifndef LOG_WARN
  #define LOG_WARN(...)     ::outpost::core::LogMessage(::outpost::core::LogLevel::Warn,     __VA_ARGS__)
#endif
#ifndef LOG_ERROR
  #define LOG_ERROR(...)    ::outpost::core::LogMessage(::outpost::core::LogLevel::Error,    __VA_ARGS__)
#endif
#ifndef LOG_CRITICAL
  #define LOG_CRITICAL(...) ::outpost::core::LogMessage(::outpost::core::LogLevel::Critical, __VA_ARGS__)
#endif
