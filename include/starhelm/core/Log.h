#pragma once

#include <iosfwd>
#include <string_view>

namespace starhelm::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Accepts "trace", "debug", "info", "warn", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parseLogLevel(std::string_view text, LogLevel& out);

// Redirect every level to one stream (e.g. std::cerr while stdout carries JSON).
// Passing nullptr restores the default split: Trace..Info -> stdout, Warn.. -> stderr.
void setLogStream(std::ostream* stream);

void log(LogLevel level, std::string_view message);

} // namespace starhelm::core

// Convenience macros
#define STARHELM_LOG_TRACE(msg) ::starhelm::core::log(::starhelm::core::LogLevel::Trace, (msg))
#define STARHELM_LOG_DEBUG(msg) ::starhelm::core::log(::starhelm::core::LogLevel::Debug, (msg))
#define STARHELM_LOG_INFO(msg)  ::starhelm::core::log(::starhelm::core::LogLevel::Info,  (msg))
#define STARHELM_LOG_WARN(msg)  ::starhelm::core::log(::starhelm::core::LogLevel::Warn,  (msg))
#define STARHELM_LOG_ERROR(msg) ::starhelm::core::log(::starhelm::core::LogLevel::Error, (msg))
