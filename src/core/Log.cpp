#include "starhelm/core/Log.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace starhelm::core {
namespace {
  std::mutex g_logMutex;
  LogLevel g_level = LogLevel::Info;
  std::ostream* g_stream = nullptr;

  std::tm localTime(std::time_t t) {
    std::tm out{};
  #if defined(_WIN32)
    localtime_s(&out, &t);
  #else
    localtime_r(&t, &out);
  #endif
    return out;
  }

  std::string nowTimeString() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto tt = system_clock::to_time_t(now);
    const auto tm = localTime(tt);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
  }

  std::string lowered(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
  }
} // namespace

void setLogLevel(LogLevel level) { g_level = level; }
LogLevel getLogLevel() { return g_level; }

std::string_view toString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "UNKNOWN";
}

bool parseLogLevel(std::string_view text, LogLevel& out) {
  const std::string s = lowered(text);
  if (s == "trace") { out = LogLevel::Trace; return true; }
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info")  { out = LogLevel::Info;  return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  if (s == "off" || s == "none") { out = LogLevel::Off; return true; }
  return false;
}

void setLogStream(std::ostream* stream) {
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_stream = stream;
}

void log(LogLevel level, std::string_view message) {
  if (level < g_level || g_level == LogLevel::Off) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostream& os = g_stream ? *g_stream
                              : ((level >= LogLevel::Warn) ? std::cerr : std::cout);
  os << "[" << nowTimeString() << "]"
     << "[" << toString(level) << "] "
     << message
     << "\n";
}

} // namespace starhelm::core
