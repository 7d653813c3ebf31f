/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_LOG_HPP_INCLUDED
#define HEAPLINE_LOG_HPP_INCLUDED

#include "base.hpp"

namespace heapline {

enum class LogLevel : uint8_t { Detail, Info, Warning, Error, Off };

using LogSink = void(*)(LogLevel level, const char* msg);

inline const char* log_level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Detail:  return "DETAIL";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Off:     return "OFF";
  }
  return "?";
}

// Accepts "detail", "info", "warning"/"warn", "error", "off" (case-insensitive). Returns false otherwise.
inline bool parse_log_level(const char* s, LogLevel& out) {
  if (!s || !*s) return false;
  char tmp[16];
  size_t i = 0;
  for (; s[i] && i + 1 < sizeof(tmp); ++i) tmp[i] = (char)((s[i] >= 'A' && s[i] <= 'Z') ? s[i] + 32 : s[i]);
  tmp[i] = 0;
  if (!std::strcmp(tmp, "detail"))                             { out = LogLevel::Detail;  return true; }
  if (!std::strcmp(tmp, "info"))                               { out = LogLevel::Info;    return true; }
  if (!std::strcmp(tmp, "warning") || !std::strcmp(tmp, "warn")) { out = LogLevel::Warning; return true; }
  if (!std::strcmp(tmp, "error"))                              { out = LogLevel::Error;   return true; }
  if (!std::strcmp(tmp, "off"))                                { out = LogLevel::Off;     return true; }
  return false;
}

inline void stderr_sink(LogLevel level, const char* msg) {
  std::fprintf(stderr, "[heapline] %s: %s\n", log_level_name(level), msg);
}

struct LogState {
  std::atomic<LogLevel> level { LogLevel::Warning };
  std::atomic<LogSink>  sink  { &stderr_sink };

  // HEAPLINE_LOG_LEVEL is read once, on first use.
  LogState() {
    LogLevel l;
    if (parse_log_level(std::getenv("HEAPLINE_LOG_LEVEL"), l)) level.store(l, std::memory_order_relaxed);
  }
};

inline LogState& log_state() { static LogState S; return S; }

inline void set_log_level(LogLevel l) { log_state().level.store(l, std::memory_order_release); }
inline void set_log_sink(LogSink s)   { log_state().sink.store(s ? s : &stderr_sink, std::memory_order_release); }

inline bool log_enabled(LogLevel l) {
  LogLevel cur = log_state().level.load(std::memory_order_relaxed);
  return cur != LogLevel::Off && l >= cur;
}

inline void log_v(LogLevel level, const char* fmt, va_list ap) {
  char buf[1024];
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  log_state().sink.load(std::memory_order_acquire)(level, buf);
}

inline void log(LogLevel level, const char* fmt, ...) {
  if (!log_enabled(level)) return;
  va_list ap;
  va_start(ap, fmt);
  log_v(level, fmt, ap);
  va_end(ap);
}

} // namespace heapline

#define HEAPLINE_LOG_DETAIL(...)  do{ if (::heapline::log_enabled(::heapline::LogLevel::Detail))  ::heapline::log(::heapline::LogLevel::Detail,  __VA_ARGS__); }while(0)
#define HEAPLINE_LOG_INFO(...)    do{ if (::heapline::log_enabled(::heapline::LogLevel::Info))    ::heapline::log(::heapline::LogLevel::Info,    __VA_ARGS__); }while(0)
#define HEAPLINE_LOG_WARN(...)    do{ if (::heapline::log_enabled(::heapline::LogLevel::Warning)) ::heapline::log(::heapline::LogLevel::Warning, __VA_ARGS__); }while(0)
#define HEAPLINE_LOG_ERROR(...)   do{ if (::heapline::log_enabled(::heapline::LogLevel::Error))   ::heapline::log(::heapline::LogLevel::Error,   __VA_ARGS__); }while(0)

#endif // HEAPLINE_LOG_HPP_INCLUDED
