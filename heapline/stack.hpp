/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_STACK_HPP_INCLUDED
#define HEAPLINE_STACK_HPP_INCLUDED

#include "base.hpp"

#ifndef __has_include
  #define __has_include(x) 0
#endif

#if defined(_WIN32)
  #define HEAPLINE_HAVE_EXECINFO 0
#elif __has_include(<execinfo.h>)
  #include <execinfo.h>        // backtrace(), backtrace_symbols()
  #define HEAPLINE_HAVE_EXECINFO 1
#else
  #define HEAPLINE_HAVE_EXECINFO 0
#endif

#if __has_include(<cxxabi.h>)
  #include <cxxabi.h>          // abi::__cxa_demangle
  #define HEAPLINE_HAVE_CXXABI 1
#else
  #define HEAPLINE_HAVE_CXXABI 0
#endif

namespace heapline {

// Fills `out` with up to `max_depth` return addresses of the caller, skipping
// `skip` innermost frames (this function is always skipped). Returns the count.
inline size_t capture_stack(Frame* out, size_t max_depth, size_t skip = 0) {
  if (!out || max_depth == 0) return 0;
#if HEAPLINE_HAVE_EXECINFO
  void* raw[HEAPLINE_STACK_DEPTH + 8];
  const size_t want = std::min(max_depth + skip + 1, sizeof(raw) / sizeof(raw[0]));
  int got = ::backtrace(raw, (int)want);
  size_t n = 0;
  for (int i = (int)(skip + 1); i < got && n < max_depth; ++i) out[n++] = (Frame)reinterpret_cast<uintptr_t>(raw[i]);
  return n;
#elif defined(_WIN32)
  void* raw[HEAPLINE_STACK_DEPTH + 8];
  const size_t want = std::min(max_depth, sizeof(raw) / sizeof(raw[0]));
  USHORT got = ::CaptureStackBackTrace((ULONG)(skip + 1), (ULONG)want, raw, nullptr);
  for (USHORT i = 0; i < got; ++i) out[i] = (Frame)reinterpret_cast<uintptr_t>(raw[i]);
  return got;
#else
  (void)skip;
  return 0;
#endif
}

inline std::string demangle(const char* name) {
#if HEAPLINE_HAVE_CXXABI
  int status = 0;
  char* d = abi::__cxa_demangle(name, nullptr, nullptr, &status);
  if (d) { std::string s(d); std::free(d); return s; }
#endif
  return name ? name : "unknown";
}

// Best-effort "function" for an address in this process; hex address otherwise.
inline std::string describe_frame(Frame f) {
  char hex[24];
  std::snprintf(hex, sizeof(hex), "0x%016" PRIx64, f);
#if HEAPLINE_HAVE_EXECINFO
  void* p = reinterpret_cast<void*>((uintptr_t)f);
  char** sym = ::backtrace_symbols(&p, 1);
  if (!sym) return hex;
  std::string s(sym[0]);
  std::free(sym);
  size_t open = s.find('('), plus = s.find('+', open == std::string::npos ? 0 : open);
  if (open != std::string::npos && plus != std::string::npos && plus > open + 1)
    return demangle(s.substr(open + 1, plus - open - 1).c_str());
  return s.empty() ? std::string(hex) : s;
#else
  return hex;
#endif
}

} // namespace heapline

#endif // HEAPLINE_STACK_HPP_INCLUDED
