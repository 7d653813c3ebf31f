/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_STATUS_HPP_INCLUDED
#define HEAPLINE_STATUS_HPP_INCLUDED

#include "base.hpp"

namespace heapline {

// Capacity exhaustion is not in here: it is a sampling transition, not a failure.
enum class ErrorKind : uint8_t {
  None,
  Configuration,   // bad thresholds/rates/buffer sizes, raised at init
  Io,              // create/read/write failure
  Format,          // bad magic/version/checksum/structure
  State,           // tracker not initialized or already finalized
  Cancelled        // cooperative cancellation; partial results travel beside it
};

inline const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:          return "ok";
    case ErrorKind::Configuration: return "configuration";
    case ErrorKind::Io:            return "io";
    case ErrorKind::Format:        return "format";
    case ErrorKind::State:         return "state";
    case ErrorKind::Cancelled:     return "cancelled";
  }
  return "unknown";
}

struct Status {
  ErrorKind   kind = ErrorKind::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }
  explicit operator bool() const { return ok(); }

  static Status success() { return Status{}; }
};

inline Status make_error(ErrorKind kind, const char* fmt, ...) {
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  Status s;
  s.kind = kind;
  s.message = buf;
  return s;
}

} // namespace heapline

#endif // HEAPLINE_STATUS_HPP_INCLUDED
