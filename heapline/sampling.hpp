/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_SAMPLING_HPP_INCLUDED
#define HEAPLINE_SAMPLING_HPP_INCLUDED

#include "base.hpp"
#include "log.hpp"
#include "status.hpp"

#include <cmath>

namespace heapline {

// What happens to one event.
//   Full          - persisted as a record with an interned call stack
//   FrequencyOnly - only counted (per-stack frequency and thread counters)
//   Dropped       - not counted at all; total_allocations becomes a lower bound
enum class Disposition : uint8_t { Full, FrequencyOnly, Dropped };

inline const char* disposition_name(Disposition d) {
  switch (d) {
    case Disposition::Full:          return "full";
    case Disposition::FrequencyOnly: return "frequency_only";
    case Disposition::Dropped:       return "dropped";
  }
  return "?";
}

struct SamplingConfig {
  uint64_t critical_size_threshold   = 10 * 1024;  // >= this: always Full
  uint64_t medium_size_threshold     = 64;         // >= this (and below critical): medium class
  double   medium_sample_rate        = 0.1;
  double   small_sample_rate         = 0.01;
  uint64_t frequency_sample_interval = 100;        // every Nth allocation of a class is forced Full
  uint64_t max_records_per_thread    = 1000000;    // cap on Full records, then FrequencyOnly
  uint32_t event_buffer_records      = HEAPLINE_DEFAULT_BUFFER_RECORDS;
  uint64_t seed                      = 0x2545F4914F6CDD1Dull;

  static SamplingConfig defaults() { return SamplingConfig{}; }

  // Debugging: more of everything.
  static SamplingConfig high_precision() {
    SamplingConfig c;
    c.critical_size_threshold = 4 * 1024;
    c.medium_size_threshold = 32;
    c.medium_sample_rate = 0.5;
    c.small_sample_rate = 0.1;
    c.frequency_sample_interval = 10;
    return c;
  }

  // Production: only big allocations and a sparse baseline.
  static SamplingConfig performance_optimized() {
    SamplingConfig c;
    c.critical_size_threshold = 50 * 1024;
    c.medium_size_threshold = 256;
    c.medium_sample_rate = 0.05;
    c.small_sample_rate = 0.001;
    c.frequency_sample_interval = 1000;
    c.max_records_per_thread = 100000;
    return c;
  }

  // Leak hunting: low critical threshold, dense medium sampling.
  static SamplingConfig leak_detection() {
    SamplingConfig c;
    c.critical_size_threshold = 1024;
    c.medium_size_threshold = 32;
    c.medium_sample_rate = 0.8;
    c.small_sample_rate = 0.01;
    c.frequency_sample_interval = 20;
    return c;
  }
};

inline bool rate_ok(double r) { return !std::isnan(r) && r >= 0.0 && r <= 1.0; }

// Configuration errors are reported here, at init, never from classify_*.
inline Status validate_sampling_config(const SamplingConfig& c) {
  if (c.critical_size_threshold == 0)
    return make_error(ErrorKind::Configuration, "critical_size_threshold must be greater than 0");
  if (c.medium_size_threshold == 0)
    return make_error(ErrorKind::Configuration, "medium_size_threshold must be greater than 0");
  if (c.medium_size_threshold >= c.critical_size_threshold)
    return make_error(ErrorKind::Configuration,
                      "medium_size_threshold (%" PRIu64 ") must be below critical_size_threshold (%" PRIu64 ")",
                      c.medium_size_threshold, c.critical_size_threshold);
  if (!rate_ok(c.medium_sample_rate))
    return make_error(ErrorKind::Configuration, "medium_sample_rate must be within [0,1], got %g", c.medium_sample_rate);
  if (!rate_ok(c.small_sample_rate))
    return make_error(ErrorKind::Configuration, "small_sample_rate must be within [0,1], got %g", c.small_sample_rate);
  if (c.frequency_sample_interval == 0)
    return make_error(ErrorKind::Configuration, "frequency_sample_interval must be greater than 0");
  if (c.max_records_per_thread == 0)
    return make_error(ErrorKind::Configuration, "max_records_per_thread must be greater than 0");
  if (c.event_buffer_records == 0)
    return make_error(ErrorKind::Configuration, "event_buffer_records must be greater than 0");
  return Status::success();
}

inline void env_u64(const char* name, uint64_t& dst) {
  const char* s = std::getenv(name);
  if (!s || !*s) return;
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s, &end, 10);
  if (errno != 0 || !end || *end != '\0') { HEAPLINE_LOG_WARN("ignoring %s=\"%s\" (not an unsigned integer)", name, s); return; }
  dst = (uint64_t)v;
}

inline void env_rate(const char* name, double& dst) {
  const char* s = std::getenv(name);
  if (!s || !*s) return;
  char* end = nullptr;
  double v = std::strtod(s, &end);
  if (!end || *end != '\0') { HEAPLINE_LOG_WARN("ignoring %s=\"%s\" (not a number)", name, s); return; }
  dst = v;   // range is checked by validate_sampling_config
}

// Environment overrides on top of `base`.
inline SamplingConfig sampling_config_from_env(SamplingConfig base = SamplingConfig::defaults()) {
  env_u64 ("HEAPLINE_CRITICAL_SIZE",   base.critical_size_threshold);
  env_u64 ("HEAPLINE_MEDIUM_SIZE",     base.medium_size_threshold);
  env_rate("HEAPLINE_SAMPLE_MEDIUM",   base.medium_sample_rate);
  env_rate("HEAPLINE_SAMPLE_SMALL",    base.small_sample_rate);
  env_u64 ("HEAPLINE_SAMPLE_INTERVAL", base.frequency_sample_interval);
  env_u64 ("HEAPLINE_MAX_RECORDS",     base.max_records_per_thread);
  return base;
}

struct SamplingStats {
  uint64_t full_allocations = 0;
  uint64_t frequency_only_allocations = 0;
  uint64_t dropped_allocations = 0;
  uint64_t full_deallocations = 0;
  uint64_t frequency_only_deallocations = 0;

  uint64_t full_records() const { return full_allocations + full_deallocations; }
};

// Per-thread, single-owner decision state. Not shared; no synchronization.
struct SamplingPolicy {
  SamplingConfig cfg;
  uint64_t       thread_id;
  uint64_t       rng;
  uint64_t       small_seen = 0;
  uint64_t       medium_seen = 0;
  bool           degraded = false;
  SamplingStats  st;

  SamplingPolicy(const SamplingConfig& c, uint64_t tid)
  : cfg(c), thread_id(tid), rng(c.seed ^ (tid * 0x9E3779B97F4A7C15ull)) {
    if (rng == 0) rng = 0x9E3779B97F4A7C15ull;   // xorshift state must be non-zero
  }

  // xorshift64, 53-bit mantissa -> [0,1)
  double next_uniform() {
    rng ^= rng << 13; rng ^= rng >> 7; rng ^= rng << 17;
    return (double)((rng >> 11) & ((1ull<<53)-1)) / (double)(1ull<<53);
  }

  const SamplingStats& stats() const { return st; }

  bool cap_reached() const { return st.full_records() >= cfg.max_records_per_thread; }

  Disposition degrade_if_capped(Disposition d) {
    if (d != Disposition::Full || !cap_reached()) return d;
    if (!degraded) {
      degraded = true;
      HEAPLINE_LOG_WARN("thread %" PRIu64 ": max_records_per_thread=%" PRIu64
                        " reached, further events are recorded as frequency-only",
                        thread_id, cfg.max_records_per_thread);
    }
    return Disposition::FrequencyOnly;
  }

  Disposition classify_allocation(uint64_t size) {
    Disposition d;
    if (size >= cfg.critical_size_threshold) {
      d = Disposition::Full;
    } else {
      const bool medium = size >= cfg.medium_size_threshold;
      uint64_t& seen = medium ? medium_seen : small_seen;
      ++seen;
      if (seen % cfg.frequency_sample_interval == 0) {
        d = Disposition::Full;
      } else {
        double rate = medium ? cfg.medium_sample_rate : cfg.small_sample_rate;
        if (next_uniform() < rate)  d = Disposition::Full;
        else if (medium)            d = Disposition::FrequencyOnly;
        else                        d = Disposition::Dropped;
      }
    }
    d = degrade_if_capped(d);
    switch (d) {
      case Disposition::Full:          ++st.full_allocations; break;
      case Disposition::FrequencyOnly: ++st.frequency_only_allocations; break;
      case Disposition::Dropped:       ++st.dropped_allocations; break;
    }
    return d;
  }

  // Deallocations are Full until the cap, then FrequencyOnly. Never Dropped.
  Disposition classify_deallocation() {
    Disposition d = degrade_if_capped(Disposition::Full);
    if (d == Disposition::Full) ++st.full_deallocations;
    else                        ++st.frequency_only_deallocations;
    return d;
  }
};

} // namespace heapline

#endif // HEAPLINE_SAMPLING_HPP_INCLUDED
