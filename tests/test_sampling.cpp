/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#include "test_support.hpp"

using namespace heapline;

static int g_cap_warnings = 0;
static int g_other_warnings = 0;

static void counting_sink(LogLevel level, const char* msg) {
  if (level != LogLevel::Warning) return;
  if (contains(msg, "max_records_per_thread")) ++g_cap_warnings;
  else ++g_other_warnings;
}

int main() {
  set_log_level(LogLevel::Warning);

  // Invalid configurations are rejected up front
  {
    SamplingConfig c;
    assert(validate_sampling_config(c).ok());

    c = SamplingConfig{}; c.medium_sample_rate = 1.5;
    Status s = validate_sampling_config(c);
    assert(!s.ok() && s.kind == ErrorKind::Configuration);
    assert(contains(s.message, "medium_sample_rate"));

    c = SamplingConfig{}; c.small_sample_rate = -0.1;
    assert(validate_sampling_config(c).kind == ErrorKind::Configuration);

    c = SamplingConfig{}; c.medium_size_threshold = c.critical_size_threshold;
    assert(validate_sampling_config(c).kind == ErrorKind::Configuration);

    c = SamplingConfig{}; c.frequency_sample_interval = 0;
    assert(validate_sampling_config(c).kind == ErrorKind::Configuration);

    c = SamplingConfig{}; c.event_buffer_records = 0;
    assert(validate_sampling_config(c).kind == ErrorKind::Configuration);

    assert(validate_sampling_config(SamplingConfig::high_precision()).ok());
    assert(validate_sampling_config(SamplingConfig::performance_optimized()).ok());
    assert(validate_sampling_config(SamplingConfig::leak_detection()).ok());
  }

  // Critical sizes are always Full
  {
    SamplingPolicy p(SamplingConfig{}, 1);
    for (int i = 0; i < 100; ++i) assert(p.classify_allocation(64 * 1024) == Disposition::Full);
    assert(p.stats().full_allocations == 100);
  }

  // Same seed and thread id give the same decisions
  {
    SamplingConfig c;
    c.medium_sample_rate = 0.3;
    c.small_sample_rate = 0.2;
    SamplingPolicy a(c, 7), b(c, 7);
    for (int i = 0; i < 5000; ++i) {
      uint64_t size = (uint64_t)(i % 300) + 1;
      assert(a.classify_allocation(size) == b.classify_allocation(size));
    }
    SamplingPolicy other(c, 8);
    int differ = 0;
    SamplingPolicy again(c, 7);
    for (int i = 0; i < 5000; ++i) {
      uint64_t size = (uint64_t)(i % 300) + 1;
      if (again.classify_allocation(size) != other.classify_allocation(size)) ++differ;
    }
    assert(differ > 0);
  }

  // Medium allocations are never dropped: Full + FrequencyOnly == M
  {
    SamplingConfig c;
    c.medium_sample_rate = 0.25;
    SamplingPolicy p(c, 3);
    const uint64_t M = 10000;
    for (uint64_t i = 0; i < M; ++i) assert(p.classify_allocation(512) != Disposition::Dropped);
    assert(p.stats().full_allocations + p.stats().frequency_only_allocations == M);
    assert(p.stats().dropped_allocations == 0);
    // every 100th one is forced Full
    assert(p.stats().full_allocations >= M / c.frequency_sample_interval);
  }

  // Small allocations below the rate are dropped, except every Nth
  {
    SamplingConfig c;
    c.small_sample_rate = 0.0;
    c.frequency_sample_interval = 10;
    SamplingPolicy p(c, 4);
    for (int i = 0; i < 100; ++i) (void)p.classify_allocation(8);
    assert(p.stats().full_allocations == 10);
    assert(p.stats().dropped_allocations == 90);
  }

  // The record cap degrades to FrequencyOnly and warns exactly once
  {
    set_log_sink(&counting_sink);
    SamplingConfig c;
    c.max_records_per_thread = 5;
    SamplingPolicy p(c, 9);
    for (int i = 0; i < 20; ++i) (void)p.classify_allocation(1 << 20);
    for (int i = 0; i < 5; ++i) assert(p.classify_deallocation() == Disposition::FrequencyOnly);
    assert(p.stats().full_allocations == 5);
    assert(p.stats().frequency_only_allocations == 15);
    assert(p.stats().frequency_only_deallocations == 5);
    assert(g_cap_warnings == 1);
    assert(g_other_warnings == 0);
    set_log_sink(nullptr);
  }

  // Deallocations are Full until the cap
  {
    SamplingPolicy p(SamplingConfig{}, 10);
    assert(p.classify_deallocation() == Disposition::Full);
    assert(p.stats().full_deallocations == 1);
  }

  std::cout << "OK\n";
  return 0;
}
