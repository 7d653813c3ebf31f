/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#include "test_support.hpp"

#include <set>
#include <thread>

using namespace heapline;

static size_t count_tag(const Container& c, uint8_t tag) {
  size_t n = 0;
  for (const Record& r : c.records) if (r.tag == tag) ++n;
  return n;
}

int main() {
  set_log_level(LogLevel::Error);
  const std::string dir = fresh_dir("recorder");
  const std::vector<Frame> stack_a = { 0x401000, 0x402000, 0x403000 };
  const std::vector<Frame> stack_b = { 0x501000 };

  // Calls before init or after finalize are state errors
  {
    PerThreadRecorder r;
    assert(r.state() == RecorderState::Uninitialized);
    Status s = r.track_allocation(0x10, 64, stack_a.data(), stack_a.size(), 1);
    assert(s.kind == ErrorKind::State);
    assert(r.flush().kind == ErrorKind::State);
    assert(r.finalize().kind == ErrorKind::State);
  }

  // Invalid sampling config fails init and leaves the recorder untouched
  {
    PerThreadRecorder r;
    SamplingConfig bad;
    bad.small_sample_rate = 2.0;
    assert(r.init(dir, bad).kind == ErrorKind::Configuration);
    assert(r.state() == RecorderState::Uninitialized);
    assert(r.thread_id() == 0);
  }

  // Full lifecycle: stack definitions written once, events in order, counters summed
  uint64_t first_id = 0;
  {
    SamplingConfig cfg;
    cfg.event_buffer_records = 4;   // forces intermediate flushes
    PerThreadRecorder r;
    assert(r.init(dir, cfg).ok());
    assert(r.state() == RecorderState::Active);
    assert(r.init(dir, cfg).ok());   // second init on an active recorder is a no-op
    first_id = r.thread_id();
    assert(first_id != 0);

    for (uint64_t i = 0; i < 10; ++i)
      assert(r.track_allocation(0x1000 + i * 0x100, 64 * 1024, stack_a.data(), stack_a.size(), 100 + i).ok());
    assert(r.track_allocation(0x9000, 32 * 1024, stack_b.data(), stack_b.size(), 200).ok());
    for (uint64_t i = 0; i < 5; ++i)
      assert(r.track_deallocation(0x1000 + i * 0x100, stack_b.data(), stack_b.size(), 300 + i).ok());
    assert(r.buffered() < 4);
    assert(r.stats().full_allocations == 11);
    assert(r.stats().full_deallocations == 5);

    assert(r.finalize().ok());
    assert(r.state() == RecorderState::Finalized);
    assert(r.finalize().kind == ErrorKind::State);
    assert(r.track_deallocation(0x9000, nullptr, 0, 400).kind == ErrorKind::State);

    Container ev = read_container(r.events_path());
    assert(ev.ok() && ev.report.checksum_state == ChecksumState::Valid);
    assert(ev.meta.kind == FileKind::ThreadEvents && ev.meta.thread_id == first_id);
    assert(ev.meta.sampling.event_buffer_records == 4);
    assert(count_tag(ev, TAG_STACK_DEF) == 2);
    assert(count_tag(ev, TAG_ALLOC) == 11);
    assert(count_tag(ev, TAG_FREE) == 5);

    // every event follows the definition of its stack
    std::set<uint64_t> defined;
    uint64_t last_ts = 0;
    for (const Record& rec : ev.records) {
      if (rec.tag == TAG_STACK_DEF) {
        StackDef d;
        assert(decode_stack_def(rec.payload, d));
        defined.insert(d.ref.id);
      } else if (rec.tag == TAG_ALLOC) {
        AllocationEvent e;
        assert(decode_alloc(rec.payload, e));
        assert(defined.count(e.call_stack.id) == 1);
        assert(e.timestamp >= last_ts);
        last_ts = e.timestamp;
      } else if (rec.tag == TAG_FREE) {
        DeallocationEvent e;
        assert(decode_free(rec.payload, e));
        assert(defined.count(e.call_stack.id) == 1);
      }
    }

    Container fq = read_container(r.frequency_path());
    assert(fq.ok() && fq.meta.kind == FileKind::ThreadFrequency);
    uint64_t allocs = 0, bytes = 0, frees = 0;
    SamplingStats total;
    for (const Record& rec : fq.records) {
      if (rec.tag == TAG_FREQ_DELTA) {
        FreqDelta d;
        assert(decode_freq_delta(rec.payload, d));
        allocs += d.allocations; bytes += d.bytes; frees += d.deallocations;
      } else if (rec.tag == TAG_COUNTERS) {
        SamplingStats d;
        assert(decode_counters(rec.payload, d));
        total.full_allocations += d.full_allocations;
        total.full_deallocations += d.full_deallocations;
      }
    }
    assert(allocs == 11 && frees == 5);
    assert(bytes == 10 * 64 * 1024 + 32 * 1024);
    assert(total.full_allocations == 11 && total.full_deallocations == 5);
  }

  // Re-init after finalize starts a new recording under a new id
  {
    PerThreadRecorder r;
    assert(r.init(dir, SamplingConfig{}).ok());
    const uint64_t a = r.thread_id();
    assert(r.finalize().ok());
    assert(r.init(dir, SamplingConfig{}).ok());
    assert(r.thread_id() != a && r.thread_id() != first_id);
    assert(file_exists(thread_file_path(dir, a, ".bin")));
    assert(file_exists(thread_file_path(dir, r.thread_id(), ".freq")));
  }   // destructor finalizes the second recording

  // Frequency-only events leave no event record but are counted
  {
    SamplingConfig cfg;
    cfg.medium_sample_rate = 0.0;
    cfg.frequency_sample_interval = 1000000;
    PerThreadRecorder r;
    assert(r.init(dir, cfg).ok());
    for (uint64_t i = 0; i < 50; ++i) assert(r.track_allocation(0x100 + i, 128, stack_a.data(), stack_a.size(), i).ok());
    assert(r.stats().frequency_only_allocations == 50);
    assert(r.buffered() == 0);
    assert(r.finalize().ok());
    Container ev = read_container(r.events_path());
    assert(ev.ok() && count_tag(ev, TAG_ALLOC) == 0 && count_tag(ev, TAG_STACK_DEF) == 0);
  }

  // Unwritable directory: Io error at init
  {
    const std::string blocker = join_path(dir, "not-a-dir");
    FILE* f = std::fopen(blocker.c_str(), "wb");
    assert(f);
    std::fclose(f);
    PerThreadRecorder r;
    Status s = r.init(join_path(blocker, "sub"), SamplingConfig{});
    assert(s.kind == ErrorKind::Io);
    assert(r.state() != RecorderState::Active);
  }

  // Free-function API on worker threads; each thread gets its own id
  {
    const std::string tdir = fresh_dir("recorder-threads");
    std::vector<uint64_t> ids(4, 0);
    std::vector<std::thread> pool;
    for (int t = 0; t < 4; ++t) {
      pool.emplace_back([&, t]() {
        assert(init_thread_tracker(tdir, SamplingConfig{}).ok());
        int x = 0;
        assert(track_allocation(&x, 16 * 1024, stack_a).ok());
        assert(track_deallocation(&x, stack_a).ok());
        assert(flush_thread_tracker().ok());
        ids[t] = this_thread_recorder().thread_id();
        assert(finalize_thread_tracker().ok());
        assert(track_allocation(&x, 8, stack_a).kind == ErrorKind::State);
      });
    }
    for (std::thread& th : pool) th.join();
    std::set<uint64_t> unique(ids.begin(), ids.end());
    assert(unique.size() == 4 && unique.count(0) == 0);
    for (uint64_t id : ids) assert(read_container(thread_file_path(tdir, id, ".bin")).ok());
  }

  // Disabled session: everything is a successful no-op
  {
    set_enabled(false);
    std::thread([&]() {
      assert(init_thread_tracker(dir, SamplingConfig{}).ok());
      int x = 0;
      assert(track_allocation(&x, 64, stack_a).ok());
      assert(this_thread_recorder().state() == RecorderState::Uninitialized);
    }).join();
    set_enabled(true);
  }

  std::cout << "OK\n";
  return 0;
}
