/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#include "test_support.hpp"

#include <set>
#include <thread>

using namespace heapline;

static uint64_t constant_hash(const Frame*, size_t) { return 42; }

int main() {
  set_log_level(LogLevel::Error);

  // Equal frames share one id; different frames do not
  {
    CallStackInterner in;
    std::vector<Frame> a = { 0x1000, 0x2000, 0x3000 };
    std::vector<Frame> b = { 0x1000, 0x2000, 0x3001 };
    CallStackRef ra1 = in.normalize(a);
    CallStackRef ra2 = in.normalize(a);
    CallStackRef rb  = in.normalize(b);
    assert(ra1 == ra2);
    assert(ra1.id != rb.id);
    assert(ra1.depth == 3);
    assert(ra1.hash == hash_frames(a.data(), a.size()));
    assert(in.hash_of(a.data(), a.size()) == ra1.hash);

    std::vector<Frame> out;
    assert(in.get_call_stack(rb.id, out) && out == b);
    assert(!in.get_call_stack(9999, out));
    assert(in.verify(ra1) && in.verify(rb));
    assert(!in.verify(CallStackRef{ ra1.id, ra1.hash ^ 1, ra1.depth }));
    assert(in.size() == 2);

    InternerStats st = in.stats();
    assert(st.total_processed == 3);
    assert(st.cache_hits == 1);
    assert(st.cache_misses == 2);
    assert(st.unique_stacks == 2);
    assert(st.memory_saved_bytes == 3 * sizeof(Frame));
  }

  // Entries keep their address while the table grows; uses are counted per entry
  {
    CallStackInterner in;
    std::vector<Frame> first = { 0xAAAA, 0xBBBB };
    CallStackRef r0 = in.normalize(first);
    const NormalizedCallStack* e0 = in.lookup(r0.id);
    assert(e0 && e0->frequency.load() == 0);
    for (Frame f = 1; f <= 2000; ++f) {
      std::vector<Frame> s = { f, f + 1, f + 2 };
      (void)in.normalize(s);
    }
    assert(in.size() == 2001);
    assert(in.lookup(r0.id) == e0);
    assert(e0->frames == first);
    in.record_use(r0);
    in.record_use(r0);
    in.record_use(CallStackRef::none());
    assert(e0->frequency.load() == 2);
  }

  // Empty stacks map to the reserved ref
  {
    CallStackInterner in;
    CallStackRef r = in.normalize(nullptr, 0);
    assert(r.empty() && r == CallStackRef::none());
    assert(in.verify(r));
    assert(in.size() == 0);
  }

  // Same hash, different frames: distinct entries, collision counted
  {
    CallStackInterner in(&constant_hash);
    std::vector<Frame> a = { 1, 2 }, b = { 3, 4 }, c = { 5 };
    CallStackRef ra = in.normalize(a), rb = in.normalize(b), rc = in.normalize(c);
    assert(ra.hash == 42 && rb.hash == 42 && rc.hash == 42);
    assert(ra.id != rb.id && rb.id != rc.id && ra.id != rc.id);
    assert(in.normalize(b) == rb);
    assert(in.stats().hash_collisions == 2);
    std::vector<Frame> out;
    assert(in.get_call_stack(ra.id, out) && out == a);
    assert(in.get_call_stack(rc.id, out) && out == c);
  }

  // Concurrent interning from 8 threads agrees on one id per stack
  {
    CallStackInterner in;
    const int threads = 8, stacks = 200;
    std::vector<std::vector<uint64_t>> ids(threads, std::vector<uint64_t>(stacks));
    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
      pool.emplace_back([&, t]() {
        for (int round = 0; round < 5; ++round) {
          for (int s = 0; s < stacks; ++s) {
            int k = (s + t * 17) % stacks;
            Frame f[3] = { 0xA000u + (Frame)k, 0xB000, 0xC000u + (Frame)(k % 7) };
            CallStackRef r = in.normalize(f, 3);
            in.record_use(r);
            ids[t][k] = r.id;
          }
        }
      });
    }
    for (std::thread& th : pool) th.join();

    std::set<uint64_t> unique;
    for (int s = 0; s < stacks; ++s) {
      for (int t = 1; t < threads; ++t) assert(ids[t][s] == ids[0][s]);
      unique.insert(ids[0][s]);
    }
    assert(unique.size() == (size_t)stacks);
    assert(in.size() == (uint64_t)stacks);
    InternerStats st = in.stats();
    assert(st.total_processed == (uint64_t)threads * stacks * 5);
    assert(st.cache_hits + st.cache_misses == st.total_processed);

    const NormalizedCallStack* e = in.lookup(ids[0][0]);
    assert(e && e->frequency.load() == (uint64_t)threads * 5);
  }

  std::cout << "OK\n";
  return 0;
}
