/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_AGGREGATOR_HPP_INCLUDED
#define HEAPLINE_AGGREGATOR_HPP_INCLUDED

#include "base.hpp"
#include "analysis.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "log.hpp"
#include "status.hpp"

#include <cmath>
#include <functional>
#include <map>
#include <queue>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace heapline {

enum class AggregationStatus : uint8_t { Complete, Cancelled };

struct AggregationOptions {
  unsigned                 max_threads = 0;          // 0: hardware_concurrency
  size_t                   top_k = HEAPLINE_TOP_K;
  BinaryExportConfig       metrics = BinaryExportConfig::performance_first();
  ReadMode                 read_mode = ReadMode::BestEffort;
  const std::atomic<bool>* cancel = nullptr;         // polled between units
  // Called from the worker after each thread's files are replayed, with the
  // thread id and the number of units finished so far.
  std::function<void(uint64_t thread_id, size_t finished, size_t total)> on_thread_done;
};

struct AggregationOutcome {
  AggregatedAnalysis       analysis;
  std::vector<std::string> warnings;
  AggregationStatus        status = AggregationStatus::Complete;
  uint64_t                 skipped_threads = 0;
  unsigned                 workers_used = 0;

  bool cancelled() const { return status == AggregationStatus::Cancelled; }
};

namespace detail {

inline bool is_cancelled(const AggregationOptions& o) {
  return o.cancel && o.cancel->load(std::memory_order_acquire);
}

struct SweepEvent {
  uint64_t ts;
  uint64_t seq;    // on-disk position within the thread
  uint64_t ptr;
  uint64_t size;
  bool     alloc;
};

struct GrowthAcc {
  uint64_t allocations = 0;
  uint64_t min_size = UINT64_MAX;
  uint64_t max_size = 0;
  std::unordered_set<uint64_t> sizes;
  uint64_t last = 0;
  uint32_t run = 0;      // consecutive strict increases ending at `last`
  bool     growing = false;

  void add(uint64_t size) {
    if (allocations > 0) {
      run = size > last ? run + 1 : 0;
      if (run >= 2) growing = true;
    }
    last = size;
    ++allocations;
    min_size = std::min(min_size, size);
    max_size = std::max(max_size, size);
    sizes.insert(size);
  }
};

struct FragAcc {
  std::array<uint64_t, SIZE_CLASS_BUCKETS> classes{};
  uint64_t allocations = 0;
  uint64_t small = 0;
  uint64_t requested = 0;
  uint64_t rounded = 0;

  void add(uint64_t size, uint64_t small_limit) {
    ++classes[size_class_of(size)];
    ++allocations;
    if (size < small_limit) ++small;
    requested += size;
    uint64_t r = 1;
    while (r < size && r < (1ull << 63)) r <<= 1;
    rounded += r;
  }
};

// Everything one worker learns from one thread's pair of files.
struct ThreadReplay {
  uint64_t    thread_id = 0;
  bool        usable = false;
  std::string skip_reason;
  std::vector<std::string> notes;   // non-fatal problems with files that were used

  ThreadStats   stats;
  ThreadContext context;
  Lifetimes     lifetimes;
  FragAcc       frag;
  std::vector<SweepEvent> events;
  std::unordered_map<uint64_t, std::vector<Frame>> frames;   // stack hash -> frames
  std::unordered_map<uint64_t, FreqDelta>          freq;     // stack hash -> summed deltas
  std::unordered_map<uint64_t, GrowthAcc>          growth;
};

inline bool load_thread_file(const std::string& path, FileKind want, uint64_t id,
                             ReadMode mode, Container& c, ThreadReplay& r) {
  c = read_container(path, mode);
  if (!c.ok()) {
    r.skip_reason = path + ": " + c.status.message;
    return false;
  }
  if (c.meta.kind != want) {
    r.skip_reason = path + ": expected " + file_kind_name(want) + " file, found " + file_kind_name(c.meta.kind);
    return false;
  }
  if (c.meta.thread_id != id) {
    char msg[96];
    std::snprintf(msg, sizeof(msg), ": metadata names thread %" PRIu64, c.meta.thread_id);
    r.skip_reason = path + msg;
    return false;
  }
  for (const ValidationIssue& e : c.report.errors) {
    char msg[64];
    std::snprintf(msg, sizeof(msg), " (offset %" PRIu64 ")", e.offset);
    r.notes.push_back(path + ": " + e.message + msg);
  }
  return true;
}

inline ThreadReplay replay_thread(const std::string& dir, uint64_t id, bool has_bin, bool has_freq,
                                  const AggregationOptions& opt) {
  ThreadReplay r;
  r.thread_id = id;
  const std::string bin_path  = thread_file_path(dir, id, ".bin");
  const std::string freq_path = thread_file_path(dir, id, ".freq");
  if (!has_bin)  { r.skip_reason = "missing " + bin_path;  return r; }
  if (!has_freq) { r.skip_reason = "missing " + freq_path; return r; }

  Container ev, fq;
  if (!load_thread_file(bin_path, FileKind::ThreadEvents, id, opt.read_mode, ev, r)) return r;
  if (!load_thread_file(freq_path, FileKind::ThreadFrequency, id, opt.read_mode, fq, r)) return r;

  // frequency log: deltas summed per stack, counters summed per thread
  SamplingStats counters;
  for (const Record& rec : fq.records) {
    if (rec.tag == TAG_FREQ_DELTA) {
      FreqDelta d;
      if (!decode_freq_delta(rec.payload, d)) {
        char msg[96]; std::snprintf(msg, sizeof(msg), ": malformed frequency record at offset %" PRIu64, rec.offset);
        r.skip_reason = freq_path + msg;
        return r;
      }
      FreqDelta& acc = r.freq[d.hash];
      acc.hash = d.hash;
      acc.allocations += d.allocations;
      acc.bytes += d.bytes;
      acc.deallocations += d.deallocations;
    } else if (rec.tag == TAG_COUNTERS) {
      SamplingStats d;
      if (!decode_counters(rec.payload, d)) {
        char msg[96]; std::snprintf(msg, sizeof(msg), ": malformed counters record at offset %" PRIu64, rec.offset);
        r.skip_reason = freq_path + msg;
        return r;
      }
      counters.full_allocations             += d.full_allocations;
      counters.frequency_only_allocations   += d.frequency_only_allocations;
      counters.dropped_allocations          += d.dropped_allocations;
      counters.full_deallocations           += d.full_deallocations;
      counters.frequency_only_deallocations += d.frequency_only_deallocations;
    }
  }

  // event log: replayed once, in on-disk order
  struct Live { uint64_t size; uint64_t ts; };
  std::unordered_map<uint64_t, Live> live;
  uint64_t cur = 0, peak = 0, allocs = 0, frees = 0, bytes = 0, seq = 0;
  uint64_t life_min = UINT64_MAX, life_max = 0, life_sum = 0, freed = 0;
  uint64_t first_ts = 0, last_ts = 0;
  const uint64_t small_limit = ev.meta.sampling.medium_size_threshold;

  for (const Record& rec : ev.records) {
    if (rec.tag == TAG_STACK_DEF) {
      StackDef d;
      if (decode_stack_def(rec.payload, d)) r.frames.emplace(d.ref.hash, std::move(d.frames));
      else r.notes.push_back(bin_path + ": malformed stack definition ignored");
      continue;
    }
    if (rec.tag != TAG_ALLOC && rec.tag != TAG_FREE) continue;

    uint64_t ts;
    if (rec.tag == TAG_ALLOC) {
      AllocationEvent e;
      if (!decode_alloc(rec.payload, e)) {
        char msg[96]; std::snprintf(msg, sizeof(msg), ": malformed allocation record at offset %" PRIu64, rec.offset);
        r.skip_reason = bin_path + msg;
        return r;
      }
      ts = e.timestamp;
      auto it = live.find(e.ptr);
      if (it != live.end()) cur -= it->second.size;   // reused without a recorded free
      live[e.ptr] = Live{ e.size, e.timestamp };
      cur += e.size;
      peak = std::max(peak, cur);
      ++allocs;
      bytes += e.size;
      r.events.push_back(SweepEvent{ e.timestamp, seq++, e.ptr, e.size, true });
      if (!e.call_stack.empty()) r.growth[e.call_stack.hash].add(e.size);
      r.frag.add(e.size, small_limit);
    } else {
      DeallocationEvent e;
      if (!decode_free(rec.payload, e)) {
        char msg[96]; std::snprintf(msg, sizeof(msg), ": malformed deallocation record at offset %" PRIu64, rec.offset);
        r.skip_reason = bin_path + msg;
        return r;
      }
      ts = e.timestamp;
      auto it = live.find(e.ptr);
      if (it != live.end()) {
        cur -= it->second.size;
        uint64_t life = e.timestamp >= it->second.ts ? e.timestamp - it->second.ts : 0;
        life_min = std::min(life_min, life);
        life_max = std::max(life_max, life);
        life_sum += life;
        ++freed;
        live.erase(it);
      }
      ++frees;
      r.events.push_back(SweepEvent{ e.timestamp, seq++, e.ptr, 0, false });
    }
    if (allocs + frees == 1) first_ts = ts;
    last_ts = ts;
  }

  ThreadStats& s = r.stats;
  s.thread_id                  = id;
  s.os_thread_id               = ev.meta.os_thread_id;
  s.total_allocations          = allocs + counters.frequency_only_allocations;
  s.total_deallocations        = frees + counters.frequency_only_deallocations;
  s.peak_memory                = peak;
  s.avg_allocation_size        = allocs ? (double)bytes / (double)allocs : 0.0;
  s.full_records               = allocs + frees;
  s.frequency_only_allocations = counters.frequency_only_allocations;
  s.dropped_allocations        = counters.dropped_allocations;
  s.total_allocated_bytes      = bytes;
  s.live_bytes_at_end          = cur;
  s.live_allocations_at_end    = live.size();

  r.context = ThreadContext{ id, first_ts, last_ts, allocs + frees, cur, (uint64_t)live.size() };
  r.lifetimes = Lifetimes{ id, freed, freed ? life_min : 0, freed ? life_sum / freed : 0, life_max, (uint64_t)live.size() };
  r.usable = true;
  return r;
}

// Exact global live-bytes peak: k-way merge of the per-thread streams by
// (timestamp, thread id, on-disk sequence) against one shared live map.
inline uint64_t sweep_peak(const std::vector<const ThreadReplay*>& threads) {
  struct Head { uint64_t ts; uint64_t tid; uint64_t seq; size_t thread; size_t index; };
  struct Later {
    bool operator()(const Head& a, const Head& b) const {
      if (a.ts != b.ts)   return a.ts > b.ts;
      if (a.tid != b.tid) return a.tid > b.tid;
      return a.seq > b.seq;
    }
  };
  std::priority_queue<Head, std::vector<Head>, Later> q;
  for (size_t t = 0; t < threads.size(); ++t) {
    const auto& ev = threads[t]->events;
    if (!ev.empty()) q.push(Head{ ev[0].ts, threads[t]->thread_id, ev[0].seq, t, 0 });
  }

  std::unordered_map<uint64_t, uint64_t> live;
  uint64_t cur = 0, peak = 0;
  while (!q.empty()) {
    Head h = q.top();
    q.pop();
    const auto& ev = threads[h.thread]->events;
    const SweepEvent& e = ev[h.index];
    auto it = live.find(e.ptr);
    if (e.alloc) {
      if (it != live.end()) { cur -= it->second; it->second = e.size; }
      else live.emplace(e.ptr, e.size);
      cur += e.size;
      peak = std::max(peak, cur);
    } else if (it != live.end()) {
      cur -= it->second;
      live.erase(it);
    }
    if (h.index + 1 < ev.size()) {
      const SweepEvent& n = ev[h.index + 1];
      q.push(Head{ n.ts, h.tid, n.seq, h.thread, h.index + 1 });
    }
  }
  return peak;
}

inline uint32_t health_score(double leak, double frag, double skipped) {
  double s = 100.0 * (1.0 - 0.5 * std::min(1.0, leak) - 0.3 * std::min(1.0, frag) - 0.2 * std::min(1.0, skipped));
  if (s < 0.0) s = 0.0;
  return (uint32_t)std::lround(s);
}

} // namespace detail

inline void aggregation_warning(AggregationOutcome& out, const char* fmt, ...) {
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  out.warnings.emplace_back(buf);
  HEAPLINE_LOG_WARN("%s", buf);
}

// Offline merge of every thread-<id>.bin / thread-<id>.freq pair in `dir`.
// Never fails as a whole: unreadable threads are skipped with one warning each.
inline AggregationOutcome aggregate_all_threads(const std::string& dir, const AggregationOptions& options = AggregationOptions{}) {
  AggregationOutcome out;
  BinaryExportConfig cfg = options.metrics;
  (void)validate_and_fix(cfg);
  out.analysis.level = cfg.advanced_metrics_level;
  out.analysis.sections.flags = cfg.section_flags();

  std::vector<std::string> names;
  if (!list_dir(dir, names)) {
    aggregation_warning(out, "cannot open directory %s", dir.c_str());
    return out;
  }

  struct Files { bool bin = false; bool freq = false; };
  std::map<uint64_t, Files> found;
  for (const std::string& n : names) {
    uint64_t id;
    if (parse_thread_file(n, ".bin", id))       found[id].bin = true;
    else if (parse_thread_file(n, ".freq", id)) found[id].freq = true;
  }

  std::vector<uint64_t> ids;
  std::vector<Files> files;
  for (const auto& kv : found) { ids.push_back(kv.first); files.push_back(kv.second); }
  const size_t n = ids.size();

  // ---- replay: bounded pool, one unit per thread ----
  std::vector<detail::ThreadReplay> replays(n);
  std::vector<char> done(n, 0);
  std::atomic<size_t> next{0};
  std::atomic<size_t> finished{0};
  std::atomic<bool> stopped{false};

  unsigned hw = options.max_threads ? options.max_threads : std::thread::hardware_concurrency();
  if (hw == 0) hw = 1;
  unsigned workers = (unsigned)std::min<size_t>(hw, n);
  out.workers_used = workers;

  auto work = [&]() {
    for (;;) {
      if (detail::is_cancelled(options)) { stopped.store(true, std::memory_order_release); return; }
      size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= n) return;
      replays[i] = detail::replay_thread(dir, ids[i], files[i].bin, files[i].freq, options);
      done[i] = 1;
      const size_t f = finished.fetch_add(1, std::memory_order_acq_rel) + 1;
      if (options.on_thread_done) options.on_thread_done(ids[i], f, n);
    }
  };
  if (workers <= 1) {
    work();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) pool.emplace_back(work);
    for (std::thread& t : pool) t.join();
  }

  // ---- collect, in thread id order ----
  std::vector<const detail::ThreadReplay*> used;
  for (size_t i = 0; i < n; ++i) {
    if (!done[i]) continue;
    const detail::ThreadReplay& r = replays[i];
    if (!r.usable) {
      ++out.skipped_threads;
      aggregation_warning(out, "thread %" PRIu64 " skipped: %s", r.thread_id, r.skip_reason.c_str());
      continue;
    }
    for (const std::string& note : r.notes)
      aggregation_warning(out, "thread %" PRIu64 ": %s", r.thread_id, note.c_str());
    used.push_back(&r);
  }

  AggregatedAnalysis& a = out.analysis;
  Summary& sum = a.summary;
  uint64_t full_allocs = 0, live_bytes = 0;
  for (const detail::ThreadReplay* r : used) {
    a.thread_stats[r->thread_id] = r->stats;
    sum.total_allocations      += r->stats.total_allocations;
    sum.total_deallocations    += r->stats.total_deallocations;
    sum.total_memory_allocated += r->stats.total_allocated_bytes;
    sum.sum_of_thread_peaks    += r->stats.peak_memory;
    sum.dropped_allocations    += r->stats.dropped_allocations;
    full_allocs += r->frag.allocations;
    live_bytes  += r->stats.live_bytes_at_end;
  }
  sum.total_threads = used.size();
  const uint64_t seen = sum.total_allocations + sum.dropped_allocations;
  sum.sampling_coverage = seen ? (double)full_allocs / (double)seen : 1.0;

  // ---- rank ----
  struct StackAcc { uint64_t frequency = 0; uint64_t bytes = 0; std::set<uint64_t> threads; };
  std::unordered_map<uint64_t, StackAcc> table;
  std::unordered_map<uint64_t, const std::vector<Frame>*> frames;
  for (const detail::ThreadReplay* r : used) {
    for (const auto& kv : r->freq) {
      StackAcc& s = table[kv.first];
      s.frequency += kv.second.allocations;
      s.bytes += kv.second.bytes;
      s.threads.insert(r->thread_id);
    }
    for (const auto& kv : r->frames) frames.emplace(kv.first, &kv.second);
  }
  sum.unique_call_stacks = table.size();

  std::vector<HotCallStack> hot;
  hot.reserve(table.size());
  for (const auto& kv : table) {
    HotCallStack h;
    h.call_stack_hash = kv.first;
    h.total_frequency = kv.second.frequency;
    h.total_size = kv.second.bytes;
    h.thread_count = (uint32_t)kv.second.threads.size();
    hot.push_back(std::move(h));
  }
  std::sort(hot.begin(), hot.end(), [](const HotCallStack& x, const HotCallStack& y) {
    if (x.total_size != y.total_size) return x.total_size > y.total_size;
    if (x.total_frequency != y.total_frequency) return x.total_frequency > y.total_frequency;
    return x.call_stack_hash < y.call_stack_hash;
  });
  if (hot.size() > options.top_k) hot.resize(options.top_k);
  for (HotCallStack& h : hot) {
    auto it = frames.find(h.call_stack_hash);
    if (it != frames.end()) h.frames = *it->second;
  }
  a.hottest_call_stacks = std::move(hot);

  // ---- merge ----
  // A cancelled run still merges what it finished; the peak then covers only those threads.
  if (stopped.load(std::memory_order_acquire) || detail::is_cancelled(options)) {
    out.status = AggregationStatus::Cancelled;
    aggregation_warning(out, "aggregation cancelled after %zu of %zu threads; partial analysis",
                        used.size() + (size_t)out.skipped_threads, n);
  }
  sum.peak_memory_usage = detail::sweep_peak(used);

  // ---- optional sections ----
  Sections& sec = a.sections;
  if (sec.has(SECTION_THREAD_CONTEXT))
    for (const detail::ThreadReplay* r : used) sec.thread_context.push_back(r->context);

  if (sec.has(SECTION_GROWTH)) {
    std::map<uint64_t, detail::GrowthAcc> merged;
    for (const detail::ThreadReplay* r : used) {
      for (const auto& kv : r->growth) {
        detail::GrowthAcc& m = merged[kv.first];
        m.allocations += kv.second.allocations;
        m.min_size = std::min(m.min_size, kv.second.min_size);
        m.max_size = std::max(m.max_size, kv.second.max_size);
        m.sizes.insert(kv.second.sizes.begin(), kv.second.sizes.end());
        m.growing = m.growing || kv.second.growing;
      }
    }
    for (const auto& kv : merged) {
      if (kv.second.allocations < 3) continue;
      sec.growth.push_back(GrowthPattern{ kv.first, kv.second.allocations, kv.second.min_size, kv.second.max_size,
                                          (uint64_t)kv.second.sizes.size(), kv.second.growing });
    }
  }

  if (sec.has(SECTION_SOURCE))
    for (const HotCallStack& h : a.hottest_call_stacks)
      if (!h.frames.empty()) sec.source.push_back(SourceDetail{ h.call_stack_hash, h.frames });

  double frag_estimate = 0.0;
  {
    detail::FragAcc f;
    for (const detail::ThreadReplay* r : used) {
      for (size_t i = 0; i < SIZE_CLASS_BUCKETS; ++i) f.classes[i] += r->frag.classes[i];
      f.allocations += r->frag.allocations;
      f.small += r->frag.small;
      f.requested += r->frag.requested;
      f.rounded += r->frag.rounded;
    }
    frag_estimate = f.rounded ? 1.0 - (double)f.requested / (double)f.rounded : 0.0;
    if (sec.has(SECTION_FRAGMENTATION)) {
      sec.fragmentation.size_classes = f.classes;
      sec.fragmentation.small_allocation_ratio = f.allocations ? (double)f.small / (double)f.allocations : 0.0;
      sec.fragmentation.fragmentation_estimate = frag_estimate;
    }
  }

  if (sec.has(SECTION_LIFETIMES))
    for (const detail::ThreadReplay* r : used) sec.lifetimes.push_back(r->lifetimes);

  if (sec.has(SECTION_HEALTH)) {
    Health& h = sec.health;
    const uint64_t considered = used.size() + out.skipped_threads;
    h.leak_ratio = sum.total_memory_allocated ? (double)live_bytes / (double)sum.total_memory_allocated : 0.0;
    h.fragmentation = frag_estimate;
    h.skipped_threads = out.skipped_threads;
    h.skipped_thread_ratio = considered ? (double)out.skipped_threads / (double)considered : 0.0;
    h.score = detail::health_score(h.leak_ratio, h.fragmentation, h.skipped_thread_ratio);
  }

  HEAPLINE_LOG_INFO("aggregated %zu threads (%" PRIu64 " skipped) from %s with %u workers",
                    used.size(), out.skipped_threads, dir.c_str(), workers);
  return out;
}

} // namespace heapline

#endif // HEAPLINE_AGGREGATOR_HPP_INCLUDED
