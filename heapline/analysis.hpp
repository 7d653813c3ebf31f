/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_ANALYSIS_HPP_INCLUDED
#define HEAPLINE_ANALYSIS_HPP_INCLUDED

#include "base.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "status.hpp"

#include <array>
#include <map>
#include <tuple>

namespace heapline {

constexpr size_t SIZE_CLASS_BUCKETS = 32;

struct ThreadStats {
  uint64_t thread_id = 0;
  uint64_t os_thread_id = 0;
  uint64_t total_allocations = 0;        // Full + FrequencyOnly; lower bound when anything was dropped
  uint64_t total_deallocations = 0;
  uint64_t peak_memory = 0;              // replay of Full records in on-disk order
  double   avg_allocation_size = 0.0;    // over Full allocation records
  uint64_t full_records = 0;
  uint64_t frequency_only_allocations = 0;
  uint64_t dropped_allocations = 0;
  uint64_t total_allocated_bytes = 0;
  uint64_t live_bytes_at_end = 0;
  uint64_t live_allocations_at_end = 0;

  auto key() const {
    return std::tie(thread_id, os_thread_id, total_allocations, total_deallocations, peak_memory,
                    avg_allocation_size, full_records, frequency_only_allocations, dropped_allocations,
                    total_allocated_bytes, live_bytes_at_end, live_allocations_at_end);
  }
  bool operator==(const ThreadStats& o) const { return key() == o.key(); }
};

struct HotCallStack {
  uint64_t           call_stack_hash = 0;
  uint64_t           total_frequency = 0;
  uint64_t           total_size = 0;
  uint32_t           thread_count = 0;
  std::vector<Frame> frames;             // empty when no file carried the definition

  bool operator==(const HotCallStack& o) const {
    return std::tie(call_stack_hash, total_frequency, total_size, thread_count, frames) ==
           std::tie(o.call_stack_hash, o.total_frequency, o.total_size, o.thread_count, o.frames);
  }
};

struct Summary {
  uint64_t total_allocations = 0;
  uint64_t total_deallocations = 0;
  uint64_t peak_memory_usage = 0;        // exact cross-thread sweep over Full records
  uint64_t unique_call_stacks = 0;
  uint64_t total_threads = 0;
  uint64_t total_memory_allocated = 0;
  uint64_t sum_of_thread_peaks = 0;      // upper bound of peak_memory_usage
  uint64_t dropped_allocations = 0;
  double   sampling_coverage = 1.0;      // Full allocation records / (total + dropped)

  auto key() const {
    return std::tie(total_allocations, total_deallocations, peak_memory_usage, unique_call_stacks, total_threads,
                    total_memory_allocated, sum_of_thread_peaks, dropped_allocations, sampling_coverage);
  }
  bool operator==(const Summary& o) const { return key() == o.key(); }
};

// ---- Optional sections ----------------------------------------------------

struct ThreadContext {
  uint64_t thread_id = 0;
  uint64_t first_timestamp = 0;
  uint64_t last_timestamp = 0;
  uint64_t event_count = 0;
  uint64_t live_bytes_at_end = 0;
  uint64_t live_allocations_at_end = 0;

  auto key() const { return std::tie(thread_id, first_timestamp, last_timestamp, event_count, live_bytes_at_end, live_allocations_at_end); }
  bool operator==(const ThreadContext& o) const { return key() == o.key(); }
};

struct GrowthPattern {
  uint64_t call_stack_hash = 0;
  uint64_t allocations = 0;
  uint64_t min_size = 0;
  uint64_t max_size = 0;
  uint64_t distinct_sizes = 0;
  bool     growing = false;   // sizes strictly increased at least twice in a row

  auto key() const { return std::tie(call_stack_hash, allocations, min_size, max_size, distinct_sizes, growing); }
  bool operator==(const GrowthPattern& o) const { return key() == o.key(); }
};

struct SourceDetail {
  uint64_t           call_stack_hash = 0;
  std::vector<Frame> frames;

  bool operator==(const SourceDetail& o) const { return call_stack_hash == o.call_stack_hash && frames == o.frames; }
};

struct Fragmentation {
  std::array<uint64_t, SIZE_CLASS_BUCKETS> size_classes{};   // bucket i: sizes in [2^i, 2^(i+1)), last bucket open-ended
  double small_allocation_ratio = 0.0;
  double fragmentation_estimate = 0.0;   // 1 - requested / power-of-two rounded bytes

  bool operator==(const Fragmentation& o) const {
    return size_classes == o.size_classes && small_allocation_ratio == o.small_allocation_ratio &&
           fragmentation_estimate == o.fragmentation_estimate;
  }
};

struct Lifetimes {
  uint64_t thread_id = 0;
  uint64_t freed = 0;
  uint64_t min_lifetime_ns = 0;
  uint64_t avg_lifetime_ns = 0;
  uint64_t max_lifetime_ns = 0;
  uint64_t leaked = 0;

  auto key() const { return std::tie(thread_id, freed, min_lifetime_ns, avg_lifetime_ns, max_lifetime_ns, leaked); }
  bool operator==(const Lifetimes& o) const { return key() == o.key(); }
};

struct Health {
  uint32_t score = 100;
  double   leak_ratio = 0.0;
  double   fragmentation = 0.0;
  double   skipped_thread_ratio = 0.0;
  uint64_t skipped_threads = 0;

  auto key() const { return std::tie(score, leak_ratio, fragmentation, skipped_thread_ratio, skipped_threads); }
  bool operator==(const Health& o) const { return key() == o.key(); }
};

struct Sections {
  uint32_t                   flags = 0;   // SectionFlag bits present
  std::vector<ThreadContext> thread_context;
  std::vector<GrowthPattern> growth;
  std::vector<SourceDetail>  source;
  Fragmentation              fragmentation;
  std::vector<Lifetimes>     lifetimes;
  Health                     health;

  bool has(uint32_t f) const { return (flags & f) != 0; }

  bool operator==(const Sections& o) const {
    return flags == o.flags && thread_context == o.thread_context && growth == o.growth && source == o.source &&
           fragmentation == o.fragmentation && lifetimes == o.lifetimes && health == o.health;
  }
};

struct AggregatedAnalysis {
  std::map<uint64_t, ThreadStats> thread_stats;
  Summary                         summary;
  std::vector<HotCallStack>       hottest_call_stacks;
  AdvancedMetricsLevel            level = AdvancedMetricsLevel::None;
  Sections                        sections;

  bool operator==(const AggregatedAnalysis& o) const {
    return thread_stats == o.thread_stats && summary == o.summary && hottest_call_stacks == o.hottest_call_stacks &&
           level == o.level && sections == o.sections;
  }
  bool operator!=(const AggregatedAnalysis& o) const { return !(*this == o); }
};

inline uint32_t size_class_of(uint64_t size) {
  uint32_t b = 0;
  while (size > 1 && b + 1 < SIZE_CLASS_BUCKETS) { size >>= 1; ++b; }
  return b;
}

// ---- Analysis document ----------------------------------------------------

inline void put_frames(Bytes& b, const std::vector<Frame>& f) {
  put_u32(b, (uint32_t)f.size());
  for (Frame x : f) put_u64(b, x);
}
inline bool get_frames(ByteCursor& c, std::vector<Frame>& f) {
  uint32_t n = c.u32();
  if (!c.ok || c.remaining() / 8 < n) { c.ok = false; return false; }
  f.resize(n);
  for (uint32_t i = 0; i < n; ++i) f[i] = c.u64();
  return c.ok;
}

inline void encode_thread_stats(const ThreadStats& t, Bytes& b) {
  put_u64(b, t.thread_id);
  put_u64(b, t.os_thread_id);
  put_u64(b, t.total_allocations);
  put_u64(b, t.total_deallocations);
  put_u64(b, t.peak_memory);
  put_f64(b, t.avg_allocation_size);
  put_u64(b, t.full_records);
  put_u64(b, t.frequency_only_allocations);
  put_u64(b, t.dropped_allocations);
  put_u64(b, t.total_allocated_bytes);
  put_u64(b, t.live_bytes_at_end);
  put_u64(b, t.live_allocations_at_end);
}
inline bool decode_thread_stats(ByteCursor& c, ThreadStats& t) {
  t.thread_id = c.u64();
  t.os_thread_id = c.u64();
  t.total_allocations = c.u64();
  t.total_deallocations = c.u64();
  t.peak_memory = c.u64();
  t.avg_allocation_size = c.f64();
  t.full_records = c.u64();
  t.frequency_only_allocations = c.u64();
  t.dropped_allocations = c.u64();
  t.total_allocated_bytes = c.u64();
  t.live_bytes_at_end = c.u64();
  t.live_allocations_at_end = c.u64();
  return c.ok;
}

inline void encode_summary(const Summary& s, Bytes& b) {
  put_u64(b, s.total_allocations);
  put_u64(b, s.total_deallocations);
  put_u64(b, s.peak_memory_usage);
  put_u64(b, s.unique_call_stacks);
  put_u64(b, s.total_threads);
  put_u64(b, s.total_memory_allocated);
  put_u64(b, s.sum_of_thread_peaks);
  put_u64(b, s.dropped_allocations);
  put_f64(b, s.sampling_coverage);
}
inline bool decode_summary(ByteCursor& c, Summary& s) {
  s.total_allocations = c.u64();
  s.total_deallocations = c.u64();
  s.peak_memory_usage = c.u64();
  s.unique_call_stacks = c.u64();
  s.total_threads = c.u64();
  s.total_memory_allocated = c.u64();
  s.sum_of_thread_peaks = c.u64();
  s.dropped_allocations = c.u64();
  s.sampling_coverage = c.f64();
  return c.ok;
}

inline void encode_hot_stack(const HotCallStack& h, Bytes& b) {
  put_u64(b, h.call_stack_hash);
  put_u64(b, h.total_frequency);
  put_u64(b, h.total_size);
  put_u32(b, h.thread_count);
  put_frames(b, h.frames);
}
inline bool decode_hot_stack(ByteCursor& c, HotCallStack& h) {
  h.call_stack_hash = c.u64();
  h.total_frequency = c.u64();
  h.total_size = c.u64();
  h.thread_count = c.u32();
  return get_frames(c, h.frames);
}

// One TAG_SECTION record per present section: [flag:u32][body].
inline void encode_section(const Sections& s, uint32_t flag, Bytes& b) {
  put_u32(b, flag);
  switch (flag) {
    case SECTION_THREAD_CONTEXT:
      put_u32(b, (uint32_t)s.thread_context.size());
      for (const ThreadContext& t : s.thread_context) {
        put_u64(b, t.thread_id); put_u64(b, t.first_timestamp); put_u64(b, t.last_timestamp);
        put_u64(b, t.event_count); put_u64(b, t.live_bytes_at_end); put_u64(b, t.live_allocations_at_end);
      }
      break;
    case SECTION_GROWTH:
      put_u32(b, (uint32_t)s.growth.size());
      for (const GrowthPattern& g : s.growth) {
        put_u64(b, g.call_stack_hash); put_u64(b, g.allocations); put_u64(b, g.min_size);
        put_u64(b, g.max_size); put_u64(b, g.distinct_sizes); put_u8(b, g.growing ? 1 : 0);
      }
      break;
    case SECTION_SOURCE:
      put_u32(b, (uint32_t)s.source.size());
      for (const SourceDetail& d : s.source) { put_u64(b, d.call_stack_hash); put_frames(b, d.frames); }
      break;
    case SECTION_FRAGMENTATION:
      for (uint64_t v : s.fragmentation.size_classes) put_u64(b, v);
      put_f64(b, s.fragmentation.small_allocation_ratio);
      put_f64(b, s.fragmentation.fragmentation_estimate);
      break;
    case SECTION_LIFETIMES:
      put_u32(b, (uint32_t)s.lifetimes.size());
      for (const Lifetimes& l : s.lifetimes) {
        put_u64(b, l.thread_id); put_u64(b, l.freed); put_u64(b, l.min_lifetime_ns);
        put_u64(b, l.avg_lifetime_ns); put_u64(b, l.max_lifetime_ns); put_u64(b, l.leaked);
      }
      break;
    case SECTION_HEALTH:
      put_u32(b, s.health.score);
      put_f64(b, s.health.leak_ratio);
      put_f64(b, s.health.fragmentation);
      put_f64(b, s.health.skipped_thread_ratio);
      put_u64(b, s.health.skipped_threads);
      break;
  }
}

// Returns false on a malformed body. Unknown section flags are ignored.
inline bool decode_section(ByteCursor& c, Sections& s) {
  uint32_t flag = c.u32();
  switch (flag) {
    case SECTION_THREAD_CONTEXT: {
      uint32_t n = c.u32();
      for (uint32_t i = 0; i < n && c.ok; ++i) {
        ThreadContext t;
        t.thread_id = c.u64(); t.first_timestamp = c.u64(); t.last_timestamp = c.u64();
        t.event_count = c.u64(); t.live_bytes_at_end = c.u64(); t.live_allocations_at_end = c.u64();
        if (c.ok) s.thread_context.push_back(t);
      }
      break;
    }
    case SECTION_GROWTH: {
      uint32_t n = c.u32();
      for (uint32_t i = 0; i < n && c.ok; ++i) {
        GrowthPattern g;
        g.call_stack_hash = c.u64(); g.allocations = c.u64(); g.min_size = c.u64();
        g.max_size = c.u64(); g.distinct_sizes = c.u64(); g.growing = c.u8() != 0;
        if (c.ok) s.growth.push_back(g);
      }
      break;
    }
    case SECTION_SOURCE: {
      uint32_t n = c.u32();
      for (uint32_t i = 0; i < n && c.ok; ++i) {
        SourceDetail d;
        d.call_stack_hash = c.u64();
        if (get_frames(c, d.frames)) s.source.push_back(std::move(d));
      }
      break;
    }
    case SECTION_FRAGMENTATION:
      for (uint64_t& v : s.fragmentation.size_classes) v = c.u64();
      s.fragmentation.small_allocation_ratio = c.f64();
      s.fragmentation.fragmentation_estimate = c.f64();
      break;
    case SECTION_LIFETIMES: {
      uint32_t n = c.u32();
      for (uint32_t i = 0; i < n && c.ok; ++i) {
        Lifetimes l;
        l.thread_id = c.u64(); l.freed = c.u64(); l.min_lifetime_ns = c.u64();
        l.avg_lifetime_ns = c.u64(); l.max_lifetime_ns = c.u64(); l.leaked = c.u64();
        if (c.ok) s.lifetimes.push_back(l);
      }
      break;
    }
    case SECTION_HEALTH:
      s.health.score = c.u32();
      s.health.leak_ratio = c.f64();
      s.health.fragmentation = c.f64();
      s.health.skipped_thread_ratio = c.f64();
      s.health.skipped_threads = c.u64();
      break;
    default:
      return c.ok;
  }
  if (c.ok) s.flags |= flag;
  return c.ok;
}

// Only sections present in `a` and enabled in `cfg` are written.
inline Bytes encode_analysis(const AggregatedAnalysis& a, const BinaryExportConfig& cfg) {
  Metadata m;
  m.kind = FileKind::Analysis;
  m.level = a.level;
  m.section_flags = a.sections.flags & cfg.section_flags();
  m.created_ns = now_ns();

  ContainerBuilder cb(m);
  Bytes p;
  for (const auto& kv : a.thread_stats) { p.clear(); encode_thread_stats(kv.second, p); cb.add(TAG_THREAD_STATS, p); }
  p.clear(); encode_summary(a.summary, p); cb.add(TAG_SUMMARY, p);
  for (const HotCallStack& h : a.hottest_call_stacks) { p.clear(); encode_hot_stack(h, p); cb.add(TAG_HOT_STACK, p); }

  static const uint32_t order[] = { SECTION_THREAD_CONTEXT, SECTION_GROWTH, SECTION_SOURCE,
                                    SECTION_FRAGMENTATION, SECTION_LIFETIMES, SECTION_HEALTH };
  for (uint32_t f : order) {
    if (!(m.section_flags & f)) continue;
    p.clear(); encode_section(a.sections, f, p); cb.add(TAG_SECTION, p);
  }
  return std::move(cb.finish());
}

// Decodes an analysis document. Strict stops at the first malformed record.
// BestEffort skips it, keeps every other record, and lists what it skipped in `dropped`.
inline Status decode_analysis(const Container& c, AggregatedAnalysis& a, ReadMode mode = ReadMode::Strict,
                              std::vector<ValidationIssue>* dropped = nullptr) {
  if (!c.ok()) return c.status;
  if (c.meta.kind != FileKind::Analysis)
    return make_error(ErrorKind::Format, "expected an analysis document, found %s", file_kind_name(c.meta.kind));

  a = AggregatedAnalysis{};
  a.level = c.meta.level;
  for (const Record& r : c.records) {
    ByteCursor cur(r.payload.data(), r.payload.size());
    bool ok = true;
    switch (r.tag) {
      case TAG_THREAD_STATS: {
        ThreadStats t;
        ok = decode_thread_stats(cur, t);
        if (ok) a.thread_stats[t.thread_id] = t;
        break;
      }
      case TAG_SUMMARY: {
        Summary sum;
        ok = decode_summary(cur, sum);
        if (ok) a.summary = sum;
        break;
      }
      case TAG_HOT_STACK: {
        HotCallStack h;
        ok = decode_hot_stack(cur, h);
        if (ok) a.hottest_call_stacks.push_back(std::move(h));
        break;
      }
      case TAG_SECTION: {
        // a section that fails half way must not leave partial entries behind
        Sections next = a.sections;
        ok = decode_section(cur, next);
        if (ok) a.sections = std::move(next);
        break;
      }
      default:
        break;   // thread-file records have no place here
    }
    if (ok) continue;

    Status bad = make_error(ErrorKind::Format, "malformed analysis record (tag %u) at offset %" PRIu64,
                            (unsigned)r.tag, r.offset);
    if (mode == ReadMode::Strict) {
      a = AggregatedAnalysis{};
      return bad;
    }
    if (dropped) dropped->push_back(ValidationIssue{ ErrorKind::Format, bad.message, r.offset });
  }
  return Status::success();
}

inline Status decode_analysis(const Bytes& b, AggregatedAnalysis& a, ReadMode mode = ReadMode::Strict,
                              std::vector<ValidationIssue>* dropped = nullptr) {
  return decode_analysis(read_container(b, mode), a, mode, dropped);
}

// Writes the analysis document; gzip when cfg.compression_level > 0 and zlib is built in.
inline Status write_analysis(const std::string& path, const AggregatedAnalysis& a, const BinaryExportConfig& cfg) {
  return write_bytes_file(path, encode_analysis(a, cfg), cfg.compression_level);
}

// BestEffort also returns container damage (checksum, truncation) through `dropped`.
inline Status read_analysis(const std::string& path, AggregatedAnalysis& a, ReadMode mode = ReadMode::Strict,
                            std::vector<ValidationIssue>* dropped = nullptr) {
  Container c = read_container(path, mode);
  std::vector<ValidationIssue> issues;
  if (mode == ReadMode::BestEffort) issues = c.report.errors;
  Status s = decode_analysis(c, a, mode, &issues);
  for (const ValidationIssue& e : issues)
    HEAPLINE_LOG_WARN("%s: %s (offset %" PRIu64 ")", path.c_str(), e.message.c_str(), e.offset);
  if (dropped) dropped->insert(dropped->end(), issues.begin(), issues.end());
  return s;
}

} // namespace heapline

#endif // HEAPLINE_ANALYSIS_HPP_INCLUDED
