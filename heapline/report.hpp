/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_REPORT_HPP_INCLUDED
#define HEAPLINE_REPORT_HPP_INCLUDED

#include "base.hpp"
#include "aggregator.hpp"
#include "analysis.hpp"
#include "config.hpp"
#include "sharded.hpp"
#include "status.hpp"

namespace heapline {

constexpr const char* ANALYSIS_FILE    = "heapline-analysis.hlb";
constexpr const char* JSON_REPORT_FILE = "heapline-report.json";
constexpr const char* HTML_REPORT_FILE = "heapline-report.html";

// ---- JSON -----------------------------------------------------------------

inline void encode_thread_stats_json(const ThreadStats& t, std::string& o) {
  o += "{\"thread_id\":";                 json_u64(o, t.thread_id);
  o += ",\"os_thread_id\":";              json_u64(o, t.os_thread_id);
  o += ",\"total_allocations\":";         json_u64(o, t.total_allocations);
  o += ",\"total_deallocations\":";       json_u64(o, t.total_deallocations);
  o += ",\"peak_memory\":";               json_u64(o, t.peak_memory);
  o += ",\"avg_allocation_size\":";       json_f64(o, t.avg_allocation_size);
  o += ",\"full_records\":";              json_u64(o, t.full_records);
  o += ",\"frequency_only_allocations\":"; json_u64(o, t.frequency_only_allocations);
  o += ",\"dropped_allocations\":";       json_u64(o, t.dropped_allocations);
  o += ",\"total_allocated_bytes\":";     json_u64(o, t.total_allocated_bytes);
  o += ",\"live_bytes_at_end\":";         json_u64(o, t.live_bytes_at_end);
  o += ",\"live_allocations_at_end\":";   json_u64(o, t.live_allocations_at_end);
  o += "}";
}

inline void json_frames(std::string& o, const std::vector<Frame>& frames) {
  o += "[";
  for (size_t i = 0; i < frames.size(); ++i) { if (i) o += ","; json_hex(o, frames[i]); }
  o += "]";
}

inline void encode_hot_stack_json(const HotCallStack& h, std::string& o) {
  o += "{\"call_stack_hash\":"; json_hex(o, h.call_stack_hash);
  o += ",\"total_frequency\":"; json_u64(o, h.total_frequency);
  o += ",\"total_size\":";      json_u64(o, h.total_size);
  o += ",\"thread_count\":";    json_u64(o, h.thread_count);
  o += ",\"frames\":";          json_frames(o, h.frames);
  o += "}";
}

inline void encode_summary_json(const Summary& s, std::string& o) {
  o += "{\"total_allocations\":";     json_u64(o, s.total_allocations);
  o += ",\"total_deallocations\":";   json_u64(o, s.total_deallocations);
  o += ",\"peak_memory_usage\":";     json_u64(o, s.peak_memory_usage);
  o += ",\"unique_call_stacks\":";    json_u64(o, s.unique_call_stacks);
  o += ",\"total_threads\":";         json_u64(o, s.total_threads);
  o += ",\"total_memory_allocated\":"; json_u64(o, s.total_memory_allocated);
  o += ",\"sum_of_thread_peaks\":";   json_u64(o, s.sum_of_thread_peaks);
  o += ",\"dropped_allocations\":";   json_u64(o, s.dropped_allocations);
  o += ",\"sampling_coverage\":";     json_f64(o, s.sampling_coverage);
  o += "}";
}

inline void encode_sections_json(const Sections& s, std::string& o) {
  o += "{";
  bool first = true;
  auto key = [&](const char* k) { if (!first) o += ","; first = false; json_escape_append(o, k); o += ":"; };

  if (s.has(SECTION_THREAD_CONTEXT)) {
    key("thread_context");
    o += "[";
    for (size_t i = 0; i < s.thread_context.size(); ++i) {
      const ThreadContext& t = s.thread_context[i];
      if (i) o += ",";
      o += "{\"thread_id\":";              json_u64(o, t.thread_id);
      o += ",\"first_timestamp\":";        json_u64(o, t.first_timestamp);
      o += ",\"last_timestamp\":";         json_u64(o, t.last_timestamp);
      o += ",\"event_count\":";            json_u64(o, t.event_count);
      o += ",\"live_bytes_at_end\":";      json_u64(o, t.live_bytes_at_end);
      o += ",\"live_allocations_at_end\":"; json_u64(o, t.live_allocations_at_end);
      o += "}";
    }
    o += "]";
  }
  if (s.has(SECTION_GROWTH)) {
    key("growth_patterns");
    o += "[";
    for (size_t i = 0; i < s.growth.size(); ++i) {
      const GrowthPattern& g = s.growth[i];
      if (i) o += ",";
      o += "{\"call_stack_hash\":"; json_hex(o, g.call_stack_hash);
      o += ",\"allocations\":";     json_u64(o, g.allocations);
      o += ",\"min_size\":";        json_u64(o, g.min_size);
      o += ",\"max_size\":";        json_u64(o, g.max_size);
      o += ",\"distinct_sizes\":";  json_u64(o, g.distinct_sizes);
      o += ",\"growing\":";         o += g.growing ? "true" : "false";
      o += "}";
    }
    o += "]";
  }
  if (s.has(SECTION_SOURCE)) {
    key("source_detail");
    o += "[";
    for (size_t i = 0; i < s.source.size(); ++i) {
      if (i) o += ",";
      o += "{\"call_stack_hash\":"; json_hex(o, s.source[i].call_stack_hash);
      o += ",\"frames\":";          json_frames(o, s.source[i].frames);
      o += "}";
    }
    o += "]";
  }
  if (s.has(SECTION_FRAGMENTATION)) {
    key("fragmentation");
    o += "{\"size_classes\":[";
    for (size_t i = 0; i < SIZE_CLASS_BUCKETS; ++i) { if (i) o += ","; json_u64(o, s.fragmentation.size_classes[i]); }
    o += "],\"small_allocation_ratio\":"; json_f64(o, s.fragmentation.small_allocation_ratio);
    o += ",\"fragmentation_estimate\":";  json_f64(o, s.fragmentation.fragmentation_estimate);
    o += "}";
  }
  if (s.has(SECTION_LIFETIMES)) {
    key("lifetimes");
    o += "[";
    for (size_t i = 0; i < s.lifetimes.size(); ++i) {
      const Lifetimes& l = s.lifetimes[i];
      if (i) o += ",";
      o += "{\"thread_id\":";       json_u64(o, l.thread_id);
      o += ",\"freed\":";           json_u64(o, l.freed);
      o += ",\"min_lifetime_ns\":"; json_u64(o, l.min_lifetime_ns);
      o += ",\"avg_lifetime_ns\":"; json_u64(o, l.avg_lifetime_ns);
      o += ",\"max_lifetime_ns\":"; json_u64(o, l.max_lifetime_ns);
      o += ",\"leaked\":";          json_u64(o, l.leaked);
      o += "}";
    }
    o += "]";
  }
  if (s.has(SECTION_HEALTH)) {
    key("health");
    o += "{\"score\":";                json_u64(o, s.health.score);
    o += ",\"leak_ratio\":";           json_f64(o, s.health.leak_ratio);
    o += ",\"fragmentation\":";        json_f64(o, s.health.fragmentation);
    o += ",\"skipped_thread_ratio\":"; json_f64(o, s.health.skipped_thread_ratio);
    o += ",\"skipped_threads\":";      json_u64(o, s.health.skipped_threads);
    o += "}";
  }
  o += "}";
}

// thread_stats goes through the ShardedEncoder; the rest is small.
inline Status write_report_json(BufferedWriter& w, const AggregatedAnalysis& a,
                                const std::vector<std::string>& warnings = {},
                                const ShardConfig& shards = ShardConfig{}) {
  std::string o;
  o += "{\"format\":\"heapline-report\",\"version\":";
  json_u64(o, FORMAT_VERSION);
  o += ",\"metrics_level\":";
  json_escape_append(o, metrics_level_name(a.level));
  o += ",\"summary\":";
  encode_summary_json(a.summary, o);
  o += ",\"thread_stats\":";
  w.write(o);

  std::vector<ThreadStats> threads;
  threads.reserve(a.thread_stats.size());
  for (const auto& kv : a.thread_stats) threads.push_back(kv.second);
  EncodeResult r = ShardedEncoder<ThreadStats>(shards).encode(threads, &encode_thread_stats_json, w);
  if (!r.ok()) return r.status;

  o.clear();
  o += ",\"hottest_call_stacks\":[";
  for (size_t i = 0; i < a.hottest_call_stacks.size(); ++i) {
    if (i) o += ",";
    encode_hot_stack_json(a.hottest_call_stacks[i], o);
  }
  o += "],\"sections\":";
  encode_sections_json(a.sections, o);
  o += ",\"warnings\":[";
  for (size_t i = 0; i < warnings.size(); ++i) {
    if (i) o += ",";
    json_escape_append(o, warnings[i].c_str());
  }
  o += "]}\n";
  w.write(o);
  if (w.failed()) return make_error(ErrorKind::Io, "write to %s failed", w.path().c_str());
  return Status::success();
}

inline std::string report_json(const AggregatedAnalysis& a, const std::vector<std::string>& warnings = {}) {
  BufferedWriter w(1);
  w.open_memory();
  Status s = write_report_json(w, a, warnings);
  if (!s.ok()) HEAPLINE_LOG_ERROR("report: %s", s.message.c_str());
  return w.memory();
}

// ---- HTML -----------------------------------------------------------------

inline void html_escape_append(std::string& out, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:  out.push_back(c);
    }
  }
}

inline std::string hex_str(uint64_t v) {
  char b[24];
  std::snprintf(b, sizeof(b), "0x%016" PRIx64, v);
  return b;
}

inline std::string num_str(uint64_t v) {
  char b[24];
  std::snprintf(b, sizeof(b), "%" PRIu64, v);
  return b;
}

// Self-contained page: summary, threads and hot stacks as tables, plus the JSON
// report embedded in <script type="application/json" id="heapline-data">.
inline std::string report_html(const AggregatedAnalysis& a, const std::vector<std::string>& warnings = {}) {
  std::string json = report_json(a, warnings);
  // keep the embedded document from closing the script element
  std::string safe;
  safe.reserve(json.size());
  for (size_t i = 0; i < json.size(); ++i) {
    if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') { safe += "<\\/"; ++i; }
    else safe.push_back(json[i]);
  }

  const Summary& s = a.summary;
  std::string h;
  h += "<!DOCTYPE html>\n<html>\n<head>\n  <meta charset=\"utf-8\">\n  <title>heapline report</title>\n"
       "  <style>\n"
       "    body { font-family: sans-serif; margin: 2em; }\n"
       "    table { border-collapse: collapse; margin-bottom: 2em; }\n"
       "    th, td { border: 1px solid #ccc; padding: 4px 8px; text-align: right; }\n"
       "    th { background: #eee; }\n"
       "    .warn { color: #a60; }\n"
       "  </style>\n</head>\n<body>\n  <h1>heapline report</h1>\n";

  h += "  <h2>Summary</h2>\n  <table id=\"summary\">\n";
  struct Row { const char* name; std::string value; } rows[] = {
    { "total_threads",          num_str(s.total_threads) },
    { "total_allocations",      num_str(s.total_allocations) },
    { "total_deallocations",    num_str(s.total_deallocations) },
    { "peak_memory_usage",      num_str(s.peak_memory_usage) },
    { "sum_of_thread_peaks",    num_str(s.sum_of_thread_peaks) },
    { "total_memory_allocated", num_str(s.total_memory_allocated) },
    { "unique_call_stacks",     num_str(s.unique_call_stacks) },
    { "dropped_allocations",    num_str(s.dropped_allocations) },
  };
  for (const Row& r : rows) h += "    <tr><th>" + std::string(r.name) + "</th><td>" + r.value + "</td></tr>\n";
  char cov[32];
  std::snprintf(cov, sizeof(cov), "%.2f%%", s.sampling_coverage * 100.0);
  h += "    <tr><th>sampling_coverage</th><td>" + std::string(cov) + "</td></tr>\n  </table>\n";

  h += "  <h2>Threads</h2>\n  <table id=\"threads\">\n"
       "    <tr><th>thread</th><th>allocations</th><th>deallocations</th><th>peak</th>"
       "<th>avg size</th><th>live at end</th><th>dropped</th></tr>\n";
  for (const auto& kv : a.thread_stats) {
    const ThreadStats& t = kv.second;
    char avg[32];
    std::snprintf(avg, sizeof(avg), "%.1f", t.avg_allocation_size);
    h += "    <tr><td>" + num_str(t.thread_id) + "</td><td>" + num_str(t.total_allocations) + "</td><td>" +
         num_str(t.total_deallocations) + "</td><td>" + num_str(t.peak_memory) + "</td><td>" + avg + "</td><td>" +
         num_str(t.live_bytes_at_end) + "</td><td>" + num_str(t.dropped_allocations) + "</td></tr>\n";
  }
  h += "  </table>\n";

  h += "  <h2>Hottest call stacks</h2>\n  <table id=\"hot\">\n"
       "    <tr><th>stack</th><th>total size</th><th>frequency</th><th>threads</th><th>top frame</th></tr>\n";
  for (const HotCallStack& hs : a.hottest_call_stacks) {
    h += "    <tr><td>" + hex_str(hs.call_stack_hash) + "</td><td>" + num_str(hs.total_size) + "</td><td>" +
         num_str(hs.total_frequency) + "</td><td>" + num_str(hs.thread_count) + "</td><td>" +
         (hs.frames.empty() ? std::string("-") : hex_str(hs.frames[0])) + "</td></tr>\n";
  }
  h += "  </table>\n";

  if (!warnings.empty()) {
    h += "  <h2>Warnings</h2>\n  <ul class=\"warn\">\n";
    for (const std::string& w : warnings) { h += "    <li>"; html_escape_append(h, w); h += "</li>\n"; }
    h += "  </ul>\n";
  }

  h += "  <script type=\"application/json\" id=\"heapline-data\">\n";
  h += safe;
  h += "  </script>\n</body>\n</html>\n";
  return h;
}

// ---- Files ----------------------------------------------------------------

// Writes <dir>/heapline-analysis.hlb, heapline-report.json and heapline-report.html.
inline Status write_reports(const std::string& dir, const AggregatedAnalysis& a, const BinaryExportConfig& cfg,
                            const std::vector<std::string>& warnings = {}) {
  if (!make_dirs(dir.c_str()))
    return make_error(ErrorKind::Io, "cannot create directory %s: %s", dir.c_str(), std::strerror(errno));

  Status s = write_analysis(join_path(dir, ANALYSIS_FILE), a, cfg);
  if (!s.ok()) return s;

  BufferedWriter w(cfg.buffer_size);
  if (!(s = w.open(join_path(dir, JSON_REPORT_FILE))).ok()) return s;
  if (!(s = write_report_json(w, a, warnings)).ok()) return s;
  if (!(s = w.close()).ok()) return s;

  const std::string html = report_html(a, warnings);
  if (!(s = w.open(join_path(dir, HTML_REPORT_FILE))).ok()) return s;
  w.write(html);
  if (!(s = w.close()).ok()) return s;

  HEAPLINE_LOG_INFO("reports written to %s", dir.c_str());
  return s;
}

inline Status write_reports(const std::string& dir, const AggregationOutcome& out, const BinaryExportConfig& cfg) {
  return write_reports(dir, out.analysis, cfg, out.warnings);
}

} // namespace heapline

#endif // HEAPLINE_REPORT_HPP_INCLUDED
