/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#include "test_support.hpp"

using namespace heapline;

static std::string read_text(const std::string& path) {
  Bytes raw;
  bool ok = read_whole_file(path, raw);
  assert(ok);
  (void)ok;
  return std::string(raw.begin(), raw.end());
}

int main() {
  set_log_level(LogLevel::Off);
  const std::string dir = fresh_dir("report");

  std::vector<Frame> hot = { 0x400abc, 0x400def };
  std::vector<Frame> cold = { 0x500000 };
  {
    PerThreadRecorder r;
    assert(r.init(dir, SamplingConfig{}).ok());
    for (uint64_t i = 0; i < 8; ++i) assert(r.track_allocation(0x1000 + i * 16, 64 * 1024, hot.data(), 2, i).ok());
    assert(r.track_allocation(0x9000, 12 * 1024, cold.data(), 1, 50).ok());
    for (uint64_t i = 0; i < 4; ++i) assert(r.track_deallocation(0x1000 + i * 16, cold.data(), 1, 100 + i).ok());
    assert(r.finalize().ok());
  }

  AggregationOptions opt;
  opt.metrics = BinaryExportConfig::debug_comprehensive();
  opt.metrics.compression_level = 0;
  AggregationOutcome out = aggregate_all_threads(dir, opt);
  out.warnings.push_back("thread 7 skipped: </script><b>& \"bad\"");

  // JSON document
  {
    const std::string j = report_json(out.analysis, out.warnings);
    assert(j.compare(0, 38, "{\"format\":\"heapline-report\",\"version\":") == 0);
    assert(contains(j, "\"metrics_level\":\"comprehensive\""));
    assert(contains(j, "\"total_allocations\":9"));
    assert(contains(j, "\"total_deallocations\":4"));
    assert(contains(j, "\"peak_memory_usage\":" + std::to_string(8 * 64 * 1024 + 12 * 1024)));
    assert(contains(j, "\"thread_stats\":[{\"thread_id\":"));
    assert(contains(j, "\"call_stack_hash\":\"0x"));
    assert(contains(j, "\"frames\":[\"0x0000000000400abc\",\"0x0000000000400def\"]"));
    assert(contains(j, "\"health\":{\"score\":"));
    assert(contains(j, "\"sampling_coverage\":1"));
    assert(contains(j, "\"warnings\":[\"thread 7 skipped: </script><b>& \\\"bad\\\"\"]"));
    assert(j.back() == '\n');

    // thread_stats sharding does not change the document
    BufferedWriter w(1);
    w.open_memory();
    ShardConfig tiny;
    tiny.shard_size = 1;
    tiny.parallel_threshold = 0;
    assert(write_report_json(w, out.analysis, out.warnings, tiny).ok());
    assert(w.memory() == j);
  }

  // HTML page
  {
    const std::string h = report_html(out.analysis, out.warnings);
    assert(h.compare(0, 15, "<!DOCTYPE html>") == 0);
    assert(contains(h, "<table id=\"summary\">"));
    assert(contains(h, "<table id=\"threads\">"));
    assert(contains(h, "<table id=\"hot\">"));
    assert(contains(h, "0x0000000000400abc"));
    assert(contains(h, "<li>thread 7 skipped: &lt;/script&gt;&lt;b&gt;&amp; &quot;bad&quot;</li>"));
    assert(contains(h, "<script type=\"application/json\" id=\"heapline-data\">"));

    // the only closing script tag is the page's own
    size_t first = h.find("</script>");
    assert(first != std::string::npos && h.find("</script>", first + 1) == std::string::npos);
    assert(contains(h, "<\\/script>"));
  }

  // Files on disk
  {
    const std::string rdir = join_path(dir, "out");
    assert(write_reports(rdir, out, opt.metrics).ok());
    assert(file_exists(join_path(rdir, ANALYSIS_FILE)));
    const std::string j = read_text(join_path(rdir, JSON_REPORT_FILE));
    assert(j == report_json(out.analysis, out.warnings));
    const std::string h = read_text(join_path(rdir, HTML_REPORT_FILE));
    assert(contains(h, "heapline-data"));

    AggregatedAnalysis back;
    assert(read_analysis(join_path(rdir, ANALYSIS_FILE), back).ok());
    assert(back == out.analysis);
  }

  std::cout << "OK\n";
  return 0;
}
