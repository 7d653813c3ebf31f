// Build: c++ -std=c++17 -O2 -pthread -I. examples/aggregate_dir.cpp -o heapline-aggregate
// Usage: heapline-aggregate [capture-dir]
//   HEAPLINE_DIR is used when no directory is given.
//   HEAPLINE_STRICT=1 rejects unsealed or damaged thread files.
//   HEAPLINE_EXPORT=path also writes the sharded event export (.gz compresses).
#include "heapline.hpp"

#include <cstdlib>

int main(int argc, char** argv) {
  if (argc > 2) {
    std::fprintf(stderr, "usage: %s [capture-dir]\n", argv[0]);
    return 2;
  }
  const std::string dir = argc == 2 ? argv[1] : heapline::default_dir();
  heapline::AggregationOptions opt;
  opt.metrics = heapline::BinaryExportConfig::debug_comprehensive();
  if (const char* s = std::getenv("HEAPLINE_STRICT")) { if (*s && *s != '0') opt.read_mode = heapline::ReadMode::Strict; }
  const char* export_path = std::getenv("HEAPLINE_EXPORT");
  heapline::set_log_level(heapline::LogLevel::Info);

  heapline::AggregationOutcome out = heapline::aggregate_all_threads(dir, opt);
  const heapline::Summary& s = out.analysis.summary;
  std::printf("threads            %llu (%llu skipped, %u workers)\n", (unsigned long long)s.total_threads,
              (unsigned long long)out.skipped_threads, out.workers_used);
  std::printf("allocations        %llu (%llu dropped)\n", (unsigned long long)s.total_allocations,
              (unsigned long long)s.dropped_allocations);
  std::printf("deallocations      %llu\n", (unsigned long long)s.total_deallocations);
  std::printf("peak memory        %llu bytes\n", (unsigned long long)s.peak_memory_usage);
  std::printf("sampling coverage  %.1f%%\n", s.sampling_coverage * 100.0);
  if (out.analysis.sections.has(heapline::SECTION_HEALTH))
    std::printf("health score       %u\n", out.analysis.sections.health.score);

  heapline::Status st = heapline::write_reports(dir, out, opt.metrics);
  if (!st.ok()) { std::fprintf(stderr, "reports: %s\n", st.message.c_str()); return 1; }

  if (export_path && *export_path) {
    heapline::EncodeResult r = heapline::export_events_json(dir, export_path);
    if (!r.ok()) { std::fprintf(stderr, "export: %s\n", r.status.message.c_str()); return 1; }
    std::printf("exported %llu events in %llu shards\n", (unsigned long long)r.stats.records,
                (unsigned long long)r.stats.shards);
  }
  return out.skipped_threads ? 1 : 0;
}
