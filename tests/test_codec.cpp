/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#include "test_support.hpp"

using namespace heapline;

static Bytes sample_thread_file() {
  Metadata m;
  m.kind = FileKind::ThreadEvents;
  m.thread_id = 5;
  m.os_thread_id = 1234;
  m.created_ns = 99;
  m.sampling = SamplingConfig::leak_detection();
  ContainerBuilder cb(m);

  Bytes p;
  CallStackRef ref{ 1, 0xABCDEF, 2 };
  Frame frames[2] = { 0x401000, 0x402000 };
  encode_stack_def(ref, frames, p); cb.add(TAG_STACK_DEF, p);
  p.clear(); encode_alloc(AllocationEvent{ 0x1000, 256, ref, 10, 5 }, p); cb.add(TAG_ALLOC, p);
  p.clear(); encode_free(DeallocationEvent{ 0x1000, ref, 20, 5 }, p); cb.add(TAG_FREE, p);
  return cb.finish();
}

static AggregatedAnalysis sample_analysis(AdvancedMetricsLevel level, uint32_t flags) {
  AggregatedAnalysis a;
  a.level = level;
  ThreadStats t;
  t.thread_id = 3; t.os_thread_id = 77; t.total_allocations = 10; t.total_deallocations = 4;
  t.peak_memory = 4096; t.avg_allocation_size = 409.6; t.full_records = 14;
  t.total_allocated_bytes = 4096; t.live_bytes_at_end = 1024; t.live_allocations_at_end = 2;
  a.thread_stats[3] = t;
  a.summary.total_allocations = 10; a.summary.total_deallocations = 4; a.summary.peak_memory_usage = 4096;
  a.summary.unique_call_stacks = 1; a.summary.total_threads = 1; a.summary.total_memory_allocated = 4096;
  a.summary.sum_of_thread_peaks = 4096; a.summary.sampling_coverage = 1.0;
  HotCallStack h;
  h.call_stack_hash = 0x1234; h.total_frequency = 10; h.total_size = 4096; h.thread_count = 1;
  h.frames = { 0x401000, 0x402000 };
  a.hottest_call_stacks.push_back(h);

  Sections& s = a.sections;
  s.flags = flags;
  if (s.has(SECTION_THREAD_CONTEXT)) s.thread_context.push_back(ThreadContext{ 3, 100, 900, 14, 1024, 2 });
  if (s.has(SECTION_GROWTH))         s.growth.push_back(GrowthPattern{ 0x1234, 5, 16, 256, 5, true });
  if (s.has(SECTION_SOURCE))         s.source.push_back(SourceDetail{ 0x1234, h.frames });
  if (s.has(SECTION_FRAGMENTATION)) {
    s.fragmentation.size_classes[4] = 3;
    s.fragmentation.size_classes[8] = 7;
    s.fragmentation.small_allocation_ratio = 0.3;
    s.fragmentation.fragmentation_estimate = 0.125;
  }
  if (s.has(SECTION_LIFETIMES))      s.lifetimes.push_back(Lifetimes{ 3, 4, 10, 50, 200, 2 });
  if (s.has(SECTION_HEALTH))         s.health = Health{ 81, 0.2, 0.125, 0.0, 0 };
  return a;
}

int main() {
  set_log_level(LogLevel::Off);
  const std::string dir = fresh_dir("codec");

  // Well-formed container
  {
    Bytes b = sample_thread_file();
    Container c = read_container(b);
    assert(c.ok());
    assert(c.report.passed());
    assert(c.report.checksum_state == ChecksumState::Valid);
    assert(c.report.found_version == FORMAT_VERSION);
    assert(c.meta.kind == FileKind::ThreadEvents);
    assert(c.meta.thread_id == 5 && c.meta.os_thread_id == 1234);
    assert(c.meta.sampling.critical_size_threshold == SamplingConfig::leak_detection().critical_size_threshold);
    assert(c.records.size() == 3);

    StackDef d;
    assert(c.records[0].tag == TAG_STACK_DEF && decode_stack_def(c.records[0].payload, d));
    assert(d.ref.id == 1 && d.frames.size() == 2 && d.frames[1] == 0x402000);
    AllocationEvent e;
    assert(decode_alloc(c.records[1].payload, e));
    assert(e.ptr == 0x1000 && e.size == 256 && e.timestamp == 10 && e.call_stack.hash == 0xABCDEF);
    DeallocationEvent f;
    assert(decode_free(c.records[2].payload, f) && f.timestamp == 20);
  }

  // Flipped payload byte: checksum mismatch
  {
    Bytes b = sample_thread_file();
    b[b.size() - 1] ^= 0xFF;
    Container strict = read_container(b, ReadMode::Strict);
    assert(!strict.ok() && strict.status.kind == ErrorKind::Format);
    assert(strict.report.checksum_state == ChecksumState::Mismatch);
    assert(strict.records.empty());
    Container loose = read_container(b, ReadMode::BestEffort);
    assert(loose.ok());
    assert(loose.records.size() == 3);
    assert(!loose.report.passed());
  }

  // Zero checksum: unsealed, rejected in strict mode only
  {
    Bytes b = sample_thread_file();
    store_u64(b.data() + CHECKSUM_OFFSET, 0);
    Container strict = read_container(b);
    assert(!strict.ok());
    assert(strict.report.checksum_state == ChecksumState::Unsealed);
    Container loose = read_container(b, ReadMode::BestEffort);
    assert(loose.ok() && loose.records.size() == 3);
    assert(loose.report.checksum_state == ChecksumState::Unsealed);
  }

  // Truncated tail: best effort keeps the complete records
  {
    Bytes b = sample_thread_file();
    b.resize(b.size() - 3);
    Container loose = read_container(b, ReadMode::BestEffort);
    assert(loose.ok());
    assert(!loose.report.structure_valid);
    assert(loose.records.size() == 2);
    assert(!loose.report.errors.empty());
    assert(!read_container(b, ReadMode::Strict).ok());
  }

  // Bad magic and short input
  {
    Bytes b = sample_thread_file();
    b[0] = 'X';
    Container c = read_container(b, ReadMode::BestEffort);
    assert(!c.ok() && !c.report.format_valid);
    Bytes tiny(MAGIC, MAGIC + 8);
    assert(read_container(tiny, ReadMode::BestEffort).status.kind == ErrorKind::Format);
  }

  // Future version is reported with both numbers
  {
    Bytes b = sample_thread_file();
    b[8] = (uint8_t)(999 & 0xFF); b[9] = (uint8_t)(999 >> 8); b[10] = 0; b[11] = 0;
    Container c = read_container(b, ReadMode::BestEffort);
    assert(!c.ok());
    assert(c.version_rejected);
    assert(c.unsupported.found == 999);
    assert(c.unsupported.supported == FORMAT_VERSION);
    assert(!c.report.version_supported);
    assert(c.records.empty());
  }

  // Version 1 files carry the short metadata block
  {
    Metadata m;
    m.kind = FileKind::ThreadFrequency;
    m.thread_id = 11;
    Bytes meta;
    encode_metadata(m, meta);
    meta.resize(METADATA_V1_SIZE);
    Bytes b;
    put_header(b, 1);
    put_u32(b, (uint32_t)meta.size());
    b.insert(b.end(), meta.begin(), meta.end());
    Bytes p;
    encode_freq_delta(FreqDelta{ 0x77, 3, 300, 1 }, p);
    put_u8(b, TAG_FREQ_DELTA); put_u32(b, (uint32_t)p.size()); b.insert(b.end(), p.begin(), p.end());
    store_u64(b.data() + CHECKSUM_OFFSET, seal_value(fnv1a(b.data() + HEADER_SIZE, b.size() - HEADER_SIZE)));

    Container c = read_container(b);
    assert(c.ok());
    assert(c.report.found_version == 1);
    assert(c.meta.kind == FileKind::ThreadFrequency && c.meta.thread_id == 11);
    assert(c.meta.sampling.critical_size_threshold == SamplingConfig{}.critical_size_threshold);
    FreqDelta d;
    assert(c.records.size() == 1 && decode_freq_delta(c.records[0].payload, d));
    assert(d.hash == 0x77 && d.allocations == 3 && d.bytes == 300 && d.deallocations == 1);
  }

  // Unknown tags are skipped and noted
  {
    Metadata m;
    m.kind = FileKind::ThreadEvents;
    ContainerBuilder cb(m);
    cb.add(42, Bytes{ 1, 2, 3 });
    Bytes p;
    encode_alloc(AllocationEvent{ 0x10, 8, CallStackRef::none(), 1, 0 }, p);
    cb.add(TAG_ALLOC, p);
    Container c = read_container(cb.finish());
    assert(c.ok() && c.report.passed());
    assert(c.records.size() == 1 && c.records[0].tag == TAG_ALLOC);
    assert(c.report.notes.size() == 1);
    assert(contains(c.report.notes[0].message, "42"));
  }

  // Streaming writer: sealed on seal(), unsealed when abandoned
  {
    Metadata m;
    m.kind = FileKind::ThreadEvents;
    m.thread_id = 8;
    const std::string sealed = join_path(dir, "sealed.bin"), open = join_path(dir, "open.bin");
    RecordWriter w;
    assert(w.open(sealed, m).ok());
    Bytes p;
    encode_alloc(AllocationEvent{ 0x20, 64, CallStackRef::none(), 5, 8 }, p);
    assert(w.append(TAG_ALLOC, p).ok());
    assert(w.records_written() == 1);
    assert(w.seal().ok());
    assert(!w.append(TAG_ALLOC, p).ok());
    Container c = read_container(sealed);
    assert(c.ok() && c.report.checksum_state == ChecksumState::Valid && c.records.size() == 1);

    {
      RecordWriter u;
      assert(u.open(open, m).ok());
      assert(u.append(TAG_ALLOC, p).ok());
    }
    Container uc = read_container(open, ReadMode::BestEffort);
    assert(uc.ok() && uc.report.checksum_state == ChecksumState::Unsealed && uc.records.size() == 1);

    assert(read_container(join_path(dir, "missing.bin")).status.kind == ErrorKind::Io);
  }

  // Analysis round trip at both levels
  {
    const uint32_t all = SECTION_THREAD_CONTEXT | SECTION_GROWTH | SECTION_SOURCE |
                         SECTION_FRAGMENTATION | SECTION_LIFETIMES | SECTION_HEALTH;
    BinaryExportConfig full = BinaryExportConfig::debug_comprehensive();
    full.compression_level = 0;
    AggregatedAnalysis a = sample_analysis(AdvancedMetricsLevel::Comprehensive, all);
    AggregatedAnalysis back;
    assert(decode_analysis(encode_analysis(a, full), back).ok());
    assert(back == a);

    BinaryExportConfig essential = BinaryExportConfig::performance_first();
    AggregatedAnalysis e = sample_analysis(AdvancedMetricsLevel::Essential, essential.section_flags());
    AggregatedAnalysis eback;
    assert(decode_analysis(encode_analysis(e, essential), eback).ok());
    assert(eback == e);
    assert(eback.sections.has(SECTION_THREAD_CONTEXT) && !eback.sections.has(SECTION_HEALTH));

    // sections not enabled in the export config are left out
    AggregatedAnalysis trimmed;
    assert(decode_analysis(encode_analysis(a, essential), trimmed).ok());
    assert(trimmed.sections.flags == essential.section_flags());
    assert(trimmed.sections.health == Health{});
    assert(trimmed.summary == a.summary);

    const std::string path = join_path(dir, "analysis.hlb");
    assert(write_analysis(path, a, full).ok());
    AggregatedAnalysis fromfile;
    assert(read_analysis(path, fromfile).ok());
    assert(fromfile == a);

    // a thread file is not an analysis document
    AggregatedAnalysis wrong;
    assert(decode_analysis(sample_thread_file(), wrong).kind == ErrorKind::Format);
  }

  // One damaged section in a sealed analysis: strict refuses the document,
  // best effort keeps everything else and names the skipped record
  {
    const uint32_t all = SECTION_THREAD_CONTEXT | SECTION_GROWTH | SECTION_SOURCE |
                         SECTION_FRAGMENTATION | SECTION_LIFETIMES | SECTION_HEALTH;
    BinaryExportConfig full = BinaryExportConfig::debug_comprehensive();
    full.compression_level = 0;
    AggregatedAnalysis a = sample_analysis(AdvancedMetricsLevel::Comprehensive, all);
    Container src = read_container(encode_analysis(a, full));
    assert(src.ok());

    ContainerBuilder cb(src.meta);
    uint64_t bad_offset = 0;
    for (const Record& r : src.records) {
      Bytes p = r.payload;
      ByteCursor cur(p.data(), p.size());
      if (r.tag == TAG_SECTION && cur.u32() == SECTION_GROWTH) {
        for (size_t i = 4; i < 8; ++i) p[i] = 0xFF;   // entry count far past the payload
        bad_offset = r.offset;
      }
      cb.add(r.tag, p);
    }
    assert(bad_offset != 0);
    const Bytes damaged = cb.finish();
    const std::string path = join_path(dir, "damaged-analysis.hlb");
    FILE* f = std::fopen(path.c_str(), "wb");
    assert(f && std::fwrite(damaged.data(), 1, damaged.size(), f) == damaged.size());
    std::fclose(f);

    AggregatedAnalysis strict;
    Status s = read_analysis(path, strict);
    assert(s.kind == ErrorKind::Format);
    assert(contains(s.message, "malformed analysis record"));
    assert(strict == AggregatedAnalysis{});

    AggregatedAnalysis partial;
    std::vector<ValidationIssue> dropped;
    assert(read_analysis(path, partial, ReadMode::BestEffort, &dropped).ok());
    assert(dropped.size() == 1);
    assert(dropped[0].kind == ErrorKind::Format && dropped[0].offset == bad_offset);
    assert(partial.summary == a.summary);
    assert(partial.thread_stats == a.thread_stats);
    assert(partial.hottest_call_stacks == a.hottest_call_stacks);
    assert(!partial.sections.has(SECTION_GROWTH) && partial.sections.growth.empty());
    assert(partial.sections.has(SECTION_HEALTH) && partial.sections.health == a.sections.health);
    assert(partial.sections.lifetimes == a.sections.lifetimes);
    assert(partial.sections.source == a.sections.source);
  }

#if HEAPLINE_USE_ZLIB
  // gzip on write, transparent on read
  {
    BinaryExportConfig cfg = BinaryExportConfig::debug_comprehensive();
    cfg.compression_level = 6;
    AggregatedAnalysis a = sample_analysis(AdvancedMetricsLevel::Comprehensive, cfg.section_flags());
    const std::string path = join_path(dir, "analysis.hlb.gz");
    assert(write_analysis(path, a, cfg).ok());
    Bytes raw;
    assert(read_whole_file(path, raw) && is_gzip(raw));
    AggregatedAnalysis back;
    assert(read_analysis(path, back).ok());
    assert(back == a);
  }

  // Compressed input larger than one inflate slice; a cut stream is refused
  {
    Bytes plain(1 << 20);
    uint64_t x = 0x9E3779B97F4A7C15ull;
    for (uint8_t& v : plain) { x ^= x << 13; x ^= x >> 7; x ^= x << 17; v = (uint8_t)x; }
    const std::string src = join_path(dir, "noise.bin");
    const std::string gz = join_path(dir, "noise.bin.gz");
    FILE* f = std::fopen(src.c_str(), "wb");
    assert(f && std::fwrite(plain.data(), 1, plain.size(), f) == plain.size());
    std::fclose(f);
    assert(compress_file_to_gzip(src.c_str(), gz.c_str(), 6));
    Bytes packed, back;
    assert(read_whole_file(gz, packed) && packed.size() > 256 * 1024);
    assert(gunzip_bytes(packed, back));
    assert(back == plain);
    packed.resize(packed.size() / 2);
    assert(!gunzip_bytes(packed, back));
  }
#endif

  // Export config fix-ups
  {
    BinaryExportConfig c;
    c.buffer_size = 10;
    c.compression_level = 42;
    c.advanced_metrics_level = AdvancedMetricsLevel::Essential;
    c.health_scoring = true;
    c.source_analysis = true;
    std::vector<std::string> w = validate_and_fix(c);
    assert(c.buffer_size == MIN_BUFFER_SIZE);
    assert(c.compression_level == MAX_COMPRESSION_LEVEL);
    assert(!c.health_scoring && !c.source_analysis);
    assert(w.size() == 4);
    assert(count_containing(w, "health_scoring") == 1);

    BinaryExportConfig none = BinaryExportConfig::debug_comprehensive();
    none.advanced_metrics_level = AdvancedMetricsLevel::None;
    none.compression_level = 0;
    w = validate_and_fix(none);
    assert(w.size() == 1 && !none.any_section());

    BinaryExportConfig ok = BinaryExportConfig::performance_first();
    assert(validate_and_fix(ok).empty());
    BinaryExportConfig m = BinaryExportConfig::minimal();
    assert(validate_and_fix(m).empty() && m.section_flags() == 0);
  }

  std::cout << "OK\n";
  return 0;
}
