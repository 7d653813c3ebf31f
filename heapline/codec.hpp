/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_CODEC_HPP_INCLUDED
#define HEAPLINE_CODEC_HPP_INCLUDED

#include "base.hpp"
#include "config.hpp"
#include "interner.hpp"
#include "log.hpp"
#include "sampling.hpp"
#include "status.hpp"

namespace heapline {

// ---- Container layout -----------------------------------------------------
//
//   [magic:8 "HEAPLINE"][format_version:u32][checksum:u64]     (20-byte header)
//   [metadata_len:u32][metadata payload]
//   [tag:u8][len:u32][payload] ...                              (record stream)
//
// Integers are little-endian. The checksum is FNV-1a-64 over every byte after
// the header; 0 marks a file whose writer never sealed it.

constexpr char     MAGIC[8] = { 'H','E','A','P','L','I','N','E' };
constexpr uint32_t FORMAT_VERSION = 2;
constexpr uint32_t MIN_SUPPORTED_VERSION = 1;
constexpr size_t   HEADER_SIZE = 20;
constexpr size_t   CHECKSUM_OFFSET = 12;
constexpr size_t   RECORD_HEADER_SIZE = 5;

// Version 1 metadata ends after `created_ns`; version 2 appends the sampling config.
constexpr size_t   METADATA_V1_SIZE = 30;
constexpr size_t   METADATA_SAMPLING_SIZE = 60;

// <dir>/thread-<id>.bin holds events, <dir>/thread-<id>.freq the frequency log.
inline std::string thread_file_path(const std::string& dir, uint64_t tid, const char* ext) {
  char name[64];
  std::snprintf(name, sizeof(name), "thread-%" PRIu64 "%s", tid, ext);
  return join_path(dir, name);
}

// "thread-<digits><ext>" -> id. Only the canonical spelling thread_file_path()
// produces is accepted: no leading zeros, no value past UINT64_MAX.
inline bool parse_thread_file(const std::string& name, const char* ext, uint64_t& id) {
  static const char prefix[] = "thread-";
  const size_t pn = sizeof(prefix) - 1, en = std::strlen(ext);
  if (name.size() <= pn + en || name.compare(0, pn, prefix) != 0 || !ends_with(name.c_str(), ext)) return false;
  const size_t end = name.size() - en;
  if (name[pn] == '0' && end - pn > 1) return false;
  uint64_t v = 0;
  for (size_t i = pn; i < end; ++i) {
    char ch = name[i];
    if (ch < '0' || ch > '9') return false;
    const uint64_t d = (uint64_t)(ch - '0');
    if (v > (UINT64_MAX - d) / 10) return false;
    v = v * 10 + d;
  }
  id = v;
  return true;
}

inline uint64_t seal_value(uint64_t h) { return h == 0 ? 1 : h; }

enum class FileKind : uint8_t { ThreadEvents = 1, ThreadFrequency = 2, Analysis = 3 };

inline const char* file_kind_name(FileKind k) {
  switch (k) {
    case FileKind::ThreadEvents:    return "thread-events";
    case FileKind::ThreadFrequency: return "thread-frequency";
    case FileKind::Analysis:        return "analysis";
  }
  return "?";
}

enum RecordTag : uint8_t {
  // per-thread files
  TAG_ALLOC        = 1,
  TAG_FREE         = 2,
  TAG_STACK_DEF    = 3,
  TAG_FREQ_DELTA   = 4,
  TAG_COUNTERS     = 5,
  // analysis document
  TAG_THREAD_STATS = 16,
  TAG_SUMMARY      = 17,
  TAG_HOT_STACK    = 18,
  TAG_SECTION      = 19,
};

inline bool known_tag(uint8_t t) {
  return (t >= TAG_ALLOC && t <= TAG_COUNTERS) || (t >= TAG_THREAD_STATS && t <= TAG_SECTION);
}

struct Metadata {
  FileKind             kind = FileKind::ThreadEvents;
  AdvancedMetricsLevel level = AdvancedMetricsLevel::None;
  uint32_t             section_flags = 0;
  uint64_t             thread_id = 0;
  uint64_t             os_thread_id = 0;
  uint64_t             created_ns = 0;
  SamplingConfig       sampling;
};

inline void encode_metadata(const Metadata& m, Bytes& out) {
  put_u8 (out, (uint8_t)m.kind);
  put_u8 (out, (uint8_t)m.level);
  put_u32(out, m.section_flags);
  put_u64(out, m.thread_id);
  put_u64(out, m.os_thread_id);
  put_u64(out, m.created_ns);
  put_u64(out, m.sampling.critical_size_threshold);
  put_u64(out, m.sampling.medium_size_threshold);
  put_f64(out, m.sampling.medium_sample_rate);
  put_f64(out, m.sampling.small_sample_rate);
  put_u64(out, m.sampling.frequency_sample_interval);
  put_u64(out, m.sampling.max_records_per_thread);
  put_u32(out, m.sampling.event_buffer_records);
  put_u64(out, m.sampling.seed);
}

// Trailing bytes beyond what this version knows are ignored.
inline bool decode_metadata(const uint8_t* p, size_t n, Metadata& m) {
  if (n < METADATA_V1_SIZE) return false;
  ByteCursor c(p, n);
  uint8_t kind  = c.u8();
  uint8_t level = c.u8();
  if (kind < (uint8_t)FileKind::ThreadEvents || kind > (uint8_t)FileKind::Analysis) return false;
  if (level > (uint8_t)AdvancedMetricsLevel::Comprehensive) return false;
  m.kind          = (FileKind)kind;
  m.level         = (AdvancedMetricsLevel)level;
  m.section_flags = c.u32();
  m.thread_id     = c.u64();
  m.os_thread_id  = c.u64();
  m.created_ns    = c.u64();
  if (c.remaining() >= METADATA_SAMPLING_SIZE) {
    m.sampling.critical_size_threshold   = c.u64();
    m.sampling.medium_size_threshold     = c.u64();
    m.sampling.medium_sample_rate        = c.f64();
    m.sampling.small_sample_rate         = c.f64();
    m.sampling.frequency_sample_interval = c.u64();
    m.sampling.max_records_per_thread    = c.u64();
    m.sampling.event_buffer_records      = c.u32();
    m.sampling.seed                      = c.u64();
  }
  return c.ok;
}

// ---- Thread records -------------------------------------------------------

struct AllocationEvent {
  uint64_t     ptr = 0;
  uint64_t     size = 0;
  CallStackRef call_stack;
  uint64_t     timestamp = 0;
  uint64_t     thread_id = 0;   // from file metadata, not stored per record
};

struct DeallocationEvent {
  uint64_t     ptr = 0;
  CallStackRef call_stack;
  uint64_t     timestamp = 0;
  uint64_t     thread_id = 0;
};

struct StackDef {
  CallStackRef       ref;
  std::vector<Frame> frames;
};

// Per-stack counts since the previous flush. Covers Full and FrequencyOnly events.
struct FreqDelta {
  uint64_t hash = 0;
  uint64_t allocations = 0;
  uint64_t bytes = 0;
  uint64_t deallocations = 0;
};

inline void put_ref(Bytes& b, const CallStackRef& r) { put_u64(b, r.id); put_u64(b, r.hash); put_u32(b, r.depth); }
inline CallStackRef get_ref(ByteCursor& c) {
  CallStackRef r;
  r.id = c.u64(); r.hash = c.u64(); r.depth = c.u32();
  return r;
}

inline void encode_alloc(const AllocationEvent& e, Bytes& b) {
  put_u64(b, e.ptr); put_u64(b, e.size); put_ref(b, e.call_stack); put_u64(b, e.timestamp);
}
inline bool decode_alloc(const Bytes& p, AllocationEvent& e) {
  ByteCursor c(p.data(), p.size());
  e.ptr = c.u64(); e.size = c.u64(); e.call_stack = get_ref(c); e.timestamp = c.u64();
  return c.ok;
}

inline void encode_free(const DeallocationEvent& e, Bytes& b) {
  put_u64(b, e.ptr); put_ref(b, e.call_stack); put_u64(b, e.timestamp);
}
inline bool decode_free(const Bytes& p, DeallocationEvent& e) {
  ByteCursor c(p.data(), p.size());
  e.ptr = c.u64(); e.call_stack = get_ref(c); e.timestamp = c.u64();
  return c.ok;
}

inline void encode_stack_def(const CallStackRef& r, const Frame* frames, Bytes& b) {
  put_ref(b, r);
  for (uint32_t i = 0; i < r.depth; ++i) put_u64(b, frames[i]);
}
inline bool decode_stack_def(const Bytes& p, StackDef& d) {
  ByteCursor c(p.data(), p.size());
  d.ref = get_ref(c);
  if (!c.ok || c.remaining() / 8 < d.ref.depth) return false;
  d.frames.resize(d.ref.depth);
  for (uint32_t i = 0; i < d.ref.depth; ++i) d.frames[i] = c.u64();
  return c.ok;
}

inline void encode_freq_delta(const FreqDelta& d, Bytes& b) {
  put_u64(b, d.hash); put_u64(b, d.allocations); put_u64(b, d.bytes); put_u64(b, d.deallocations);
}
inline bool decode_freq_delta(const Bytes& p, FreqDelta& d) {
  ByteCursor c(p.data(), p.size());
  d.hash = c.u64(); d.allocations = c.u64(); d.bytes = c.u64(); d.deallocations = c.u64();
  return c.ok;
}

inline void encode_counters(const SamplingStats& s, Bytes& b) {
  put_u64(b, s.full_allocations);
  put_u64(b, s.frequency_only_allocations);
  put_u64(b, s.dropped_allocations);
  put_u64(b, s.full_deallocations);
  put_u64(b, s.frequency_only_deallocations);
}
inline bool decode_counters(const Bytes& p, SamplingStats& s) {
  ByteCursor c(p.data(), p.size());
  s.full_allocations             = c.u64();
  s.frequency_only_allocations   = c.u64();
  s.dropped_allocations          = c.u64();
  s.full_deallocations           = c.u64();
  s.frequency_only_deallocations = c.u64();
  return c.ok;
}

// ---- Writers --------------------------------------------------------------

inline void put_header(Bytes& b, uint32_t version) {
  b.insert(b.end(), MAGIC, MAGIC + 8);
  put_u32(b, version);
  put_u64(b, 0);
}

// Builds a whole container in memory. finish() patches the checksum.
struct ContainerBuilder {
  Bytes    out;
  uint64_t records = 0;

  explicit ContainerBuilder(const Metadata& m, uint32_t version = FORMAT_VERSION) {
    put_header(out, version);
    Bytes meta;
    encode_metadata(m, meta);
    put_u32(out, (uint32_t)meta.size());
    out.insert(out.end(), meta.begin(), meta.end());
  }

  void add(uint8_t tag, const Bytes& payload) {
    put_u8(out, tag);
    put_u32(out, (uint32_t)payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
    ++records;
  }

  Bytes& finish() {
    uint64_t h = fnv1a(out.data() + HEADER_SIZE, out.size() - HEADER_SIZE);
    store_u64(out.data() + CHECKSUM_OFFSET, seal_value(h));
    return out;
  }
};

// Streaming writer: header first, records appended as they come, checksum
// patched in by seal(). A writer destroyed without seal() leaves an unsealed file.
class RecordWriter {
public:
  RecordWriter() = default;
  ~RecordWriter() { abandon(); }

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  Status open(const std::string& path, const Metadata& meta,
              uint32_t buffer_size = 64 * 1024, uint32_t version = FORMAT_VERSION) {
    abandon();
    path_ = path;
    f_ = std::fopen(path.c_str(), "wb");
    if (!f_) return make_error(ErrorKind::Io, "cannot create %s: %s", path.c_str(), std::strerror(errno));
    if (buffer_size) {
      buf_.resize(buffer_size);
      std::setvbuf(f_, buf_.data(), _IOFBF, buf_.size());
    }
    hash_ = FNV_OFFSET;
    bytes_ = 0;
    records_ = 0;

    Bytes head;
    put_header(head, version);
    if (!write_raw(head.data(), head.size(), false)) return fail("header");

    Bytes m;
    encode_metadata(meta, m);
    Bytes len;
    put_u32(len, (uint32_t)m.size());
    if (!write_raw(len.data(), len.size(), true) || !write_raw(m.data(), m.size(), true)) return fail("metadata");
    return Status::success();
  }

  Status append(uint8_t tag, const Bytes& payload) {
    if (!f_) return make_error(ErrorKind::State, "%s is not open", path_.c_str());
    uint8_t rh[RECORD_HEADER_SIZE];
    rh[0] = tag;
    for (int i = 0; i < 4; ++i) rh[1 + i] = (uint8_t)((uint32_t)payload.size() >> (8 * i));
    if (!write_raw(rh, sizeof(rh), true) || !write_raw(payload.data(), payload.size(), true)) return fail("record");
    ++records_;
    return Status::success();
  }

  Status flush() {
    if (!f_) return make_error(ErrorKind::State, "%s is not open", path_.c_str());
    if (std::fflush(f_) != 0) return fail("flush");
    return Status::success();
  }

  Status seal() {
    if (!f_) return make_error(ErrorKind::State, "%s is not open", path_.c_str());
    uint8_t sum[8];
    store_u64(sum, seal_value(hash_));
    if (std::fflush(f_) != 0 ||
        std::fseek(f_, (long)CHECKSUM_OFFSET, SEEK_SET) != 0 ||
        std::fwrite(sum, 1, sizeof(sum), f_) != sizeof(sum))
      return fail("seal");
    int rc = std::fclose(f_);
    f_ = nullptr;
    if (rc != 0) return make_error(ErrorKind::Io, "close %s failed: %s", path_.c_str(), std::strerror(errno));
    return Status::success();
  }

  // Close without sealing.
  void abandon() {
    if (f_) { std::fclose(f_); f_ = nullptr; }
  }

  bool is_open() const { return f_ != nullptr; }
  uint64_t bytes_written() const { return bytes_; }
  uint64_t records_written() const { return records_; }
  const std::string& path() const { return path_; }

private:
  bool write_raw(const void* p, size_t n, bool hashed) {
    if (n && std::fwrite(p, 1, n, f_) != n) return false;
    if (hashed) hash_ = fnv1a(p, n, hash_);
    bytes_ += n;
    return true;
  }

  Status fail(const char* what) {
    Status s = make_error(ErrorKind::Io, "%s write to %s failed: %s", what, path_.c_str(), std::strerror(errno));
    abandon();
    return s;
  }

  FILE*             f_ = nullptr;
  std::vector<char> buf_;
  std::string       path_;
  uint64_t          hash_ = FNV_OFFSET;
  uint64_t          bytes_ = 0;
  uint64_t          records_ = 0;
};

// ---- Reader ---------------------------------------------------------------

enum class ReadMode : uint8_t { Strict, BestEffort };

enum class ChecksumState : uint8_t { Valid, Mismatch, Unsealed, NotChecked };

inline const char* checksum_state_name(ChecksumState s) {
  switch (s) {
    case ChecksumState::Valid:      return "valid";
    case ChecksumState::Mismatch:   return "mismatch";
    case ChecksumState::Unsealed:   return "unsealed";
    case ChecksumState::NotChecked: return "not-checked";
  }
  return "?";
}

struct ValidationIssue {
  ErrorKind   kind;
  std::string message;
  uint64_t    offset;
};

struct ValidationReport {
  bool          format_valid = false;
  uint32_t      found_version = 0;
  bool          version_supported = false;
  ChecksumState checksum_state = ChecksumState::NotChecked;
  bool          structure_valid = false;
  bool          integrity_valid = false;
  uint64_t      record_count = 0;
  uint64_t      bytes = 0;
  std::vector<ValidationIssue> errors;
  std::vector<ValidationIssue> notes;   // skipped unknown records

  bool passed() const { return format_valid && version_supported && structure_valid && integrity_valid; }

  void error(ErrorKind k, uint64_t off, const char* fmt, ...) {
    char buf[256];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    errors.push_back(ValidationIssue{ k, buf, off });
  }
};

struct UnsupportedVersion {
  uint32_t found = 0;
  uint32_t supported = FORMAT_VERSION;
};

struct Record {
  uint8_t  tag;
  uint64_t offset;
  Bytes    payload;
};

struct Container {
  ValidationReport    report;
  bool                version_rejected = false;
  UnsupportedVersion  unsupported;
  Metadata            meta;
  std::vector<Record> records;
  Status              status;

  bool ok() const { return status.ok(); }
};

inline Container read_container(const uint8_t* data, size_t n, ReadMode mode = ReadMode::Strict) {
  Container out;
  ValidationReport& r = out.report;
  r.bytes = n;

  if (n < sizeof(MAGIC) || std::memcmp(data, MAGIC, sizeof(MAGIC)) != 0) {
    r.error(ErrorKind::Format, 0, "bad magic (not a heapline file)");
    out.status = make_error(ErrorKind::Format, "bad magic (not a heapline file)");
    return out;
  }
  if (n < HEADER_SIZE) {
    r.error(ErrorKind::Format, n, "truncated header (%zu bytes)", n);
    out.status = make_error(ErrorKind::Format, "truncated header (%zu bytes)", n);
    return out;
  }

  ByteCursor hc(data, HEADER_SIZE);
  hc.skip(sizeof(MAGIC));
  r.found_version = hc.u32();
  const uint64_t stored = hc.u64();

  r.version_supported = r.found_version >= MIN_SUPPORTED_VERSION && r.found_version <= FORMAT_VERSION;
  if (!r.version_supported) {
    out.version_rejected = true;
    out.unsupported = UnsupportedVersion{ r.found_version, FORMAT_VERSION };
    r.error(ErrorKind::Format, 8, "unsupported format version %u (supported %u..%u)",
            r.found_version, MIN_SUPPORTED_VERSION, FORMAT_VERSION);
    out.status = make_error(ErrorKind::Format, "unsupported format version %u (supported %u..%u)",
                            r.found_version, MIN_SUPPORTED_VERSION, FORMAT_VERSION);
    return out;
  }
  r.format_valid = true;

  if (stored == 0) {
    r.checksum_state = ChecksumState::Unsealed;
    r.error(ErrorKind::Format, CHECKSUM_OFFSET, "file is unsealed (writer did not finish)");
  } else if (seal_value(fnv1a(data + HEADER_SIZE, n - HEADER_SIZE)) == stored) {
    r.checksum_state = ChecksumState::Valid;
  } else {
    r.checksum_state = ChecksumState::Mismatch;
    r.error(ErrorKind::Format, CHECKSUM_OFFSET, "checksum mismatch");
  }
  r.integrity_valid = r.checksum_state == ChecksumState::Valid;

  ByteCursor c(data, n);
  c.skip(HEADER_SIZE);
  uint32_t meta_len = c.u32();
  const bool meta_ok = c.ok && c.need(meta_len) && decode_metadata(data + c.pos, meta_len, out.meta);
  if (!meta_ok) {
    r.error(ErrorKind::Format, HEADER_SIZE, "metadata block is missing or malformed");
  } else {
    c.skip(meta_len);
    r.structure_valid = true;
    while (c.remaining() > 0) {
      const uint64_t off = c.pos;
      if (c.remaining() < RECORD_HEADER_SIZE) {
        r.structure_valid = false;
        r.error(ErrorKind::Format, off, "truncated record header");
        break;
      }
      uint8_t tag = c.u8();
      uint32_t len = c.u32();
      if (c.remaining() < len) {
        r.structure_valid = false;
        r.error(ErrorKind::Format, off, "record payload truncated (%u bytes declared, %zu available)", len, c.remaining());
        break;
      }
      if (!known_tag(tag)) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "unknown record tag %u skipped", (unsigned)tag);
        r.notes.push_back(ValidationIssue{ ErrorKind::Format, msg, off });
        c.skip(len);
        continue;
      }
      out.records.push_back(Record{ tag, off, Bytes(data + c.pos, data + c.pos + len) });
      c.skip(len);
    }
  }
  r.record_count = out.records.size();

  if (mode == ReadMode::Strict && !r.passed()) {
    out.records.clear();
    out.status = make_error(ErrorKind::Format, "%s", r.errors.empty() ? "validation failed" : r.errors.front().message.c_str());
  } else if (!meta_ok) {
    out.status = make_error(ErrorKind::Format, "metadata block is missing or malformed");
  }
  return out;
}

inline Container read_container(const Bytes& b, ReadMode mode = ReadMode::Strict) {
  return read_container(b.data(), b.size(), mode);
}

// ---- gzip (zlib) ----------------------------------------------------------

inline bool is_gzip(const Bytes& b) { return b.size() >= 2 && b[0] == 0x1f && b[1] == 0x8b; }

#if HEAPLINE_USE_ZLIB
// Stream-compress a whole file to gzip (.gz).
inline bool compress_file_to_gzip(const char* in_path, const char* out_path, int level /*1..9*/) {
  if (!in_path || !out_path) return false;
  FILE* fin = std::fopen(in_path, "rb");
  if (!fin) return false;
  FILE* fout = std::fopen(out_path, "wb");
  if (!fout) { std::fclose(fin); return false; }

  z_stream zs{};
  // windowBits=15, +16 -> gzip header/trailer
  int rc = deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) { std::fclose(fin); std::fclose(fout); return false; }

  const size_t CHUNK = 256 * 1024;
  std::vector<unsigned char> inbuf(CHUNK), outbuf(CHUNK);

  bool ok = true;
  for (;;) {
    zs.avail_in = (uInt)std::fread(inbuf.data(), 1, CHUNK, fin);
    zs.next_in  = inbuf.data();
    if (std::ferror(fin)) { ok = false; break; }
    int flush = std::feof(fin) ? Z_FINISH : Z_NO_FLUSH;
    do {
      zs.avail_out = (uInt)CHUNK;
      zs.next_out  = outbuf.data();
      rc = deflate(&zs, flush);
      if (rc == Z_STREAM_ERROR) { ok = false; break; }
      size_t have = CHUNK - zs.avail_out;
      if (have && std::fwrite(outbuf.data(), 1, have, fout) != have) { ok = false; break; }
    } while (zs.avail_out == 0);
    if (!ok || flush == Z_FINISH) break;
  }

  deflateEnd(&zs);
  std::fclose(fin);
  if (std::fclose(fout) != 0) ok = false;
  if (!ok) std::remove(out_path);
  return ok;
}

// Input is fed in slices, so buffers past the 32-bit avail_in range inflate too.
inline bool gunzip_bytes(const Bytes& in, Bytes& out) {
  z_stream zs{};
  if (inflateInit2(&zs, 15 + 16) != Z_OK) return false;

  const size_t CHUNK = 256 * 1024;
  std::vector<unsigned char> buf(CHUNK);
  out.clear();
  size_t fed = 0;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0) {
      if (fed == in.size()) break;   // input ended before the gzip trailer
      const size_t take = std::min(CHUNK, in.size() - fed);
      zs.next_in  = const_cast<Bytef*>(in.data() + fed);
      zs.avail_in = (uInt)take;
      fed += take;
    }
    zs.next_out  = buf.data();
    zs.avail_out = (uInt)CHUNK;
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) { inflateEnd(&zs); return false; }
    out.insert(out.end(), buf.data(), buf.data() + (CHUNK - zs.avail_out));
  }
  inflateEnd(&zs);
  return rc == Z_STREAM_END;
}
#endif // HEAPLINE_USE_ZLIB

inline Container read_container(const std::string& path, ReadMode mode = ReadMode::Strict) {
  Bytes raw;
  if (!read_whole_file(path, raw)) {
    Container out;
    out.report.error(ErrorKind::Io, 0, "cannot read %s", path.c_str());
    out.status = make_error(ErrorKind::Io, "cannot read %s: %s", path.c_str(), std::strerror(errno));
    return out;
  }
  if (is_gzip(raw)) {
#if HEAPLINE_USE_ZLIB
    Bytes plain;
    if (!gunzip_bytes(raw, plain)) {
      Container out;
      out.report.bytes = raw.size();
      out.report.error(ErrorKind::Format, 0, "corrupt gzip stream");
      out.status = make_error(ErrorKind::Format, "%s: corrupt gzip stream", path.c_str());
      return out;
    }
    return read_container(plain, mode);
#else
    Container out;
    out.report.bytes = raw.size();
    out.report.error(ErrorKind::Format, 0, "gzip-compressed file, built without zlib");
    out.status = make_error(ErrorKind::Format, "%s is gzip-compressed; rebuild with HEAPLINE_USE_ZLIB=1", path.c_str());
    return out;
#endif
  }
  return read_container(raw, mode);
}

// Writes `b` to `path` through a .tmp file; gzip when level > 0 and zlib is built in.
inline Status write_bytes_file(const std::string& path, const Bytes& b, int gzip_level = 0) {
  const std::string tmp = path + ".tmp";
  FILE* f = std::fopen(tmp.c_str(), "wb");
  if (!f) return make_error(ErrorKind::Io, "cannot create %s: %s", tmp.c_str(), std::strerror(errno));
  bool ok = b.empty() || std::fwrite(b.data(), 1, b.size(), f) == b.size();
  if (std::fclose(f) != 0) ok = false;
  if (!ok) { std::remove(tmp.c_str()); return make_error(ErrorKind::Io, "write to %s failed", tmp.c_str()); }

  if (gzip_level > 0) {
#if HEAPLINE_USE_ZLIB
    bool gz = compress_file_to_gzip(tmp.c_str(), path.c_str(), gzip_level);
    std::remove(tmp.c_str());
    if (!gz) return make_error(ErrorKind::Io, "gzip of %s failed", path.c_str());
    return Status::success();
#else
    HEAPLINE_LOG_WARN("compression_level %d ignored for %s (built without zlib)", gzip_level, path.c_str());
#endif
  }
  std::remove(path.c_str());
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    return make_error(ErrorKind::Io, "rename to %s failed: %s", path.c_str(), std::strerror(errno));
  }
  return Status::success();
}

} // namespace heapline

#endif // HEAPLINE_CODEC_HPP_INCLUDED
