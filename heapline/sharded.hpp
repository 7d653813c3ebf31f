/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_SHARDED_HPP_INCLUDED
#define HEAPLINE_SHARDED_HPP_INCLUDED

#include "base.hpp"
#include "codec.hpp"
#include "log.hpp"
#include "status.hpp"

#include <cmath>

namespace heapline {

// ---- BufferedWriter -------------------------------------------------------

constexpr size_t DEFAULT_WRITER_BUFFER = 2 * 1024 * 1024;

// FILE* with a large user buffer, or an in-memory string when opened with open_memory().
// The first failed write sticks; close() reports it.
class BufferedWriter {
public:
  explicit BufferedWriter(size_t buffer_bytes = DEFAULT_WRITER_BUFFER) : buf_(buffer_bytes ? buffer_bytes : 1) {}
  ~BufferedWriter() {
    Status s = close();
    if (!s.ok()) HEAPLINE_LOG_ERROR("%s", s.message.c_str());
  }

  BufferedWriter(const BufferedWriter&) = delete;
  BufferedWriter& operator=(const BufferedWriter&) = delete;

  Status open(const std::string& path) {
    Status s = close();
    if (!s.ok()) return s;
    path_ = path;
    f_ = std::fopen(path.c_str(), "wb");
    if (!f_) return make_error(ErrorKind::Io, "cannot create %s: %s", path.c_str(), std::strerror(errno));
    std::setvbuf(f_, buf_.data(), _IOFBF, buf_.size());
    bytes_ = 0;
    failed_ = false;
    memory_ = false;
    return s;
  }

  void open_memory() {
    (void)close();
    path_ = "<memory>";
    mem_.clear();
    bytes_ = 0;
    failed_ = false;
    memory_ = true;
  }

  bool write(const char* p, size_t n) {
    if (failed_) return false;
    if (memory_) { mem_.append(p, n); bytes_ += n; return true; }
    if (!f_ || (n && std::fwrite(p, 1, n, f_) != n)) { failed_ = true; return false; }
    bytes_ += n;
    return true;
  }
  bool write(const std::string& s) { return write(s.data(), s.size()); }
  bool put(char c) { return write(&c, 1); }

  Status close() {
    if (memory_) { memory_ = false; return Status::success(); }
    if (!f_) return Status::success();
    int rc = std::fclose(f_);
    f_ = nullptr;
    if (failed_ || rc != 0) return make_error(ErrorKind::Io, "write to %s failed", path_.c_str());
    return Status::success();
  }

  bool failed() const { return failed_; }
  uint64_t bytes() const { return bytes_; }
  const std::string& memory() const { return mem_; }
  const std::string& path() const { return path_; }

private:
  FILE*             f_ = nullptr;
  std::vector<char> buf_;
  std::string       mem_;
  std::string       path_;
  uint64_t          bytes_ = 0;
  bool              failed_ = false;
  bool              memory_ = false;
};

// ---- ShardedEncoder -------------------------------------------------------

struct ShardConfig {
  size_t   shard_size = 1000;
  size_t   parallel_threshold = 2000;   // fewer records than this: encode on the calling thread
  unsigned max_threads = 0;             // 0: hardware_concurrency
};

struct EncodeStats {
  uint64_t records = 0;
  uint64_t shards = 0;
  unsigned threads_used = 0;
  bool     used_parallel = false;
  uint64_t bytes = 0;
};

struct EncodeResult {
  Status      status;                    // Cancelled carries a valid prefix in the writer
  EncodeStats stats;
  uint64_t    shards_written = 0;

  bool ok() const { return status.ok(); }
  bool cancelled() const { return status.kind == ErrorKind::Cancelled; }
};

// Splits records into shards, encodes each to its own "[r,r,...]" buffer, and
// stitches them in shard order into one JSON array. Output is identical to a
// sequential encoding of the same records.
template <class T>
class ShardedEncoder {
public:
  using EncodeOne = std::function<void(const T&, std::string&)>;

  explicit ShardedEncoder(ShardConfig cfg = ShardConfig{}) : cfg_(cfg) {}

  EncodeResult encode(const std::vector<T>& records, const EncodeOne& encode_one, BufferedWriter& out,
                      const std::atomic<bool>* cancel = nullptr) const {
    EncodeResult res;
    if (cfg_.shard_size == 0) {
      res.status = make_error(ErrorKind::Configuration, "shard_size must be greater than 0");
      return res;
    }
    const size_t n = records.size();
    const size_t shards = (n + cfg_.shard_size - 1) / cfg_.shard_size;
    const uint64_t start_bytes = out.bytes();
    res.stats.records = n;
    res.stats.shards = shards;

    bool wrote_any = false;
    out.put('[');

    if (n < cfg_.parallel_threshold || shards <= 1) {
      res.stats.threads_used = 1;
      std::string buf;
      for (size_t i = 0; i < shards; ++i) {
        if (cancel && cancel->load(std::memory_order_acquire)) break;
        buf.clear();
        encode_shard(records, i, encode_one, buf);
        stitch(buf, out, wrote_any);
        ++res.shards_written;
      }
    } else {
      unsigned hw = cfg_.max_threads ? cfg_.max_threads : std::thread::hardware_concurrency();
      if (hw == 0) hw = 1;
      const unsigned workers = (unsigned)std::min<size_t>(hw, shards);
      res.stats.threads_used = workers;
      res.stats.used_parallel = true;

      std::vector<std::string> bufs(shards);
      std::vector<char> done(shards, 0);
      std::atomic<size_t> next{0};
      auto work = [&]() {
        for (;;) {
          if (cancel && cancel->load(std::memory_order_acquire)) return;
          size_t i = next.fetch_add(1, std::memory_order_relaxed);
          if (i >= shards) return;
          encode_shard(records, i, encode_one, bufs[i]);
          done[i] = 1;
        }
      };
      std::vector<std::thread> pool;
      pool.reserve(workers);
      for (unsigned w = 0; w < workers; ++w) pool.emplace_back(work);
      for (std::thread& t : pool) t.join();

      // longest contiguous prefix of completed shards
      for (size_t i = 0; i < shards && done[i]; ++i) {
        stitch(bufs[i], out, wrote_any);
        ++res.shards_written;
      }
    }

    out.put(']');
    res.stats.bytes = out.bytes() - start_bytes;
    if (out.failed()) {
      res.status = make_error(ErrorKind::Io, "write to %s failed", out.path().c_str());
    } else if (res.shards_written < shards) {
      res.status = make_error(ErrorKind::Cancelled, "encoding cancelled after %" PRIu64 " of %zu shards",
                              res.shards_written, shards);
      HEAPLINE_LOG_INFO("%s", res.status.message.c_str());
    }
    return res;
  }

  const ShardConfig& config() const { return cfg_; }

private:
  void encode_shard(const std::vector<T>& records, size_t index, const EncodeOne& encode_one, std::string& buf) const {
    const size_t begin = index * cfg_.shard_size;
    const size_t end = std::min(records.size(), begin + cfg_.shard_size);
    buf.push_back('[');
    for (size_t i = begin; i < end; ++i) {
      if (i != begin) buf.push_back(',');
      encode_one(records[i], buf);
    }
    buf.push_back(']');
  }

  // Strips the shard's brackets; one ',' between non-empty shards.
  static void stitch(const std::string& shard, BufferedWriter& out, bool& wrote_any) {
    if (shard.size() <= 2) return;
    if (wrote_any) out.put(',');
    out.write(shard.data() + 1, shard.size() - 2);
    wrote_any = true;
  }

  ShardConfig cfg_;
};

// ---- JSON helpers ---------------------------------------------------------

inline void json_escape_append(std::string& out, const char* s) {
  out.push_back('"');
  for (const unsigned char* p = (const unsigned char*)s; *p; ++p) {
    unsigned char c = *p;
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) { char u[8]; std::snprintf(u, sizeof(u), "\\u%04x", c); out += u; }
        else out.push_back((char)c);
    }
  }
  out.push_back('"');
}

// 64-bit ids and addresses go out as hex strings; JSON numbers lose precision past 2^53.
inline void json_hex(std::string& out, uint64_t v) {
  char b[24];
  std::snprintf(b, sizeof(b), "\"0x%016" PRIx64 "\"", v);
  out += b;
}

inline void json_u64(std::string& out, uint64_t v) {
  char b[24];
  std::snprintf(b, sizeof(b), "%" PRIu64, v);
  out += b;
}

inline void json_f64(std::string& out, double v) {
  char b[32];
  std::snprintf(b, sizeof(b), "%.17g", std::isfinite(v) ? v : 0.0);
  out += b;
}

// ---- Event export ---------------------------------------------------------

struct ExportedEvent {
  uint64_t thread_id;
  uint64_t ptr;
  uint64_t size;
  uint64_t timestamp;
  uint64_t stack_hash;
  bool     alloc;
};

inline void encode_event_json(const ExportedEvent& e, std::string& out) {
  out += e.alloc ? "{\"type\":\"alloc\",\"thread\":" : "{\"type\":\"free\",\"thread\":";
  json_u64(out, e.thread_id);
  out += ",\"ptr\":";   json_hex(out, e.ptr);
  if (e.alloc) { out += ",\"size\":"; json_u64(out, e.size); }
  out += ",\"ts\":";    json_u64(out, e.timestamp);
  out += ",\"stack\":"; json_hex(out, e.stack_hash);
  out += "}";
}

// Streams every Full event of every readable thread file in `dir` (thread id order,
// on-disk order within a thread) into {"events":[...]}. A ".gz" target is gzipped
// when zlib is built in; otherwise the suffix is dropped.
inline EncodeResult export_events_json(const std::string& dir, const std::string& path,
                                       const ShardConfig& cfg = ShardConfig{},
                                       const std::atomic<bool>* cancel = nullptr) {
  EncodeResult res;
  std::vector<std::string> names;
  if (!list_dir(dir, names)) {
    res.status = make_error(ErrorKind::Io, "cannot open directory %s", dir.c_str());
    return res;
  }
  std::vector<uint64_t> ids;
  for (const std::string& n : names) {
    uint64_t id;
    if (parse_thread_file(n, ".bin", id)) ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());

  std::vector<ExportedEvent> events;
  for (uint64_t id : ids) {
    Container c = read_container(thread_file_path(dir, id, ".bin"), ReadMode::BestEffort);
    if (!c.ok() || c.meta.kind != FileKind::ThreadEvents) {
      HEAPLINE_LOG_WARN("export: thread %" PRIu64 " skipped: %s", id, c.status.ok() ? "not an event log" : c.status.message.c_str());
      continue;
    }
    for (const Record& r : c.records) {
      if (r.tag == TAG_ALLOC) {
        AllocationEvent e;
        if (decode_alloc(r.payload, e)) events.push_back(ExportedEvent{ id, e.ptr, e.size, e.timestamp, e.call_stack.hash, true });
      } else if (r.tag == TAG_FREE) {
        DeallocationEvent e;
        if (decode_free(r.payload, e)) events.push_back(ExportedEvent{ id, e.ptr, 0, e.timestamp, e.call_stack.hash, false });
      }
    }
  }

  bool gz = ends_with(path.c_str(), ".gz");
  std::string target = path;
#if !HEAPLINE_USE_ZLIB
  if (gz) { target = path.substr(0, path.size() - 3); gz = false; }
#endif
  const std::string tmp = target + ".tmp";

  BufferedWriter w;
  res.status = w.open(tmp);
  if (!res.status.ok()) return res;
  w.write("{\"events\":", 10);
  ShardedEncoder<ExportedEvent> enc(cfg);
  res = enc.encode(events, &encode_event_json, w, cancel);
  w.write("}\n", 2);
  Status cs = w.close();
  if (!cs.ok()) { std::remove(tmp.c_str()); res.status = cs; return res; }

#if HEAPLINE_USE_ZLIB
  if (gz) {
    bool ok = compress_file_to_gzip(tmp.c_str(), target.c_str(), 6);
    std::remove(tmp.c_str());
    if (!ok && res.status.ok()) res.status = make_error(ErrorKind::Io, "gzip of %s failed", target.c_str());
    return res;
  }
#endif
  std::remove(target.c_str());
  if (std::rename(tmp.c_str(), target.c_str()) != 0) {
    std::remove(tmp.c_str());
    if (res.status.ok()) res.status = make_error(ErrorKind::Io, "rename to %s failed", target.c_str());
  }
  return res;
}

} // namespace heapline

#endif // HEAPLINE_SHARDED_HPP_INCLUDED
