/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_RECORDER_HPP_INCLUDED
#define HEAPLINE_RECORDER_HPP_INCLUDED

#include "base.hpp"
#include "codec.hpp"
#include "interner.hpp"
#include "log.hpp"
#include "sampling.hpp"
#include "status.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace heapline {

// ---- Session registry -----------------------------------------------------

struct Session {
  std::mutex            mu;               // guards dir and sampling
  std::string           dir = HEAPLINE_DEFAULT_DIR;
  SamplingConfig        sampling;
  std::atomic<bool>     enabled{true};
  std::atomic<uint64_t> next_thread_id{1};
  std::atomic<uint64_t> active_recorders{0};

  // Environment is read once, on first use.
  Session() {
    if (const char* d = std::getenv("HEAPLINE_DIR")) { if (*d) dir = d; }
    if (std::getenv("HEAPLINE_DISABLE")) enabled.store(false, std::memory_order_release);
    if (std::getenv("HEAPLINE_ENABLE"))  enabled.store(true,  std::memory_order_release);
    sampling = sampling_config_from_env(SamplingConfig::defaults());
  }
};

inline Session& session() { static Session S; return S; }

inline bool is_enabled() { return session().enabled.load(std::memory_order_acquire); }
inline void set_enabled(bool on) { session().enabled.store(on, std::memory_order_release); }

inline void set_default_dir(const std::string& dir) {
  std::lock_guard<std::mutex> lk(session().mu);
  session().dir = dir;
}
inline std::string default_dir() {
  std::lock_guard<std::mutex> lk(session().mu);
  return session().dir;
}

inline Status set_default_sampling(const SamplingConfig& cfg) {
  Status s = validate_sampling_config(cfg);
  if (!s.ok()) return s;
  std::lock_guard<std::mutex> lk(session().mu);
  session().sampling = cfg;
  return s;
}
inline SamplingConfig default_sampling() {
  std::lock_guard<std::mutex> lk(session().mu);
  return session().sampling;
}

inline uint64_t active_recorders() { return session().active_recorders.load(std::memory_order_relaxed); }

// ---- PerThreadRecorder ----------------------------------------------------

enum class RecorderState : uint8_t { Uninitialized, Active, Finalized, Failed };

inline const char* recorder_state_name(RecorderState s) {
  switch (s) {
    case RecorderState::Uninitialized: return "uninitialized";
    case RecorderState::Active:        return "active";
    case RecorderState::Finalized:     return "finalized";
    case RecorderState::Failed:        return "failed";
  }
  return "?";
}

class PerThreadRecorder;

// Recorder the heap hooks feed on this thread. Trivially destructible, so it stays
// readable while the thread's other thread_local objects are torn down.
inline thread_local PerThreadRecorder* tls_capture_recorder = nullptr;

// One thread's capture state and its two files. Owned and driven by a single thread.
class PerThreadRecorder {
public:
  explicit PerThreadRecorder(CallStackInterner& in = interner()) : interner_(&in) {}

  ~PerThreadRecorder() {
    if (tls_capture_recorder == this) tls_capture_recorder = nullptr;
    if (state_ != RecorderState::Active) return;
    Status s = finalize();
    if (!s.ok()) HEAPLINE_LOG_ERROR("thread %" PRIu64 ": finalize at exit failed: %s", thread_id_, s.message.c_str());
  }

  PerThreadRecorder(const PerThreadRecorder&) = delete;
  PerThreadRecorder& operator=(const PerThreadRecorder&) = delete;

  Status init(const std::string& dir, const SamplingConfig& cfg) {
    if (state_ == RecorderState::Active) return Status::success();
    Status s = validate_sampling_config(cfg);
    if (!s.ok()) return s;
    if (!make_dirs(dir.c_str()))
      return make_error(ErrorKind::Io, "cannot create directory %s: %s", dir.c_str(), std::strerror(errno));

    thread_id_ = session().next_thread_id.fetch_add(1, std::memory_order_relaxed);
    policy_.reset(new SamplingPolicy(cfg, thread_id_));
    flushed_ = SamplingStats{};
    defined_.clear();
    freq_.clear();
    buffer_.clear();
    buffer_.reserve(cfg.event_buffer_records);
    last_error_.clear();

    Metadata m;
    m.thread_id = thread_id_;
    m.os_thread_id = os_tid();
    m.created_ns = now_ns();
    m.sampling = cfg;

    m.kind = FileKind::ThreadEvents;
    s = events_.open(thread_file_path(dir, thread_id_, ".bin"), m);
    if (s.ok()) {
      m.kind = FileKind::ThreadFrequency;
      s = freq_log_.open(thread_file_path(dir, thread_id_, ".freq"), m);
    }
    if (!s.ok()) {
      events_.abandon();
      freq_log_.abandon();
      state_ = RecorderState::Failed;
      last_error_ = s.message;
      HEAPLINE_LOG_ERROR("thread %" PRIu64 ": %s", thread_id_, s.message.c_str());
      return s;
    }

    state_ = RecorderState::Active;
    session().active_recorders.fetch_add(1, std::memory_order_relaxed);
    HEAPLINE_LOG_INFO("thread %" PRIu64 " recording into %s", thread_id_, dir.c_str());
    return Status::success();
  }

  Status track_allocation(uint64_t ptr, uint64_t size, const Frame* frames, size_t depth, uint64_t ts) {
    Status s = check_active();
    if (!s.ok()) return s;

    Disposition d = policy_->classify_allocation(size);
    if (d == Disposition::Dropped) return s;

    if (d == Disposition::Full) {
      CallStackRef ref = interner_->normalize(frames, depth);
      interner_->record_use(ref);
      note_frequency(ref.hash, size, true);
      buffer_.push_back(Pending{ TAG_ALLOC, ptr, size, ts, ref });
    } else {
      note_frequency(interner_->hash_of(frames, depth), size, true);
    }
    return maybe_flush();
  }

  Status track_deallocation(uint64_t ptr, const Frame* frames, size_t depth, uint64_t ts) {
    Status s = check_active();
    if (!s.ok()) return s;

    if (policy_->classify_deallocation() == Disposition::Full) {
      CallStackRef ref = interner_->normalize(frames, depth);
      interner_->record_use(ref);
      note_frequency(ref.hash, 0, false);
      buffer_.push_back(Pending{ TAG_FREE, ptr, 0, ts, ref });
    } else {
      note_frequency(interner_->hash_of(frames, depth), 0, false);
    }
    return maybe_flush();
  }

  // Writes buffered events, then the frequency and counter deltas, then flushes both files.
  Status flush() {
    Status s = check_active();
    if (!s.ok()) return s;

    Bytes p;
    for (const Pending& e : buffer_) {
      if (!e.ref.empty() && defined_.insert(e.ref.id).second) {
        const NormalizedCallStack* ns = interner_->lookup(e.ref.id);
        if (ns) {
          p.clear();
          encode_stack_def(e.ref, ns->frames.data(), p);
          if (!(s = events_.append(TAG_STACK_DEF, p)).ok()) return fail(s);
        }
      }
      p.clear();
      if (e.tag == TAG_ALLOC) encode_alloc(AllocationEvent{ e.ptr, e.size, e.ref, e.ts, thread_id_ }, p);
      else                    encode_free(DeallocationEvent{ e.ptr, e.ref, e.ts, thread_id_ }, p);
      if (!(s = events_.append(e.tag, p)).ok()) return fail(s);
    }
    buffer_.clear();

    for (const auto& kv : freq_) {
      p.clear();
      encode_freq_delta(kv.second, p);
      if (!(s = freq_log_.append(TAG_FREQ_DELTA, p)).ok()) return fail(s);
    }
    freq_.clear();

    const SamplingStats& now = policy_->stats();
    SamplingStats delta;
    delta.full_allocations             = now.full_allocations - flushed_.full_allocations;
    delta.frequency_only_allocations   = now.frequency_only_allocations - flushed_.frequency_only_allocations;
    delta.dropped_allocations          = now.dropped_allocations - flushed_.dropped_allocations;
    delta.full_deallocations           = now.full_deallocations - flushed_.full_deallocations;
    delta.frequency_only_deallocations = now.frequency_only_deallocations - flushed_.frequency_only_deallocations;
    p.clear();
    encode_counters(delta, p);
    if (!(s = freq_log_.append(TAG_COUNTERS, p)).ok()) return fail(s);
    flushed_ = now;

    if (!(s = events_.flush()).ok())   return fail(s);
    if (!(s = freq_log_.flush()).ok()) return fail(s);
    return s;
  }

  Status finalize() {
    if (state_ != RecorderState::Active)
      return make_error(ErrorKind::State, "tracker not initialized or already finalized");
    Status s = flush();
    if (!s.ok()) return s;
    if (!(s = events_.seal()).ok())   return fail(s);
    if (!(s = freq_log_.seal()).ok()) return fail(s);
    state_ = RecorderState::Finalized;
    session().active_recorders.fetch_sub(1, std::memory_order_relaxed);
    HEAPLINE_LOG_INFO("thread %" PRIu64 " finalized: %" PRIu64 " full records, %" PRIu64 " frequency-only, %" PRIu64 " dropped",
                      thread_id_, policy_->stats().full_records(),
                      policy_->stats().frequency_only_allocations + policy_->stats().frequency_only_deallocations,
                      policy_->stats().dropped_allocations);
    return s;
  }

  RecorderState state() const { return state_; }
  uint64_t thread_id() const { return thread_id_; }
  size_t buffered() const { return buffer_.size(); }
  SamplingStats stats() const { return policy_ ? policy_->stats() : SamplingStats{}; }
  const std::string& events_path() const { return events_.path(); }
  const std::string& frequency_path() const { return freq_log_.path(); }

private:
  struct Pending {
    uint8_t      tag;
    uint64_t     ptr;
    uint64_t     size;
    uint64_t     ts;
    CallStackRef ref;
  };

  Status check_active() const {
    switch (state_) {
      case RecorderState::Active: return Status::success();
      case RecorderState::Failed: return make_error(ErrorKind::Io, "recorder failed earlier: %s", last_error_.c_str());
      default:                    return make_error(ErrorKind::State, "tracker not initialized or already finalized");
    }
  }

  Status maybe_flush() {
    if (buffer_.size() < policy_->cfg.event_buffer_records) return Status::success();
    return flush();
  }

  void note_frequency(uint64_t hash, uint64_t bytes, bool alloc) {
    if (hash == 0) return;
    FreqDelta& d = freq_[hash];
    d.hash = hash;
    if (alloc) { ++d.allocations; d.bytes += bytes; }
    else       { ++d.deallocations; }
  }

  // I/O errors are final for this recording: files are closed unsealed.
  Status fail(const Status& s) {
    events_.abandon();
    freq_log_.abandon();
    buffer_.clear();
    freq_.clear();
    if (state_ == RecorderState::Active) session().active_recorders.fetch_sub(1, std::memory_order_relaxed);
    state_ = RecorderState::Failed;
    last_error_ = s.message;
    HEAPLINE_LOG_ERROR("thread %" PRIu64 ": %s", thread_id_, s.message.c_str());
    return s;
  }

  CallStackInterner*                     interner_;
  RecorderState                          state_ = RecorderState::Uninitialized;
  uint64_t                               thread_id_ = 0;
  std::unique_ptr<SamplingPolicy>        policy_;
  SamplingStats                          flushed_;
  RecordWriter                           events_;
  RecordWriter                           freq_log_;
  std::vector<Pending>                   buffer_;
  std::unordered_map<uint64_t, FreqDelta> freq_;
  std::unordered_set<uint64_t>           defined_;   // stack ids with a StackDef in this events file
  std::string                            last_error_;
};

// ---- Upstream API (calling thread's recorder) -----------------------------

// Finalized by its destructor at thread exit if still Active.
inline PerThreadRecorder& this_thread_recorder() {
  thread_local PerThreadRecorder R;
  return R;
}

inline uint64_t ptr_bits(const void* p) { return (uint64_t)reinterpret_cast<uintptr_t>(p); }

inline Status init_thread_tracker(const std::string& dir, const SamplingConfig& cfg) {
  if (!is_enabled()) return Status::success();
  PerThreadRecorder& r = this_thread_recorder();
  Status s = r.init(dir, cfg);
  if (s.ok()) tls_capture_recorder = &r;
  return s;
}

inline Status init_thread_tracker() { return init_thread_tracker(default_dir(), default_sampling()); }

inline Status track_allocation_at(const void* ptr, size_t size, const Frame* frames, size_t depth, uint64_t ts) {
  if (!is_enabled()) return Status::success();
  return this_thread_recorder().track_allocation(ptr_bits(ptr), size, frames, depth, ts);
}
inline Status track_allocation(const void* ptr, size_t size, const Frame* frames, size_t depth) {
  return track_allocation_at(ptr, size, frames, depth, now_ns());
}
inline Status track_allocation(const void* ptr, size_t size, const std::vector<Frame>& call_stack) {
  return track_allocation_at(ptr, size, call_stack.data(), call_stack.size(), now_ns());
}
inline Status track_allocation_at(const void* ptr, size_t size, const std::vector<Frame>& call_stack, uint64_t ts) {
  return track_allocation_at(ptr, size, call_stack.data(), call_stack.size(), ts);
}

inline Status track_deallocation_at(const void* ptr, const Frame* frames, size_t depth, uint64_t ts) {
  if (!is_enabled()) return Status::success();
  return this_thread_recorder().track_deallocation(ptr_bits(ptr), frames, depth, ts);
}
inline Status track_deallocation(const void* ptr, const Frame* frames, size_t depth) {
  return track_deallocation_at(ptr, frames, depth, now_ns());
}
inline Status track_deallocation(const void* ptr, const std::vector<Frame>& call_stack) {
  return track_deallocation_at(ptr, call_stack.data(), call_stack.size(), now_ns());
}
inline Status track_deallocation_at(const void* ptr, const std::vector<Frame>& call_stack, uint64_t ts) {
  return track_deallocation_at(ptr, call_stack.data(), call_stack.size(), ts);
}

inline Status flush_thread_tracker() { return this_thread_recorder().flush(); }

inline Status finalize_thread_tracker() {
  tls_capture_recorder = nullptr;
  return this_thread_recorder().finalize();
}

} // namespace heapline

#endif // HEAPLINE_RECORDER_HPP_INCLUDED
