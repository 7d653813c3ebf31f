/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */


#ifndef HEAPLINE_HPP_INCLUDED
#define HEAPLINE_HPP_INCLUDED
/*
 * heapline.hpp: header-only allocation capture and aggregation
 * version: 0.1.0
 *
 * About:
 *   Each instrumented thread records its allocations and deallocations into its own
 *   pair of binary files (thread-<id>.bin for sampled events, thread-<id>.freq for
 *   per-stack frequencies and counters). Call stacks are interned process-wide and
 *   written once per file. After the run, aggregate_all_threads() replays every
 *   thread file in parallel, merges them into one AggregatedAnalysis (per-thread
 *   stats, summary with a global peak, hottest stacks, optional analysis sections)
 *   and write_reports() emits a binary analysis file plus JSON and HTML reports.
 *
 * Build flags (define at compile time):
 *   -DHEAPLINE_CAPTURE=0                 Compile the HEAPLINE_* capture macros out (default 1)
 *   -DHEAPLINE_USE_ZLIB=1                Enable gzip for compressed analysis/exports (zlib present)
 *   -DHEAPLINE_DEFAULT_DIR="dir"         Capture directory (default "heapline-out")
 *   -DHEAPLINE_INTERNER_SHARDS=64        Lock shards of the call-stack interner
 *   -DHEAPLINE_STACK_DEPTH=16            Max frames captured by macros and heap hooks
 *   -DHEAPLINE_DEFAULT_BUFFER_RECORDS=N  Buffered events per thread before a flush (default 1000)
 *   -DHEAPLINE_TOP_K=10                  Hottest call stacks kept by the aggregator
 *   -DHEAPLINE_DEFINE_HEAP_HOOKS=1       Define global new/delete wrappers (ONE TU only)
 *
 * Environment variables (read once on first use):
 *   HEAPLINE_DISABLE=1                   Disable recording
 *   HEAPLINE_ENABLE=1                    Enable recording (wins over DISABLE)
 *   HEAPLINE_DIR=path                    Capture directory
 *   HEAPLINE_LOG_LEVEL=info              detail | info | warning | error | off
 *   HEAPLINE_CRITICAL_SIZE / HEAPLINE_MEDIUM_SIZE / HEAPLINE_SAMPLE_MEDIUM /
 *   HEAPLINE_SAMPLE_SMALL / HEAPLINE_SAMPLE_INTERVAL / HEAPLINE_MAX_RECORDS
 *                                        Sampling overrides for the default config
 *
 * Public API (when HEAPLINE_CAPTURE==1), examples:
 *   // Per-thread recording
 *   HEAPLINE_THREAD_INIT();                              // default dir + sampling
 *   HEAPLINE_THREAD_INIT_AT("caps", heapline::SamplingConfig::leak_detection());
 *   HEAPLINE_ALLOC(p, n);  HEAPLINE_FREE(p);             // capture the caller's stack
 *   HEAPLINE_THREAD_FLUSH();  HEAPLINE_THREAD_FINALIZE();
 *
 *   // Runtime gate
 *   HEAPLINE_ENABLE(); HEAPLINE_DISABLE(); bool on = HEAPLINE_IS_ENABLED();
 *
 *   // Aggregation and reports (plain functions, always available)
 *   heapline::AggregationOutcome out = heapline::aggregate_all_threads("caps");
 *   heapline::write_reports("caps", out, heapline::BinaryExportConfig::debug_comprehensive());
 *   HEAPLINE_REPORT("caps");                             // both steps, default options
 *
 * Notes:
 *   • Track calls on a thread that never initialized return a State error; the macros
 *     log it at detail level and move on.
 *   • A thread's files are sealed by HEAPLINE_THREAD_FINALIZE() or at thread exit.
 *   • The heap hooks only record threads that initialized a tracker, and never record
 *     heapline's own allocations.
 *   • Without HEAPLINE_USE_ZLIB a requested ".gz" output is written uncompressed under
 *     the name without ".gz".
 *
 * Requirements: C++17+, Linux/macOS (Windows without stack capture). Not async-signal-safe.
 */


#if !defined(__cplusplus) || __cplusplus < 201703L
#  error "heapline.hpp requires C++17 or later"
#endif

#include "heapline/base.hpp"
#include "heapline/status.hpp"
#include "heapline/log.hpp"
#include "heapline/stack.hpp"
#include "heapline/sampling.hpp"
#include "heapline/interner.hpp"
#include "heapline/config.hpp"
#include "heapline/codec.hpp"
#include "heapline/analysis.hpp"
#include "heapline/recorder.hpp"
#include "heapline/aggregator.hpp"
#include "heapline/sharded.hpp"
#include "heapline/report.hpp"

#include <new>

namespace heapline {

// ---- Hook layer ------------------------------------------------------------

// Set while a hook records, so allocations made by the recorder itself are not seen.
inline thread_local bool tls_in_heap_hook = false;

struct HeapHookGuard {
  bool active = false;
  HeapHookGuard() {
    if (!tls_in_heap_hook) { tls_in_heap_hook = true; active = true; }
  }
  ~HeapHookGuard() {
    if (active) tls_in_heap_hook = false;
  }
  HeapHookGuard(const HeapHookGuard&) = delete;
  HeapHookGuard& operator=(const HeapHookGuard&) = delete;
};

inline void note_capture_status(const char* what, const Status& s) {
  if (!s.ok()) HEAPLINE_LOG_DETAIL("%s: %s (%s)", what, s.message.c_str(), error_kind_name(s.kind));
}

// Captures the caller's stack (skip counts frames above this function).
inline void capture_alloc(const void* ptr, size_t size, size_t skip = 1) {
  if (!ptr || !is_enabled()) return;
  HeapHookGuard guard;
  if (!guard.active) return;
  Frame frames[HEAPLINE_STACK_DEPTH];
  size_t depth = capture_stack(frames, HEAPLINE_STACK_DEPTH, skip);
  note_capture_status("track_allocation", track_allocation(ptr, size, frames, depth));
}

inline void capture_free(const void* ptr, size_t skip = 1) {
  if (!ptr || !is_enabled()) return;
  HeapHookGuard guard;
  if (!guard.active) return;
  Frame frames[HEAPLINE_STACK_DEPTH];
  size_t depth = capture_stack(frames, HEAPLINE_STACK_DEPTH, skip);
  note_capture_status("track_deallocation", track_deallocation(ptr, frames, depth));
}

namespace hooks {

// Called from global new/delete: records only when this thread has a live tracker.
inline void record_alloc(void* ptr, size_t size) {
  if (!ptr) return;
  PerThreadRecorder* r = tls_capture_recorder;
  if (!r || r->state() != RecorderState::Active) return;
  HeapHookGuard guard;
  if (!guard.active) return;
  if (!is_enabled()) return;
  Frame frames[HEAPLINE_STACK_DEPTH];
  size_t depth = capture_stack(frames, HEAPLINE_STACK_DEPTH, 2);   // skip record_alloc + operator new
  note_capture_status("heap hook", r->track_allocation(ptr_bits(ptr), size, frames, depth, now_ns()));
}

inline void record_free(void* ptr) {
  if (!ptr) return;
  PerThreadRecorder* r = tls_capture_recorder;
  if (!r || r->state() != RecorderState::Active) return;
  HeapHookGuard guard;
  if (!guard.active) return;
  if (!is_enabled()) return;
  Frame frames[HEAPLINE_STACK_DEPTH];
  size_t depth = capture_stack(frames, HEAPLINE_STACK_DEPTH, 2);
  note_capture_status("heap hook", r->track_deallocation(ptr_bits(ptr), frames, depth, now_ns()));
}

inline void* allocate_or_throw(std::size_t size) {
  if (size == 0) size = 1;
  void* ptr = std::malloc(size);
  if (!ptr) throw std::bad_alloc();
  record_alloc(ptr, size);
  return ptr;
}

inline void* allocate_nothrow(std::size_t size) noexcept {
  if (size == 0) size = 1;
  void* ptr = std::malloc(size);
  if (ptr) record_alloc(ptr, size);
  return ptr;
}

inline void release(void* ptr) noexcept {
  if (!ptr) return;
  record_free(ptr);
  std::free(ptr);
}

} // namespace hooks

// Aggregates `dir` with default options and writes the reports next to the captures.
inline Status generate_report(const std::string& dir,
                              const BinaryExportConfig& cfg = BinaryExportConfig::debug_comprehensive()) {
  AggregationOptions opt;
  opt.metrics = cfg;
  AggregationOutcome out = aggregate_all_threads(dir, opt);
  for (const std::string& w : out.warnings) HEAPLINE_LOG_WARN("%s", w.c_str());
  return write_reports(dir, out, cfg);
}

} // namespace heapline

#if HEAPLINE_DEFINE_HEAP_HOOKS

// Global new/delete operators
void* operator new(std::size_t size)                                   { return heapline::hooks::allocate_or_throw(size); }
void* operator new[](std::size_t size)                                 { return heapline::hooks::allocate_or_throw(size); }
void* operator new(std::size_t size, const std::nothrow_t&) noexcept   { return heapline::hooks::allocate_nothrow(size); }
void* operator new[](std::size_t size, const std::nothrow_t&) noexcept { return heapline::hooks::allocate_nothrow(size); }

void operator delete(void* ptr) noexcept                               { heapline::hooks::release(ptr); }
void operator delete[](void* ptr) noexcept                             { heapline::hooks::release(ptr); }
void operator delete(void* ptr, const std::nothrow_t&) noexcept        { heapline::hooks::release(ptr); }
void operator delete[](void* ptr, const std::nothrow_t&) noexcept      { heapline::hooks::release(ptr); }
void operator delete(void* ptr, std::size_t) noexcept                  { heapline::hooks::release(ptr); }
void operator delete[](void* ptr, std::size_t) noexcept                { heapline::hooks::release(ptr); }

#endif // HEAPLINE_DEFINE_HEAP_HOOKS

// ---- Public API macros ----------------------------------------------------

#if HEAPLINE_CAPTURE

#define HEAPLINE_THREAD_INIT() \
  do{ ::heapline::Status _hl_s = ::heapline::init_thread_tracker(); \
      if (!_hl_s.ok()) HEAPLINE_LOG_ERROR("thread init: %s", _hl_s.message.c_str()); }while(0)

#define HEAPLINE_THREAD_INIT_AT(dir, cfg) \
  do{ ::heapline::Status _hl_s = ::heapline::init_thread_tracker((dir), (cfg)); \
      if (!_hl_s.ok()) HEAPLINE_LOG_ERROR("thread init: %s", _hl_s.message.c_str()); }while(0)

#define HEAPLINE_ALLOC(ptr, size)   do{ ::heapline::capture_alloc((ptr), (size_t)(size)); }while(0)
#define HEAPLINE_FREE(ptr)          do{ ::heapline::capture_free((ptr)); }while(0)

#define HEAPLINE_THREAD_FLUSH() \
  do{ ::heapline::Status _hl_s = ::heapline::flush_thread_tracker(); \
      if (!_hl_s.ok()) HEAPLINE_LOG_ERROR("thread flush: %s", _hl_s.message.c_str()); }while(0)

#define HEAPLINE_THREAD_FINALIZE() \
  do{ ::heapline::Status _hl_s = ::heapline::finalize_thread_tracker(); \
      if (!_hl_s.ok()) HEAPLINE_LOG_ERROR("thread finalize: %s", _hl_s.message.c_str()); }while(0)

#define HEAPLINE_ENABLE()           do{ ::heapline::set_enabled(true); }while(0)
#define HEAPLINE_DISABLE()          do{ ::heapline::set_enabled(false); }while(0)
#define HEAPLINE_IS_ENABLED()       (::heapline::is_enabled())

#define HEAPLINE_REPORT(dir) \
  do{ ::heapline::Status _hl_s = ::heapline::generate_report((dir)); \
      if (!_hl_s.ok()) HEAPLINE_LOG_ERROR("report: %s", _hl_s.message.c_str()); }while(0)

#else

#define HEAPLINE_THREAD_INIT()            ((void)0)
#define HEAPLINE_THREAD_INIT_AT(dir, cfg) ((void)0)
#define HEAPLINE_ALLOC(ptr, size)         ((void)0)
#define HEAPLINE_FREE(ptr)                ((void)0)
#define HEAPLINE_THREAD_FLUSH()           ((void)0)
#define HEAPLINE_THREAD_FINALIZE()        ((void)0)
#define HEAPLINE_ENABLE()                 ((void)0)
#define HEAPLINE_DISABLE()                ((void)0)
#define HEAPLINE_IS_ENABLED()             (false)
#define HEAPLINE_REPORT(dir)              ((void)0)

#endif // HEAPLINE_CAPTURE

#endif // HEAPLINE_HPP_INCLUDED
