/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_BASE_HPP_INCLUDED
#define HEAPLINE_BASE_HPP_INCLUDED

#if !defined(__cplusplus) || __cplusplus < 201703L
#  error "heapline requires C++17 or later"
#endif

// ---- Compile-time knobs ---------------------------------------------------

#ifndef HEAPLINE_CAPTURE
#define HEAPLINE_CAPTURE 1          // 0 turns the HEAPLINE_* capture macros into no-ops
#endif

#ifndef HEAPLINE_USE_ZLIB
#define HEAPLINE_USE_ZLIB 0         // set to 1 to gzip reports/analysis with system zlib
#endif

#ifndef HEAPLINE_DEFAULT_DIR
#define HEAPLINE_DEFAULT_DIR "heapline-out"
#endif

#ifndef HEAPLINE_INTERNER_SHARDS
#define HEAPLINE_INTERNER_SHARDS 64
#endif

#ifndef HEAPLINE_STACK_DEPTH
#define HEAPLINE_STACK_DEPTH 16     // max frames captured by the macro layer / heap hooks
#endif

#ifndef HEAPLINE_DEFAULT_BUFFER_RECORDS
#define HEAPLINE_DEFAULT_BUFFER_RECORDS 1000
#endif

#ifndef HEAPLINE_TOP_K
#define HEAPLINE_TOP_K 10
#endif

#ifndef HEAPLINE_DEFINE_HEAP_HOOKS
#define HEAPLINE_DEFINE_HEAP_HOOKS 0
#endif

#include <atomic>
#include <cstdint>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdarg>
#include <cerrno>
#include <chrono>
#include <thread>
#include <vector>
#include <string>
#include <algorithm>
#include <utility>
#include <functional>

#if defined(_WIN32)
  #define WIN32_LEAN_AND_MEAN
  #include <windows.h>
  #include <processthreadsapi.h>
  #include <sys/stat.h>
  #include <direct.h>
#elif defined(__APPLE__)
  #include <pthread.h>
  #include <sys/types.h>
  #include <unistd.h>
  #include <sys/stat.h>
  #include <dirent.h>
#else
  #include <sys/syscall.h>
  #include <sys/types.h>
  #include <unistd.h>
  #include <sys/stat.h>
  #include <dirent.h>
#endif

#if HEAPLINE_USE_ZLIB
  #include <zlib.h>
#endif

namespace heapline {

// Return address of one stack frame.
using Frame = uint64_t;
using Bytes = std::vector<uint8_t>;

// ---- Platform helpers -----------------------------------------------------

inline uint32_t pid() {
#if defined(_WIN32)
  return static_cast<uint32_t>(::GetCurrentProcessId());
#else
  return static_cast<uint32_t>(::getpid());
#endif
}

inline uint64_t os_tid() {
#if defined(_WIN32)
  return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
  uint64_t tid64 = 0;
  pthread_threadid_np(nullptr, &tid64);
  return tid64;
#elif defined(__linux__)
  return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
  return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

// Nanoseconds since the Unix epoch. Comparable across processes, subject to clock adjustments.
inline uint64_t now_ns() {
  using clk = std::chrono::system_clock;
  auto d = clk::now().time_since_epoch();
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
  return ns > 0 ? (uint64_t)ns : 0;
}

inline bool make_one_dir(const char* path) {
#if defined(_WIN32)
  return _mkdir(path) == 0 || errno == EEXIST;
#else
  return mkdir(path, 0755) == 0 || errno == EEXIST;
#endif
}

// Create a directory and all of its parents. Returns false if the leaf could not be created.
inline bool make_dirs(const char* dir) {
  if (!dir || !*dir) return false;
  char tmp[1024];
  int n = std::snprintf(tmp, sizeof(tmp), "%s", dir);
  if (n <= 0 || n >= (int)sizeof(tmp)) return false;

#if defined(_WIN32)
  for (char* q = tmp; *q; ++q) if (*q == '/') *q = '\\';
  const char sep = '\\';
  char* p = tmp;
  if (((p[0]|32) >= 'a' && (p[0]|32) <= 'z') && p[1]==':' && p[2]=='\\') p += 3;
  else if (p[0]=='\\' && p[1]=='\\') {
    p += 2; while (*p && *p!='\\') ++p; if (*p=='\\') ++p;   // server
    while (*p && *p!='\\') ++p; if (*p=='\\') ++p;           // share
  }
#else
  const char sep = '/';
  char* p = tmp + 1;
#endif

  for (; *p; ++p) {
    if (*p == sep) {
      *p = 0;
      (void)make_one_dir(tmp);   // intermediate failures surface on the leaf
      *p = sep;
    }
  }
  // strip a trailing separator before the leaf mkdir
  size_t len = std::strlen(tmp);
  if (len > 1 && tmp[len-1] == sep) tmp[len-1] = 0;
  return make_one_dir(tmp);
}

inline bool file_exists(const std::string& path) {
#if defined(_WIN32)
  struct _stat64 st; return _stat64(path.c_str(), &st) == 0;
#else
  struct stat st; return stat(path.c_str(), &st) == 0;
#endif
}

inline uint64_t file_size_bytes(const char* path) {
  if (!path) return 0;
#if defined(_WIN32)
  struct _stat64 st; if (_stat64(path, &st) == 0) return (uint64_t)st.st_size; else return 0;
#else
  struct stat st; if (stat(path, &st) == 0) return (uint64_t)st.st_size; else return 0;
#endif
}

// Regular entry names in dir (no "." / ".."). Returns false if dir cannot be opened.
inline bool list_dir(const std::string& dir, std::vector<std::string>& names) {
#if defined(_WIN32)
  std::string pattern = dir + "\\*";
  WIN32_FIND_DATAA fd;
  HANDLE h = ::FindFirstFileA(pattern.c_str(), &fd);
  if (h == INVALID_HANDLE_VALUE) return false;
  do {
    if (!(fd.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY)) names.emplace_back(fd.cFileName);
  } while (::FindNextFileA(h, &fd));
  ::FindClose(h);
  return true;
#else
  DIR* d = ::opendir(dir.c_str());
  if (!d) return false;
  while (dirent* e = ::readdir(d)) {
    if (e->d_name[0] == '.' && (e->d_name[1] == 0 || (e->d_name[1] == '.' && e->d_name[2] == 0))) continue;
    names.emplace_back(e->d_name);
  }
  ::closedir(d);
  return true;
#endif
}

inline std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  char last = dir.back();
  if (last == '/' || last == '\\') return dir + name;
  return dir + "/" + name;
}

inline bool ends_with(const char* s, const char* suff) {
  if (!s || !suff) return false;
  size_t n = std::strlen(s), m = std::strlen(suff);
  return (m <= n) && (std::memcmp(s + (n - m), suff, m) == 0);
}

inline bool read_whole_file(const std::string& path, Bytes& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;
  out.clear();
  unsigned char buf[64 * 1024];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) != 0) out.insert(out.end(), buf, buf + n);
  bool ok = !std::ferror(f);
  std::fclose(f);
  return ok;
}

// ---- Hashing --------------------------------------------------------------

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME  = 1099511628211ULL;

inline uint64_t fnv1a(const void* data, size_t n, uint64_t h = FNV_OFFSET) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < n; ++i) { h ^= p[i]; h *= FNV_PRIME; }
  return h;
}

// ---- Little-endian byte helpers -------------------------------------------

inline void put_u8 (Bytes& b, uint8_t v)  { b.push_back(v); }
inline void put_u16(Bytes& b, uint16_t v) { for (int i=0;i<2;i++) b.push_back((uint8_t)(v >> (8*i))); }
inline void put_u32(Bytes& b, uint32_t v) { for (int i=0;i<4;i++) b.push_back((uint8_t)(v >> (8*i))); }
inline void put_u64(Bytes& b, uint64_t v) { for (int i=0;i<8;i++) b.push_back((uint8_t)(v >> (8*i))); }
inline void put_f64(Bytes& b, double v)   { uint64_t u; std::memcpy(&u, &v, 8); put_u64(b, u); }
inline void put_str(Bytes& b, const std::string& s) {
  put_u32(b, (uint32_t)s.size());
  b.insert(b.end(), s.begin(), s.end());
}

inline void store_u64(uint8_t* dst, uint64_t v) { for (int i=0;i<8;i++) dst[i] = (uint8_t)(v >> (8*i)); }

// Bounds-checked reader; any short read clears `ok` and yields zeros from then on.
struct ByteCursor {
  const uint8_t* p;
  size_t n;
  size_t pos = 0;
  bool ok = true;

  ByteCursor(const uint8_t* data, size_t size) : p(data), n(size) {}

  size_t remaining() const { return pos <= n ? n - pos : 0; }
  bool need(size_t k) {
    if (!ok || remaining() < k) { ok = false; return false; }
    return true;
  }
  uint8_t u8() { if (!need(1)) return 0; return p[pos++]; }
  uint16_t u16() {
    if (!need(2)) return 0;
    uint16_t v = (uint16_t)(p[pos] | (p[pos+1] << 8)); pos += 2; return v;
  }
  uint32_t u32() {
    if (!need(4)) return 0;
    uint32_t v = 0; for (int i=0;i<4;i++) v |= (uint32_t)p[pos+i] << (8*i);
    pos += 4; return v;
  }
  uint64_t u64() {
    if (!need(8)) return 0;
    uint64_t v = 0; for (int i=0;i<8;i++) v |= (uint64_t)p[pos+i] << (8*i);
    pos += 8; return v;
  }
  double f64() { uint64_t u = u64(); double d; std::memcpy(&d, &u, 8); return d; }
  std::string str() {
    uint32_t len = u32();
    if (!need(len)) return std::string();
    std::string s((const char*)p + pos, len); pos += len; return s;
  }
  void skip(size_t k) { if (need(k)) pos += k; }
};

} // namespace heapline

#endif // HEAPLINE_BASE_HPP_INCLUDED
