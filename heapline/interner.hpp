/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_INTERNER_HPP_INCLUDED
#define HEAPLINE_INTERNER_HPP_INCLUDED

#include "base.hpp"
#include "log.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace heapline {

// Non-owning handle to an interned stack. {0,0,0} means "no stack captured".
struct CallStackRef {
  uint64_t id    = 0;
  uint64_t hash  = 0;
  uint32_t depth = 0;

  bool empty() const { return id == 0 && depth == 0; }
  static CallStackRef none() { return CallStackRef{}; }

  bool operator==(const CallStackRef& o) const { return id == o.id && hash == o.hash && depth == o.depth; }
  bool operator!=(const CallStackRef& o) const { return !(*this == o); }
};

// Owned by the interner for the whole run. Only `frequency` changes after insertion.
struct NormalizedCallStack {
  uint64_t              id;
  std::vector<Frame>    frames;
  uint64_t              hash;
  uint32_t              depth;
  mutable std::atomic<uint64_t> frequency{0};

  NormalizedCallStack(uint64_t i, const Frame* f, size_t n, uint64_t h)
  : id(i), frames(f, f + n), hash(h), depth((uint32_t)n) {}
};

struct InternerStats {
  uint64_t total_processed = 0;
  uint64_t cache_hits = 0;
  uint64_t cache_misses = 0;
  uint64_t hash_collisions = 0;
  uint64_t unique_stacks = 0;
  uint64_t memory_saved_bytes = 0;   // frames not stored again thanks to hits
};

// FNV-1a over the little-endian frame bytes. 0 is reserved for the empty ref.
inline uint64_t hash_frames(const Frame* frames, size_t depth) {
  uint64_t h = FNV_OFFSET;
  for (size_t i = 0; i < depth; ++i) {
    uint8_t le[8];
    store_u64(le, frames[i]);
    h = fnv1a(le, 8, h);
  }
  return h == 0 ? 1 : h;
}

using FrameHashFn = uint64_t(*)(const Frame* frames, size_t depth);

// Sharded by hash: each shard has its own mutex, taken only for the lookup/insert itself.
// Ids come from one atomic counter and are never reused.
class CallStackInterner {
public:
  explicit CallStackInterner(FrameHashFn fn = &hash_frames) : hash_fn_(fn ? fn : &hash_frames) {}

  CallStackInterner(const CallStackInterner&) = delete;
  CallStackInterner& operator=(const CallStackInterner&) = delete;

  CallStackRef normalize(const Frame* frames, size_t depth) {
    total_processed_.fetch_add(1, std::memory_order_relaxed);
    if (!frames || depth == 0) return CallStackRef::none();

    const uint64_t h = hash_fn_(frames, depth);
    HashShard& sh = hash_shards_[h % HEAPLINE_INTERNER_SHARDS];
    std::lock_guard<std::mutex> lk(sh.mu);

    auto& bucket = sh.by_hash[h];
    for (NormalizedCallStack* e : bucket) {
      if (e->depth == depth && std::equal(frames, frames + depth, e->frames.begin())) {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
        memory_saved_.fetch_add(depth * sizeof(Frame), std::memory_order_relaxed);
        return CallStackRef{e->id, e->hash, e->depth};
      }
    }
    if (!bucket.empty()) {
      hash_collisions_.fetch_add(1, std::memory_order_relaxed);
      HEAPLINE_LOG_DETAIL("call stack hash collision on 0x%016" PRIx64, h);
    }

    const uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    sh.owned.push_back(std::make_unique<NormalizedCallStack>(id, frames, depth, h));
    NormalizedCallStack* e = sh.owned.back().get();
    bucket.push_back(e);
    {
      // lock order: hash shard, then id shard (readers only take the id shard)
      IdShard& is = id_shards_[id % HEAPLINE_INTERNER_SHARDS];
      std::lock_guard<std::mutex> ilk(is.mu);
      is.by_id.emplace(id, e);
    }
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
    return CallStackRef{id, h, (uint32_t)depth};
  }

  CallStackRef normalize(const std::vector<Frame>& frames) { return normalize(frames.data(), frames.size()); }

  // Same hash normalize() would assign, without touching the table.
  uint64_t hash_of(const Frame* frames, size_t depth) const {
    return (!frames || depth == 0) ? 0 : hash_fn_(frames, depth);
  }

  // Entry for `id`, or nullptr. Entries live as long as the interner.
  const NormalizedCallStack* lookup(uint64_t id) const {
    if (id == 0) return nullptr;
    IdShard& is = id_shards_[id % HEAPLINE_INTERNER_SHARDS];
    std::lock_guard<std::mutex> lk(is.mu);
    auto it = is.by_id.find(id);
    return it == is.by_id.end() ? nullptr : it->second;
  }

  bool get_call_stack(uint64_t id, std::vector<Frame>& out) const {
    const NormalizedCallStack* e = lookup(id);
    if (!e) return false;
    out = e->frames;
    return true;
  }

  // True for the empty ref, or when the ref resolves and its hash/depth match.
  bool verify(const CallStackRef& ref) const {
    if (ref.empty()) return true;
    const NormalizedCallStack* e = lookup(ref.id);
    return e && e->hash == ref.hash && e->depth == ref.depth;
  }

  void record_use(const CallStackRef& ref) {
    if (ref.empty()) return;
    if (const NormalizedCallStack* e = lookup(ref.id))
      e->frequency.fetch_add(1, std::memory_order_relaxed);
  }

  uint64_t size() const { return cache_misses_.load(std::memory_order_relaxed); }

  InternerStats stats() const {
    InternerStats s;
    s.total_processed    = total_processed_.load(std::memory_order_relaxed);
    s.cache_hits         = cache_hits_.load(std::memory_order_relaxed);
    s.cache_misses       = cache_misses_.load(std::memory_order_relaxed);
    s.hash_collisions    = hash_collisions_.load(std::memory_order_relaxed);
    s.unique_stacks      = s.cache_misses;
    s.memory_saved_bytes = memory_saved_.load(std::memory_order_relaxed);
    return s;
  }

private:
  struct HashShard {
    std::mutex mu;
    std::unordered_map<uint64_t, std::vector<NormalizedCallStack*>> by_hash;
    std::vector<std::unique_ptr<NormalizedCallStack>> owned;
  };
  struct IdShard {
    std::mutex mu;
    std::unordered_map<uint64_t, NormalizedCallStack*> by_id;
  };

  FrameHashFn hash_fn_;
  HashShard hash_shards_[HEAPLINE_INTERNER_SHARDS];
  mutable IdShard id_shards_[HEAPLINE_INTERNER_SHARDS];

  std::atomic<uint64_t> next_id_{1};
  std::atomic<uint64_t> total_processed_{0};
  std::atomic<uint64_t> cache_hits_{0};
  std::atomic<uint64_t> cache_misses_{0};
  std::atomic<uint64_t> hash_collisions_{0};
  std::atomic<uint64_t> memory_saved_{0};
};

// Process-wide interner shared by every recorder.
inline CallStackInterner& interner() { static CallStackInterner I; return I; }

} // namespace heapline

#endif // HEAPLINE_INTERNER_HPP_INCLUDED
