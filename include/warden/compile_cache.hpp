#pragma once

// warden/compile_cache.hpp — In-process compilation cache.
//
// KEYING:
//   key = hash_domain("art:", canonical(language, toolchain id, flags, source))
//   The toolchain id folds the compiler version in, so upgrading rustc or g++
//   never serves a stale binary. CACHE_KEY_VERSION is part of the canonical
//   text.
//
// STORAGE:
//   Artifacts are immutable and shared read-only (shared_ptr<const>). Stored
//   blobs are zstd-encoded when that shrinks them, and every payload() read
//   re-verifies the stored blob hash and the decoded size. A mismatch fails
//   closed with InfrastructureError(cache_integrity_failed).
//
// EVICTION:
//   Bounded LRU on entry count and stored bytes. An artifact larger than the
//   byte budget is returned to the caller but never retained.
//
// CONCURRENCY:
//   One mutex guards the index. get_or_compile() is single-flight: concurrent
//   callers for a key wait on one shared_future while exactly one producer
//   runs outside the lock. Producer exceptions reach every waiter and nothing
//   is cached for a failed compile.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/types.hpp"

namespace warden {

// Output of a compile step, before it is sealed into the cache.
struct CompiledArtifactData {
  Language language{Language::cpp};
  std::string entry_name;  // file name the runner materializes
  std::string payload;
  std::string diagnostics;
  std::uint64_t compile_time_ms{0};
};

struct CompiledArtifact {
  std::string key;
  Language language{Language::cpp};
  std::string entry_name;
  std::string encoding;  // "identity" or "zstd"
  std::string blob;      // stored bytes
  std::string blob_digest;
  std::size_t original_size{0};
  std::string diagnostics;
  std::uint64_t compile_time_ms{0};

  // Decoded payload. Throws InfrastructureError on integrity failure.
  std::string payload() const;
  bool verify() const;

  static std::shared_ptr<const CompiledArtifact> seal(std::string key, CompiledArtifactData data,
                                                      const std::string& compression);
};

using ArtifactPtr = std::shared_ptr<const CompiledArtifact>;

class CompilationCache {
 public:
  struct Options {
    std::size_t max_entries{128};
    std::size_t max_bytes{256ull * 1024 * 1024};
    std::string compression{"zstd"};
  };

  struct Stats {
    std::size_t entries{0};
    std::size_t bytes{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t compile_failures{0};
  };

  using Producer = std::function<CompiledArtifactData()>;

  explicit CompilationCache(Options options);

  static std::string make_key(Language language, std::string_view toolchain_id,
                              const CompilerFlags& flags, std::string_view source);

  // Returns the cached artifact or runs `producer` once per key. Sets
  // *cache_hit when no compile was needed by this caller.
  ArtifactPtr get_or_compile(const std::string& key, const Producer& producer,
                             bool* cache_hit = nullptr);

  ArtifactPtr lookup(const std::string& key);
  ArtifactPtr insert(const std::string& key, CompiledArtifactData data);
  bool erase(const std::string& key);
  void clear();

  Stats stats() const;
  const Options& options() const { return options_; }

 private:
  void store_locked(const ArtifactPtr& artifact);
  void evict_locked();

  struct Entry {
    ArtifactPtr artifact;
    std::list<std::string>::iterator lru_pos;
  };

  Options options_;
  mutable std::mutex mu_;
  std::list<std::string> lru_;  // front = most recently used
  std::unordered_map<std::string, Entry> entries_;
  std::unordered_map<std::string, std::shared_future<ArtifactPtr>> inflight_;
  std::size_t bytes_{0};
  Stats counters_;
};

}  // namespace warden
