#include "warden/compile_cache.hpp"

#include <exception>

#include "warden/errors.hpp"
#include "warden/hash.hpp"
#include "warden/version.hpp"

#if defined(WARDEN_WITH_ZSTD)
#include <zstd.h>
#endif

namespace warden {

namespace {

#if defined(WARDEN_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return {};
  return out;
}
#endif

}  // namespace

// ---------------------------------------------------------------------------
// CompiledArtifact
// ---------------------------------------------------------------------------

std::shared_ptr<const CompiledArtifact> CompiledArtifact::seal(std::string key,
                                                               CompiledArtifactData data,
                                                               const std::string& compression) {
  auto a = std::make_shared<CompiledArtifact>();
  a->key = std::move(key);
  a->language = data.language;
  a->entry_name = std::move(data.entry_name);
  a->diagnostics = std::move(data.diagnostics);
  a->compile_time_ms = data.compile_time_ms;
  a->original_size = data.payload.size();
  a->encoding = "identity";
#if defined(WARDEN_WITH_ZSTD)
  if (compression == "zstd" && !data.payload.empty()) {
    auto c = compress_zstd(data.payload);
    if (!c.empty() && c.size() < data.payload.size()) {
      a->blob = std::move(c);
      a->encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif
  if (a->encoding == "identity") a->blob = std::move(data.payload);
  a->blob_digest = blob_hash(a->blob);
  return a;
}

bool CompiledArtifact::verify() const {
  return blob_hash(blob) == blob_digest;
}

std::string CompiledArtifact::payload() const {
  if (!verify()) {
    throw InfrastructureError("artifact " + key + " failed blob integrity check",
                              ErrorCode::cache_integrity_failed);
  }
  if (encoding == "identity") {
    if (blob.size() != original_size) {
      throw InfrastructureError("artifact " + key + " size mismatch",
                                ErrorCode::cache_integrity_failed);
    }
    return blob;
  }
#if defined(WARDEN_WITH_ZSTD)
  if (encoding == "zstd") {
    std::string out = decompress_zstd(blob, original_size);
    if (out.size() != original_size) {
      throw InfrastructureError("artifact " + key + " failed to decode",
                                ErrorCode::cache_integrity_failed);
    }
    return out;
  }
#endif
  throw InfrastructureError("artifact " + key + " has unsupported encoding " + encoding,
                            ErrorCode::cache_integrity_failed);
}

// ---------------------------------------------------------------------------
// CompilationCache
// ---------------------------------------------------------------------------

CompilationCache::CompilationCache(Options options) : options_(std::move(options)) {}

std::string CompilationCache::make_key(Language language, std::string_view toolchain_id,
                                       const CompilerFlags& flags, std::string_view source) {
  std::string canon;
  canon.reserve(source.size() + 160);
  canon += "v=";
  canon += std::to_string(version::CACHE_KEY_VERSION);
  canon += "\nlang=";
  canon += to_string(language);
  canon += "\ntoolchain=";
  canon += toolchain_id;
  canon += "\nopt=";
  canon += to_string(flags.optimization);
  canon += "\nstd=";
  canon += flags.standard.empty() ? default_standard(language) : flags.standard;
  canon += "\nwarn=";
  canon += to_string(flags.warnings);
  canon += "\ndebug=";
  canon += flags.debug ? "1" : "0";
  canon += "\nsrc_len=";
  canon += std::to_string(source.size());
  canon += "\n";
  canon += source;
  return artifact_key_hash(canon);
}

ArtifactPtr CompilationCache::get_or_compile(const std::string& key, const Producer& producer,
                                             bool* cache_hit) {
  std::unique_lock<std::mutex> lk(mu_);
  if (auto it = entries_.find(key); it != entries_.end()) {
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    ++counters_.hits;
    if (cache_hit) *cache_hit = true;
    return it->second.artifact;
  }
  if (auto it = inflight_.find(key); it != inflight_.end()) {
    std::shared_future<ArtifactPtr> pending = it->second;
    ++counters_.hits;
    lk.unlock();
    if (cache_hit) *cache_hit = true;
    return pending.get();
  }

  ++counters_.misses;
  std::promise<ArtifactPtr> promise;
  inflight_.emplace(key, promise.get_future().share());
  lk.unlock();
  if (cache_hit) *cache_hit = false;

  try {
    ArtifactPtr artifact = CompiledArtifact::seal(key, producer(), options_.compression);
    lk.lock();
    inflight_.erase(key);
    store_locked(artifact);
    lk.unlock();
    promise.set_value(artifact);
    return artifact;
  } catch (...) {
    // Waiters receive the same exception; the failed attempt is not cached.
    if (!lk.owns_lock()) lk.lock();
    inflight_.erase(key);
    ++counters_.compile_failures;
    lk.unlock();
    promise.set_exception(std::current_exception());
    throw;
  }
}

ArtifactPtr CompilationCache::lookup(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++counters_.misses;
    return nullptr;
  }
  lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  ++counters_.hits;
  return it->second.artifact;
}

ArtifactPtr CompilationCache::insert(const std::string& key, CompiledArtifactData data) {
  ArtifactPtr artifact = CompiledArtifact::seal(key, std::move(data), options_.compression);
  std::lock_guard<std::mutex> lk(mu_);
  store_locked(artifact);
  return artifact;
}

bool CompilationCache::erase(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return false;
  bytes_ -= it->second.artifact->blob.size();
  lru_.erase(it->second.lru_pos);
  entries_.erase(it);
  return true;
}

void CompilationCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
  lru_.clear();
  bytes_ = 0;
}

CompilationCache::Stats CompilationCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  Stats s = counters_;
  s.entries = entries_.size();
  s.bytes = bytes_;
  return s;
}

void CompilationCache::store_locked(const ArtifactPtr& artifact) {
  const std::size_t size = artifact->blob.size();
  if (size > options_.max_bytes) return;

  if (auto it = entries_.find(artifact->key); it != entries_.end()) {
    bytes_ -= it->second.artifact->blob.size();
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
  }
  lru_.push_front(artifact->key);
  entries_.emplace(artifact->key, Entry{artifact, lru_.begin()});
  bytes_ += size;
  evict_locked();
}

void CompilationCache::evict_locked() {
  while (!lru_.empty() &&
         (entries_.size() > options_.max_entries || bytes_ > options_.max_bytes)) {
    const std::string victim = lru_.back();
    lru_.pop_back();
    auto it = entries_.find(victim);
    if (it != entries_.end()) {
      bytes_ -= it->second.artifact->blob.size();
      entries_.erase(it);
    }
    ++counters_.evictions;
  }
}

}  // namespace warden
