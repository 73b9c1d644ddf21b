#pragma once

// warden/engine.hpp — Execution facade.
//
// Engine is the only entry point an embedder needs. It owns the adapter
// registry (fixed table indexed by Language, immutable after construction),
// the compilation cache and the statistics aggregate. There is no
// process-wide instance; construct as many engines as needed.
//
// execute() pipeline:
//   readiness -> structural validation -> security validation ->
//   compile through the cache (compiled languages) -> limited run holding an
//   instance slot -> statistics + event -> result.
//
// Everything before dispatch throws (CodeExecutionError, SecurityError,
// UnsupportedLanguageError, InitializationError) and leaves statistics
// untouched. After dispatch the program's own failures are result data;
// only InfrastructureError escapes, after being counted and emitted.
//
// LIFECYCLE:
//   initialize() is idempotent. dispose() drops the cache and makes execute()
//   fail fast; initialize() may be called again. Introspection (languages,
//   environment info, limits, statistics) works in any state.

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "warden/adapters.hpp"
#include "warden/compile_cache.hpp"
#include "warden/config.hpp"
#include "warden/limiter.hpp"
#include "warden/observability.hpp"
#include "warden/security.hpp"
#include "warden/types.hpp"

namespace warden {

// Counting gate bounding concurrently running instances.
class InstanceSlots {
 public:
  explicit InstanceSlots(std::size_t capacity) : free_(capacity) {}

  void acquire();
  void release();
  std::size_t in_use() const;

  class Hold {
   public:
    explicit Hold(InstanceSlots& slots) : slots_(slots) { slots_.acquire(); }
    ~Hold() { slots_.release(); }
    Hold(const Hold&) = delete;
    Hold& operator=(const Hold&) = delete;

   private:
    InstanceSlots& slots_;
  };

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::size_t free_;
  std::size_t used_{0};
};

class Engine {
 public:
  explicit Engine(EngineConfig config = EngineConfig::from_env());
  // Custom adapters (tests, embedders). Empty slots are unregistered.
  Engine(EngineConfig config, AdapterSet adapters);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  void initialize();
  bool is_ready() const;
  void dispose();

  ExecutionResult execute(const ExecutionRequest& request);
  // Results in input order. Every error becomes that request's failed result.
  std::vector<ExecutionResult> execute_multiple(const std::vector<ExecutionRequest>& requests);

  std::vector<Language> supported_languages() const;
  bool is_language_supported(std::string_view id) const;
  std::optional<RuntimeEnvironmentInfo> environment_info(std::string_view id) const;

  ExecutionLimits default_limits() const;
  void set_default_limits(const LimitsPatch& patch);

  ExecutionStatistics statistics() const { return stats_.snapshot(); }
  void reset_statistics() { stats_.reset(); }
  CompilationCache::Stats cache_stats() const;

  const EngineConfig& config() const { return config_; }

 private:
  struct Prepared {
    Language language;
    RuntimeAdapter* adapter;
    ExecutionLimits limits;
    CompilerFlags flags;
  };

  void ensure_ready() const;
  RuntimeAdapter* registered(Language language) const;
  Prepared prepare(const ExecutionRequest& request) const;
  ExecutionResult dispatch(const ExecutionRequest& request, const Prepared& prepared,
                           std::shared_ptr<CompilationCache> cache);
  void finish(ExecutionEvent& ev);

  EngineConfig config_;
  AdapterSet adapters_;
  SecurityValidator validator_;
  ResourceLimiter limiter_;
  InstanceSlots slots_;
  EngineStats stats_;

  mutable std::mutex lifecycle_mu_;
  bool ready_{false};
  std::shared_ptr<CompilationCache> cache_;

  mutable std::mutex limits_mu_;
  ExecutionLimits default_limits_;
};

// Failed result for an error thrown by execute(); used by execute_multiple
// and the CLI batch command.
ExecutionResult failed_result(const std::string& language, ErrorCode code,
                              const std::string& message);

}  // namespace warden
