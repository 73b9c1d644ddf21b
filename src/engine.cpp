#include "warden/engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

#include "warden/errors.hpp"
#include "warden/runtime.hpp"

namespace warden {

namespace {

std::uint64_t unix_ms_now() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

bool blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  });
}

int exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::security_violation: return kExitSecurity;
    case ErrorCode::unsupported_language: return kExitUnsupported;
    case ErrorCode::timeout: return kExitTimeout;
    case ErrorCode::memory_limit: return kExitMemoryLimit;
    case ErrorCode::output_limit: return kExitOutputLimit;
    default: return 1;
  }
}

CompilationCache::Options cache_options(const EngineConfig& config) {
  CompilationCache::Options o;
  o.max_entries = config.cache_max_entries;
  o.max_bytes = config.cache_max_bytes;
  o.compression = config.cache_compression;
  return o;
}

}  // namespace

// ---------------------------------------------------------------------------
// InstanceSlots
// ---------------------------------------------------------------------------

void InstanceSlots::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return free_ > 0; });
  --free_;
  ++used_;
}

void InstanceSlots::release() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++free_;
    --used_;
  }
  cv_.notify_one();
}

std::size_t InstanceSlots::in_use() const {
  std::lock_guard<std::mutex> lk(mu_);
  return used_;
}

ExecutionResult failed_result(const std::string& language, ErrorCode code,
                              const std::string& message) {
  ExecutionResult r;
  r.language = language;
  r.exit_code = exit_code_for(code);
  r.error = message;
  r.error_code = code;
  r.stderr_text = message;
  r.finalize();
  return r;
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

Engine::Engine(EngineConfig config)
    : Engine(config, make_default_adapters(
                         config, std::make_shared<PosixInstanceBackend>(config.sandbox))) {}

Engine::Engine(EngineConfig config, AdapterSet adapters)
    : config_(std::move(config)),
      adapters_(std::move(adapters)),
      limiter_(config_.ceilings),
      slots_(std::max<std::size_t>(1, config_.max_concurrent_instances)),
      default_limits_(config_.default_limits) {}

Engine::~Engine() = default;

void Engine::initialize() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (ready_) return;

  ConfigValidationResult check = validate_config(config_);
  if (!check.ok) {
    std::string msg = "invalid configuration:";
    for (const auto& e : check.errors) msg += " " + e + ";";
    throw InitializationError(msg);
  }

  const std::string root = scratch_root_of(config_);
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    throw InitializationError("cannot create scratch root " + root + ": " + ec.message(),
                              ErrorCode::sandbox_unavailable);
  }

  for (const auto& adapter : adapters_) {
    if (adapter) adapter->environment_info();
  }
  for (Language lang : config_.required_languages) {
    RuntimeAdapter* adapter = registered(lang);
    if (!adapter) {
      throw InitializationError("required language " + to_string(lang) + " is not registered");
    }
    const auto& info = adapter->environment_info();
    if (!info.available) {
      throw InitializationError("required runtime " + info.runtime + " for " + to_string(lang) +
                                    " is not available",
                                ErrorCode::toolchain_unavailable);
    }
  }

  cache_ = std::make_shared<CompilationCache>(cache_options(config_));
  ready_ = true;
}

bool Engine::is_ready() const {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  return ready_;
}

void Engine::dispose() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  ready_ = false;
  // In-flight executions keep their own reference until they finish.
  cache_.reset();
}

void Engine::ensure_ready() const {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (!ready_) {
    throw InitializationError("engine is not initialized", ErrorCode::not_initialized);
  }
}

RuntimeAdapter* Engine::registered(Language language) const {
  return adapters_[index_of(language)].get();
}

std::vector<Language> Engine::supported_languages() const {
  std::vector<Language> out;
  for (Language lang : kAllLanguages) {
    RuntimeAdapter* adapter = registered(lang);
    if (adapter && adapter->environment_info().available) out.push_back(lang);
  }
  return out;
}

bool Engine::is_language_supported(std::string_view id) const {
  auto lang = language_from_string(id);
  if (!lang) return false;
  RuntimeAdapter* adapter = registered(*lang);
  return adapter && adapter->environment_info().available;
}

std::optional<RuntimeEnvironmentInfo> Engine::environment_info(std::string_view id) const {
  auto lang = language_from_string(id);
  if (!lang) return std::nullopt;
  RuntimeAdapter* adapter = registered(*lang);
  if (!adapter) return std::nullopt;
  return adapter->environment_info();
}

ExecutionLimits Engine::default_limits() const {
  std::lock_guard<std::mutex> lk(limits_mu_);
  return default_limits_;
}

void Engine::set_default_limits(const LimitsPatch& patch) {
  std::lock_guard<std::mutex> lk(limits_mu_);
  default_limits_ = limiter_.validate_defaults(default_limits_, patch);
}

CompilationCache::Stats Engine::cache_stats() const {
  std::shared_ptr<CompilationCache> cache;
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    cache = cache_;
  }
  return cache ? cache->stats() : CompilationCache::Stats{};
}

Engine::Prepared Engine::prepare(const ExecutionRequest& request) const {
  auto lang = language_from_string(request.language);
  if (!lang) throw UnsupportedLanguageError(request.language);
  RuntimeAdapter* adapter = registered(*lang);
  if (!adapter) throw UnsupportedLanguageError(request.language);
  if (!adapter->environment_info().available) {
    throw UnsupportedLanguageError(request.language, "Unsupported language: " + request.language +
                                                         " (runtime not available)");
  }

  Prepared p{*lang, adapter, limiter_.resolve(default_limits(), request.limits), {}};

  if (request.code.empty() || blank(request.code)) {
    throw CodeExecutionError("code must not be empty");
  }
  if (request.code.size() > p.limits.max_input_size) {
    throw CodeExecutionError("code size " + std::to_string(request.code.size()) +
                                 " exceeds maxInputSize " +
                                 std::to_string(p.limits.max_input_size),
                             ErrorCode::code_too_large);
  }
  if (request.input.size() > p.limits.max_input_size) {
    throw CodeExecutionError("input size " + std::to_string(request.input.size()) +
                                 " exceeds maxInputSize " +
                                 std::to_string(p.limits.max_input_size),
                             ErrorCode::input_too_large);
  }
  if (request.compiler_flags) {
    p.flags = *request.compiler_flags;
    if (!is_valid_standard(p.language, p.flags.standard)) {
      throw CodeExecutionError("standard " + p.flags.standard + " is not valid for " +
                                   to_string(p.language),
                               ErrorCode::invalid_compiler_flags);
    }
  }

  validator_.validate_request(request, p.language, p.limits);
  return p;
}

ExecutionResult Engine::execute(const ExecutionRequest& request) {
  ensure_ready();
  const Prepared prepared = prepare(request);

  std::shared_ptr<CompilationCache> cache;
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!ready_) throw InitializationError("engine was disposed", ErrorCode::not_initialized);
    cache = cache_;
  }
  return dispatch(request, prepared, std::move(cache));
}

void Engine::finish(ExecutionEvent& ev) {
  ev.end_unix_ms = unix_ms_now();
  stats_.record(ev);
  emit_execution_event(ev);
}

ExecutionResult Engine::dispatch(const ExecutionRequest& request, const Prepared& p,
                                 std::shared_ptr<CompilationCache> cache) {
  RuntimeAdapter& adapter = *p.adapter;
  const auto& info = adapter.environment_info();

  ExecutionResult res;
  res.language = to_string(p.language);
  res.metadata.runtime = info.runtime;
  res.metadata.version = info.version;
  res.metadata.start_unix_ms = unix_ms_now();

  ExecutionEvent ev;
  ev.execution_id = request_digest(request);
  ev.language = p.language;
  ev.bytes_in = request.code.size() + request.input.size();
  ev.compiled = adapter.requires_compilation();

  InstanceSlots::Hold slot(slots_);
  const auto t0 = std::chrono::steady_clock::now();
  auto elapsed_ms = [&t0] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0)
        .count();
  };

  try {
    ArtifactPtr artifact;
    if (ev.compiled) {
      const std::string key =
          CompilationCache::make_key(p.language, adapter.toolchain_id(), p.flags, request.code);
      try {
        ScopeTimer timer(ev.compile_ns);
        artifact = cache->get_or_compile(
            key, [&] { return adapter.compile(request.code, p.flags); }, &ev.cache_hit);
      } catch (const CompileError& e) {
        res.exit_code = e.exit_code() == 0 ? 1 : e.exit_code();
        res.stderr_text = e.diagnostics();
        res.error = std::string(e.what());
        res.error_code = ErrorCode::compile_error;
        res.metadata.compile_time_ms = ev.compile_ns / 1000000u;
        res.execution_time_ms = elapsed_ms();
        res.metadata.end_unix_ms = unix_ms_now();
        res.finalize();

        ev.ok = false;
        ev.error_code = ErrorCode::compile_error;
        ev.failure_kind = FailureKind::compile;
        ev.bytes_stderr = res.stderr_text.size();
        ev.duration_ns = ev.compile_ns;
        finish(ev);
        return res;
      }
    } else {
      artifact = CompiledArtifact::seal("", adapter.compile(request.code, p.flags), "identity");
    }

    RunContext ctx;
    ctx.input = request.input;
    ctx.args = request.args;
    if (p.limits.allow_env) ctx.env = request.env;
    ctx.limits = p.limits;

    LimitedRun run;
    {
      ScopeTimer timer(ev.run_ns);
      run = limiter_.run(adapter, *artifact, ctx);
    }

    res.stdout_text = std::move(run.outcome.stdout_text);
    res.stderr_text = std::move(run.outcome.stderr_text);
    res.exit_code = run.exit_code;
    res.error = std::move(run.error);
    res.error_code = run.error_code;
    res.metadata.was_sandboxed = run.outcome.sandboxed;
    res.metadata.timeout_hit = run.timeout_hit;
    res.metadata.memory_limit_hit = run.memory_limit_hit;
    res.metadata.output_limit_hit = run.output_limit_hit;
    res.metadata.output_size = run.outcome.output_bytes;
    res.metadata.memory_used_bytes = run.outcome.peak_memory_bytes;
    res.metadata.cache_hit = ev.cache_hit;
    res.metadata.compile_time_ms = ev.cache_hit ? 0 : artifact->compile_time_ms;
    res.execution_time_ms = elapsed_ms();
    res.metadata.end_unix_ms = unix_ms_now();
    res.finalize();

    ev.ok = res.success;
    ev.error_code = res.error_code;
    if (res.success) {
      ev.failure_kind = FailureKind::none;
    } else if (run.timeout_hit || run.memory_limit_hit || run.output_limit_hit) {
      ev.failure_kind = FailureKind::limit;
    } else {
      ev.failure_kind = FailureKind::user;
    }
    ev.bytes_stdout = res.stdout_text.size();
    ev.bytes_stderr = res.stderr_text.size();
    ev.peak_memory_bytes = run.outcome.peak_memory_bytes;
    ev.duration_ns = static_cast<std::uint64_t>(res.execution_time_ms * 1e6);
    finish(ev);
    return res;
  } catch (const std::exception& e) {
    ev.ok = false;
    const auto* engine_error = dynamic_cast<const EngineError*>(&e);
    ev.error_code = engine_error ? engine_error->code() : ErrorCode::spawn_failed;
    ev.failure_kind = FailureKind::infrastructure;
    ev.duration_ns = static_cast<std::uint64_t>(elapsed_ms() * 1e6);
    finish(ev);
    throw;
  }
}

std::vector<ExecutionResult> Engine::execute_multiple(
    const std::vector<ExecutionRequest>& requests) {
  std::vector<ExecutionResult> results(requests.size());
  if (requests.empty()) return results;

  const std::size_t workers =
      std::min(requests.size(), std::max<std::size_t>(1, config_.max_concurrent_instances));
  std::atomic<std::size_t> next_job{0};

  auto run_one = [this, &requests](std::size_t idx) -> ExecutionResult {
    const ExecutionRequest& req = requests[idx];
    try {
      return execute(req);
    } catch (const EngineError& e) {
      return failed_result(req.language, e.code(), e.what());
    } catch (const std::exception& e) {
      return failed_result(req.language, ErrorCode::spawn_failed, e.what());
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    pool.emplace_back([&] {
      for (;;) {
        const std::size_t idx = next_job.fetch_add(1);
        if (idx >= requests.size()) break;
        results[idx] = run_one(idx);
      }
    });
  }
  for (auto& t : pool) t.join();
  return results;
}

}  // namespace warden
