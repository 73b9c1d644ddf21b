#include "warden/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "warden/jsonlite.hpp"
#include "warden/version.hpp"

namespace warden {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<ExecutionEventHook> g_event_hook{nullptr};

double running_mean(double mean, double sample, std::uint64_t n) {
  return mean + (sample - mean) / static_cast<double>(n);
}

}  // namespace

std::string to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::none: return "none";
    case FailureKind::user: return "user";
    case FailureKind::limit: return "limit";
    case FailureKind::compile: return "compile";
    case FailureKind::infrastructure: return "infrastructure";
  }
  return "none";
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  if (target == 0) target = 1;
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of the bucket.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const ExecutionEvent& ev) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& s = stats_;
  ++s.total_executions;
  if (ev.ok) {
    ++s.successful_executions;
  } else {
    ++s.failed_executions;
  }
  ++s.per_language[index_of(ev.language)];

  const double ms = static_cast<double>(ev.duration_ns) / 1e6;
  const double mb = static_cast<double>(ev.peak_memory_bytes) / (1024.0 * 1024.0);
  s.average_execution_time_ms = running_mean(s.average_execution_time_ms, ms, s.total_executions);
  s.average_memory_usage_mb = running_mean(s.average_memory_usage_mb, mb, s.total_executions);
  s.last_execution_time_ms = ms;
  s.last_execution_unix_ms = ev.end_unix_ms;

  switch (ev.error_code) {
    case ErrorCode::timeout: ++s.timeouts; break;
    case ErrorCode::memory_limit: ++s.memory_limit_hits; break;
    case ErrorCode::output_limit: ++s.output_limit_hits; break;
    case ErrorCode::compile_error: ++s.compile_errors; break;
    default: break;
  }
  if (ev.failure_kind == FailureKind::infrastructure) ++s.infrastructure_errors;
  if (ev.compiled) {
    if (ev.cache_hit) {
      ++s.cache_hits;
    } else {
      ++s.cache_misses;
    }
  }
  latency_.record(ev.duration_ns);
}

ExecutionStatistics EngineStats::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  ExecutionStatistics out = stats_;
  out.most_used_language.reset();
  std::uint64_t best = 0;
  for (Language lang : kAllLanguages) {
    const std::uint64_t n = out.per_language[index_of(lang)];
    if (n > best) {
      best = n;
      out.most_used_language = lang;
    }
  }
  out.p50_ms = latency_.percentile(0.50) / 1000.0;
  out.p95_ms = latency_.percentile(0.95) / 1000.0;
  out.p99_ms = latency_.percentile(0.99) / 1000.0;
  return out;
}

void EngineStats::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  stats_ = ExecutionStatistics{};
  latency_.reset();
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

void set_execution_event_hook(ExecutionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::EVENT_LOG_VERSION);
  o["execution_id"] = ev.execution_id;
  o["language"] = to_string(ev.language);
  o["ok"] = ev.ok;
  o["error_code"] = to_string(ev.error_code);
  o["failure_kind"] = to_string(ev.failure_kind);
  o["duration_ns"] = ev.duration_ns;
  o["compile_ns"] = ev.compile_ns;
  o["run_ns"] = ev.run_ns;
  o["bytes_in"] = static_cast<std::uint64_t>(ev.bytes_in);
  o["bytes_stdout"] = static_cast<std::uint64_t>(ev.bytes_stdout);
  o["bytes_stderr"] = static_cast<std::uint64_t>(ev.bytes_stderr);
  o["peak_memory_bytes"] = ev.peak_memory_bytes;
  o["cache_hit"] = ev.cache_hit;
  o["end_unix_ms"] = ev.end_unix_ms;
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void emit_execution_event(const ExecutionEvent& ev) {
  ExecutionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("WARDEN_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // O_APPEND keeps concurrent lines whole below PIPE_BUF.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace warden
