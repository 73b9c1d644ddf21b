#pragma once

// warden/observability.hpp — Execution events and engine statistics.
//
// ExecutionEvent is the single observable unit: every execution that reaches
// dispatch emits exactly one, including compile errors and infrastructure
// faults. Request rejections (validation, security, unsupported language)
// happen before dispatch and emit nothing.
//
// Sinks, in order:
//   1. a hook registered with set_execution_event_hook(), or
//   2. one JSON line appended to $WARDEN_EVENT_LOG when it is set.
// Events carry digests and sizes only, never program output.
//
// EngineStats is owned by an Engine (no process-wide instance). Updates are
// serialized by one mutex; averages are running means over all recorded
// events.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   The hook is where a span exporter attaches. Invariant: the hook must not
//   block execute() for long; it runs on the executing thread.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "warden/types.hpp"

namespace warden {

enum class FailureKind { none, user, limit, compile, infrastructure };

std::string to_string(FailureKind kind);

struct ExecutionEvent {
  std::string execution_id;  // request digest
  Language language{Language::javascript};
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  FailureKind failure_kind{FailureKind::none};

  std::uint64_t duration_ns{0};  // dispatch to result
  std::uint64_t compile_ns{0};
  std::uint64_t run_ns{0};

  std::size_t bytes_in{0};  // source + stdin
  std::size_t bytes_stdout{0};
  std::size_t bytes_stderr{0};
  std::uint64_t peak_memory_bytes{0};

  bool compiled{false};  // went through the compilation cache
  bool cache_hit{false};
  std::uint64_t end_unix_ms{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1), 2^i) us; bucket 0 is [0, 1) us. Boundaries are
// fixed so percentiles are approximate to within one doubling.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 40;

  void record(std::uint64_t duration_ns);
  void reset();

  // p in [0, 1]. Microseconds; 0.0 with no samples.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

class EngineStats {
 public:
  void record(const ExecutionEvent& ev);
  ExecutionStatistics snapshot() const;
  void reset();

 private:
  mutable std::mutex mu_;
  ExecutionStatistics stats_;
  LatencyHistogram latency_;
};

// Delivers `ev` to the registered hook, else to $WARDEN_EVENT_LOG. Sink
// failures are dropped; observability never fails an execution.
void emit_execution_event(const ExecutionEvent& ev);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
void set_execution_event_hook(ExecutionEventHook hook);

std::string event_to_json(const ExecutionEvent& ev);

// RAII duration capture.
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace warden
