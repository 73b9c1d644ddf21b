#pragma once

// warden/limiter.hpp — Resource Limiter.
//
// Two jobs:
//   1. Resolve the effective ExecutionLimits of a request. A request can only
//      narrow the engine defaults: larger numerics are clamped to the default
//      and a capability is granted only if the default grants it. Non-positive
//      numerics are rejected with CodeExecutionError(invalid_limits).
//   2. Drive one adapter run under those limits. A watchdog thread cancels the
//      run's CancellationToken at the deadline; the instance backend tears the
//      process group down. Exactly one bound is reported per run, the first
//      one the backend observed.

#include <cstdint>
#include <optional>
#include <string>

#include "warden/adapter.hpp"
#include "warden/types.hpp"

namespace warden {

struct LimitedRun {
  RunOutcome outcome;
  int exit_code{0};
  bool timeout_hit{false};
  bool memory_limit_hit{false};
  bool output_limit_hit{false};
  ErrorCode error_code{ErrorCode::none};
  std::optional<std::string> error;
};

class ResourceLimiter {
 public:
  explicit ResourceLimiter(LimitCeilings ceilings = {});

  ExecutionLimits resolve(const ExecutionLimits& defaults, const LimitsPatch& patch) const;

  // New engine defaults after applying `patch` to `current`. Throws
  // CodeExecutionError(invalid_limits) for values that are not positive or
  // exceed the ceilings.
  ExecutionLimits validate_defaults(const ExecutionLimits& current, const LimitsPatch& patch) const;

  LimitedRun run(RuntimeAdapter& adapter, const CompiledArtifact& artifact,
                 const RunContext& context) const;

  const LimitCeilings& ceilings() const { return ceilings_; }

 private:
  LimitCeilings ceilings_;
};

// Failure text for a program that exited non-zero without tripping a bound.
std::string describe_failure(const RunOutcome& outcome);

}  // namespace warden
