#include "warden/limiter.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "warden/errors.hpp"

namespace warden {

namespace {

constexpr std::size_t kMaxErrorText = 4096;

std::uint64_t narrow(const std::optional<std::int64_t>& requested, std::uint64_t fallback,
                     const char* field) {
  if (!requested) return fallback;
  if (*requested <= 0) {
    throw CodeExecutionError(std::string(field) + " must be a positive integer",
                             ErrorCode::invalid_limits);
  }
  return std::min(static_cast<std::uint64_t>(*requested), fallback);
}

std::uint64_t bounded(const std::optional<std::int64_t>& requested, std::uint64_t current,
                      std::uint64_t ceiling, const char* field) {
  if (!requested) return current;
  if (*requested <= 0) {
    throw CodeExecutionError(std::string(field) + " must be a positive integer",
                             ErrorCode::invalid_limits);
  }
  if (static_cast<std::uint64_t>(*requested) > ceiling) {
    throw CodeExecutionError(std::string(field) + " exceeds the ceiling of " +
                                 std::to_string(ceiling),
                             ErrorCode::invalid_limits);
  }
  return static_cast<std::uint64_t>(*requested);
}

// Joins the watchdog on every exit path, including adapter exceptions.
class Watchdog {
 public:
  Watchdog(std::uint64_t timeout_ms, CancellationToken& run_token)
      : thread_([this, timeout_ms, &run_token] {
          if (!finished_.wait_for(std::chrono::milliseconds(timeout_ms))) {
            run_token.cancel();
          }
        }) {}

  ~Watchdog() {
    finished_.cancel();
    if (thread_.joinable()) thread_.join();
  }

 private:
  CancellationToken finished_;
  std::thread thread_;
};

}  // namespace

ResourceLimiter::ResourceLimiter(LimitCeilings ceilings) : ceilings_(ceilings) {}

ExecutionLimits ResourceLimiter::resolve(const ExecutionLimits& defaults,
                                         const LimitsPatch& patch) const {
  ExecutionLimits out = defaults;
  out.timeout_ms = narrow(patch.timeout_ms, defaults.timeout_ms, "timeoutMs");
  out.max_memory_mb = narrow(patch.max_memory_mb, defaults.max_memory_mb, "maxMemoryMB");
  out.max_output_size = narrow(patch.max_output_size, defaults.max_output_size, "maxOutputSize");
  out.max_input_size = narrow(patch.max_input_size, defaults.max_input_size, "maxInputSize");
  if (patch.allow_network) out.allow_network = *patch.allow_network && defaults.allow_network;
  if (patch.allow_file_system) {
    out.allow_file_system = *patch.allow_file_system && defaults.allow_file_system;
  }
  if (patch.allow_env) out.allow_env = *patch.allow_env && defaults.allow_env;
  if (patch.allow_process) out.allow_process = *patch.allow_process && defaults.allow_process;
  return out;
}

ExecutionLimits ResourceLimiter::validate_defaults(const ExecutionLimits& current,
                                                   const LimitsPatch& patch) const {
  ExecutionLimits out = current;
  out.timeout_ms = bounded(patch.timeout_ms, current.timeout_ms, ceilings_.timeout_ms, "timeoutMs");
  out.max_memory_mb =
      bounded(patch.max_memory_mb, current.max_memory_mb, ceilings_.max_memory_mb, "maxMemoryMB");
  out.max_output_size = bounded(patch.max_output_size, current.max_output_size,
                                ceilings_.max_output_size, "maxOutputSize");
  out.max_input_size = bounded(patch.max_input_size, current.max_input_size,
                               ceilings_.max_input_size, "maxInputSize");
  if (patch.allow_network) out.allow_network = *patch.allow_network;
  if (patch.allow_file_system) out.allow_file_system = *patch.allow_file_system;
  if (patch.allow_env) out.allow_env = *patch.allow_env;
  if (patch.allow_process) out.allow_process = *patch.allow_process;
  return out;
}

LimitedRun ResourceLimiter::run(RuntimeAdapter& adapter, const CompiledArtifact& artifact,
                                const RunContext& context) const {
  CancellationToken cancel;
  LimitedRun r;
  {
    Watchdog watchdog(context.limits.timeout_ms, cancel);
    r.outcome = adapter.run(artifact, context, cancel);
  }

  const auto& lim = context.limits;
  switch (r.outcome.termination) {
    case TerminationReason::cancelled:
    case TerminationReason::deadline:
    case TerminationReason::cpu_limit:
      r.timeout_hit = true;
      break;
    case TerminationReason::memory_limit:
      r.memory_limit_hit = true;
      break;
    case TerminationReason::output_limit:
      r.output_limit_hit = true;
      break;
    case TerminationReason::none:
      // A watchdog that fires while the program is already exiting leaves
      // the program's own status standing.
      break;
  }

  if (r.timeout_hit) {
    r.exit_code = kExitTimeout;
    r.error_code = ErrorCode::timeout;
    r.error = "Execution timed out after " + std::to_string(lim.timeout_ms) + "ms";
  } else if (r.memory_limit_hit) {
    r.exit_code = kExitMemoryLimit;
    r.error_code = ErrorCode::memory_limit;
    r.error = "Memory limit of " + std::to_string(lim.max_memory_mb) + "MB exceeded";
  } else if (r.output_limit_hit) {
    r.exit_code = kExitOutputLimit;
    r.error_code = ErrorCode::output_limit;
    r.error = "Output limit of " + std::to_string(lim.max_output_size) + " bytes exceeded";
  } else {
    r.exit_code = r.outcome.exit_code;
    if (r.exit_code != 0) {
      r.error_code = ErrorCode::runtime_error;
      r.error = describe_failure(r.outcome);
    }
  }
  return r;
}

std::string describe_failure(const RunOutcome& outcome) {
  std::string text = outcome.stderr_text;
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.pop_back();
  }
  if (text.empty()) return "Process exited with code " + std::to_string(outcome.exit_code);
  if (text.size() > kMaxErrorText) text = text.substr(text.size() - kMaxErrorText);
  return text;
}

}  // namespace warden
