#pragma once

// warden/sandbox.hpp — Isolated instance backend.
//
// An "instance" is one supervised execution of a toolchain or a user program.
// The engine treats it as a black box: it configures the bounds, hands over a
// cancellation token and receives an InstanceResult. Nothing here knows about
// languages.
//
// POSIX BACKEND (sandbox_posix.cpp):
//   - fork + execve with a fresh session (setsid) so the whole process tree
//     can be killed through the process group.
//   - rlimits: RLIMIT_AS (address-space memory ceiling), RLIMIT_CPU (backstop
//     for busy loops), RLIMIT_NOFILE, RLIMIT_CORE=0, RLIMIT_FSIZE=0 when file
//     writes are not allowed.
//   - best-effort network namespace (unshare(CLONE_NEWNET)); needs
//     CAP_SYS_ADMIN, silently skipped otherwise.
//   - private scratch directory as cwd, removed when the instance ends.
//   - stdout/stderr pipes with a combined output ceiling; stdin from a file so
//     large inputs never deadlock against an unread pipe.
//   - peak RSS via wait4(2) rusage.
//
// SANDBOX ENABLED FLAG:
//   SandboxConfig::sandbox_enabled defaults to true. WARDEN_SANDBOX_DISABLED=1
//   skips rlimits and namespaces for debugging; results then report
//   wasSandboxed=false.
//
// EXTENSION_POINT: seccomp_profile
//   A seccomp-BPF allowlist installed in the child before execve would close
//   the gap left by the source denylists. Landlock is the path-confinement
//   candidate.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/cancellation.hpp"

namespace warden {

enum class TerminationReason {
  none,
  cancelled,     // cancellation token fired (engine deadline)
  deadline,      // backend's own wall-clock backstop
  cpu_limit,     // RLIMIT_CPU (SIGXCPU)
  memory_limit,
  output_limit,
};

std::string to_string(TerminationReason reason);

enum class MemoryCeilingMode {
  address_space,    // RLIMIT_AS
  runtime_managed,  // the runtime enforces its own heap ceiling (V8)
  none,
};

struct InstanceSpec {
  std::string command;  // absolute path
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  // Toolchain steps pass the engine's own environment through so that
  // version-manager shims keep working. User programs never do.
  bool inherit_env{false};
  std::string cwd;
  std::string stdin_path;  // empty = /dev/null
  std::uint64_t timeout_ms{0};  // 0 = no backstop
  std::uint64_t max_memory_bytes{0};  // 0 = unlimited
  MemoryCeilingMode memory_mode{MemoryCeilingMode::address_space};
  std::size_t max_output_bytes{1024 * 1024};  // stdout + stderr combined
  std::uint64_t max_file_descriptors{256};
  bool allow_file_writes{false};
  bool isolate_network{true};
  std::vector<std::string> oom_markers;  // stderr substrings meaning OOM
};

struct InstanceResult {
  int exit_code{0};
  int term_signal{0};
  TerminationReason termination{TerminationReason::none};
  std::string stdout_text;
  std::string stderr_text;
  std::size_t output_bytes{0};  // bytes produced, including any overflow chunk
  std::uint64_t peak_memory_bytes{0};
  std::uint64_t duration_ms{0};
  bool sandboxed{false};
  std::string error_message;  // non-empty: the instance could not be created
};

struct SandboxConfig {
  bool sandbox_enabled{true};

  static SandboxConfig from_env();
};

class InstanceBackend {
 public:
  virtual ~InstanceBackend() = default;

  // Runs one instance to completion. Must not throw for the target program's
  // own failures; reports creation failures through error_message.
  virtual InstanceResult launch(const InstanceSpec& spec, const CancellationToken& cancel) = 0;

  virtual std::string name() const = 0;
};

class PosixInstanceBackend : public InstanceBackend {
 public:
  explicit PosixInstanceBackend(SandboxConfig config = SandboxConfig::from_env());

  InstanceResult launch(const InstanceSpec& spec, const CancellationToken& cancel) override;
  std::string name() const override { return "posix"; }

 private:
  SandboxConfig config_;
};

// Per-instance working directory under `root`, removed on destruction.
// Construction and writes throw InfrastructureError.
class ScratchDir {
 public:
  explicit ScratchDir(const std::string& root);
  ~ScratchDir();
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::string& path() const { return path_; }
  std::string file(const std::string& name) const;
  std::string write_file(const std::string& name, std::string_view data, bool executable = false);
  std::optional<std::string> read_file(const std::string& name) const;

 private:
  std::string path_;
};

// Search PATH for `name` (or check it directly when it contains '/').
std::optional<std::string> resolve_executable(const std::string& name);

}  // namespace warden
