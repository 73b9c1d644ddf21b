#pragma once

// warden/adapter.hpp — Runtime adapter contract and compiler backend seam.
//
// One RuntimeAdapter per Language. The engine only ever talks to this
// interface:
//   compile()  identity for interpreted languages, transpile for TypeScript,
//              native build for Rust/C/C++. Raises CompileError on failure.
//   run()      executes an artifact in an isolated instance. A failing user
//              program is a normal outcome (exit_code != 0); only
//              adapter-level faults raise InfrastructureError.
//   environment_info()  probed once, cached for the adapter's lifetime.
//
// EXTENSION_POINT: compiler_backend
//   CompilerBackend decouples "how a toolchain is invoked" from the adapter.
//   ToolchainCompilerBackend shells out through an InstanceBackend; a remote
//   build service or a pre-warmed compiler server can slot in here without
//   touching adapters or the cache.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "warden/cancellation.hpp"
#include "warden/compile_cache.hpp"
#include "warden/sandbox.hpp"
#include "warden/types.hpp"

namespace warden {

struct RunContext {
  std::string input;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;  // already filtered by allow_env
  ExecutionLimits limits;
};

struct RunOutcome {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
  TerminationReason termination{TerminationReason::none};
  std::size_t output_bytes{0};
  std::uint64_t peak_memory_bytes{0};
  std::uint64_t duration_ms{0};
  bool sandboxed{false};
};

struct ToolchainProbe {
  bool available{false};
  std::string path;
  std::string version;
  std::vector<std::string> lines;  // non-empty output lines
  std::string detail;              // why it is unavailable
};

// ---------------------------------------------------------------------------
// Compiler backend
// ---------------------------------------------------------------------------

struct CompileJob {
  Language language{Language::cpp};
  std::string source_name;
  std::string source;
  std::vector<std::string> argv;  // relative to the job's scratch directory
  std::string output_name;
  std::uint64_t timeout_ms{30000};
  std::size_t max_output_bytes{1024 * 1024};
};

struct CompileOutput {
  bool ok{false};
  std::string binary;
  std::string diagnostics;
  int exit_code{0};
  bool timed_out{false};
  std::uint64_t duration_ms{0};
};

class CompilerBackend {
 public:
  virtual ~CompilerBackend() = default;

  // Throws InfrastructureError when the toolchain cannot be launched at all.
  virtual CompileOutput compile(const CompileJob& job) = 0;
  virtual ToolchainProbe probe() = 0;
  virtual std::string name() const = 0;
};

class ToolchainCompilerBackend : public CompilerBackend {
 public:
  ToolchainCompilerBackend(std::string command, std::vector<std::string> version_args,
                           std::shared_ptr<InstanceBackend> instances, std::string scratch_root);

  CompileOutput compile(const CompileJob& job) override;
  ToolchainProbe probe() override;
  std::string name() const override { return command_; }

 private:
  std::string command_;
  std::vector<std::string> version_args_;
  std::shared_ptr<InstanceBackend> instances_;
  std::string scratch_root_;
};

// ---------------------------------------------------------------------------
// Runtime adapter
// ---------------------------------------------------------------------------

class RuntimeAdapter {
 public:
  virtual ~RuntimeAdapter() = default;

  virtual Language language() const = 0;
  virtual bool requires_compilation() const { return warden::requires_compilation(language()); }

  virtual CompiledArtifactData compile(const std::string& code, const CompilerFlags& flags) = 0;
  virtual RunOutcome run(const CompiledArtifact& artifact, const RunContext& context,
                         const CancellationToken& cancel) = 0;

  const RuntimeEnvironmentInfo& environment_info() const;

  // Folded into cache keys: runtime name, version and resolved path.
  std::string toolchain_id() const;

 protected:
  virtual RuntimeEnvironmentInfo probe_environment() const = 0;

 private:
  mutable std::once_flag probe_once_;
  mutable RuntimeEnvironmentInfo info_;
};

// Describes how to start one program inside a fresh scratch directory.
struct ProgramLaunch {
  std::string command;  // absolute interpreter path; empty = exec the entry itself
  std::vector<std::string> leading_args;
  std::string entry_name;
  std::string entry_payload;
  bool entry_executable{false};
  MemoryCeilingMode memory_mode{MemoryCeilingMode::address_space};
  std::vector<std::string> oom_markers;
  std::map<std::string, std::string> env;
};

RunOutcome launch_program(InstanceBackend& backend, const std::string& scratch_root,
                          const ProgramLaunch& launch, const RunContext& context,
                          const CancellationToken& cancel);

// Runs `command args...` with the engine's environment and returns the first
// lines of its output. Used for toolchain discovery.
ToolchainProbe probe_command(InstanceBackend& backend, const std::string& scratch_root,
                             const std::string& command, const std::vector<std::string>& args);

}  // namespace warden
