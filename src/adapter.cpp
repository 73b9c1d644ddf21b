#include "warden/adapter.hpp"

#include <filesystem>
#include <sstream>

#include "warden/errors.hpp"

namespace warden {

namespace {

// The limiter owns the real deadline through the cancellation token; the
// backend's own backstop only catches a limiter that never fires.
constexpr std::uint64_t kBackstopGraceMs = 1000;
constexpr std::uint64_t kProbeTimeoutMs = 10000;

std::vector<std::string> nonempty_lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

void replace_all(std::string& text, const std::string& needle, const std::string& with) {
  if (needle.empty()) return;
  for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + with.size())) {
    text.replace(pos, needle.size(), with);
  }
}

// Host scratch paths never reach the caller: "<dir>/main.js:1" reads "main.js:1".
void hide_scratch_path(std::string& text, const std::string& dir) {
  std::error_code ec;
  const std::string canonical = std::filesystem::weakly_canonical(dir, ec).string();
  for (const std::string& p : {dir, ec ? std::string() : canonical}) {
    if (p.empty()) continue;
    replace_all(text, p + "/", "");
    replace_all(text, p, ".");
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Program launch / probing
// ---------------------------------------------------------------------------

RunOutcome launch_program(InstanceBackend& backend, const std::string& scratch_root,
                          const ProgramLaunch& launch, const RunContext& context,
                          const CancellationToken& cancel) {
  ScratchDir dir(scratch_root);
  const std::string entry_path =
      dir.write_file(launch.entry_name, launch.entry_payload, launch.entry_executable);
  const std::string stdin_path = dir.write_file(".stdin", context.input);

  InstanceSpec spec;
  if (launch.command.empty()) {
    spec.command = entry_path;
  } else {
    spec.command = launch.command;
    spec.argv = launch.leading_args;
    spec.argv.push_back(launch.entry_name);
  }
  spec.argv.insert(spec.argv.end(), context.args.begin(), context.args.end());
  spec.env = launch.env;
  for (const auto& [k, v] : context.env) spec.env[k] = v;
  spec.cwd = dir.path();
  spec.stdin_path = stdin_path;
  spec.timeout_ms = context.limits.timeout_ms + kBackstopGraceMs;
  spec.max_memory_bytes = context.limits.max_memory_mb * 1024ull * 1024ull;
  spec.memory_mode = launch.memory_mode;
  spec.max_output_bytes = static_cast<std::size_t>(context.limits.max_output_size);
  spec.allow_file_writes = context.limits.allow_file_system;
  spec.isolate_network = !context.limits.allow_network;
  spec.oom_markers = launch.oom_markers;

  InstanceResult r = backend.launch(spec, cancel);
  if (!r.error_message.empty()) {
    throw InfrastructureError("instance creation failed: " + r.error_message, ErrorCode::spawn_failed);
  }

  RunOutcome out;
  out.stdout_text = std::move(r.stdout_text);
  out.stderr_text = std::move(r.stderr_text);
  hide_scratch_path(out.stderr_text, dir.path());
  out.exit_code = r.exit_code;
  out.termination = r.termination;
  out.output_bytes = r.output_bytes;
  out.peak_memory_bytes = r.peak_memory_bytes;
  out.duration_ms = r.duration_ms;
  out.sandboxed = r.sandboxed;
  return out;
}

ToolchainProbe probe_command(InstanceBackend& backend, const std::string& scratch_root,
                             const std::string& command, const std::vector<std::string>& args) {
  ToolchainProbe probe;
  auto resolved = resolve_executable(command);
  if (!resolved) {
    probe.detail = command + " not found on PATH";
    return probe;
  }
  probe.path = *resolved;

  ScratchDir dir(scratch_root);
  InstanceSpec spec;
  spec.command = *resolved;
  spec.argv = args;
  spec.inherit_env = true;
  spec.cwd = dir.path();
  spec.timeout_ms = kProbeTimeoutMs;
  spec.memory_mode = MemoryCeilingMode::none;
  spec.max_output_bytes = 64 * 1024;
  spec.max_file_descriptors = 1024;
  spec.allow_file_writes = true;
  spec.isolate_network = false;

  CancellationToken never;
  InstanceResult r = backend.launch(spec, never);
  if (!r.error_message.empty()) {
    probe.detail = r.error_message;
    return probe;
  }
  if (r.exit_code != 0 || r.termination != TerminationReason::none) {
    probe.detail = command + " exited with " + std::to_string(r.exit_code);
    return probe;
  }
  probe.lines = nonempty_lines(r.stdout_text);
  if (probe.lines.empty()) probe.lines = nonempty_lines(r.stderr_text);
  if (!probe.lines.empty()) probe.version = probe.lines.front();
  probe.available = true;
  return probe;
}

// ---------------------------------------------------------------------------
// ToolchainCompilerBackend
// ---------------------------------------------------------------------------

ToolchainCompilerBackend::ToolchainCompilerBackend(std::string command,
                                                   std::vector<std::string> version_args,
                                                   std::shared_ptr<InstanceBackend> instances,
                                                   std::string scratch_root)
    : command_(std::move(command)),
      version_args_(std::move(version_args)),
      instances_(std::move(instances)),
      scratch_root_(std::move(scratch_root)) {}

ToolchainProbe ToolchainCompilerBackend::probe() {
  return probe_command(*instances_, scratch_root_, command_, version_args_);
}

CompileOutput ToolchainCompilerBackend::compile(const CompileJob& job) {
  auto resolved = resolve_executable(command_);
  if (!resolved) {
    throw InfrastructureError(command_ + " not found on PATH", ErrorCode::toolchain_unavailable);
  }

  ScratchDir dir(scratch_root_);
  dir.write_file(job.source_name, job.source);

  InstanceSpec spec;
  spec.command = *resolved;
  spec.argv = job.argv;
  spec.inherit_env = true;
  spec.cwd = dir.path();
  spec.timeout_ms = job.timeout_ms;
  spec.memory_mode = MemoryCeilingMode::none;
  spec.max_output_bytes = job.max_output_bytes;
  spec.max_file_descriptors = 1024;
  spec.allow_file_writes = true;
  spec.isolate_network = true;

  CancellationToken never;
  InstanceResult r = instances_->launch(spec, never);
  if (!r.error_message.empty()) {
    throw InfrastructureError("compiler launch failed: " + r.error_message, ErrorCode::spawn_failed);
  }

  CompileOutput out;
  out.exit_code = r.exit_code;
  out.duration_ms = r.duration_ms;
  out.timed_out = r.termination == TerminationReason::deadline ||
                  r.termination == TerminationReason::cpu_limit;
  out.diagnostics = r.stderr_text;
  if (!r.stdout_text.empty()) {
    if (!out.diagnostics.empty() && out.diagnostics.back() != '\n') out.diagnostics += '\n';
    out.diagnostics += r.stdout_text;
  }
  hide_scratch_path(out.diagnostics, dir.path());
  if (r.exit_code != 0 || r.termination != TerminationReason::none) return out;

  auto binary = dir.read_file(job.output_name);
  if (!binary) {
    out.diagnostics += "compiler produced no " + job.output_name + "\n";
    return out;
  }
  out.binary = std::move(*binary);
  out.ok = true;
  return out;
}

// ---------------------------------------------------------------------------
// RuntimeAdapter
// ---------------------------------------------------------------------------

const RuntimeEnvironmentInfo& RuntimeAdapter::environment_info() const {
  std::call_once(probe_once_, [this] {
    info_ = probe_environment();
    info_.language = language();
  });
  return info_;
}

std::string RuntimeAdapter::toolchain_id() const {
  const auto& info = environment_info();
  return info.runtime + "@" + info.version + ":" + info.path;
}

}  // namespace warden
