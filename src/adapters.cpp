#include "warden/adapters.hpp"

#include <filesystem>
#include <regex>

#include "warden/errors.hpp"

namespace warden {

namespace {

const std::map<std::string, std::string>& program_env() {
  static const std::map<std::string, std::string> env{
      {"PATH", "/usr/local/bin:/usr/bin:/bin"},
      {"LANG", "C.UTF-8"},
  };
  return env;
}

// POSIX backend can lift every isolation toggle when the limits grant it.
RuntimeCapabilities posix_capabilities() {
  RuntimeCapabilities caps;
  caps.network = true;
  caps.file_system = true;
  caps.environment = true;
  caps.processes = true;
  return caps;
}

std::string first_version_token(const std::string& line) {
  static const std::regex re(R"((\d+\.\d+(\.\d+)?))");
  std::smatch m;
  if (std::regex_search(line, m, re)) return m[1].str();
  return line;
}

[[noreturn]] void raise_compile_failure(Language language, const CompileOutput& out) {
  if (out.timed_out) {
    throw CompileError(to_string(language) + " compilation timed out", out.diagnostics,
                       out.exit_code, true);
  }
  throw CompileError(to_string(language) + " compilation failed", out.diagnostics,
                     out.exit_code == 0 ? 1 : out.exit_code);
}

}  // namespace

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

InterpreterProfile node_profile(const std::string& command) {
  InterpreterProfile p;
  p.language = Language::javascript;
  p.runtime_name = "node";
  p.command = command;
  p.probe_args = {"-p", "process.versions.node + \"\\n\" + process.execPath"};
  p.entry_name = "main.js";
  // V8 reserves far more address space than it uses; the heap flag is the
  // ceiling instead.
  p.memory_mode = MemoryCeilingMode::runtime_managed;
  p.oom_markers = {"JavaScript heap out of memory", "Reached heap limit",
                   "Fatal process out of memory"};
  p.base_env = program_env();
  return p;
}

InterpreterProfile python_profile(const std::string& command) {
  InterpreterProfile p;
  p.language = Language::python;
  p.runtime_name = "python";
  p.command = command;
  p.probe_args = {"-c", "import sys;print(sys.version.split()[0]);print(sys.executable)"};
  p.entry_name = "main.py";
  p.memory_mode = MemoryCeilingMode::address_space;
  p.oom_markers = {"MemoryError"};
  p.base_env = program_env();
  return p;
}

std::vector<std::string> interpreter_args(const InterpreterProfile& profile,
                                          const ExecutionLimits& limits) {
  switch (profile.language) {
    case Language::javascript:
    case Language::typescript:
      return {"--max-old-space-size=" + std::to_string(limits.max_memory_mb),
              "--disallow-code-generation-from-strings"};
    case Language::python:
      return {"-I", "-B", "-u", "-X", "utf8"};
    case Language::rust:
    case Language::c:
    case Language::cpp:
      return {};
  }
  return {};
}

// ---------------------------------------------------------------------------
// InterpreterAdapter
// ---------------------------------------------------------------------------

InterpreterAdapter::InterpreterAdapter(InterpreterProfile profile,
                                       std::shared_ptr<InstanceBackend> instances,
                                       std::string scratch_root)
    : profile_(std::move(profile)),
      instances_(std::move(instances)),
      scratch_root_(std::move(scratch_root)) {}

CompiledArtifactData InterpreterAdapter::compile(const std::string& code, const CompilerFlags&) {
  CompiledArtifactData data;
  data.language = profile_.language;
  data.entry_name = profile_.entry_name;
  data.payload = code;
  return data;
}

RunOutcome InterpreterAdapter::run(const CompiledArtifact& artifact, const RunContext& context,
                                   const CancellationToken& cancel) {
  return run_script(artifact.entry_name, artifact.payload(), context, cancel);
}

RunOutcome InterpreterAdapter::run_script(const std::string& entry_name, const std::string& payload,
                                          const RunContext& context,
                                          const CancellationToken& cancel) {
  const auto& info = environment_info();
  if (!info.available) {
    throw InfrastructureError(profile_.runtime_name + " is not available",
                              ErrorCode::toolchain_unavailable);
  }
  ProgramLaunch launch;
  launch.command = info.path;
  launch.leading_args = interpreter_args(profile_, context.limits);
  launch.entry_name = entry_name;
  launch.entry_payload = payload;
  launch.memory_mode = profile_.memory_mode;
  launch.oom_markers = profile_.oom_markers;
  launch.env = profile_.base_env;
  return launch_program(*instances_, scratch_root_, launch, context, cancel);
}

RuntimeEnvironmentInfo InterpreterAdapter::probe_environment() const {
  RuntimeEnvironmentInfo info;
  info.runtime = profile_.runtime_name;
  info.capabilities = posix_capabilities();
  ToolchainProbe probe;
  try {
    probe = probe_command(*instances_, scratch_root_, profile_.command, profile_.probe_args);
  } catch (const InfrastructureError& e) {
    probe.detail = e.what();
  }
  info.available = probe.available;
  info.path = probe.path;
  if (!probe.lines.empty()) info.version = probe.lines[0];
  // The interpreter reports its real executable, which sidesteps version
  // manager shims that re-resolve through the environment.
  if (probe.lines.size() > 1 && probe.lines[1].front() == '/') info.path = probe.lines[1];
  return info;
}

// ---------------------------------------------------------------------------
// TypeScriptAdapter
// ---------------------------------------------------------------------------

TypeScriptAdapter::TypeScriptAdapter(std::shared_ptr<CompilerBackend> tsc, InterpreterProfile node,
                                     std::shared_ptr<InstanceBackend> instances,
                                     std::string scratch_root, std::uint64_t compile_timeout_ms,
                                     std::size_t compile_max_output)
    : tsc_(std::move(tsc)),
      node_(std::move(node), std::move(instances), std::move(scratch_root)),
      compile_timeout_ms_(compile_timeout_ms),
      compile_max_output_(compile_max_output) {}

CompiledArtifactData TypeScriptAdapter::compile(const std::string& code,
                                                const CompilerFlags& flags) {
  CompileJob job;
  job.language = Language::typescript;
  job.source_name = source_file_name(Language::typescript);
  job.source = code;
  job.output_name = "out/main.js";
  job.argv = compiler_args(Language::typescript, flags, job.source_name, job.output_name);
  job.timeout_ms = compile_timeout_ms_;
  job.max_output_bytes = compile_max_output_;

  CompileOutput out = tsc_->compile(job);
  if (!out.ok) raise_compile_failure(Language::typescript, out);

  CompiledArtifactData data;
  data.language = Language::typescript;
  data.entry_name = "main.js";
  data.payload = std::move(out.binary);
  data.diagnostics = std::move(out.diagnostics);
  data.compile_time_ms = out.duration_ms;
  return data;
}

RunOutcome TypeScriptAdapter::run(const CompiledArtifact& artifact, const RunContext& context,
                                  const CancellationToken& cancel) {
  return node_.run_script(artifact.entry_name, artifact.payload(), context, cancel);
}

RuntimeEnvironmentInfo TypeScriptAdapter::probe_environment() const {
  RuntimeEnvironmentInfo info;
  info.runtime = "tsc";
  info.capabilities = posix_capabilities();
  ToolchainProbe probe;
  try {
    probe = tsc_->probe();
  } catch (const InfrastructureError& e) {
    probe.detail = e.what();
  }
  info.path = probe.path;
  info.version = first_version_token(probe.version);
  info.available = probe.available && node_.environment_info().available;
  return info;
}

// ---------------------------------------------------------------------------
// NativeAdapter
// ---------------------------------------------------------------------------

NativeAdapter::NativeAdapter(Language language, std::shared_ptr<CompilerBackend> compiler,
                             std::shared_ptr<InstanceBackend> instances, std::string scratch_root,
                             std::uint64_t compile_timeout_ms, std::size_t compile_max_output)
    : language_(language),
      compiler_(std::move(compiler)),
      instances_(std::move(instances)),
      scratch_root_(std::move(scratch_root)),
      compile_timeout_ms_(compile_timeout_ms),
      compile_max_output_(compile_max_output) {}

CompiledArtifactData NativeAdapter::compile(const std::string& code, const CompilerFlags& flags) {
  CompileJob job;
  job.language = language_;
  job.source_name = source_file_name(language_);
  job.source = prepare_source(language_, code);
  job.output_name = "main";
  job.argv = compiler_args(language_, flags, job.source_name, job.output_name);
  job.timeout_ms = compile_timeout_ms_;
  job.max_output_bytes = compile_max_output_;

  CompileOutput out = compiler_->compile(job);
  if (!out.ok) raise_compile_failure(language_, out);

  CompiledArtifactData data;
  data.language = language_;
  data.entry_name = "main";
  data.payload = std::move(out.binary);
  data.diagnostics = std::move(out.diagnostics);
  data.compile_time_ms = out.duration_ms;
  return data;
}

RunOutcome NativeAdapter::run(const CompiledArtifact& artifact, const RunContext& context,
                              const CancellationToken& cancel) {
  ProgramLaunch launch;
  launch.entry_name = artifact.entry_name;
  launch.entry_payload = artifact.payload();
  launch.entry_executable = true;
  launch.memory_mode = MemoryCeilingMode::address_space;
  launch.oom_markers = {"std::bad_alloc", "memory allocation of", "Cannot allocate memory"};
  launch.env = program_env();
  return launch_program(*instances_, scratch_root_, launch, context, cancel);
}

RuntimeEnvironmentInfo NativeAdapter::probe_environment() const {
  RuntimeEnvironmentInfo info;
  info.runtime = compiler_->name();
  info.capabilities = posix_capabilities();
  ToolchainProbe probe;
  try {
    probe = compiler_->probe();
  } catch (const InfrastructureError& e) {
    probe.detail = e.what();
  }
  info.available = probe.available;
  info.path = probe.path;
  info.version = first_version_token(probe.version);
  return info;
}

// ---------------------------------------------------------------------------
// Source preparation and compiler arguments
// ---------------------------------------------------------------------------

std::string source_file_name(Language language) {
  switch (language) {
    case Language::javascript: return "main.js";
    case Language::typescript: return "main.ts";
    case Language::python: return "main.py";
    case Language::rust: return "main.rs";
    case Language::c: return "main.c";
    case Language::cpp: return "main.cpp";
  }
  return "main";
}

std::string prepare_source(Language language, const std::string& code) {
  switch (language) {
    case Language::cpp: {
      static const std::regex has_std(R"(#\s*include\s*<(iostream|string|vector|algorithm|map)>)");
      if (std::regex_search(code, has_std)) return code;
      return "#include <iostream>\n#include <string>\n#include <vector>\n"
             "#include <algorithm>\n#include <map>\n#line 1 \"main.cpp\"\n" +
             code;
    }
    case Language::c: {
      static const std::regex has_std(R"(#\s*include\s*<(stdio|stdlib|string)\.h>)");
      if (std::regex_search(code, has_std)) return code;
      return "#include <stdio.h>\n#include <stdlib.h>\n#include <string.h>\n"
             "#line 1 \"main.c\"\n" +
             code;
    }
    case Language::rust:
      // Appended so inner attributes at the top of the crate stay first.
      return code + "\n#[allow(unused_imports)]\nuse std::io::{Read as _, Write as _};\n";
    case Language::javascript:
    case Language::typescript:
    case Language::python:
      return code;
  }
  return code;
}

std::vector<std::string> compiler_args(Language language, const CompilerFlags& flags,
                                       const std::string& source_name,
                                       const std::string& output_name) {
  const std::string standard =
      flags.standard.empty() ? default_standard(language) : flags.standard;
  std::vector<std::string> argv;
  switch (language) {
    case Language::typescript: {
      // tsc names the output after the source; only its directory is chosen.
      std::string out_dir = std::filesystem::path(output_name).parent_path().string();
      if (out_dir.empty()) out_dir = ".";
      argv = {"--target", standard, "--module", "commonjs", "--outDir", out_dir,
              "--pretty", "false", "--noEmitOnError", "--skipLibCheck"};
      if (flags.warnings == WarningLevel::pedantic) argv.push_back("--strict");
      if (flags.debug) argv.push_back("--sourceMap");
      argv.push_back(source_name);
      return argv;
    }
    case Language::rust: {
      static const char* const kOpt[] = {"0", "1", "2", "3", "s", "z"};
      argv = {"--edition", standard, "--crate-name", "main", "-C",
              std::string("opt-level=") + kOpt[static_cast<int>(flags.optimization)]};
      if (flags.debug) argv.push_back("-g");
      if (flags.warnings == WarningLevel::pedantic) {
        argv.push_back("-D");
        argv.push_back("warnings");
      }
      argv.push_back("-o");
      argv.push_back(output_name);
      argv.push_back(source_name);
      return argv;
    }
    case Language::c:
    case Language::cpp: {
      argv = {"-std=" + standard, "-" + to_string(flags.optimization), "-pipe"};
      switch (flags.warnings) {
        case WarningLevel::minimal:
          break;
        case WarningLevel::pedantic:
          argv.push_back("-Werror");
          [[fallthrough]];
        case WarningLevel::extra:
          argv.push_back("-Wpedantic");
          [[fallthrough]];
        case WarningLevel::all:
          argv.push_back("-Wall");
          argv.push_back("-Wextra");
          break;
      }
      if (flags.debug) {
        argv.push_back("-g");
        argv.push_back("-DDEBUG");
      }
      argv.push_back("-o");
      argv.push_back(output_name);
      argv.push_back(source_name);
      if (language == Language::c) argv.push_back("-lm");
      return argv;
    }
    case Language::javascript:
    case Language::python:
      return argv;
  }
  return argv;
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

AdapterSet make_default_adapters(const EngineConfig& config,
                                 std::shared_ptr<InstanceBackend> instances) {
  const std::string root = scratch_root_of(config);
  const auto& tc = config.toolchains;
  auto compiler = [&](const std::string& command, std::vector<std::string> version_args) {
    return std::make_shared<ToolchainCompilerBackend>(command, std::move(version_args),
                                                      instances, root);
  };

  AdapterSet set;
  set[index_of(Language::javascript)] =
      std::make_unique<InterpreterAdapter>(node_profile(tc.node), instances, root);
  set[index_of(Language::python)] =
      std::make_unique<InterpreterAdapter>(python_profile(tc.python), instances, root);
  set[index_of(Language::typescript)] = std::make_unique<TypeScriptAdapter>(
      compiler(tc.tsc, {"--version"}), node_profile(tc.node), instances, root,
      config.compile_timeout_ms, config.compile_max_output_bytes);
  set[index_of(Language::rust)] = std::make_unique<NativeAdapter>(
      Language::rust, compiler(tc.rustc, {"--version"}), instances, root,
      config.compile_timeout_ms, config.compile_max_output_bytes);
  set[index_of(Language::c)] = std::make_unique<NativeAdapter>(
      Language::c, compiler(tc.cc, {"-dumpfullversion"}), instances, root,
      config.compile_timeout_ms, config.compile_max_output_bytes);
  set[index_of(Language::cpp)] = std::make_unique<NativeAdapter>(
      Language::cpp, compiler(tc.cxx, {"-dumpfullversion"}), instances, root,
      config.compile_timeout_ms, config.compile_max_output_bytes);
  return set;
}

}  // namespace warden
