#pragma once

// warden/adapters.hpp — Concrete runtime adapters.
//
//   InterpreterAdapter   JavaScript (node) and Python (python3). Compile is the
//                        identity; the source becomes the instance entry file.
//   TypeScriptAdapter    tsc to CommonJS, then runs the emitted JS on node.
//   NativeAdapter        rustc, gcc, g++. Sources get a small standard preamble
//                        before the build; the binary is exec'd directly.
//
// All adapters share one InstanceBackend and one scratch root.

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "warden/adapter.hpp"
#include "warden/config.hpp"

namespace warden {

// How an interpreter is invoked and how it reports running out of memory.
struct InterpreterProfile {
  Language language{Language::javascript};
  std::string runtime_name;  // "node", "python"
  std::string command;
  std::vector<std::string> probe_args;  // prints version, then real executable path
  std::string entry_name;
  MemoryCeilingMode memory_mode{MemoryCeilingMode::address_space};
  std::vector<std::string> oom_markers;
  std::map<std::string, std::string> base_env;
};

InterpreterProfile node_profile(const std::string& command);
InterpreterProfile python_profile(const std::string& command);

// Interpreter flags placed before the entry file.
std::vector<std::string> interpreter_args(const InterpreterProfile& profile,
                                          const ExecutionLimits& limits);

class InterpreterAdapter : public RuntimeAdapter {
 public:
  InterpreterAdapter(InterpreterProfile profile, std::shared_ptr<InstanceBackend> instances,
                     std::string scratch_root);

  Language language() const override { return profile_.language; }
  CompiledArtifactData compile(const std::string& code, const CompilerFlags& flags) override;
  RunOutcome run(const CompiledArtifact& artifact, const RunContext& context,
                 const CancellationToken& cancel) override;

  // Runs an already materialized script payload under this interpreter.
  RunOutcome run_script(const std::string& entry_name, const std::string& payload,
                        const RunContext& context, const CancellationToken& cancel);

 protected:
  RuntimeEnvironmentInfo probe_environment() const override;

 private:
  InterpreterProfile profile_;
  std::shared_ptr<InstanceBackend> instances_;
  std::string scratch_root_;
};

class TypeScriptAdapter : public RuntimeAdapter {
 public:
  TypeScriptAdapter(std::shared_ptr<CompilerBackend> tsc, InterpreterProfile node,
                    std::shared_ptr<InstanceBackend> instances, std::string scratch_root,
                    std::uint64_t compile_timeout_ms, std::size_t compile_max_output);

  Language language() const override { return Language::typescript; }
  CompiledArtifactData compile(const std::string& code, const CompilerFlags& flags) override;
  RunOutcome run(const CompiledArtifact& artifact, const RunContext& context,
                 const CancellationToken& cancel) override;

 protected:
  RuntimeEnvironmentInfo probe_environment() const override;

 private:
  std::shared_ptr<CompilerBackend> tsc_;
  InterpreterAdapter node_;
  std::uint64_t compile_timeout_ms_;
  std::size_t compile_max_output_;
};

class NativeAdapter : public RuntimeAdapter {
 public:
  NativeAdapter(Language language, std::shared_ptr<CompilerBackend> compiler,
                std::shared_ptr<InstanceBackend> instances, std::string scratch_root,
                std::uint64_t compile_timeout_ms, std::size_t compile_max_output);

  Language language() const override { return language_; }
  CompiledArtifactData compile(const std::string& code, const CompilerFlags& flags) override;
  RunOutcome run(const CompiledArtifact& artifact, const RunContext& context,
                 const CancellationToken& cancel) override;

 protected:
  RuntimeEnvironmentInfo probe_environment() const override;

 private:
  Language language_;
  std::shared_ptr<CompilerBackend> compiler_;
  std::shared_ptr<InstanceBackend> instances_;
  std::string scratch_root_;
  std::uint64_t compile_timeout_ms_;
  std::size_t compile_max_output_;
};

// Source as handed to the compiler: C and C++ get common headers when the
// program includes none of them, Rust gets the io traits in scope.
std::string prepare_source(Language language, const std::string& code);

// Compiler argv for one build. `standard` is already defaulted.
std::vector<std::string> compiler_args(Language language, const CompilerFlags& flags,
                                       const std::string& source_name,
                                       const std::string& output_name);

std::string source_file_name(Language language);

using AdapterSet = std::array<std::unique_ptr<RuntimeAdapter>, kLanguageCount>;

AdapterSet make_default_adapters(const EngineConfig& config,
                                 std::shared_ptr<InstanceBackend> instances);

}  // namespace warden
