#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "warden/adapter.hpp"
#include "warden/adapters.hpp"
#include "warden/cancellation.hpp"
#include "warden/compile_cache.hpp"
#include "warden/config.hpp"
#include "warden/engine.hpp"
#include "warden/errors.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/limiter.hpp"
#include "warden/observability.hpp"
#include "warden/runtime.hpp"
#include "warden/sandbox.hpp"
#include "warden/security.hpp"
#include "warden/types.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;
using namespace warden;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;
std::string g_scratch_root;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

void skip(const std::string& why) {
  std::cout << " (skipped: " << why << ")";
  g_tests_skipped++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool has_arg(const std::vector<std::string>& argv, const std::string& a) {
  return std::find(argv.begin(), argv.end(), a) != argv.end();
}

template <class Fn>
std::string security_category(Fn&& fn) {
  try {
    fn();
  } catch (const SecurityError& e) {
    return e.category();
  }
  return "";
}

template <class Fn>
ErrorCode engine_error_code(Fn&& fn) {
  try {
    fn();
  } catch (const EngineError& e) {
    return e.code();
  }
  return ErrorCode::none;
}

ExecutionRequest js_request(const std::string& code, const std::string& input = "") {
  ExecutionRequest req;
  req.language = "javascript";
  req.code = code;
  req.input = input;
  return req;
}

// ============================================================================
// Stub runtime: behavior is selected by keywords in the source.
// ============================================================================

struct StubState {
  std::atomic<int> compiles{0};
  std::atomic<int> runs{0};
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  std::atomic<std::size_t> last_env_size{0};
};

class StubAdapter : public RuntimeAdapter {
 public:
  StubAdapter(Language language, StubState& state, bool available = true)
      : language_(language), state_(state), available_(available) {}

  Language language() const override { return language_; }

  CompiledArtifactData compile(const std::string& code, const CompilerFlags&) override {
    ++state_.compiles;
    if (contains(code, "COMPILE_FAIL")) {
      throw CompileError(to_string(language_) + " compilation failed",
                         "main.rs:1:1: error: expected item", 1);
    }
    CompiledArtifactData data;
    data.language = language_;
    data.entry_name = "main";
    data.payload = "bin:" + code;
    data.compile_time_ms = 3;
    return data;
  }

  RunOutcome run(const CompiledArtifact& artifact, const RunContext& ctx,
                 const CancellationToken& cancel) override {
    ++state_.runs;
    const int now = ++state_.running;
    int seen = state_.max_running.load();
    while (now > seen && !state_.max_running.compare_exchange_weak(seen, now)) {
    }
    state_.last_env_size = ctx.env.size();

    const std::string program = artifact.payload();
    RunOutcome out;
    out.sandboxed = true;
    if (contains(program, "INFRA")) {
      --state_.running;
      throw InfrastructureError("stub backend lost the instance");
    }
    if (contains(program, "SLEEP")) {
      if (cancel.wait_for(std::chrono::seconds(10))) out.termination = TerminationReason::cancelled;
    } else if (contains(program, "HOLD")) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      out.stdout_text = "held\n";
    } else if (contains(program, "EXIT3")) {
      out.exit_code = 3;
      out.stderr_text = "boom\n";
    } else if (contains(program, "OOM")) {
      out.exit_code = 137;
      out.termination = TerminationReason::memory_limit;
    } else if (contains(program, "FLOOD")) {
      out.stdout_text = "partial";
      out.termination = TerminationReason::output_limit;
    } else {
      out.stdout_text = "ran:" + ctx.input;
      for (const auto& a : ctx.args) out.stdout_text += " " + a;
    }
    out.output_bytes = out.stdout_text.size() + out.stderr_text.size();
    out.peak_memory_bytes = 4 * 1024 * 1024;
    --state_.running;
    return out;
  }

 protected:
  RuntimeEnvironmentInfo probe_environment() const override {
    RuntimeEnvironmentInfo info;
    info.language = language_;
    info.runtime = "stub";
    info.version = "1.0.0";
    info.path = "/opt/stub/bin/stub";
    info.available = available_;
    info.capabilities = {true, true, true, true};
    return info;
  }

 private:
  Language language_;
  StubState& state_;
  bool available_;
};

EngineConfig stub_config() {
  EngineConfig config;
  config.required_languages = {Language::javascript};
  config.scratch_root = g_scratch_root;
  return config;
}

// javascript (interpreted) and rust (compiled) are available, python is
// registered but its runtime is missing.
std::unique_ptr<Engine> make_stub_engine(StubState& state, EngineConfig config = stub_config()) {
  AdapterSet adapters;
  adapters[index_of(Language::javascript)] =
      std::make_unique<StubAdapter>(Language::javascript, state);
  adapters[index_of(Language::rust)] = std::make_unique<StubAdapter>(Language::rust, state);
  adapters[index_of(Language::python)] =
      std::make_unique<StubAdapter>(Language::python, state, false);
  return std::make_unique<Engine>(std::move(config), std::move(adapters));
}

// Emits a shell script in place of a native binary.
class ScriptCompilerBackend : public CompilerBackend {
 public:
  CompileOutput compile(const CompileJob& job) override {
    ++compiles;
    last_job = job;
    CompileOutput out;
    out.duration_ms = 1;
    if (contains(job.source, "syntax error")) {
      out.diagnostics = "main.c:1:5: error: expected ';' before '}' token\n";
      out.exit_code = 1;
      return out;
    }
    out.ok = true;
    out.binary = "#!/bin/sh\necho \"native:$1\"\n";
    return out;
  }

  ToolchainProbe probe() override {
    ToolchainProbe p;
    p.available = true;
    p.path = "/usr/bin/fakecc";
    p.version = "fakecc (Fake) 9.1.0";
    p.lines = {p.version};
    return p;
  }

  std::string name() const override { return "fakecc"; }

  int compiles{0};
  CompileJob last_job;
};

std::mutex g_events_mu;
std::vector<ExecutionEvent> g_events;

void capture_event(const ExecutionEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

// ============================================================================
// Phase 1: Types, hashing and the wire codec
// ============================================================================

void test_language_ids() {
  expect(language_from_string("javascript") == Language::javascript, "canonical js");
  expect(language_from_string("JS") == Language::javascript, "alias is case-insensitive");
  expect(language_from_string("node") == Language::javascript, "node alias");
  expect(language_from_string("ts") == Language::typescript, "ts alias");
  expect(language_from_string("python3") == Language::python, "python3 alias");
  expect(language_from_string("rs") == Language::rust, "rs alias");
  expect(language_from_string("c++") == Language::cpp, "c++ alias");
  expect(language_from_string("cxx") == Language::cpp, "cxx alias");
  expect(!language_from_string("ruby").has_value(), "ruby unknown");
  expect(!language_from_string("").has_value(), "empty id unknown");
  for (Language lang : kAllLanguages) {
    expect(language_from_string(to_string(lang)) == lang, "to_string round-trips " + to_string(lang));
  }
  expect(requires_compilation(Language::rust), "rust compiled");
  expect(requires_compilation(Language::typescript), "typescript transpiled");
  expect(!requires_compilation(Language::python), "python interpreted");
}

void test_compiler_standards() {
  expect(is_valid_standard(Language::cpp, "c++20"), "c++20 valid");
  expect(!is_valid_standard(Language::cpp, "c11"), "c11 is not a C++ standard");
  expect(is_valid_standard(Language::c, "c99"), "c99 valid");
  expect(is_valid_standard(Language::rust, "2018"), "edition 2018 valid");
  expect(!is_valid_standard(Language::rust, "2030"), "future edition invalid");
  expect(is_valid_standard(Language::python, ""), "empty always valid");
  expect(!is_valid_standard(Language::python, "3.12"), "python takes no standard");
  expect(default_standard(Language::cpp) == "c++17", "c++ default");
  expect(default_standard(Language::rust) == "2021", "rust default");
  expect(optimization_from_string("Oz") == OptimizationLevel::Oz, "Oz parses");
  expect(!optimization_from_string("O9").has_value(), "O9 rejected");
  expect(warnings_from_string("pedantic") == WarningLevel::pedantic, "pedantic parses");
}

void test_hash_domains() {
  const auto info = hash_runtime_info();
  expect(info.primitive == "blake3", "blake3 primitive");
  const std::string h = blake3_hex("warden");
  expect(h.size() == 64, "blake3 hex is 32 bytes");
  expect(request_hash("x") != artifact_key_hash("x"), "request and artifact domains differ");
  expect(artifact_key_hash("x") != blob_hash("x"), "artifact and blob domains differ");
  expect(request_hash("x") == request_hash("x"), "domain hash deterministic");
}

void test_parse_request() {
  const std::string json =
      R"j({"code":"print(1)","language":"python","input":"abc","args":["a","b"],)j"
      R"("env":{"MODE":"fast"},"limits":{"timeoutMs":2000,"allowNetwork":true},)"
      R"("compilerFlags":{"optimization":"O3","standard":"c++20","warnings":"all","debug":true}})";
  std::string err;
  auto req = parse_request_json(json, &err);
  expect(err.empty(), "valid request parses: " + err);
  expect(req.code == "print(1)", "code");
  expect(req.language == "python", "language");
  expect(req.input == "abc", "input");
  expect(req.args.size() == 2 && req.args[1] == "b", "args");
  expect(req.env.at("MODE") == "fast", "env");
  expect(req.limits.timeout_ms == 2000, "timeoutMs");
  expect(req.limits.allow_network == true, "allowNetwork");
  expect(!req.limits.max_memory_mb.has_value(), "absent limit stays unset");
  expect(req.compiler_flags.has_value(), "flags present");
  expect(req.compiler_flags->optimization == OptimizationLevel::O3, "O3");
  expect(req.compiler_flags->standard == "c++20", "standard");
  expect(req.compiler_flags->warnings == WarningLevel::all, "warnings");
  expect(req.compiler_flags->debug, "debug");
}

void test_parse_request_type_errors() {
  const char* bad[] = {
      R"({"language":"python"})",
      R"({"code":42,"language":"python"})",
      R"({"code":"x","language":"python","args":"a b"})",
      R"({"code":"x","language":"python","args":["a",1]})",
      R"({"code":"x","language":"python","env":{"A":1}})",
      R"({"code":"x","language":"python","limits":{"timeoutMs":"fast"}})",
      R"({"code":"x","language":"python","limits":{"allowEnv":"yes"}})",
      R"({"code":"x","language":"cpp","compilerFlags":{"optimization":"O9"}})",
      R"({"code":"x","language":"python","input":7})",
      R"({"code":"x",)",
  };
  for (const char* json : bad) {
    std::string err;
    parse_request_json(json, &err);
    expect(!err.empty(), std::string("rejected: ") + json);
  }

  std::string err;
  auto req = parse_request_json(R"({"code":"x","language":"js","limits":{"timeoutMs":-5}})", &err);
  expect(err.empty(), "negative limit parses; range is checked later");
  expect(req.limits.timeout_ms == -5, "negative preserved");
}

void test_request_size_cap() {
  std::string big = R"({"code":")" + std::string(kMaxRequestPayloadBytes, 'a') + R"(","language":"js"})";
  std::string err;
  parse_request_json(big, &err);
  expect(contains(err, "exceeds"), "oversized payload rejected before parsing");
}

void test_result_json() {
  ExecutionResult r;
  r.success = false;
  r.stdout_text = "out\n";
  r.stderr_text = "err\n";
  r.exit_code = 124;
  r.language = "python";
  r.execution_time_ms = 12.5;
  r.metadata.was_sandboxed = true;
  r.metadata.timeout_hit = true;
  r.metadata.runtime = "python";
  r.metadata.version = "3.12.1";
  r.error = "Execution timed out after 100ms";
  r.error_code = ErrorCode::timeout;

  std::optional<jsonlite::JsonError> jerr;
  auto o = jsonlite::parse(result_to_json(r), &jerr);
  expect(!jerr, "result JSON parses");
  expect(!jsonlite::get_bool(o, "success", true), "success false");
  expect(jsonlite::get_string(o, "stdout") == "out\n", "stdout");
  expect(jsonlite::get_u64(o, "exitCode") == 124, "exitCode");
  expect(jsonlite::get_string(o, "errorCode") == "timeout", "errorCode");
  expect(jsonlite::get_string(o, "error") == "Execution timed out after 100ms", "error");
  const auto* meta = jsonlite::get_object(o, "metadata");
  expect(meta != nullptr, "metadata object");
  expect(jsonlite::get_bool(*meta, "wasSandboxed"), "wasSandboxed");
  expect(jsonlite::get_bool(*meta, "timeoutHit"), "timeoutHit");
  expect(jsonlite::get_string(*meta, "version") == "3.12.1", "version");

  ExecutionResult ok;
  ok.success = true;
  ok.language = "javascript";
  auto o2 = jsonlite::parse(result_to_json(ok), &jerr);
  expect(!jsonlite::has(o2, "error"), "no error field on success");
}

void test_request_digest() {
  auto a = js_request("console.log(1)");
  auto b = js_request("console.log(1)");
  auto c = js_request("console.log(2)");
  expect(request_digest(a) == request_digest(b), "digest stable");
  expect(request_digest(a) != request_digest(c), "digest covers code");
  b.limits.timeout_ms = 100;
  expect(request_digest(a) != request_digest(b), "digest covers limits");
  b = a;
  b.env["A"] = "1";
  expect(request_digest(a) != request_digest(b), "digest covers env");
}

void test_error_json() {
  std::optional<jsonlite::JsonError> jerr;
  auto o = jsonlite::parse(error_to_json(ErrorCode::security_violation, "nope"), &jerr);
  expect(!jerr, "error JSON parses");
  expect(jsonlite::get_string(o, "errorCode") == "security_violation", "errorCode");
  expect(jsonlite::get_string(o, "error") == "nope", "error message");
}

void test_version_manifest() {
  const auto m = version::current_manifest();
  const std::string json = version::manifest_to_json(m);
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::parse(json, &jerr);
  expect(!jerr, "manifest is valid JSON");
  expect(contains(json, "blake3"), "manifest names the hash primitive");
}

// ============================================================================
// Phase 2: Configuration
// ============================================================================

void test_config_defaults_valid() {
  EngineConfig c;
  auto check = validate_config(c);
  expect(check.ok, "compiled-in defaults are valid");
  expect(c.default_limits.timeout_ms == 5000, "default timeout");
  expect(c.default_limits.max_memory_mb == 256, "default memory");
  expect(!c.default_limits.allow_network, "network denied by default");
}

void test_config_rejects_bad_values() {
  EngineConfig c;
  c.default_limits.timeout_ms = 60000;
  expect(!validate_config(c).ok, "default above ceiling rejected");

  c = EngineConfig{};
  c.max_concurrent_instances = 0;
  expect(!validate_config(c).ok, "zero concurrency rejected");

  c = EngineConfig{};
  c.cache_compression = "lz4";
  expect(!validate_config(c).ok, "unknown compression rejected");

  c = EngineConfig{};
  c.default_limits.allow_network = true;
  auto check = validate_config(c);
  expect(check.ok && !check.warnings.empty(), "granting network warns");
}

void test_config_json_overlay() {
  EngineConfig c;
  std::string err;
  const bool ok = apply_config_json(
      c, R"({"defaultLimits":{"timeoutMs":2500},"maxConcurrentInstances":3,"requiredLanguages":["js"]})",
      &err);
  expect(ok, "overlay parses: " + err);
  expect(c.default_limits.timeout_ms == 2500, "timeout overlaid");
  expect(c.max_concurrent_instances == 3, "concurrency overlaid");
  expect(c.required_languages.size() == 1 && c.required_languages[0] == Language::javascript,
         "required languages overlaid");
  expect(!apply_config_json(c, "{not json", &err), "invalid JSON rejected");
}

// ============================================================================
// Phase 3: Security validator
// ============================================================================

void test_security_script_rules() {
  SecurityValidator v;
  ExecutionLimits none;
  auto js = [&](const std::string& code) {
    return security_category([&] { v.validate_code(code, Language::javascript, none); });
  };
  expect(js("console.log('hello')").empty(), "plain output allowed");
  expect(js("const x = eval('1+1')") == "dynamic_evaluation", "eval denied");
  expect(js("new Function('return 1')()") == "dynamic_evaluation", "Function denied");
  expect(js("setTimeout(() => {}, 10)") == "deferred_execution", "timers denied");
  expect(js("const fs = require('fs')") == "module_import", "require denied");
  expect(js("process.exit(1)") == "process_control", "process.exit denied");
  expect(js("console.log(process.env.HOME)") == "environment_access", "env denied");
  expect(js("({}).__proto__.x = 1") == "prototype_pollution", "__proto__ denied");
  expect(js("fetch('http://example.com')") == "network", "fetch denied");
  expect(js("process.stdout.write('x')").empty(), "stdout write allowed");
  expect(js("const a = process.argv.slice(2)").empty(), "argv allowed");
}

void test_security_capability_lifting() {
  SecurityValidator v;
  ExecutionLimits limits;
  limits.allow_env = true;
  v.validate_code("console.log(process.env.HOME)", Language::javascript, limits);

  limits = ExecutionLimits{};
  limits.allow_file_system = true;
  v.validate_code("with open('data.txt') as f:\n    print(f.read())\n", Language::python, limits);

  limits = ExecutionLimits{};
  limits.allow_network = true;
  v.validate_code("fetch('http://example.com')", Language::javascript, limits);
  // Capabilities never lift evaluation rules.
  limits.allow_process = true;
  limits.allow_env = true;
  limits.allow_file_system = true;
  expect(security_category([&] { v.validate_code("eval('1')", Language::javascript, limits); }) ==
             "dynamic_evaluation",
         "eval denied with every capability");
}

void test_security_python_rules() {
  SecurityValidator v;
  ExecutionLimits none;
  auto py = [&](const std::string& code) {
    return security_category([&] { v.validate_code(code, Language::python, none); });
  };
  expect(py("import sys\nprint(sys.stdin.read())").empty(), "stdin allowed");
  expect(py("import re\np = re.compile('a+')\n").empty(), "re.compile allowed");
  expect(py("exec('print(1)')") == "dynamic_evaluation", "exec denied");
  expect(py("__import__('os')") == "dynamic_import", "__import__ denied");
  expect(py("name = input()") == "interactive_input", "input denied");
  expect(py("import subprocess") == "process_control", "subprocess denied");
  expect(py("import os") == "process_control", "os import denied");
  expect(py("open('/etc/passwd')") == "filesystem", "open denied");
  expect(py("import socket") == "network", "socket denied");
  expect(py("sys.modules['x'] = 1") == "host_access", "sys internals denied");
  expect(py("import sys\nsys.stdout.write(sys.argv[0])\n").empty(), "sys streams and argv allowed");
  expect(py("import sys\nsys.exit(0)") == "host_access", "sys.exit denied");

  // import os is a process capability; allowEnv alone does not lift it.
  ExecutionLimits env_only;
  env_only.allow_env = true;
  expect(security_category([&] { v.validate_code("import os\nprint(1)", Language::python, env_only); }) ==
             "process_control",
         "os import denied under allowEnv");
  ExecutionLimits process;
  process.allow_process = true;
  v.validate_code("import os\nprint(1)", Language::python, process);
}

void test_security_native_rules() {
  SecurityValidator v;
  ExecutionLimits none;
  auto cc = [&](const std::string& code) {
    return security_category([&] { v.validate_code(code, Language::cpp, none); });
  };
  expect(cc("#include <iostream>\nint main() { std::cout << 1; }").empty(), "iostream allowed");
  expect(cc("int main() { system(\"ls\"); }") == "process_control", "system denied");
  expect(cc("#include <unistd.h>\nint main() {}") == "process_control", "unistd denied");
  expect(cc("#include \"/etc/passwd\"") == "compile_time_inclusion", "quoted include denied");
  expect(cc("int main() { FILE* f = fopen(\"x\", \"r\"); }") == "filesystem", "fopen denied");
  expect(cc("int main() { return getenv(\"HOME\") != 0; }") == "environment_access", "getenv denied");
  expect(cc("int main() { asm(\"nop\"); }") == "foreign_code", "inline asm denied");

  auto rs = [&](const std::string& code) {
    return security_category([&] { v.validate_code(code, Language::rust, none); });
  };
  expect(rs("fn main() { println!(\"hi\"); }").empty(), "println allowed");
  expect(rs("fn main() { let a: Vec<String> = std::env::args().collect(); }").empty(),
         "env::args allowed");
  expect(rs("use std::process::Command;") == "process_control", "std::process denied");
  expect(rs("fn main() { let s = include_str!(\"/etc/passwd\"); }") == "compile_time_inclusion",
         "include_str denied");
}

void test_security_structure() {
  SecurityValidator v;
  ExecutionLimits none;
  std::string nested = "x = " + std::string(101, '[') + std::string(101, ']');
  expect(security_category([&] { v.validate_code(nested, Language::python, none); }) ==
             "excessive_nesting",
         "deep nesting denied");

  std::string run999 = "s = '" + std::string(999, 'a') + "'";
  v.validate_code(run999, Language::python, none);
  std::string run1000 = "s = '" + std::string(1000, 'a') + "'";
  expect(security_category([&] { v.validate_code(run1000, Language::python, none); }) ==
             "excessive_repetition",
         "run of 1000 denied");

  std::string long_line;
  for (int i = 0; i < 1500; ++i) long_line += "x = 1; ";
  expect(security_category([&] { v.validate_code(long_line, Language::python, none); }) ==
             "excessive_line_length",
         "long line denied");

  // Alternating spaces and newlines pass every structural check; the
  // denylist must still finish on an in-limit snippet of that shape.
  std::string padded = "let x = 1;\nconsole.log(x)";
  while (padded.size() < 100000) padded += " \n";
  v.validate_code(padded, Language::javascript, none);
  const std::string late_import = padded + "\n \n  \t\nimport os from 'os'";
  expect(security_category([&] { v.validate_code(late_import, Language::typescript, none); }) ==
             "module_import",
         "static import after whitespace padding denied");
  std::string nul = std::string("print(1)") + '\0';
  expect(security_category([&] { v.validate_code(nul, Language::python, none); }) == "null_byte",
         "NUL denied");
}

void test_security_args_env_input() {
  SecurityValidator v;
  v.validate_args({"--verbose", "data.txt", "42"});
  expect(security_category([&] { v.validate_args({"a && rm -rf /"}); }) == "shell_injection", "&&");
  expect(security_category([&] { v.validate_args({"$(id)"}); }) == "shell_injection", "$()");
  expect(security_category([&] { v.validate_args({"--exec"}); }) == "shell_injection", "--exec");
  expect(security_category([&] { v.validate_args({"x | sh"}); }) == "shell_injection", "pipe");
  expect(security_category([&] { v.validate_args(std::vector<std::string>(21, "a")); }) ==
             "argument_limits",
         "too many args");
  expect(security_category([&] { v.validate_args({std::string(1001, 'a')}); }) == "argument_limits",
         "arg too long");

  v.validate_env({{"GREETING", "hello"}, {"MODE", "fast"}});
  expect(security_category([&] { v.validate_env({{"PATH", "/tmp"}}); }) == "sensitive_environment",
         "PATH denied");
  expect(security_category([&] { v.validate_env({{"LD_PRELOAD", "x.so"}}); }) ==
             "sensitive_environment",
         "LD_ denied");
  expect(security_category([&] { v.validate_env({{"GITHUB_TOKEN", "x"}}); }) == "secret_environment",
         "token denied");
  expect(security_category([&] { v.validate_env({{"AWS_SECRET_ACCESS_KEY", "x"}}); }) ==
             "secret_environment",
         "aws secret denied");
  expect(security_category([&] { v.validate_env({{"1BAD", "x"}}); }) == "invalid_environment_name",
         "invalid name");

  v.validate_input("line one\nline two\n");
  expect(security_category([&] { v.validate_input(std::string(1000, 'z')); }) ==
             "excessive_repetition",
         "repetitive input denied");
}

// ============================================================================
// Phase 4: Resource limiter
// ============================================================================

void test_limiter_resolve() {
  ResourceLimiter limiter;
  ExecutionLimits defaults;
  LimitsPatch p;
  p.timeout_ms = 9000;
  p.max_memory_mb = 64;
  auto out = limiter.resolve(defaults, p);
  expect(out.timeout_ms == 5000, "request cannot raise timeout above default");
  expect(out.max_memory_mb == 64, "request can lower memory");
  expect(out.max_output_size == defaults.max_output_size, "absent field keeps default");

  p = LimitsPatch{};
  p.allow_network = true;
  expect(!limiter.resolve(defaults, p).allow_network, "capability not granted by default");
  defaults.allow_network = true;
  expect(limiter.resolve(defaults, p).allow_network, "capability granted when default allows");
  p.allow_network = false;
  expect(!limiter.resolve(defaults, p).allow_network, "request can drop a capability");

  p = LimitsPatch{};
  p.timeout_ms = 0;
  expect(engine_error_code([&] { limiter.resolve(defaults, p); }) == ErrorCode::invalid_limits,
         "zero timeout rejected");
  p.timeout_ms = std::nullopt;
  p.max_output_size = -1;
  expect(engine_error_code([&] { limiter.resolve(defaults, p); }) == ErrorCode::invalid_limits,
         "negative output size rejected");
}

void test_limiter_validate_defaults() {
  ResourceLimiter limiter;
  ExecutionLimits current;
  LimitsPatch p;
  p.timeout_ms = 8000;
  p.allow_env = true;
  auto out = limiter.validate_defaults(current, p);
  expect(out.timeout_ms == 8000, "default raised within ceiling");
  expect(out.allow_env, "default capability set");

  p = LimitsPatch{};
  p.timeout_ms = 20000;
  expect(engine_error_code([&] { limiter.validate_defaults(current, p); }) ==
             ErrorCode::invalid_limits,
         "above ceiling rejected");
  p.timeout_ms = std::nullopt;
  p.max_memory_mb = 0;
  expect(engine_error_code([&] { limiter.validate_defaults(current, p); }) ==
             ErrorCode::invalid_limits,
         "zero memory rejected");
}

void test_limiter_watchdog() {
  StubState state;
  StubAdapter adapter(Language::javascript, state);
  ResourceLimiter limiter;
  auto artifact = CompiledArtifact::seal("", adapter.compile("SLEEP", {}), "identity");
  RunContext ctx;
  ctx.limits.timeout_ms = 100;
  const auto t0 = std::chrono::steady_clock::now();
  auto run = limiter.run(adapter, *artifact, ctx);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0)
                      .count();
  expect(run.timeout_hit, "deadline reported");
  expect(run.exit_code == kExitTimeout, "timeout exit code");
  expect(run.error_code == ErrorCode::timeout, "timeout error code");
  expect(run.error && contains(*run.error, "100ms"), "message names the limit");
  expect(ms < 100 + 1500, "watchdog fired close to the limit: " + std::to_string(ms) + "ms");
}

void test_limiter_bounds_and_failures() {
  StubState state;
  StubAdapter adapter(Language::javascript, state);
  ResourceLimiter limiter;
  RunContext ctx;

  auto oom = CompiledArtifact::seal("", adapter.compile("OOM", {}), "identity");
  auto r = limiter.run(adapter, *oom, ctx);
  expect(r.memory_limit_hit && r.exit_code == kExitMemoryLimit, "memory bound");
  expect(r.error && contains(*r.error, "256MB"), "memory message");

  auto flood = CompiledArtifact::seal("", adapter.compile("FLOOD", {}), "identity");
  r = limiter.run(adapter, *flood, ctx);
  expect(r.output_limit_hit && r.exit_code == kExitOutputLimit, "output bound");

  auto fail = CompiledArtifact::seal("", adapter.compile("EXIT3", {}), "identity");
  r = limiter.run(adapter, *fail, ctx);
  expect(r.exit_code == 3 && !r.timeout_hit, "program exit code kept");
  expect(r.error_code == ErrorCode::runtime_error, "runtime error");
  expect(r.error == std::optional<std::string>("boom"), "stderr becomes the error");

  RunOutcome silent;
  silent.exit_code = 2;
  expect(describe_failure(silent) == "Process exited with code 2", "fallback failure text");
}

// ============================================================================
// Phase 5: Compilation cache
// ============================================================================

CompiledArtifactData artifact_data(const std::string& payload) {
  CompiledArtifactData d;
  d.language = Language::cpp;
  d.entry_name = "main";
  d.payload = payload;
  return d;
}

void test_cache_key_sensitivity() {
  CompilerFlags flags;
  const auto base = CompilationCache::make_key(Language::cpp, "g++@13.2.0:/usr/bin/g++", flags, "int main(){}");
  expect(base.size() == 64, "key is a hex digest");
  expect(base == CompilationCache::make_key(Language::cpp, "g++@13.2.0:/usr/bin/g++", flags, "int main(){}"),
         "key deterministic");
  expect(base != CompilationCache::make_key(Language::cpp, "g++@14.1.0:/usr/bin/g++", flags, "int main(){}"),
         "toolchain version in key");
  expect(base != CompilationCache::make_key(Language::c, "g++@13.2.0:/usr/bin/g++", flags, "int main(){}"),
         "language in key");
  expect(base != CompilationCache::make_key(Language::cpp, "g++@13.2.0:/usr/bin/g++", flags, "int main(){ }"),
         "source in key");
  CompilerFlags debug = flags;
  debug.debug = true;
  expect(base != CompilationCache::make_key(Language::cpp, "g++@13.2.0:/usr/bin/g++", debug, "int main(){}"),
         "flags in key");
  CompilerFlags explicit_default = flags;
  explicit_default.standard = "c++17";
  expect(base == CompilationCache::make_key(Language::cpp, "g++@13.2.0:/usr/bin/g++", explicit_default, "int main(){}"),
         "explicit default standard shares the key");
}

void test_cache_hit_and_miss() {
  CompilationCache cache(CompilationCache::Options{});
  int produced = 0;
  auto producer = [&] {
    ++produced;
    return artifact_data("ELF-binary-bytes");
  };
  bool hit = true;
  auto a = cache.get_or_compile("k1", producer, &hit);
  expect(!hit && produced == 1, "first call compiles");
  auto b = cache.get_or_compile("k1", producer, &hit);
  expect(hit && produced == 1, "second call hits");
  expect(a == b, "same shared artifact");
  expect(b->payload() == "ELF-binary-bytes", "payload intact");
  auto s = cache.stats();
  expect(s.hits == 1 && s.misses == 1 && s.entries == 1, "stats");
}

void test_cache_lru_entries() {
  CompilationCache::Options o;
  o.max_entries = 2;
  CompilationCache cache(o);
  cache.insert("a", artifact_data("A"));
  cache.insert("b", artifact_data("B"));
  expect(cache.lookup("a") != nullptr, "a present");
  cache.insert("c", artifact_data("C"));
  expect(cache.lookup("b") == nullptr, "least recently used evicted");
  expect(cache.lookup("a") != nullptr, "recently used kept");
  expect(cache.lookup("c") != nullptr, "newest kept");
  expect(cache.stats().evictions == 1, "one eviction");
}

void test_cache_byte_budget() {
  CompilationCache::Options o;
  o.max_bytes = 10;
  o.compression = "identity";
  CompilationCache cache(o);
  cache.insert("a", artifact_data("12345678"));
  cache.insert("b", artifact_data("abcdefgh"));
  expect(cache.lookup("a") == nullptr, "byte budget evicts oldest");
  expect(cache.stats().bytes == 8, "bytes accounted");
  auto big = cache.insert("big", artifact_data(std::string(20, 'q') + "r"));
  expect(big && big->payload().size() == 21, "oversized artifact still returned");
  expect(cache.lookup("big") == nullptr, "oversized artifact not retained");
  expect(cache.lookup("b") != nullptr, "existing entry survives oversized insert");
}

void test_cache_single_flight() {
  CompilationCache cache(CompilationCache::Options{});
  std::atomic<int> produced{0};
  std::vector<ArtifactPtr> got(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      got[i] = cache.get_or_compile("shared", [&] {
        ++produced;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return artifact_data("built-once");
      });
    });
  }
  for (auto& t : threads) t.join();
  expect(produced == 1, "exactly one producer ran");
  for (const auto& a : got) expect(a == got[0], "every caller shares the artifact");
  auto s = cache.stats();
  expect(s.misses == 1 && s.hits == 7, "one miss, the rest hits");
}

void test_cache_failure_not_cached() {
  CompilationCache cache(CompilationCache::Options{});
  bool threw = false;
  try {
    cache.get_or_compile("k", []() -> CompiledArtifactData {
      throw CompileError("cpp compilation failed", "error: expected ';'", 1);
    });
  } catch (const CompileError& e) {
    threw = true;
    expect(e.diagnostics() == "error: expected ';'", "diagnostics propagate");
  }
  expect(threw, "compile error propagates");
  auto s = cache.stats();
  expect(s.entries == 0 && s.compile_failures == 1, "failure not cached");

  int produced = 0;
  cache.get_or_compile("k", [&] {
    ++produced;
    return artifact_data("fixed");
  });
  expect(produced == 1, "next request compiles again");
}

void test_cache_integrity() {
  auto artifact = CompiledArtifact::seal("key", artifact_data(std::string(4096, 'x')), "zstd");
#if defined(WARDEN_WITH_ZSTD)
  expect(artifact->encoding == "zstd", "compressible payload stored compressed");
  expect(artifact->blob.size() < 4096, "compressed blob smaller");
#else
  expect(artifact->encoding == "identity", "identity without zstd");
#endif
  expect(artifact->payload() == std::string(4096, 'x'), "payload decodes");
  expect(artifact->verify(), "fresh artifact verifies");

  CompiledArtifact tampered = *artifact;
  tampered.blob[0] = static_cast<char>(tampered.blob[0] ^ 0x01);
  expect(!tampered.verify(), "tamper detected");
  ErrorCode code = engine_error_code([&] { tampered.payload(); });
  expect(code == ErrorCode::cache_integrity_failed, "payload fails closed");
}

// ============================================================================
// Phase 6: Instance backend
// ============================================================================

InstanceSpec shell(const std::string& script) {
  InstanceSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", script};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.timeout_ms = 10000;
  spec.memory_mode = MemoryCeilingMode::none;
  return spec;
}

void test_cancellation_token() {
  CancellationToken token;
  expect(!token.cancelled(), "fresh token");
  expect(!token.wait_for(std::chrono::milliseconds(10)), "wait times out");
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token.cancel();
  });
  expect(token.wait_for(std::chrono::seconds(5)), "wait wakes on cancel");
  t.join();
  expect(token.cancelled(), "stays cancelled");
}

void test_sandbox_exit_and_streams() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  auto r = backend.launch(shell("echo hello; echo err 1>&2; exit 3"), cancel);
  expect(r.error_message.empty(), "launched: " + r.error_message);
  expect(r.stdout_text == "hello\n", "stdout captured");
  expect(r.stderr_text == "err\n", "stderr captured");
  expect(r.exit_code == 3, "exit code");
  expect(r.termination == TerminationReason::none, "no bound tripped");
  expect(r.sandboxed, "sandboxed");
}

void test_sandbox_stdin_and_env() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  ScratchDir dir(g_scratch_root);
  auto spec = shell("read line; echo \"got:$line:$GREETING:[$WARDEN_TEST_MARKER]\"");
  spec.stdin_path = dir.write_file("stdin", "payload\n");
  spec.env["GREETING"] = "hi";
  ::setenv("WARDEN_TEST_MARKER", "leak", 1);
  auto r = backend.launch(spec, cancel);
  ::unsetenv("WARDEN_TEST_MARKER");
  expect(r.stdout_text == "got:payload:hi:[]\n", "stdin fed and env not inherited: " + r.stdout_text);
}

void test_sandbox_deadline() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  auto spec = shell("while :; do :; done");
  spec.timeout_ms = 300;
  auto r = backend.launch(spec, cancel);
  expect(r.termination == TerminationReason::deadline ||
             r.termination == TerminationReason::cpu_limit,
         "busy loop stopped by deadline");
  expect(r.duration_ms < 300 + 1500, "stopped close to the deadline: " + std::to_string(r.duration_ms) + "ms");
}

void test_sandbox_cancel() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.cancel();
  });
  auto r = backend.launch(shell("while :; do :; done"), cancel);
  t.join();
  expect(r.termination == TerminationReason::cancelled, "cancel observed");
  expect(r.exit_code != 0, "killed");
}

void test_sandbox_output_limit() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  auto spec = shell("while :; do echo aaaaaaaaaa; done");
  spec.max_output_bytes = 1000;
  auto r = backend.launch(spec, cancel);
  expect(r.termination == TerminationReason::output_limit, "flood stopped");
  expect(r.stdout_text.size() + r.stderr_text.size() <= 1000, "kept output within ceiling");
}

void test_sandbox_file_writes_blocked() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  ScratchDir dir(g_scratch_root);
  auto spec = shell("echo data > out.txt");
  spec.cwd = dir.path();
  auto r = backend.launch(spec, cancel);
  expect(r.exit_code != 0, "write past RLIMIT_FSIZE fails");
  auto written = dir.read_file("out.txt");
  expect(!written || written->empty(), "nothing written");

  spec.allow_file_writes = true;
  r = backend.launch(spec, cancel);
  expect(r.exit_code == 0, "write allowed when granted");
  expect(dir.read_file("out.txt") == std::optional<std::string>("data\n"), "file written");
}

void test_sandbox_exec_failure() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  InstanceSpec spec;
  spec.command = "/nonexistent/warden-binary";
  auto r = backend.launch(spec, cancel);
  expect(contains(r.error_message, "spawn_failed"), "exec failure reported: " + r.error_message);
}

void test_scratch_dir_lifecycle() {
  std::string path;
  {
    ScratchDir dir(g_scratch_root);
    path = dir.path();
    dir.write_file("a.txt", "abc");
    expect(dir.read_file("a.txt") == std::optional<std::string>("abc"), "round trip");
    expect(!dir.read_file("missing").has_value(), "missing file");
    expect(fs::exists(path), "dir exists while alive");
  }
  expect(!fs::exists(path), "dir removed on destruction");
  expect(resolve_executable("sh").has_value(), "sh on PATH");
  expect(!resolve_executable("warden-no-such-tool").has_value(), "unknown tool");
}

// ============================================================================
// Phase 7: Adapters
// ============================================================================

void test_prepare_source() {
  const std::string bare = "int main() { std::cout << 1; }";
  const std::string cpp = prepare_source(Language::cpp, bare);
  expect(contains(cpp, "#include <iostream>"), "iostream added");
  expect(contains(cpp, "#line 1 \"main.cpp\""), "line numbers preserved");
  const std::string own = "#include <vector>\nint main() {}";
  expect(prepare_source(Language::cpp, own) == own, "own includes left alone");
  expect(contains(prepare_source(Language::c, "int main(void) { return 0; }"), "#include <stdio.h>"),
         "stdio added");
  const std::string rs = prepare_source(Language::rust, "#![allow(dead_code)]\nfn main() {}");
  expect(rs.rfind("#![allow(dead_code)]", 0) == 0, "inner attribute stays first");
  expect(contains(rs, "use std::io::{Read as _, Write as _};"), "io traits in scope");
  expect(prepare_source(Language::python, "print(1)") == "print(1)", "scripts untouched");
}

void test_compiler_args() {
  CompilerFlags f;
  f.optimization = OptimizationLevel::O3;
  f.warnings = WarningLevel::pedantic;
  f.debug = true;
  auto cpp = compiler_args(Language::cpp, f, "main.cpp", "main");
  expect(has_arg(cpp, "-std=c++17"), "default standard");
  expect(has_arg(cpp, "-O3"), "optimization");
  expect(has_arg(cpp, "-Werror") && has_arg(cpp, "-Wpedantic") && has_arg(cpp, "-Wall"),
         "pedantic warnings");
  expect(has_arg(cpp, "-g") && has_arg(cpp, "-DDEBUG"), "debug");
  expect(!has_arg(cpp, "-lm"), "libm only for C");

  CompilerFlags c;
  c.standard = "c99";
  auto cargs = compiler_args(Language::c, c, "main.c", "main");
  expect(has_arg(cargs, "-std=c99") && has_arg(cargs, "-lm"), "C args");
  expect(!has_arg(cargs, "-Wall"), "minimal warnings");

  CompilerFlags r;
  r.optimization = OptimizationLevel::Oz;
  auto rs = compiler_args(Language::rust, r, "main.rs", "main");
  expect(has_arg(rs, "opt-level=z") && has_arg(rs, "2021"), "rust opt level and edition");

  CompilerFlags t;
  t.warnings = WarningLevel::pedantic;
  auto ts = compiler_args(Language::typescript, t, "main.ts", "out/main.js");
  expect(has_arg(ts, "--strict") && has_arg(ts, "commonjs") && ts.back() == "main.ts", "tsc args");
  auto out_dir = std::find(ts.begin(), ts.end(), "--outDir");
  expect(out_dir != ts.end() && std::next(out_dir) != ts.end() && *std::next(out_dir) == "out",
         "outDir follows the output name");
  auto build = compiler_args(Language::typescript, t, "main.ts", "build/main.js");
  expect(std::find(build.begin(), build.end(), "build") != build.end(), "custom outDir");
}

void test_interpreter_profiles() {
  ExecutionLimits limits;
  limits.max_memory_mb = 128;
  auto node = node_profile("node");
  auto nargs = interpreter_args(node, limits);
  expect(has_arg(nargs, "--max-old-space-size=128"), "heap ceiling passed to V8");
  expect(node.memory_mode == MemoryCeilingMode::runtime_managed, "V8 manages its heap");
  expect(node.entry_name == "main.js", "node entry");

  auto py = python_profile("python3");
  auto pargs = interpreter_args(py, limits);
  expect(has_arg(pargs, "-I") && has_arg(pargs, "-u"), "isolated unbuffered python");
  expect(py.memory_mode == MemoryCeilingMode::address_space, "python under RLIMIT_AS");
  expect(std::find(py.oom_markers.begin(), py.oom_markers.end(), "MemoryError") != py.oom_markers.end(),
         "MemoryError marker");
}

void test_toolchain_backend() {
  auto instances = std::make_shared<PosixInstanceBackend>(SandboxConfig{});
  ToolchainCompilerBackend sh("/bin/sh", {"-c", "echo shc 1.2.3"}, instances, g_scratch_root);
  auto probe = sh.probe();
  expect(probe.available, "probe ran: " + probe.detail);
  expect(probe.path == "/bin/sh", "resolved path");
  expect(probe.version == "shc 1.2.3", "version line");

  CompileJob job;
  job.language = Language::c;
  job.source_name = "main.c";
  job.source = "int main(void) { return 0; }\n";
  job.output_name = "main";
  job.argv = {"-c", "cat main.c > main"};
  auto out = sh.compile(job);
  expect(out.ok, "build succeeded: " + out.diagnostics);
  expect(out.binary == job.source, "output file collected");

  job.argv = {"-c", "echo 'main.c:1: error: bad' 1>&2; exit 4"};
  out = sh.compile(job);
  expect(!out.ok && out.exit_code == 4, "build failure reported");
  expect(contains(out.diagnostics, "error: bad"), "diagnostics captured");

  job.argv = {"-c", "echo \"$(pwd)/main.c:2: error: worse\" 1>&2; exit 1"};
  out = sh.compile(job);
  expect(out.diagnostics == "main.c:2: error: worse\n", "diagnostics relative: " + out.diagnostics);

  ToolchainCompilerBackend missing("warden-no-such-compiler", {"--version"}, instances,
                                   g_scratch_root);
  expect(!missing.probe().available, "missing toolchain unavailable");
  expect(engine_error_code([&] { missing.compile(job); }) == ErrorCode::toolchain_unavailable,
         "compile with missing toolchain raises");
}

void test_launch_hides_scratch_path() {
  PosixInstanceBackend backend(SandboxConfig{});
  CancellationToken cancel;
  ProgramLaunch launch;
  launch.command = "/bin/sh";
  launch.entry_name = "main.sh";
  launch.entry_payload = "echo \"$(pwd)/main.sh:1: boom\" >&2\nexit 1\n";
  launch.memory_mode = MemoryCeilingMode::none;
  RunContext ctx;
  ctx.limits.timeout_ms = 5000;
  auto out = launch_program(backend, g_scratch_root, launch, ctx, cancel);
  expect(out.exit_code == 1, "script failed");
  expect(out.stderr_text == "main.sh:1: boom\n", "scratch path stripped: " + out.stderr_text);
}

void test_native_adapter_through_engine() {
  auto compiler = std::make_shared<ScriptCompilerBackend>();
  StubState state;
  AdapterSet adapters;
  adapters[index_of(Language::javascript)] =
      std::make_unique<StubAdapter>(Language::javascript, state);
  adapters[index_of(Language::c)] = std::make_unique<NativeAdapter>(
      Language::c, compiler, std::make_shared<PosixInstanceBackend>(SandboxConfig{}),
      g_scratch_root, 30000, 1024 * 1024);
  Engine engine(stub_config(), std::move(adapters));
  engine.initialize();

  auto info = engine.environment_info("c");
  expect(info && info->available, "native toolchain available");
  expect(info->runtime == "fakecc" && info->version == "9.1.0", "runtime and version token");

  ExecutionRequest req;
  req.language = "c";
  req.code = "int main(void) { puts(\"hi\"); return 0; }";
  req.args = {"abc"};
  auto r = engine.execute(req);
  expect(r.success, "native program ran: " + r.stderr_text);
  expect(r.stdout_text == "native:abc\n", "binary exec'd with args: " + r.stdout_text);
  expect(r.metadata.was_sandboxed, "sandboxed");
  expect(!r.metadata.cache_hit, "first build misses");
  expect(has_arg(compiler->last_job.argv, "-std=c11"), "default C standard");
  expect(compiler->last_job.source.rfind("#include <stdio.h>", 0) == 0, "preamble applied");

  r = engine.execute(req);
  expect(r.metadata.cache_hit && compiler->compiles == 1, "second run served from cache");

  req.code = "int main(void) { syntax error }";
  r = engine.execute(req);
  expect(!r.success && r.error_code == ErrorCode::compile_error, "compile failure is a result");
  expect(contains(r.stderr_text, "expected ';'"), "diagnostics in stderr");
  expect(r.exit_code == 1, "compiler exit code");
}

// ============================================================================
// Phase 8: Engine facade
// ============================================================================

void test_engine_lifecycle() {
  StubState state;
  auto engine = make_stub_engine(state);
  expect(!engine->is_ready(), "not ready before initialize");
  expect(engine_error_code([&] { engine->execute(js_request("console.log(1)")); }) ==
             ErrorCode::not_initialized,
         "execute before initialize");
  engine->initialize();
  engine->initialize();
  expect(engine->is_ready(), "ready");
  expect(engine->execute(js_request("console.log(1)")).success, "executes");

  engine->dispose();
  expect(!engine->is_ready(), "disposed");
  expect(engine_error_code([&] { engine->execute(js_request("console.log(1)")); }) ==
             ErrorCode::not_initialized,
         "execute after dispose");
  expect(engine->cache_stats().entries == 0, "cache dropped");
  expect(engine->supported_languages().size() == 2, "introspection works while disposed");

  engine->initialize();
  expect(engine->execute(js_request("console.log(1)")).success, "re-initialized");
}

void test_engine_required_language() {
  StubState state;
  auto config = stub_config();
  config.required_languages = {Language::javascript, Language::python};
  auto engine = make_stub_engine(state, config);
  expect(engine_error_code([&] { engine->initialize(); }) == ErrorCode::toolchain_unavailable,
         "missing required runtime fails initialize");
  expect(!engine->is_ready(), "stays uninitialized");

  config.required_languages = {Language::cpp};
  auto engine2 = make_stub_engine(state, config);
  expect(engine_error_code([&] { engine2->initialize(); }) == ErrorCode::initialization_failed,
         "unregistered required language fails initialize");

  config = stub_config();
  config.max_concurrent_instances = 0;
  auto engine3 = make_stub_engine(state, config);
  expect(engine_error_code([&] { engine3->initialize(); }) == ErrorCode::initialization_failed,
         "invalid config fails initialize");
}

void test_engine_introspection() {
  StubState state;
  auto engine = make_stub_engine(state);
  auto langs = engine->supported_languages();
  expect(langs.size() == 2 && langs[0] == Language::javascript && langs[1] == Language::rust,
         "available languages in enum order");
  expect(engine->is_language_supported("JS"), "alias supported");
  expect(!engine->is_language_supported("python"), "unavailable runtime not supported");
  expect(!engine->is_language_supported("ruby"), "unknown language");
  auto py = engine->environment_info("python");
  expect(py && !py->available, "registered but unavailable runtime reported");
  expect(!engine->environment_info("cpp"), "unregistered language has no info");
  auto js = engine->environment_info("javascript");
  expect(js && js->runtime == "stub" && js->version == "1.0.0", "probe cached");
}

void test_engine_request_errors() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  auto req = js_request("console.log(1)");
  req.language = "ruby";
  expect(engine_error_code([&] { engine->execute(req); }) == ErrorCode::unsupported_language,
         "unknown language");
  req.language = "python";
  try {
    engine->execute(req);
    expect(false, "unavailable runtime should throw");
  } catch (const UnsupportedLanguageError& e) {
    expect(contains(e.what(), "not available"), "message says runtime missing");
  }

  expect(engine_error_code([&] { engine->execute(js_request("")); }) == ErrorCode::invalid_request,
         "empty code");
  expect(engine_error_code([&] { engine->execute(js_request(" \n\t ")); }) == ErrorCode::invalid_request,
         "blank code");

  req = js_request("console.log(1)");
  req.limits.timeout_ms = 0;
  expect(engine_error_code([&] { engine->execute(req); }) == ErrorCode::invalid_limits,
         "invalid limits");

  ExecutionRequest rs;
  rs.language = "rust";
  rs.code = "fn main() {}";
  rs.compiler_flags = CompilerFlags{};
  rs.compiler_flags->standard = "c++17";
  expect(engine_error_code([&] { engine->execute(rs); }) == ErrorCode::invalid_compiler_flags,
         "invalid standard");

  expect(engine_error_code([&] { engine->execute(js_request("eval('1')")); }) ==
             ErrorCode::security_violation,
         "security violation");

  auto stats = engine->statistics();
  expect(stats.total_executions == 0, "rejections never touch statistics");
  expect(state.runs == 0, "no instance created");
}

void test_engine_size_boundaries() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  std::string code = "console.log(1);//";
  const std::string letters = "abcdefghijklmnopqrstuvwxyz";
  while (code.size() < 64) code += letters[code.size() % letters.size()];
  auto req = js_request(code);
  req.limits.max_input_size = 64;
  expect(engine->execute(req).success, "code of exactly maxInputSize accepted");

  req.code += "x";
  expect(engine_error_code([&] { engine->execute(req); }) == ErrorCode::code_too_large,
         "one byte over rejected");

  req = js_request("console.log(1)", std::string(65, '\n').replace(0, 3, "abc"));
  req.limits.max_input_size = 64;
  expect(engine_error_code([&] { engine->execute(req); }) == ErrorCode::input_too_large,
         "oversized input rejected");
}

void test_engine_success_result() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();
  auto req = js_request("console.log('hi')", "in");
  req.args = {"--verbose"};
  auto r = engine->execute(req);
  expect(r.success, "success");
  expect(r.stdout_text == "ran:in --verbose", "stdin and args reach the program");
  expect(r.exit_code == 0 && !r.error, "clean exit");
  expect(r.language == "javascript", "canonical language id");
  expect(r.metadata.was_sandboxed, "sandboxed");
  expect(r.metadata.runtime == "stub" && r.metadata.version == "1.0.0", "runtime metadata");
  expect(r.metadata.output_size == r.stdout_text.size(), "output size");
  expect(r.metadata.memory_used_bytes == 4 * 1024 * 1024, "peak memory");
  expect(r.metadata.end_unix_ms >= r.metadata.start_unix_ms, "timestamps ordered");
  expect(!r.metadata.cache_hit, "interpreted languages never hit");
}

void test_engine_failures_are_results() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  auto r = engine->execute(js_request("console.log('EXIT3')"));
  expect(!r.success && r.exit_code == 3, "non-zero exit");
  expect(r.error == std::optional<std::string>("boom"), "error from stderr");
  expect(r.error_code == ErrorCode::runtime_error, "runtime_error");

  auto req = js_request("console.log('SLEEP')");
  req.limits.timeout_ms = 100;
  r = engine->execute(req);
  expect(!r.success && r.metadata.timeout_hit && r.exit_code == kExitTimeout, "timeout");

  r = engine->execute(js_request("console.log('OOM')"));
  expect(r.metadata.memory_limit_hit && r.exit_code == kExitMemoryLimit, "memory");

  r = engine->execute(js_request("console.log('FLOOD')"));
  expect(r.metadata.output_limit_hit && r.exit_code == kExitOutputLimit, "output");

  auto stats = engine->statistics();
  expect(stats.total_executions == 4 && stats.failed_executions == 4, "all counted as failures");
  expect(stats.timeouts == 1 && stats.memory_limit_hits == 1 && stats.output_limit_hits == 1,
         "bound counters");
}

void test_engine_compile_cache() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  ExecutionRequest req;
  req.language = "rust";
  req.code = "fn main() { println!(\"hi\"); }";
  auto first = engine->execute(req);
  expect(first.success && !first.metadata.cache_hit, "first compile misses");
  expect(first.metadata.compile_time_ms == 3, "compile time reported");
  auto second = engine->execute(req);
  expect(second.success && second.metadata.cache_hit, "second compile hits");
  expect(second.metadata.compile_time_ms == 0, "no compile time on a hit");
  expect(state.compiles == 1, "compiled once");

  req.compiler_flags = CompilerFlags{};
  req.compiler_flags->optimization = OptimizationLevel::O0;
  engine->execute(req);
  expect(state.compiles == 2, "different flags compile again");

  auto cs = engine->cache_stats();
  expect(cs.entries == 2 && cs.hits == 1 && cs.misses == 2, "cache stats");
  auto stats = engine->statistics();
  expect(stats.cache_hits == 1 && stats.cache_misses == 2, "statistics mirror the cache");
}

void test_engine_compile_error() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  ExecutionRequest req;
  req.language = "rust";
  req.code = "fn main() { COMPILE_FAIL }";
  auto r = engine->execute(req);
  expect(!r.success, "compile failure is a failed result");
  expect(r.error_code == ErrorCode::compile_error, "compile_error code");
  expect(r.exit_code == 1, "compiler exit code");
  expect(contains(r.stderr_text, "expected item"), "diagnostics in stderr");
  expect(r.error && contains(*r.error, "compilation failed"), "error message");
  expect(state.runs == 0, "nothing ran");

  engine->execute(req);
  expect(state.compiles == 2, "failed compile never cached");
  auto stats = engine->statistics();
  expect(stats.compile_errors == 2 && stats.failed_executions == 2, "compile errors counted");
}

void test_engine_infrastructure_error() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();
  expect(engine_error_code([&] { engine->execute(js_request("console.log('INFRA')")); }) ==
             ErrorCode::spawn_failed,
         "infrastructure fault escapes");
  auto stats = engine->statistics();
  expect(stats.total_executions == 1 && stats.infrastructure_errors == 1,
         "infrastructure fault counted");
}

void test_engine_env_filtering() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  auto req = js_request("console.log(1)");
  req.env = {{"GREETING", "hi"}};
  req.limits.allow_env = true;
  engine->execute(req);
  expect(state.last_env_size == 0, "env dropped when the default denies it");

  LimitsPatch p;
  p.allow_env = true;
  engine->set_default_limits(p);
  engine->execute(req);
  expect(state.last_env_size == 1, "env passed when granted");

  req.limits.allow_env = false;
  engine->execute(req);
  expect(state.last_env_size == 0, "request can decline env");
}

void test_engine_default_limits() {
  StubState state;
  auto engine = make_stub_engine(state);
  LimitsPatch p;
  p.timeout_ms = 2000;
  engine->set_default_limits(p);
  expect(engine->default_limits().timeout_ms == 2000, "default lowered");
  p.timeout_ms = 999999;
  expect(engine_error_code([&] { engine->set_default_limits(p); }) == ErrorCode::invalid_limits,
         "ceiling enforced");
  expect(engine->default_limits().timeout_ms == 2000, "failed update leaves defaults");
}

void test_engine_statistics() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();
  engine->execute(js_request("console.log(1)"));
  engine->execute(js_request("console.log(2)"));
  ExecutionRequest rs;
  rs.language = "rust";
  rs.code = "fn main() {}";
  engine->execute(rs);

  auto s = engine->statistics();
  expect(s.total_executions == 3 && s.successful_executions == 3, "totals");
  expect(s.per_language[index_of(Language::javascript)] == 2, "per language");
  expect(s.most_used_language == Language::javascript, "most used");
  expect(s.average_memory_usage_mb > 3.9 && s.average_memory_usage_mb < 4.1, "average memory");
  expect(s.last_execution_unix_ms > 0, "last execution time");

  std::optional<jsonlite::JsonError> jerr;
  auto o = jsonlite::parse(statistics_to_json(s), &jerr);
  expect(!jerr, "statistics JSON parses");
  expect(jsonlite::get_string(o, "mostUsedLanguage") == "javascript", "mostUsedLanguage");

  engine->reset_statistics();
  s = engine->statistics();
  expect(s.total_executions == 0 && !s.most_used_language, "reset");
  o = jsonlite::parse(statistics_to_json(s), &jerr);
  expect(jsonlite::has(o, "mostUsedLanguage") && jsonlite::get_string(o, "mostUsedLanguage").empty(),
         "mostUsedLanguage null when empty");
}

void test_engine_events() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  set_execution_event_hook(capture_event);
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();
  auto req = js_request("console.log('EXIT3')");
  engine->execute(req);
  set_execution_event_hook(nullptr);

  std::lock_guard<std::mutex> lk(g_events_mu);
  expect(g_events.size() == 1, "one event per execution");
  const auto& ev = g_events[0];
  expect(ev.execution_id == request_digest(req), "event keyed by request digest");
  expect(!ev.ok && ev.failure_kind == FailureKind::user, "user failure");
  expect(ev.error_code == ErrorCode::runtime_error, "error code");
  expect(ev.bytes_stderr == 5, "stderr bytes");
  const std::string json = event_to_json(ev);
  expect(contains(json, "\"failure_kind\":\"user\"") || contains(json, "\"failureKind\":\"user\""),
         "event JSON names the failure kind");
}

void test_engine_execute_multiple() {
  StubState state;
  auto engine = make_stub_engine(state);
  engine->initialize();

  std::vector<ExecutionRequest> reqs;
  for (int i = 0; i < 6; ++i) reqs.push_back(js_request("console.log(1)", std::to_string(i)));
  auto unknown = js_request("puts 1");
  unknown.language = "ruby";
  reqs.push_back(unknown);
  reqs.push_back(js_request("eval('1')"));
  reqs.push_back(js_request(""));

  auto results = engine->execute_multiple(reqs);
  expect(results.size() == reqs.size(), "one result per request");
  for (int i = 0; i < 6; ++i) {
    expect(results[i].success && results[i].stdout_text == "ran:" + std::to_string(i),
           "result " + std::to_string(i) + " in input order");
  }
  expect(!results[6].success && results[6].exit_code == kExitUnsupported &&
             results[6].error_code == ErrorCode::unsupported_language,
         "unsupported language becomes 127");
  expect(results[7].exit_code == kExitSecurity &&
             results[7].error_code == ErrorCode::security_violation,
         "security violation becomes 126");
  expect(results[8].exit_code == 1 && results[8].error_code == ErrorCode::invalid_request,
         "invalid request becomes 1");
  expect(results[6].language == "ruby", "original language id kept");
  expect(engine->execute_multiple({}).empty(), "empty batch");
}

void test_engine_concurrency_bound() {
  StubState state;
  auto config = stub_config();
  config.max_concurrent_instances = 2;
  auto engine = make_stub_engine(state, config);
  engine->initialize();
  std::vector<ExecutionRequest> reqs(6, js_request("console.log('HOLD')"));

  std::vector<ExecutionResult> extra;
  std::thread other([&] { extra = engine->execute_multiple(reqs); });
  auto results = engine->execute_multiple(reqs);
  other.join();
  for (const auto& r : results) expect(r.success, "held run succeeded");
  for (const auto& r : extra) expect(r.success, "concurrent batch succeeded");
  expect(state.max_running >= 1 && state.max_running <= 2, "at most two instances at once");
}

// ============================================================================
// Phase 9: Real toolchains (skipped when the runtime is not installed)
// ============================================================================

EngineConfig real_engine_config() {
  EngineConfig config;
  config.required_languages = {};
  config.scratch_root = g_scratch_root;
  return config;
}

Engine& real_engine() {
  static Engine engine(real_engine_config());
  engine.initialize();
  return engine;
}

void test_real_javascript() {
  Engine& engine = real_engine();
  if (!engine.is_language_supported("javascript")) return skip("node not installed");
  auto r = engine.execute(js_request("console.log(\"Hello, World!\");"));
  expect(r.success, "node ran: " + r.stderr_text);
  expect(r.stdout_text == "Hello, World!\n", "stdout: " + r.stdout_text);
  expect(r.metadata.was_sandboxed, "sandboxed");
  expect(!r.metadata.version.empty(), "node version reported");

  r = engine.execute(js_request("throw new Error(\"kaboom\");"));
  expect(!r.success && r.exit_code > 0, "uncaught throw fails");
  expect(r.error && contains(*r.error, "kaboom"), "error carries the message");
  expect(r.error && !contains(*r.error, g_scratch_root), "scratch path hidden: " + r.error.value_or(""));

  auto req = js_request("while (true) {}");
  req.limits.timeout_ms = 1000;
  const auto t0 = std::chrono::steady_clock::now();
  r = engine.execute(req);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0)
                      .count();
  expect(r.metadata.timeout_hit && r.exit_code == kExitTimeout, "infinite loop times out");
  expect(ms < 1000 + 1500, "timed out close to the limit: " + std::to_string(ms) + "ms");
}

void test_real_python() {
  Engine& engine = real_engine();
  if (!engine.is_language_supported("python")) return skip("python3 not installed");
  ExecutionRequest req;
  req.language = "python";
  req.code = "import sys\ndata = sys.stdin.read()\nprint(data.upper())\n";
  req.input = "abc";
  auto r = engine.execute(req);
  expect(r.success, "python ran: " + r.stderr_text);
  expect(r.stdout_text == "ABC\n", "stdin processed: " + r.stdout_text);

  req.code = "raise ValueError('bad value')\n";
  req.input.clear();
  r = engine.execute(req);
  expect(!r.success && r.exit_code == 1, "exception exits 1");
  expect(r.error && contains(*r.error, "ValueError"), "traceback in error");
}

void test_real_cpp() {
  Engine& engine = real_engine();
  if (!engine.is_language_supported("cpp")) return skip("g++ not installed");
  ExecutionRequest req;
  req.language = "cpp";
  req.code = "int main() { std::vector<int> v{1, 2, 3}; std::cout << v.size() << std::endl; }\n";
  auto r = engine.execute(req);
  expect(r.success, "g++ build and run: " + r.stderr_text);
  expect(r.stdout_text == "3\n", "preamble headers available: " + r.stdout_text);
  r = engine.execute(req);
  expect(r.metadata.cache_hit, "rebuild served from cache");

  req.code = "int main() { return missing_symbol; }\n";
  r = engine.execute(req);
  expect(r.error_code == ErrorCode::compile_error, "compile error result");
  expect(contains(r.stderr_text, "main.cpp:1"), "diagnostics point at the user's line");
}

}  // namespace

int main() {
  std::cout << "=== Warden Engine Test Suite ===\n";
  g_scratch_root =
      (fs::temp_directory_path() / ("warden-tests-" + std::to_string(::getpid()))).string();
  fs::create_directories(g_scratch_root);

  std::cout << "\n[Phase 1] Types, Hashing & Wire Codec\n";
  run_test("language ids and aliases", test_language_ids);
  run_test("compiler standards", test_compiler_standards);
  run_test("hash domain separation", test_hash_domains);
  run_test("parse request", test_parse_request);
  run_test("parse request type errors", test_parse_request_type_errors);
  run_test("request size cap", test_request_size_cap);
  run_test("result JSON", test_result_json);
  run_test("request digest", test_request_digest);
  run_test("error JSON", test_error_json);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] Configuration\n";
  run_test("defaults valid", test_config_defaults_valid);
  run_test("bad values rejected", test_config_rejects_bad_values);
  run_test("JSON overlay", test_config_json_overlay);

  std::cout << "\n[Phase 3] Security Validator\n";
  run_test("script denylist", test_security_script_rules);
  run_test("capability lifting", test_security_capability_lifting);
  run_test("python denylist", test_security_python_rules);
  run_test("native denylists", test_security_native_rules);
  run_test("structural limits", test_security_structure);
  run_test("args, env and input", test_security_args_env_input);

  std::cout << "\n[Phase 4] Resource Limiter\n";
  run_test("resolve narrows defaults", test_limiter_resolve);
  run_test("validate defaults", test_limiter_validate_defaults);
  run_test("watchdog deadline", test_limiter_watchdog);
  run_test("bounds and failures", test_limiter_bounds_and_failures);

  std::cout << "\n[Phase 5] Compilation Cache\n";
  run_test("key sensitivity", test_cache_key_sensitivity);
  run_test("hit and miss", test_cache_hit_and_miss);
  run_test("LRU by entries", test_cache_lru_entries);
  run_test("byte budget", test_cache_byte_budget);
  run_test("single flight", test_cache_single_flight);
  run_test("failures not cached", test_cache_failure_not_cached);
  run_test("blob integrity", test_cache_integrity);

  std::cout << "\n[Phase 6] Instance Backend\n";
  run_test("cancellation token", test_cancellation_token);
  run_test("exit code and streams", test_sandbox_exit_and_streams);
  run_test("stdin and env", test_sandbox_stdin_and_env);
  run_test("wall-clock deadline", test_sandbox_deadline);
  run_test("cancel", test_sandbox_cancel);
  run_test("output limit", test_sandbox_output_limit);
  run_test("file writes blocked", test_sandbox_file_writes_blocked);
  run_test("exec failure", test_sandbox_exec_failure);
  run_test("scratch dir lifecycle", test_scratch_dir_lifecycle);

  std::cout << "\n[Phase 7] Runtime Adapters\n";
  run_test("source preamble", test_prepare_source);
  run_test("compiler arguments", test_compiler_args);
  run_test("interpreter profiles", test_interpreter_profiles);
  run_test("toolchain backend", test_toolchain_backend);
  run_test("scratch path hidden", test_launch_hides_scratch_path);
  run_test("native adapter through engine", test_native_adapter_through_engine);

  std::cout << "\n[Phase 8] Engine Facade\n";
  run_test("lifecycle", test_engine_lifecycle);
  run_test("required languages", test_engine_required_language);
  run_test("introspection", test_engine_introspection);
  run_test("request errors", test_engine_request_errors);
  run_test("size boundaries", test_engine_size_boundaries);
  run_test("success result", test_engine_success_result);
  run_test("failures are results", test_engine_failures_are_results);
  run_test("compile cache", test_engine_compile_cache);
  run_test("compile error", test_engine_compile_error);
  run_test("infrastructure error", test_engine_infrastructure_error);
  run_test("env filtering", test_engine_env_filtering);
  run_test("default limits", test_engine_default_limits);
  run_test("statistics", test_engine_statistics);
  run_test("execution events", test_engine_events);
  run_test("execute multiple", test_engine_execute_multiple);
  run_test("concurrency bound", test_engine_concurrency_bound);

  std::cout << "\n[Phase 9] Real Toolchains\n";
  run_test("javascript", test_real_javascript);
  run_test("python", test_real_python);
  run_test("c++", test_real_cpp);

  std::error_code ec;
  fs::remove_all(g_scratch_root, ec);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << " (" << g_tests_skipped << " skipped)";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
