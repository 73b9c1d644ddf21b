#pragma once

// warden/types.hpp — Core value types for the Warden execution engine.
//
// MEMORY OWNERSHIP:
//   - Requests and results are value types. execute() returns ExecutionResult
//     by value and the caller owns it.
//   - No raw pointer members in any public API type.
//
// LANGUAGE MODEL:
//   Language is a closed enum. Every switch over it is exhaustive so adding a
//   language is a compile-visible change. Wire ids are lowercase strings; see
//   language_from_string() for accepted aliases.
//
// EXTENSION_POINT: language_registry
//   Adding a language: extend Language + kLanguageCount, add a case to each
//   switch in types.cpp, a denylist in security.cpp and an adapter profile in
//   adapters.cpp. The registry table in engine.cpp is sized by kLanguageCount.

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden {

enum class Language {
  javascript,
  typescript,
  python,
  rust,
  c,
  cpp,
};

constexpr std::size_t kLanguageCount = 6;

constexpr std::array<Language, kLanguageCount> kAllLanguages = {
    Language::javascript, Language::typescript, Language::python,
    Language::rust,       Language::c,          Language::cpp,
};

constexpr std::size_t index_of(Language lang) {
  return static_cast<std::size_t>(lang);
}

// Canonical wire id ("javascript", "cpp", ...).
std::string to_string(Language lang);

// Accepts canonical ids and aliases (js, node, ts, py, python3, rs, c++, cxx).
// Case-insensitive. Returns nullopt for anything else.
std::optional<Language> language_from_string(std::string_view id);

// True when the adapter must produce an artifact before it can run.
bool requires_compilation(Language lang);

enum class ErrorCode {
  none,
  invalid_request,
  code_too_large,
  input_too_large,
  invalid_limits,
  invalid_compiler_flags,
  unsupported_language,
  security_violation,
  not_initialized,
  initialization_failed,
  compile_error,
  timeout,
  memory_limit,
  output_limit,
  runtime_error,
  spawn_failed,
  sandbox_unavailable,
  cache_integrity_failed,
  toolchain_unavailable,
  json_parse_error,
};

std::string to_string(ErrorCode code);

// Exit codes reported when a resource bound trips. Security and unsupported
// language rejections use 126 and 127 in batched results.
constexpr int kExitTimeout = 124;
constexpr int kExitOutputLimit = 125;
constexpr int kExitSecurity = 126;
constexpr int kExitUnsupported = 127;
constexpr int kExitMemoryLimit = 137;

// ---------------------------------------------------------------------------
// Limits
// ---------------------------------------------------------------------------

struct ExecutionLimits {
  std::uint64_t timeout_ms{5000};
  std::uint64_t max_memory_mb{256};
  std::uint64_t max_output_size{1024 * 1024};
  std::uint64_t max_input_size{100 * 1024};
  bool allow_network{false};
  bool allow_file_system{false};
  bool allow_env{false};
  bool allow_process{false};
};

// Partial limits. Numerics are signed so that zero and negative values coming
// off the wire reach validation instead of wrapping.
struct LimitsPatch {
  std::optional<std::int64_t> timeout_ms;
  std::optional<std::int64_t> max_memory_mb;
  std::optional<std::int64_t> max_output_size;
  std::optional<std::int64_t> max_input_size;
  std::optional<bool> allow_network;
  std::optional<bool> allow_file_system;
  std::optional<bool> allow_env;
  std::optional<bool> allow_process;

  bool empty() const;
};

// Operator hard ceilings. Defaults can never be raised above these.
struct LimitCeilings {
  std::uint64_t timeout_ms{10000};
  std::uint64_t max_memory_mb{512};
  std::uint64_t max_output_size{10 * 1024 * 1024};
  std::uint64_t max_input_size{1024 * 1024};
};

// ---------------------------------------------------------------------------
// Compiler flags (Rust, C, C++; TypeScript honors only `debug`)
// ---------------------------------------------------------------------------

enum class OptimizationLevel { O0, O1, O2, O3, Os, Oz };
enum class WarningLevel { minimal, all, extra, pedantic };

struct CompilerFlags {
  OptimizationLevel optimization{OptimizationLevel::O2};
  // Empty selects the language default: c++17, c11, rust edition 2021.
  std::string standard;
  WarningLevel warnings{WarningLevel::minimal};
  bool debug{false};
};

std::string to_string(OptimizationLevel level);
std::string to_string(WarningLevel level);
std::optional<OptimizationLevel> optimization_from_string(std::string_view s);
std::optional<WarningLevel> warnings_from_string(std::string_view s);

// Standard / edition accepted for `lang`. Empty is always accepted.
bool is_valid_standard(Language lang, std::string_view standard);
std::string default_standard(Language lang);

// ---------------------------------------------------------------------------
// Request / result
// ---------------------------------------------------------------------------

struct ExecutionRequest {
  std::string code;
  std::string language;  // wire id, resolved by the engine
  std::string input;     // stdin
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
  LimitsPatch limits;
  std::optional<CompilerFlags> compiler_flags;
};

struct ExecutionMetadata {
  bool was_sandboxed{false};
  bool timeout_hit{false};
  bool memory_limit_hit{false};
  bool output_limit_hit{false};
  std::size_t output_size{0};
  std::uint64_t memory_used_bytes{0};
  std::string runtime;
  std::string version;
  bool cache_hit{false};
  std::uint64_t compile_time_ms{0};
  std::uint64_t start_unix_ms{0};
  std::uint64_t end_unix_ms{0};
};

struct ExecutionResult {
  bool success{false};
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
  std::string language;
  double execution_time_ms{0.0};
  ExecutionMetadata metadata;
  std::optional<std::string> error;
  ErrorCode error_code{ErrorCode::none};

  // Recompute `success` from exit code, bound flags and error.
  void finalize();
};

// ---------------------------------------------------------------------------
// Environment info and statistics
// ---------------------------------------------------------------------------

struct RuntimeCapabilities {
  bool network{false};
  bool file_system{false};
  bool environment{false};
  bool processes{false};
};

struct RuntimeEnvironmentInfo {
  Language language{Language::javascript};
  std::string runtime;
  std::string version;
  std::string path;
  bool available{false};
  RuntimeCapabilities capabilities;
};

struct ExecutionStatistics {
  std::uint64_t total_executions{0};
  std::uint64_t successful_executions{0};
  std::uint64_t failed_executions{0};
  double average_execution_time_ms{0.0};
  double last_execution_time_ms{0.0};
  std::uint64_t last_execution_unix_ms{0};
  double average_memory_usage_mb{0.0};
  std::optional<Language> most_used_language;
  std::array<std::uint64_t, kLanguageCount> per_language{};

  std::uint64_t timeouts{0};
  std::uint64_t memory_limit_hits{0};
  std::uint64_t output_limit_hits{0};
  std::uint64_t compile_errors{0};
  std::uint64_t infrastructure_errors{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};

  double p50_ms{0.0};
  double p95_ms{0.0};
  double p99_ms{0.0};
};

}  // namespace warden
