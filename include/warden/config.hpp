#pragma once

// warden/config.hpp — Engine configuration.
//
// Layering: compiled-in defaults, then WARDEN_* environment variables
// (from_env), then an optional JSON document (apply_config_json). The result
// is checked once by validate_config() before the engine is constructed.
//
// Environment variables:
//   WARDEN_DEFAULT_TIMEOUT_MS   WARDEN_DEFAULT_MEMORY_MB
//   WARDEN_DEFAULT_MAX_OUTPUT   WARDEN_DEFAULT_MAX_INPUT
//   WARDEN_MAX_CONCURRENCY      WARDEN_CACHE_MAX_ENTRIES
//   WARDEN_CACHE_MAX_BYTES      WARDEN_SCRATCH_ROOT
//   WARDEN_REQUIRED_LANGUAGES   (comma separated wire ids)
//   WARDEN_SANDBOX_DISABLED=1
//   WARDEN_NODE WARDEN_PYTHON WARDEN_TSC WARDEN_RUSTC WARDEN_CC WARDEN_CXX
//   WARDEN_EVENT_LOG            (read by observability.cpp)

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "warden/sandbox.hpp"
#include "warden/types.hpp"

namespace warden {

struct ToolchainCommands {
  std::string node{"node"};
  std::string python{"python3"};
  std::string tsc{"tsc"};
  std::string rustc{"rustc"};
  std::string cc{"gcc"};
  std::string cxx{"g++"};
};

struct EngineConfig {
  ExecutionLimits default_limits;
  LimitCeilings ceilings;

  std::size_t max_concurrent_instances{5};

  std::size_t cache_max_entries{128};
  std::size_t cache_max_bytes{256ull * 1024 * 1024};
  std::string cache_compression{"zstd"};  // "zstd" or "identity"

  std::uint64_t compile_timeout_ms{30000};
  std::size_t compile_max_output_bytes{1024 * 1024};

  std::string scratch_root;  // empty = <temp dir>/warden
  std::vector<Language> required_languages{Language::javascript, Language::python};

  ToolchainCommands toolchains;
  SandboxConfig sandbox;

  // Unparseable values seen while loading; reported by validate_config().
  std::vector<std::string> load_errors;

  static EngineConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const EngineConfig& config);

// Overlays recognized keys from a JSON object. Unknown keys are ignored.
// Returns false and sets *error when the document is not valid JSON.
bool apply_config_json(EngineConfig& config, const std::string& json, std::string* error);

std::string config_to_json(const EngineConfig& config);

// Resolved scratch root (applies the temp-dir default).
std::string scratch_root_of(const EngineConfig& config);

}  // namespace warden
