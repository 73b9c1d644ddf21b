#include "warden/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>

#include "warden/jsonlite.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

std::optional<std::string> env_value(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return std::nullopt;
  return std::string(v);
}

std::optional<std::uint64_t> parse_u64(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return std::stoull(s);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

template <class T>
void env_u64(EngineConfig& cfg, const char* name, T& out) {
  auto v = env_value(name);
  if (!v) return;
  auto n = parse_u64(*v);
  if (!n) {
    cfg.load_errors.push_back(std::string(name) + ": not a non-negative integer: " + *v);
    return;
  }
  out = static_cast<T>(*n);
}

void env_string(const char* name, std::string& out) {
  if (auto v = env_value(name)) out = *v;
}

std::vector<Language> parse_language_list(const std::vector<std::string>& ids,
                                          std::vector<std::string>& errors) {
  std::vector<Language> out;
  for (const auto& id : ids) {
    if (id.empty()) continue;
    auto lang = language_from_string(id);
    if (!lang) {
      errors.push_back("unknown language in required list: " + id);
      continue;
    }
    out.push_back(*lang);
  }
  return out;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    const auto b = item.find_first_not_of(" \t");
    const auto e = item.find_last_not_of(" \t");
    if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
  }
  return out;
}

void json_u64(const jsonlite::Object& obj, const std::string& key, std::uint64_t& out,
              std::vector<std::string>& errors) {
  if (!jsonlite::has(obj, key)) return;
  auto n = jsonlite::get_i64(obj, key);
  if (!n || *n < 0) {
    errors.push_back(key + ": expected a non-negative integer");
    return;
  }
  out = static_cast<std::uint64_t>(*n);
}

}  // namespace

EngineConfig EngineConfig::from_env() {
  EngineConfig cfg;
  env_u64(cfg, "WARDEN_DEFAULT_TIMEOUT_MS", cfg.default_limits.timeout_ms);
  env_u64(cfg, "WARDEN_DEFAULT_MEMORY_MB", cfg.default_limits.max_memory_mb);
  env_u64(cfg, "WARDEN_DEFAULT_MAX_OUTPUT", cfg.default_limits.max_output_size);
  env_u64(cfg, "WARDEN_DEFAULT_MAX_INPUT", cfg.default_limits.max_input_size);
  env_u64(cfg, "WARDEN_MAX_CONCURRENCY", cfg.max_concurrent_instances);
  env_u64(cfg, "WARDEN_CACHE_MAX_ENTRIES", cfg.cache_max_entries);
  env_u64(cfg, "WARDEN_CACHE_MAX_BYTES", cfg.cache_max_bytes);
  env_string("WARDEN_SCRATCH_ROOT", cfg.scratch_root);
  if (auto v = env_value("WARDEN_REQUIRED_LANGUAGES")) {
    cfg.required_languages = parse_language_list(split_csv(*v), cfg.load_errors);
  }
  env_string("WARDEN_NODE", cfg.toolchains.node);
  env_string("WARDEN_PYTHON", cfg.toolchains.python);
  env_string("WARDEN_TSC", cfg.toolchains.tsc);
  env_string("WARDEN_RUSTC", cfg.toolchains.rustc);
  env_string("WARDEN_CC", cfg.toolchains.cc);
  env_string("WARDEN_CXX", cfg.toolchains.cxx);
  cfg.sandbox = SandboxConfig::from_env();
  return cfg;
}

ConfigValidationResult validate_config(const EngineConfig& config) {
  ConfigValidationResult r;
  r.errors = config.load_errors;

  const auto& d = config.default_limits;
  const auto& c = config.ceilings;
  auto check = [&](const char* name, std::uint64_t value, std::uint64_t ceiling) {
    if (value == 0) r.errors.push_back(std::string(name) + " must be positive");
    else if (value > ceiling)
      r.errors.push_back(std::string(name) + " " + std::to_string(value) +
                         " exceeds ceiling " + std::to_string(ceiling));
  };
  check("default timeoutMs", d.timeout_ms, c.timeout_ms);
  check("default maxMemoryMB", d.max_memory_mb, c.max_memory_mb);
  check("default maxOutputSize", d.max_output_size, c.max_output_size);
  check("default maxInputSize", d.max_input_size, c.max_input_size);

  if (config.max_concurrent_instances == 0) r.errors.push_back("maxConcurrentInstances must be positive");
  if (config.cache_max_entries == 0) r.errors.push_back("cacheMaxEntries must be positive");
  if (config.cache_compression != "zstd" && config.cache_compression != "identity") {
    r.errors.push_back("cacheCompression must be zstd or identity");
  }
#if !defined(WARDEN_WITH_ZSTD)
  if (config.cache_compression == "zstd") {
    r.warnings.push_back("built without zstd; cache blobs are stored uncompressed");
  }
#endif
  if (config.compile_timeout_ms == 0) r.errors.push_back("compileTimeoutMs must be positive");
  if (!config.sandbox.sandbox_enabled) r.warnings.push_back("sandbox disabled (WARDEN_SANDBOX_DISABLED=1)");
  if (d.allow_network || d.allow_file_system || d.allow_env || d.allow_process) {
    r.warnings.push_back("default limits grant capabilities to every request");
  }
  r.ok = r.errors.empty();
  return r;
}

bool apply_config_json(EngineConfig& config, const std::string& json, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return false;
  }

  if (const auto* limits = jsonlite::get_object(obj, "defaultLimits")) {
    auto& d = config.default_limits;
    json_u64(*limits, "timeoutMs", d.timeout_ms, config.load_errors);
    json_u64(*limits, "maxMemoryMB", d.max_memory_mb, config.load_errors);
    json_u64(*limits, "maxOutputSize", d.max_output_size, config.load_errors);
    json_u64(*limits, "maxInputSize", d.max_input_size, config.load_errors);
    d.allow_network = jsonlite::get_bool(*limits, "allowNetwork", d.allow_network);
    d.allow_file_system = jsonlite::get_bool(*limits, "allowFileSystem", d.allow_file_system);
    d.allow_env = jsonlite::get_bool(*limits, "allowEnv", d.allow_env);
    d.allow_process = jsonlite::get_bool(*limits, "allowProcess", d.allow_process);
  }
  if (const auto* ceil = jsonlite::get_object(obj, "ceilings")) {
    auto& c = config.ceilings;
    json_u64(*ceil, "timeoutMs", c.timeout_ms, config.load_errors);
    json_u64(*ceil, "maxMemoryMB", c.max_memory_mb, config.load_errors);
    json_u64(*ceil, "maxOutputSize", c.max_output_size, config.load_errors);
    json_u64(*ceil, "maxInputSize", c.max_input_size, config.load_errors);
  }

  std::uint64_t n = config.max_concurrent_instances;
  json_u64(obj, "maxConcurrentInstances", n, config.load_errors);
  config.max_concurrent_instances = static_cast<std::size_t>(n);
  n = config.cache_max_entries;
  json_u64(obj, "cacheMaxEntries", n, config.load_errors);
  config.cache_max_entries = static_cast<std::size_t>(n);
  n = config.cache_max_bytes;
  json_u64(obj, "cacheMaxBytes", n, config.load_errors);
  config.cache_max_bytes = static_cast<std::size_t>(n);
  json_u64(obj, "compileTimeoutMs", config.compile_timeout_ms, config.load_errors);
  config.cache_compression = jsonlite::get_string(obj, "cacheCompression", config.cache_compression);
  config.scratch_root = jsonlite::get_string(obj, "scratchRoot", config.scratch_root);

  if (jsonlite::get_array(obj, "requiredLanguages")) {
    config.required_languages =
        parse_language_list(jsonlite::get_string_array(obj, "requiredLanguages"), config.load_errors);
  }
  if (const auto* tc = jsonlite::get_object(obj, "toolchains")) {
    auto& t = config.toolchains;
    t.node = jsonlite::get_string(*tc, "node", t.node);
    t.python = jsonlite::get_string(*tc, "python", t.python);
    t.tsc = jsonlite::get_string(*tc, "tsc", t.tsc);
    t.rustc = jsonlite::get_string(*tc, "rustc", t.rustc);
    t.cc = jsonlite::get_string(*tc, "cc", t.cc);
    t.cxx = jsonlite::get_string(*tc, "cxx", t.cxx);
  }
  config.sandbox.sandbox_enabled = jsonlite::get_bool(obj, "sandboxEnabled", config.sandbox.sandbox_enabled);
  return true;
}

std::string config_to_json(const EngineConfig& config) {
  using jsonlite::Object;
  using jsonlite::Value;
  const auto& d = config.default_limits;
  const auto& c = config.ceilings;
  jsonlite::Array required;
  for (auto lang : config.required_languages) required.push_back(Value{to_string(lang)});

  Object o;
  o["defaultLimits"] = Value{Object{
      {"timeoutMs", Value{static_cast<std::uint64_t>(d.timeout_ms)}},
      {"maxMemoryMB", Value{static_cast<std::uint64_t>(d.max_memory_mb)}},
      {"maxOutputSize", Value{static_cast<std::uint64_t>(d.max_output_size)}},
      {"maxInputSize", Value{static_cast<std::uint64_t>(d.max_input_size)}},
      {"allowNetwork", Value{d.allow_network}},
      {"allowFileSystem", Value{d.allow_file_system}},
      {"allowEnv", Value{d.allow_env}},
      {"allowProcess", Value{d.allow_process}},
  }};
  o["ceilings"] = Value{Object{
      {"timeoutMs", Value{static_cast<std::uint64_t>(c.timeout_ms)}},
      {"maxMemoryMB", Value{static_cast<std::uint64_t>(c.max_memory_mb)}},
      {"maxOutputSize", Value{static_cast<std::uint64_t>(c.max_output_size)}},
      {"maxInputSize", Value{static_cast<std::uint64_t>(c.max_input_size)}},
  }};
  o["maxConcurrentInstances"] = Value{static_cast<std::uint64_t>(config.max_concurrent_instances)};
  o["cacheMaxEntries"] = Value{static_cast<std::uint64_t>(config.cache_max_entries)};
  o["cacheMaxBytes"] = Value{static_cast<std::uint64_t>(config.cache_max_bytes)};
  o["cacheCompression"] = Value{config.cache_compression};
  o["compileTimeoutMs"] = Value{static_cast<std::uint64_t>(config.compile_timeout_ms)};
  o["scratchRoot"] = Value{scratch_root_of(config)};
  o["requiredLanguages"] = Value{std::move(required)};
  o["sandboxEnabled"] = Value{config.sandbox.sandbox_enabled};
  o["toolchains"] = Value{Object{
      {"node", Value{config.toolchains.node}},
      {"python", Value{config.toolchains.python}},
      {"tsc", Value{config.toolchains.tsc}},
      {"rustc", Value{config.toolchains.rustc}},
      {"cc", Value{config.toolchains.cc}},
      {"cxx", Value{config.toolchains.cxx}},
  }};
  return jsonlite::to_json(Value{std::move(o)});
}

std::string scratch_root_of(const EngineConfig& config) {
  if (!config.scratch_root.empty()) return config.scratch_root;
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec) base = "/tmp";
  return (base / "warden").string();
}

}  // namespace warden
