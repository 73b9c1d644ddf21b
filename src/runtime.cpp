#include "warden/runtime.hpp"

#include <variant>

#include "warden/hash.hpp"

namespace warden {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Value u64(std::uint64_t n) { return Value(n); }

bool is_string(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<std::string>(it->second.v);
}

bool is_bool(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<bool>(it->second.v);
}

bool fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

bool read_optional_bool(const Object& obj, const std::string& key, std::optional<bool>& out,
                        std::string* error, const std::string& path) {
  if (!jsonlite::has(obj, key)) return true;
  if (!is_bool(obj, key)) return fail(error, path + key + " must be a boolean");
  out = jsonlite::get_bool(obj, key);
  return true;
}

bool read_optional_int(const Object& obj, const std::string& key,
                       std::optional<std::int64_t>& out, std::string* error,
                       const std::string& path) {
  if (!jsonlite::has(obj, key)) return true;
  auto v = jsonlite::get_i64(obj, key);
  if (!v) return fail(error, path + key + " must be an integer");
  out = v;
  return true;
}

bool read_string_array(const Object& obj, const std::string& key, std::vector<std::string>& out,
                       std::string* error) {
  const Array* arr = jsonlite::get_array(obj, key);
  if (!arr) {
    if (jsonlite::has(obj, key)) return fail(error, key + " must be an array of strings");
    return true;
  }
  for (const auto& item : *arr) {
    if (!std::holds_alternative<std::string>(item.v)) {
      return fail(error, key + " must be an array of strings");
    }
    out.push_back(std::get<std::string>(item.v));
  }
  return true;
}

bool read_string_map(const Object& obj, const std::string& key,
                     std::map<std::string, std::string>& out, std::string* error) {
  const Object* m = jsonlite::get_object(obj, key);
  if (!m) {
    if (jsonlite::has(obj, key)) return fail(error, key + " must be an object of strings");
    return true;
  }
  for (const auto& [k, v] : *m) {
    if (!std::holds_alternative<std::string>(v.v)) {
      return fail(error, key + "." + k + " must be a string");
    }
    out[k] = std::get<std::string>(v.v);
  }
  return true;
}

bool read_compiler_flags(const Object& obj, CompilerFlags& flags, std::string* error) {
  if (jsonlite::has(obj, "optimization")) {
    if (!is_string(obj, "optimization")) {
      return fail(error, "compilerFlags.optimization must be a string");
    }
    auto o = optimization_from_string(jsonlite::get_string(obj, "optimization"));
    if (!o) return fail(error, "compilerFlags.optimization is not one of O0 O1 O2 O3 Os Oz");
    flags.optimization = *o;
  }
  if (jsonlite::has(obj, "standard")) {
    if (!is_string(obj, "standard")) return fail(error, "compilerFlags.standard must be a string");
    flags.standard = jsonlite::get_string(obj, "standard");
  }
  if (jsonlite::has(obj, "warnings")) {
    if (!is_string(obj, "warnings")) return fail(error, "compilerFlags.warnings must be a string");
    auto w = warnings_from_string(jsonlite::get_string(obj, "warnings"));
    if (!w) return fail(error, "compilerFlags.warnings is not one of minimal all extra pedantic");
    flags.warnings = *w;
  }
  if (jsonlite::has(obj, "debug")) {
    if (!is_bool(obj, "debug")) return fail(error, "compilerFlags.debug must be a boolean");
    flags.debug = jsonlite::get_bool(obj, "debug");
  }
  return true;
}

Object limits_patch_object(const LimitsPatch& p) {
  Object o;
  auto put_int = [&o](const char* key, const std::optional<std::int64_t>& v) {
    if (!v) return;
    if (*v >= 0) {
      o[key] = u64(static_cast<std::uint64_t>(*v));
    } else {
      o[key] = static_cast<double>(*v);
    }
  };
  put_int("timeoutMs", p.timeout_ms);
  put_int("maxMemoryMB", p.max_memory_mb);
  put_int("maxOutputSize", p.max_output_size);
  put_int("maxInputSize", p.max_input_size);
  if (p.allow_network) o["allowNetwork"] = *p.allow_network;
  if (p.allow_file_system) o["allowFileSystem"] = *p.allow_file_system;
  if (p.allow_env) o["allowEnv"] = *p.allow_env;
  if (p.allow_process) o["allowProcess"] = *p.allow_process;
  return o;
}

Object limits_object(const ExecutionLimits& l) {
  Object o;
  o["timeoutMs"] = u64(l.timeout_ms);
  o["maxMemoryMB"] = u64(l.max_memory_mb);
  o["maxOutputSize"] = u64(l.max_output_size);
  o["maxInputSize"] = u64(l.max_input_size);
  o["allowNetwork"] = l.allow_network;
  o["allowFileSystem"] = l.allow_file_system;
  o["allowEnv"] = l.allow_env;
  o["allowProcess"] = l.allow_process;
  return o;
}

}  // namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

LimitsPatch parse_limits_patch(const Object& obj, std::string* error) {
  LimitsPatch p;
  const std::string path = "limits.";
  if (!read_optional_int(obj, "timeoutMs", p.timeout_ms, error, path) ||
      !read_optional_int(obj, "maxMemoryMB", p.max_memory_mb, error, path) ||
      !read_optional_int(obj, "maxOutputSize", p.max_output_size, error, path) ||
      !read_optional_int(obj, "maxInputSize", p.max_input_size, error, path) ||
      !read_optional_bool(obj, "allowNetwork", p.allow_network, error, path) ||
      !read_optional_bool(obj, "allowFileSystem", p.allow_file_system, error, path) ||
      !read_optional_bool(obj, "allowEnv", p.allow_env, error, path) ||
      !read_optional_bool(obj, "allowProcess", p.allow_process, error, path)) {
    return {};
  }
  return p;
}

ExecutionRequest parse_request_object(const Object& obj, std::string* error) {
  ExecutionRequest req;
  if (!is_string(obj, "code")) {
    fail(error, "code must be a string");
    return {};
  }
  if (!is_string(obj, "language")) {
    fail(error, "language must be a string");
    return {};
  }
  req.code = jsonlite::get_string(obj, "code");
  req.language = jsonlite::get_string(obj, "language");

  if (jsonlite::has(obj, "input")) {
    if (!is_string(obj, "input")) {
      fail(error, "input must be a string");
      return {};
    }
    req.input = jsonlite::get_string(obj, "input");
  }
  if (!read_string_array(obj, "args", req.args, error)) return {};
  if (!read_string_map(obj, "env", req.env, error)) return {};

  if (jsonlite::has(obj, "limits")) {
    const Object* lim = jsonlite::get_object(obj, "limits");
    if (!lim) {
      fail(error, "limits must be an object");
      return {};
    }
    std::string lim_error;
    req.limits = parse_limits_patch(*lim, &lim_error);
    if (!lim_error.empty()) {
      fail(error, lim_error);
      return {};
    }
  }

  if (jsonlite::has(obj, "compilerFlags")) {
    const Object* flags = jsonlite::get_object(obj, "compilerFlags");
    if (!flags) {
      fail(error, "compilerFlags must be an object");
      return {};
    }
    CompilerFlags cf;
    if (!read_compiler_flags(*flags, cf, error)) return {};
    req.compiler_flags = cf;
  }
  return req;
}

ExecutionRequest parse_request_json(const std::string& json_payload, std::string* error) {
  if (json_payload.size() > kMaxRequestPayloadBytes) {
    fail(error, "request payload exceeds " + std::to_string(kMaxRequestPayloadBytes) + " bytes");
    return {};
  }
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json_payload, &err);
  if (err) {
    fail(error, err->code + ": " + err->message);
    return {};
  }
  return parse_request_object(obj, error);
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

Value result_to_value(const ExecutionResult& r) {
  Object meta;
  meta["wasSandboxed"] = r.metadata.was_sandboxed;
  meta["timeoutHit"] = r.metadata.timeout_hit;
  meta["memoryLimitHit"] = r.metadata.memory_limit_hit;
  meta["outputLimitHit"] = r.metadata.output_limit_hit;
  meta["outputSize"] = u64(r.metadata.output_size);
  meta["memoryUsed"] = u64(r.metadata.memory_used_bytes);
  meta["runtime"] = r.metadata.runtime;
  meta["version"] = r.metadata.version;
  meta["cacheHit"] = r.metadata.cache_hit;
  meta["compileTimeMs"] = u64(r.metadata.compile_time_ms);
  meta["startTime"] = u64(r.metadata.start_unix_ms);
  meta["endTime"] = u64(r.metadata.end_unix_ms);

  Object o;
  o["success"] = r.success;
  o["stdout"] = r.stdout_text;
  o["stderr"] = r.stderr_text;
  // Negative exit codes do not occur; the POSIX backend maps signals to 128+n.
  o["exitCode"] = u64(static_cast<std::uint64_t>(r.exit_code < 0 ? 0 : r.exit_code));
  o["language"] = r.language;
  o["executionTime"] = r.execution_time_ms;
  o["metadata"] = std::move(meta);
  if (r.error) o["error"] = *r.error;
  o["errorCode"] = to_string(r.error_code);
  return Value(std::move(o));
}

std::string result_to_json(const ExecutionResult& result) {
  return jsonlite::to_json(result_to_value(result));
}

std::string limits_to_json(const ExecutionLimits& limits) {
  return jsonlite::to_json(Value(limits_object(limits)));
}

std::string statistics_to_json(const ExecutionStatistics& s) {
  Object per_language;
  for (Language lang : kAllLanguages) {
    per_language[to_string(lang)] = u64(s.per_language[index_of(lang)]);
  }
  Object latency;
  latency["p50"] = s.p50_ms;
  latency["p95"] = s.p95_ms;
  latency["p99"] = s.p99_ms;

  Object o;
  o["totalExecutions"] = u64(s.total_executions);
  o["successfulExecutions"] = u64(s.successful_executions);
  o["failedExecutions"] = u64(s.failed_executions);
  o["averageExecutionTime"] = s.average_execution_time_ms;
  o["lastExecutionTime"] = s.last_execution_time_ms;
  o["lastExecutionAt"] = u64(s.last_execution_unix_ms);
  o["averageMemoryUsage"] = s.average_memory_usage_mb;
  o["mostUsedLanguage"] =
      s.most_used_language ? Value(to_string(*s.most_used_language)) : Value(nullptr);
  o["perLanguage"] = std::move(per_language);
  o["timeouts"] = u64(s.timeouts);
  o["memoryLimitHits"] = u64(s.memory_limit_hits);
  o["outputLimitHits"] = u64(s.output_limit_hits);
  o["compileErrors"] = u64(s.compile_errors);
  o["infrastructureErrors"] = u64(s.infrastructure_errors);
  o["cacheHits"] = u64(s.cache_hits);
  o["cacheMisses"] = u64(s.cache_misses);
  o["latencyMs"] = std::move(latency);
  return jsonlite::to_json(Value(std::move(o)));
}

std::string environment_info_to_json(const RuntimeEnvironmentInfo& info) {
  Object caps;
  caps["network"] = info.capabilities.network;
  caps["fileSystem"] = info.capabilities.file_system;
  caps["environment"] = info.capabilities.environment;
  caps["processes"] = info.capabilities.processes;

  Object o;
  o["language"] = to_string(info.language);
  o["runtime"] = info.runtime;
  o["version"] = info.version;
  o["path"] = info.path;
  o["available"] = info.available;
  o["capabilities"] = std::move(caps);
  return jsonlite::to_json(Value(std::move(o)));
}

std::string cache_stats_to_json(const CompilationCache::Stats& s) {
  Object o;
  o["entries"] = u64(s.entries);
  o["bytes"] = u64(s.bytes);
  o["hits"] = u64(s.hits);
  o["misses"] = u64(s.misses);
  o["evictions"] = u64(s.evictions);
  o["compileFailures"] = u64(s.compile_failures);
  return jsonlite::to_json(Value(std::move(o)));
}

std::string error_to_json(ErrorCode code, const std::string& message) {
  Object o;
  o["success"] = false;
  o["errorCode"] = to_string(code);
  o["error"] = message;
  return jsonlite::to_json(Value(std::move(o)));
}

// ---------------------------------------------------------------------------
// Digest
// ---------------------------------------------------------------------------

std::string canonicalize_request(const ExecutionRequest& r) {
  Object o;
  o["code"] = r.code;
  o["language"] = r.language;
  o["input"] = r.input;
  Array args;
  for (const auto& a : r.args) args.emplace_back(a);
  o["args"] = std::move(args);
  Object env;
  for (const auto& [k, v] : r.env) env[k] = v;
  o["env"] = std::move(env);
  o["limits"] = limits_patch_object(r.limits);
  if (r.compiler_flags) {
    Object f;
    f["optimization"] = to_string(r.compiler_flags->optimization);
    f["standard"] = r.compiler_flags->standard;
    f["warnings"] = to_string(r.compiler_flags->warnings);
    f["debug"] = r.compiler_flags->debug;
    o["compilerFlags"] = std::move(f);
  }
  return jsonlite::to_json(Value(std::move(o)));
}

std::string request_digest(const ExecutionRequest& request) {
  return request_hash(canonicalize_request(request));
}

}  // namespace warden
