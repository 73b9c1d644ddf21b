#pragma once

// warden/runtime.hpp — JSON wire codec for requests, results and reports.
//
// Field names are camelCase on the wire. Parsing is strict about types: a
// present field of the wrong JSON type is an error, an absent optional field
// takes its default. Range checks (positive limits, sizes) belong to the
// engine, not the codec.

#include <string>

#include "warden/compile_cache.hpp"
#include "warden/jsonlite.hpp"
#include "warden/types.hpp"

namespace warden {

constexpr std::size_t kMaxRequestPayloadBytes = 2 * 1024 * 1024;

// On failure returns a default request and sets *error.
ExecutionRequest parse_request_json(const std::string& json_payload, std::string* error);
ExecutionRequest parse_request_object(const jsonlite::Object& obj, std::string* error);
LimitsPatch parse_limits_patch(const jsonlite::Object& obj, std::string* error);

jsonlite::Value result_to_value(const ExecutionResult& result);
std::string result_to_json(const ExecutionResult& result);
std::string limits_to_json(const ExecutionLimits& limits);
std::string statistics_to_json(const ExecutionStatistics& stats);
std::string environment_info_to_json(const RuntimeEnvironmentInfo& info);
std::string cache_stats_to_json(const CompilationCache::Stats& stats);

// Failed result for an error raised before or outside dispatch.
std::string error_to_json(ErrorCode code, const std::string& message);

// Deterministic encoding of everything that influences execution.
std::string canonicalize_request(const ExecutionRequest& request);
std::string request_digest(const ExecutionRequest& request);

}  // namespace warden
