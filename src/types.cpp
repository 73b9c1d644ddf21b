#include "warden/types.hpp"

#include <algorithm>
#include <cctype>

namespace warden {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

std::string to_string(Language lang) {
  switch (lang) {
    case Language::javascript: return "javascript";
    case Language::typescript: return "typescript";
    case Language::python:     return "python";
    case Language::rust:       return "rust";
    case Language::c:          return "c";
    case Language::cpp:        return "cpp";
  }
  return "unknown";
}

std::optional<Language> language_from_string(std::string_view id) {
  const std::string s = lower(id);
  if (s == "javascript" || s == "js" || s == "node") return Language::javascript;
  if (s == "typescript" || s == "ts") return Language::typescript;
  if (s == "python" || s == "py" || s == "python3") return Language::python;
  if (s == "rust" || s == "rs") return Language::rust;
  if (s == "c") return Language::c;
  if (s == "cpp" || s == "c++" || s == "cxx") return Language::cpp;
  return std::nullopt;
}

bool requires_compilation(Language lang) {
  switch (lang) {
    case Language::javascript:
    case Language::python:
      return false;
    case Language::typescript:
    case Language::rust:
    case Language::c:
    case Language::cpp:
      return true;
  }
  return false;
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:                   return "";
    case ErrorCode::invalid_request:        return "invalid_request";
    case ErrorCode::code_too_large:         return "code_too_large";
    case ErrorCode::input_too_large:        return "input_too_large";
    case ErrorCode::invalid_limits:         return "invalid_limits";
    case ErrorCode::invalid_compiler_flags: return "invalid_compiler_flags";
    case ErrorCode::unsupported_language:   return "unsupported_language";
    case ErrorCode::security_violation:     return "security_violation";
    case ErrorCode::not_initialized:        return "not_initialized";
    case ErrorCode::initialization_failed:  return "initialization_failed";
    case ErrorCode::compile_error:          return "compile_error";
    case ErrorCode::timeout:                return "timeout";
    case ErrorCode::memory_limit:           return "memory_limit";
    case ErrorCode::output_limit:           return "output_limit";
    case ErrorCode::runtime_error:          return "runtime_error";
    case ErrorCode::spawn_failed:           return "spawn_failed";
    case ErrorCode::sandbox_unavailable:    return "sandbox_unavailable";
    case ErrorCode::cache_integrity_failed: return "cache_integrity_failed";
    case ErrorCode::toolchain_unavailable:  return "toolchain_unavailable";
    case ErrorCode::json_parse_error:       return "json_parse_error";
  }
  return "unknown";
}

bool LimitsPatch::empty() const {
  return !timeout_ms && !max_memory_mb && !max_output_size && !max_input_size &&
         !allow_network && !allow_file_system && !allow_env && !allow_process;
}

std::string to_string(OptimizationLevel level) {
  switch (level) {
    case OptimizationLevel::O0: return "O0";
    case OptimizationLevel::O1: return "O1";
    case OptimizationLevel::O2: return "O2";
    case OptimizationLevel::O3: return "O3";
    case OptimizationLevel::Os: return "Os";
    case OptimizationLevel::Oz: return "Oz";
  }
  return "O2";
}

std::string to_string(WarningLevel level) {
  switch (level) {
    case WarningLevel::minimal:  return "minimal";
    case WarningLevel::all:      return "all";
    case WarningLevel::extra:    return "extra";
    case WarningLevel::pedantic: return "pedantic";
  }
  return "minimal";
}

std::optional<OptimizationLevel> optimization_from_string(std::string_view s) {
  if (s == "O0") return OptimizationLevel::O0;
  if (s == "O1") return OptimizationLevel::O1;
  if (s == "O2") return OptimizationLevel::O2;
  if (s == "O3") return OptimizationLevel::O3;
  if (s == "Os") return OptimizationLevel::Os;
  if (s == "Oz") return OptimizationLevel::Oz;
  return std::nullopt;
}

std::optional<WarningLevel> warnings_from_string(std::string_view s) {
  if (s == "minimal") return WarningLevel::minimal;
  if (s == "all") return WarningLevel::all;
  if (s == "extra") return WarningLevel::extra;
  if (s == "pedantic") return WarningLevel::pedantic;
  return std::nullopt;
}

bool is_valid_standard(Language lang, std::string_view standard) {
  if (standard.empty()) return true;
  switch (lang) {
    case Language::cpp:
      return standard == "c++11" || standard == "c++14" || standard == "c++17" ||
             standard == "c++20" || standard == "c++23";
    case Language::c:
      return standard == "c99" || standard == "c11" || standard == "c17";
    case Language::rust:
      return standard == "2015" || standard == "2018" || standard == "2021";
    case Language::typescript:
      return standard == "es2017" || standard == "es2020" || standard == "es2022";
    case Language::javascript:
    case Language::python:
      return false;
  }
  return false;
}

std::string default_standard(Language lang) {
  switch (lang) {
    case Language::cpp:        return "c++17";
    case Language::c:          return "c11";
    case Language::rust:       return "2021";
    case Language::typescript: return "es2020";
    case Language::javascript:
    case Language::python:
      return "";
  }
  return "";
}

void ExecutionResult::finalize() {
  success = exit_code == 0 && !metadata.timeout_hit && !metadata.memory_limit_hit &&
            !metadata.output_limit_hit && !error.has_value();
}

}  // namespace warden
