#pragma once

// warden/errors.hpp — Exception taxonomy.
//
// Everything raised before an isolated instance exists is one of these types
// and allocates nothing engine-side. Once an instance is running, the target
// program's own failures (non-zero exit, exceeded bounds, compile errors) are
// data in ExecutionResult, never exceptions. InfrastructureError is the only
// type that represents a genuine engine or host fault.

#include <stdexcept>
#include <string>

#include "warden/types.hpp"

namespace warden {

class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Malformed request: empty code, oversized payload, invalid limits or flags.
class CodeExecutionError : public EngineError {
 public:
  explicit CodeExecutionError(const std::string& message,
                              ErrorCode code = ErrorCode::invalid_request)
      : EngineError(code, message) {}
};

class UnsupportedLanguageError : public EngineError {
 public:
  explicit UnsupportedLanguageError(const std::string& language)
      : EngineError(ErrorCode::unsupported_language,
                    "Unsupported language: " + language),
        language_(language) {}

  UnsupportedLanguageError(const std::string& language, const std::string& message)
      : EngineError(ErrorCode::unsupported_language, message), language_(language) {}

  const std::string& language() const noexcept { return language_; }

 private:
  std::string language_;
};

class SecurityError : public EngineError {
 public:
  SecurityError(const std::string& category, const std::string& detail)
      : EngineError(ErrorCode::security_violation,
                    "Security violation [" + category + "]: " + detail),
        category_(category) {}

  const std::string& category() const noexcept { return category_; }

 private:
  std::string category_;
};

class InitializationError : public EngineError {
 public:
  explicit InitializationError(const std::string& message,
                               ErrorCode code = ErrorCode::initialization_failed)
      : EngineError(code, message) {}
};

class InfrastructureError : public EngineError {
 public:
  explicit InfrastructureError(const std::string& message,
                               ErrorCode code = ErrorCode::spawn_failed)
      : EngineError(code, message) {}
};

// Raised by a compile step. The engine converts it into a failed result and
// never caches the attempt.
class CompileError : public EngineError {
 public:
  CompileError(const std::string& message, std::string diagnostics, int exit_code,
               bool timed_out = false)
      : EngineError(ErrorCode::compile_error, message),
        diagnostics_(std::move(diagnostics)),
        exit_code_(exit_code),
        timed_out_(timed_out) {}

  const std::string& diagnostics() const noexcept { return diagnostics_; }
  int exit_code() const noexcept { return exit_code_; }
  bool timed_out() const noexcept { return timed_out_; }

 private:
  std::string diagnostics_;
  int exit_code_;
  bool timed_out_;
};

}  // namespace warden
