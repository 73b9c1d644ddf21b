#pragma once

// warden/security.hpp — Static pre-execution screening.
//
// The validator runs before any instance is created. It is a denylist, not a
// proof of safety: the instance backend's rlimits and namespaces remain the
// enforcement boundary. Every rejection raises SecurityError naming the
// offending category so callers can report it without parsing messages.
//
// Rules may name capabilities that lift them. A rule is skipped when the
// resolved limits grant one of those (e.g. allowFileSystem lifts
// "filesystem" rules); rules that name none are always enforced.
//
// All patterns are compiled once at construction; the validator is immutable
// afterwards and safe to share across threads.

#include <map>
#include <regex>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

enum class Capability { network, file_system, environment, process };

struct DenyRule {
  std::string category;
  std::string pattern;  // ECMAScript regex source, kept for diagnostics
  std::regex regex;
  std::vector<Capability> lifted_by;  // any granted capability skips the rule
};

bool granted(const ExecutionLimits& limits, Capability capability);

struct SecurityPolicy {
  std::size_t max_args{20};
  std::size_t max_arg_length{1000};
  std::size_t max_env_vars{50};
  std::size_t max_env_key_length{100};
  std::size_t max_env_value_length{1000};
  int max_bracket_depth{100};
  std::size_t max_char_run{1000};
  std::size_t max_line_length{10000};
};

class SecurityValidator {
 public:
  explicit SecurityValidator(SecurityPolicy policy = {});

  void validate_code(const std::string& code, Language language, const ExecutionLimits& limits) const;
  void validate_args(const std::vector<std::string>& args) const;
  void validate_env(const std::map<std::string, std::string>& env) const;
  void validate_input(const std::string& input) const;

  // Convenience: all of the above in pipeline order.
  void validate_request(const ExecutionRequest& request, Language language,
                        const ExecutionLimits& limits) const;

  const std::vector<DenyRule>& rules_for(Language language) const;
  const SecurityPolicy& policy() const { return policy_; }

 private:
  void check_structure(const std::string& code) const;

  SecurityPolicy policy_;
  std::vector<std::vector<DenyRule>> language_rules_;  // indexed by Language
  std::vector<DenyRule> arg_rules_;
  std::vector<DenyRule> env_key_rules_;
};

}  // namespace warden
