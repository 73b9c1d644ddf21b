#include "warden/security.hpp"

#include <algorithm>

#include "warden/errors.hpp"

namespace warden {

namespace {

using C = Capability;

struct RuleSpec {
  const char* category;
  const char* pattern;
  std::vector<Capability> lifted_by;
  bool icase{false};
};

DenyRule compile_rule(const RuleSpec& spec) {
  auto flags = std::regex::ECMAScript | std::regex::optimize;
  if (spec.icase) flags |= std::regex::icase;
  return DenyRule{spec.category, spec.pattern, std::regex(spec.pattern, flags), spec.lifted_by};
}

std::vector<DenyRule> compile_all(const std::vector<RuleSpec>& specs) {
  std::vector<DenyRule> out;
  out.reserve(specs.size());
  for (const auto& s : specs) out.push_back(compile_rule(s));
  return out;
}

// JavaScript and TypeScript share one list. process.stdin/stdout/stderr and
// argv stay reachable so programs can do ordinary I/O.
std::vector<RuleSpec> script_rules() {
  return {
      {"dynamic_evaluation", R"re(\beval\s*\()re", {}},
      {"dynamic_evaluation", R"re(\bFunction\s*\()re", {}},
      {"dynamic_evaluation", R"re(\bnew\s+Function\b)re", {}},
      {"deferred_execution", R"re(\bset(Timeout|Interval|Immediate)\s*\()re", {}},
      {"module_import", R"re(\brequire\s*\()re", {}},
      {"module_import", R"re(\bimport\s*\()re", {}},
      {"module_import", R"re((^|[\n;])[ \t]?import\s+[\w{*'"])re", {}},
      {"process_control", R"re(\bprocess\s*\.\s*(exit|kill|abort|binding|_linkedBinding|dlopen|chdir|setuid|setgid|umask)\b)re", {}},
      {"process_control", R"re(\bchild_process\b)re", {}},
      {"environment_access", R"re(\bprocess\s*\.\s*env\b)re", {C::environment}},
      {"process_control", R"re(\bprocess\s*\.(?!\s*(env|stdin|stdout|stderr|argv|hrtime)\b))re", {C::process}},
      {"process_control", R"re(\bprocess\s*\[)re", {}},
      {"host_globals", R"re(\bglobal\s*\.)re", {}},
      {"host_globals", R"re(\bglobalThis\b)re", {}},
      {"host_globals", R"re(\bBuffer\s*\.)re", {}},
      {"prototype_pollution", R"re(__proto__)re", {}},
      {"prototype_pollution", R"re(\bconstructor\s*\.\s*constructor\b)re", {}},
      {"filesystem", R"re(\bfs\s*\.)re", {C::file_system}},
      {"network", R"re(\b(net|http|https|http2|dgram|tls|dns)\s*\.)re", {C::network}},
      {"network", R"re(\bfetch\s*\()re", {C::network}},
      {"network", R"re(\b(WebSocket|XMLHttpRequest)\b)re", {C::network}},
  };
}

std::vector<RuleSpec> python_rules() {
  return {
      {"dynamic_evaluation", R"re(\beval\s*\()re", {}},
      {"dynamic_evaluation", R"re(\bexec\s*\()re", {}},
      {"dynamic_evaluation", R"re((^|[^.\w])compile\s*\()re", {}},
      {"dynamic_import", R"re(\b__import__\s*\()re", {}},
      {"dynamic_import", R"re(\bimportlib\b)re", {}},
      {"interactive_input", R"re(\b(raw_)?input\s*\()re", {}},
      {"filesystem", R"re(\bopen\s*\()re", {C::file_system}},
      {"filesystem", R"re(\bfile\s*\()re", {C::file_system}},
      {"filesystem", R"re(\b(pathlib|shutil|tempfile)\b)re", {C::file_system}},
      {"process_control", R"re(\bos\s*\.\s*(system|popen|exec\w{0,16}|spawn\w{0,16}|fork\w{0,16}|kill\w{0,16}|_exit|setuid|setgid)\b)re", {}},
      {"process_control", R"re(\b(subprocess|multiprocessing|pty)\b)re", {}},
      {"process_control", R"re(\b(import|from)\s+os\b)re", {C::process}},
      {"environment_access", R"re(\bos\s*\.\s*(environ|getenv|putenv|unsetenv)\b)re", {C::environment}},
      {"process_control", R"re(\bos\s*\.(?!\s*(environ|getenv|putenv|unsetenv)\b))re", {C::process}},
      {"host_access", R"re(\bsys\s*\.(?!\s*(stdin|stdout|stderr|argv|maxsize|version|float_info)\b))re", {}},
      {"host_access", R"re(\b(ctypes|builtins|__builtins__)\b)re", {}},
      {"host_access", R"re(\bglobals\s*\()re", {}},
      {"network", R"re(\b(socket|urllib\d?|requests|ftplib|smtplib|telnetlib|asyncio\s*\.\s*open_connection)\b)re", {C::network}},
      {"network", R"re(\bhttp\s*\.\s*(client|server)\b)re", {C::network}},
  };
}

std::vector<RuleSpec> rust_rules() {
  return {
      {"process_control", R"re(\bstd\s*::\s*process\b)re", {}},
      {"process_control", R"re(\bCommand\s*::)re", {}},
      {"filesystem", R"re(\bstd\s*::\s*fs\b)re", {C::file_system}},
      {"filesystem", R"re(\b(File|OpenOptions|DirBuilder)\s*::)re", {C::file_system}},
      {"network", R"re(\bstd\s*::\s*net\b)re", {C::network}},
      {"network", R"re(\b(TcpStream|TcpListener|UdpSocket)\b)re", {C::network}},
      {"environment_access", R"re(\bstd\s*::\s*env\b(?!\s*::\s*args\b))re", {C::environment}},
      {"environment_access", R"re(\b(option_)?env!\s*\()re", {}},
      {"compile_time_inclusion", R"re(\binclude(_str|_bytes)?!\s*\()re", {}},
      {"foreign_code", R"re(\bextern\s*")re", {}},
      {"foreign_code", R"re(#\s*!?\[\s*link\b)re", {}},
      {"foreign_code", R"re(\b(global_|naked_)?asm!\s*\()re", {}},
  };
}

// Shared by C and C++.
std::vector<RuleSpec> native_rules() {
  return {
      {"process_control", R"re(\b(system|popen|fork|vfork|execl|execlp|execle|execv|execvp|execve|execvpe|posix_spawnp?|clone|ptrace|kill)\s*\()re", {}},
      {"process_control", R"re(#\s*include\s*<\s*(unistd\.h|spawn\.h|sys/wait\.h|sys/ptrace\.h)\s*>)re", {}},
      {"filesystem", R"re(\b(fopen|freopen|open|openat|creat|unlink|mkdir|rmdir|opendir)\s*\()re", {C::file_system}},
      {"filesystem", R"re(#\s*include\s*<\s*(fstream|filesystem|fcntl\.h|sys/stat\.h|dirent\.h)\s*>)re", {C::file_system}},
      {"filesystem", R"re(\bstd\s*::\s*(filesystem|ifstream|ofstream|fstream)\b)re", {C::file_system}},
      {"network", R"re(#\s*include\s*<\s*(sys/socket\.h|netinet/[^>\n]{0,64}|arpa/[^>\n]{0,64}|netdb\.h|sys/un\.h)\s*>)re", {C::network}},
      {"network", R"re(\b(socket|gethostbyname|getaddrinfo)\s*\()re", {C::network}},
      {"environment_access", R"re(\b(getenv|secure_getenv|setenv|putenv|unsetenv)\s*\()re", {C::environment}},
      {"environment_access", R"re(\benviron\b)re", {C::environment}},
      {"compile_time_inclusion", R"re(#\s*include\s*")re", {}},
      {"compile_time_inclusion", R"re(#\s*include\s*<\s*[./])re", {}},
      {"compile_time_inclusion", R"re(#\s*include\s*<[^>\n]{0,256}\.\.)re", {}},
      {"compile_time_inclusion", R"re(#\s*include\s+[A-Za-z_])re", {}},
      {"compile_time_inclusion", R"re(#\s*(embed|include_next)\b)re", {}},
      {"foreign_code", R"re(\b(asm|__asm__|__asm)\b)re", {}},
      {"foreign_code", R"re(\b(dlopen|dlsym|syscall|mmap|mprotect)\s*\()re", {}},
  };
}

std::vector<RuleSpec> arg_rules() {
  return {
      {"shell_injection", R"re(^-{1,2}(exec|sh|bash|cmd)\b)re", {}, true},
      {"shell_injection", R"re(>\s*/)re", {}},
      {"shell_injection", R"re(\|\s*\w)re", {}},
      {"shell_injection", R"re(&&)re", {}},
      {"shell_injection", R"re(\|\|)re", {}},
      {"shell_injection", R"re(`)re", {}},
      {"shell_injection", R"re(\$\()re", {}},
  };
}

std::vector<RuleSpec> env_key_rules() {
  return {
      {"sensitive_environment", R"re(^(PATH|HOME|USER|LOGNAME|SHELL|TERM|DISPLAY|PWD|TMPDIR|IFS|ENV|BASH_ENV)$)re", {}, true},
      {"sensitive_environment", R"re(^(LD_|DYLD_|SSH_|GIT_|NPM_|NODE_|X11|RUSTUP_|CARGO_))re", {}, true},
      {"sensitive_environment", R"re(PYTHON|JAVA)re", {}, true},
      {"secret_environment", R"re((_TOKEN|_SECRET|_KEY|_PASSWORD|_PASSWD|_CREDENTIALS?)$)re", {}, true},
      {"secret_environment", R"re(^(AUTH|AWS_SECRET))re", {}, true},
  };
}

const std::regex& env_name_regex() {
  static const std::regex re(R"re(^[A-Za-z_][A-Za-z0-9_]*$)re");
  return re;
}

// Every whitespace run becomes one character: a newline if the run held one,
// otherwise a space. No \s* in a rule then spans more than one character, so
// regex_search recursion stays bounded by token length rather than input
// length.
std::string collapse_whitespace(const std::string& code) {
  std::string out;
  out.reserve(code.size());
  bool in_run = false;
  for (char c : code) {
    const bool ws = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    if (!ws) {
      out.push_back(c);
      in_run = false;
    } else if (!in_run) {
      out.push_back(c == '\n' ? '\n' : ' ');
      in_run = true;
    } else if (c == '\n') {
      out.back() = '\n';
    }
  }
  return out;
}

[[noreturn]] void reject(const std::string& category, const std::string& detail) {
  throw SecurityError(category, detail);
}

void check_rules(const std::vector<DenyRule>& rules, const std::string& subject,
                 const ExecutionLimits* limits, const std::string& what) {
  for (const auto& rule : rules) {
    if (limits && std::any_of(rule.lifted_by.begin(), rule.lifted_by.end(),
                              [&](Capability c) { return granted(*limits, c); })) {
      continue;
    }
    if (std::regex_search(subject, rule.regex)) {
      reject(rule.category, what + " matches denied pattern /" + rule.pattern + "/");
    }
  }
}

void check_char_run(const std::string& s, std::size_t max_run, const std::string& what) {
  std::size_t run = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    run = (i > 0 && s[i] == s[i - 1]) ? run + 1 : 1;
    if (run >= max_run) {
      reject("excessive_repetition",
             what + " repeats one character " + std::to_string(max_run) + " or more times");
    }
  }
}

}  // namespace

bool granted(const ExecutionLimits& limits, Capability capability) {
  switch (capability) {
    case Capability::network:     return limits.allow_network;
    case Capability::file_system: return limits.allow_file_system;
    case Capability::environment: return limits.allow_env;
    case Capability::process:     return limits.allow_process;
  }
  return false;
}

SecurityValidator::SecurityValidator(SecurityPolicy policy) : policy_(policy) {
  language_rules_.resize(kLanguageCount);
  for (Language lang : kAllLanguages) {
    std::vector<RuleSpec> specs;
    switch (lang) {
      case Language::javascript:
      case Language::typescript: specs = script_rules(); break;
      case Language::python:     specs = python_rules(); break;
      case Language::rust:       specs = rust_rules(); break;
      case Language::c:
      case Language::cpp:        specs = native_rules(); break;
    }
    language_rules_[index_of(lang)] = compile_all(specs);
  }
  arg_rules_ = compile_all(arg_rules());
  env_key_rules_ = compile_all(env_key_rules());
}

const std::vector<DenyRule>& SecurityValidator::rules_for(Language language) const {
  return language_rules_[index_of(language)];
}

void SecurityValidator::check_structure(const std::string& code) const {
  int depth = 0;
  for (char c : code) {
    if (c == '(' || c == '[' || c == '{') {
      if (++depth > policy_.max_bracket_depth) {
        reject("excessive_nesting",
               "bracket nesting deeper than " + std::to_string(policy_.max_bracket_depth));
      }
    } else if (c == ')' || c == ']' || c == '}') {
      if (depth > 0) --depth;
    }
  }

  check_char_run(code, policy_.max_char_run, "code");

  std::size_t line_len = 0;
  for (char c : code) {
    if (c == '\n') {
      line_len = 0;
      continue;
    }
    if (++line_len > policy_.max_line_length) {
      reject("excessive_line_length",
             "line longer than " + std::to_string(policy_.max_line_length) + " characters");
    }
  }
}

void SecurityValidator::validate_code(const std::string& code, Language language,
                                      const ExecutionLimits& limits) const {
  if (code.find('\0') != std::string::npos) reject("null_byte", "code contains a NUL byte");
  // Structural checks first: they bound line and run lengths before any
  // regex sees the text.
  check_structure(code);
  check_rules(rules_for(language), collapse_whitespace(code), &limits, to_string(language) + " code");
}

void SecurityValidator::validate_args(const std::vector<std::string>& args) const {
  if (args.size() > policy_.max_args) {
    reject("argument_limits", std::to_string(args.size()) + " arguments exceed the maximum of " +
                                  std::to_string(policy_.max_args));
  }
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    const std::string what = "argument " + std::to_string(i);
    if (arg.size() > policy_.max_arg_length) {
      reject("argument_limits", what + " longer than " + std::to_string(policy_.max_arg_length) + " bytes");
    }
    if (arg.find('\0') != std::string::npos) reject("null_byte", what + " contains a NUL byte");
    check_rules(arg_rules_, arg, nullptr, what);
  }
}

void SecurityValidator::validate_env(const std::map<std::string, std::string>& env) const {
  if (env.size() > policy_.max_env_vars) {
    reject("environment_limits", std::to_string(env.size()) + " variables exceed the maximum of " +
                                     std::to_string(policy_.max_env_vars));
  }
  for (const auto& [key, value] : env) {
    if (key.size() > policy_.max_env_key_length) {
      reject("environment_limits", "variable name longer than " +
                                       std::to_string(policy_.max_env_key_length) + " bytes");
    }
    if (value.size() > policy_.max_env_value_length) {
      reject("environment_limits", "value of " + key + " longer than " +
                                       std::to_string(policy_.max_env_value_length) + " bytes");
    }
    if (!std::regex_match(key, env_name_regex())) {
      reject("invalid_environment_name", "'" + key + "' is not a valid variable name");
    }
    if (value.find('\0') != std::string::npos) reject("null_byte", "value of " + key + " contains a NUL byte");
    check_rules(env_key_rules_, key, nullptr, "variable " + key);
  }
}

void SecurityValidator::validate_input(const std::string& input) const {
  if (input.find('\0') != std::string::npos) reject("null_byte", "input contains a NUL byte");
  check_char_run(input, policy_.max_char_run, "input");
}

void SecurityValidator::validate_request(const ExecutionRequest& request, Language language,
                                         const ExecutionLimits& limits) const {
  validate_code(request.code, language, limits);
  validate_args(request.args);
  validate_env(request.env);
  validate_input(request.input);
}

}  // namespace warden
