#ifndef _WIN32

#include "warden/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "warden/errors.hpp"

extern char** environ;

namespace fs = std::filesystem;

namespace warden {

namespace {

constexpr int kPollIntervalMs = 5;

struct Pipe {
  int fds[2]{-1, -1};

  ~Pipe() {
    close_read();
    close_write();
  }
  bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
  int read_end() const { return fds[0]; }
  int write_end() const { return fds[1]; }
  void close_read() {
    if (fds[0] >= 0) ::close(fds[0]);
    fds[0] = -1;
  }
  void close_write() {
    if (fds[1] >= 0) ::close(fds[1]);
    fds[1] = -1;
  }
};

class FdGuard {
 public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() { reset(); }
  int get() const { return fd_; }
  void reset() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_;
};

void set_limit(int resource, rlim_t soft, rlim_t hard) {
  struct rlimit rl;
  rl.rlim_cur = soft;
  rl.rlim_max = hard;
  setrlimit(resource, &rl);
}

// Appends up to the remaining combined budget. Returns false once the budget
// is exceeded.
bool append_bounded(InstanceResult& result, std::string& dst, const char* src,
                    std::size_t n, std::size_t limit) {
  result.output_bytes += n;
  const std::size_t used = result.stdout_text.size() + result.stderr_text.size();
  const std::size_t avail = used < limit ? limit - used : 0;
  const std::size_t take = std::min(n, avail);
  dst.append(src, take);
  return take == n;
}

std::vector<std::string> build_environment(const InstanceSpec& spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env && environ) {
    for (char** e = environ; *e; ++e) {
      const std::string entry(*e);
      const auto eq = entry.find('=');
      if (eq == std::string::npos) continue;
      merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

bool contains_any(const std::string& hay, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (!n.empty() && hay.find(n) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

std::string to_string(TerminationReason reason) {
  switch (reason) {
    case TerminationReason::none:         return "none";
    case TerminationReason::cancelled:    return "cancelled";
    case TerminationReason::deadline:     return "deadline";
    case TerminationReason::cpu_limit:    return "cpu_limit";
    case TerminationReason::memory_limit: return "memory_limit";
    case TerminationReason::output_limit: return "output_limit";
  }
  return "none";
}

SandboxConfig SandboxConfig::from_env() {
  SandboxConfig cfg;
  const char* v = std::getenv("WARDEN_SANDBOX_DISABLED");
  if (v && std::string(v) == "1") cfg.sandbox_enabled = false;
  return cfg;
}

PosixInstanceBackend::PosixInstanceBackend(SandboxConfig config) : config_(config) {}

InstanceResult PosixInstanceBackend::launch(const InstanceSpec& spec,
                                            const CancellationToken& cancel) {
  InstanceResult result;
  result.sandboxed = config_.sandbox_enabled;
  const auto start = std::chrono::steady_clock::now();

  // Everything the child needs is materialized before fork: only
  // async-signal-safe calls are allowed between fork and execve.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_environment(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const std::string stdin_path = spec.stdin_path.empty() ? "/dev/null" : spec.stdin_path;
  FdGuard in_fd(::open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC));
  if (in_fd.get() < 0) {
    result.error_message = "stdin_unavailable: " + std::string(std::strerror(errno));
    return result;
  }

  Pipe out_pipe, err_pipe, exec_status;
  if (!out_pipe.open() || !err_pipe.open() || !exec_status.open()) {
    result.error_message = "spawn_failed: pipe: " + std::string(std::strerror(errno));
    return result;
  }

  const bool sandbox = config_.sandbox_enabled;
  const rlim_t cpu_seconds = static_cast<rlim_t>((spec.timeout_ms + 999) / 1000 + 1);

  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = "spawn_failed: fork: " + std::string(std::strerror(errno));
    return result;
  }

  if (pid == 0) {
    setsid();
    if (sandbox && spec.isolate_network) {
      // Best effort: requires CAP_SYS_ADMIN without a user namespace.
      (void)unshare(CLONE_NEWNET);
    }
    dup2(in_fd.get(), STDIN_FILENO);
    dup2(out_pipe.write_end(), STDOUT_FILENO);
    dup2(err_pipe.write_end(), STDERR_FILENO);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
      int e = errno;
      (void)!write(exec_status.write_end(), &e, sizeof(e));
      _exit(127);
    }

    if (sandbox) {
      if (spec.memory_mode == MemoryCeilingMode::address_space && spec.max_memory_bytes > 0) {
        set_limit(RLIMIT_AS, spec.max_memory_bytes, spec.max_memory_bytes);
      }
      if (spec.max_file_descriptors > 0) {
        set_limit(RLIMIT_NOFILE, spec.max_file_descriptors, spec.max_file_descriptors);
      }
      if (spec.timeout_ms > 0) {
        set_limit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1);
      }
      set_limit(RLIMIT_CORE, 0, 0);
      if (!spec.allow_file_writes) {
        set_limit(RLIMIT_FSIZE, 0, 0);
      }
    }

    execve(spec.command.c_str(), argv.data(), envp.data());
    int e = errno;
    (void)!write(exec_status.write_end(), &e, sizeof(e));
    _exit(127);
  }

  out_pipe.close_write();
  err_pipe.close_write();
  exec_status.close_write();
  in_fd.reset();

  // execve closes the CLOEXEC status pipe on success; otherwise the child
  // reports errno through it.
  int child_errno = 0;
  ssize_t sn;
  do {
    sn = ::read(exec_status.read_end(), &child_errno, sizeof(child_errno));
  } while (sn < 0 && errno == EINTR);
  if (sn == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    result.error_message = "spawn_failed: exec " + spec.command + ": " + std::strerror(child_errno);
    return result;
  }

  const bool has_deadline = spec.timeout_ms > 0;
  const auto deadline = start + std::chrono::milliseconds(spec.timeout_ms);

  pollfd fds[2] = {{out_pipe.read_end(), POLLIN, 0}, {err_pipe.read_end(), POLLIN, 0}};
  std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
  char buf[8192];
  int status = 0;
  struct rusage usage {};
  bool exited = false;

  auto terminate = [&](TerminationReason reason) {
    if (result.termination != TerminationReason::none) return;
    result.termination = reason;
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
  };

  while (true) {
    if (!exited) {
      pid_t w = wait4(pid, &status, WNOHANG, &usage);
      if (w == pid) exited = true;
    }
    if (exited) {
      // Drain whatever the program flushed before exiting. Orphaned
      // grandchildren may hold the pipes open, so never block here.
      for (int i = 0; i < 2; ++i) {
        if (fds[i].fd < 0) continue;
        fcntl(fds[i].fd, F_SETFL, O_NONBLOCK);
        while (result.termination == TerminationReason::none) {
          ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
          if (n <= 0) break;
          if (!append_bounded(result, *sinks[i], buf, static_cast<std::size_t>(n),
                              spec.max_output_bytes)) {
            result.termination = TerminationReason::output_limit;
          }
        }
      }
      break;
    }

    if (cancel.cancelled()) {
      terminate(TerminationReason::cancelled);
    } else if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      terminate(TerminationReason::deadline);
    }

    int pr = poll(fds, 2, kPollIntervalMs);
    if (pr < 0 && errno != EINTR) break;
    if (pr <= 0) continue;
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n <= 0) {
        fds[i].fd = -1;
        continue;
      }
      // Nothing produced after a tripped bound is kept.
      if (result.termination != TerminationReason::none) continue;
      if (!append_bounded(result, *sinks[i], buf, static_cast<std::size_t>(n),
                          spec.max_output_bytes)) {
        terminate(TerminationReason::output_limit);
      }
    }
  }

  if (!exited) {
    kill(-pid, SIGKILL);
    wait4(pid, &status, 0, &usage);
  }
  // Reap-independent teardown of anything left in the group.
  kill(-pid, SIGKILL);

  result.duration_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start).count());
  // ru_maxrss is reported in kilobytes on Linux.
  result.peak_memory_bytes = static_cast<std::uint64_t>(usage.ru_maxrss) * 1024u;

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }

  if (result.termination == TerminationReason::none) {
    if (result.term_signal == SIGXCPU) {
      result.termination = TerminationReason::cpu_limit;
    } else if (spec.memory_mode != MemoryCeilingMode::none && result.exit_code != 0 &&
               (contains_any(result.stderr_text, spec.oom_markers) ||
                (spec.max_memory_bytes > 0 && result.peak_memory_bytes >= spec.max_memory_bytes))) {
      result.termination = TerminationReason::memory_limit;
    }
  }
  return result;
}

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

ScratchDir::ScratchDir(const std::string& root) {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    throw InfrastructureError("scratch root unavailable: " + root + ": " + ec.message(),
                              ErrorCode::sandbox_unavailable);
  }
  std::string tmpl = (fs::path(root) / "inst-XXXXXX").string();
  if (!mkdtemp(tmpl.data())) {
    throw InfrastructureError("mkdtemp failed under " + root + ": " + std::strerror(errno),
                              ErrorCode::sandbox_unavailable);
  }
  path_ = tmpl;
}

ScratchDir::~ScratchDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string ScratchDir::file(const std::string& name) const {
  return (fs::path(path_) / name).string();
}

std::string ScratchDir::write_file(const std::string& name, std::string_view data,
                                   bool executable) {
  const std::string target = file(name);
  std::error_code ec;
  fs::create_directories(fs::path(target).parent_path(), ec);
  {
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) throw InfrastructureError("cannot create " + target, ErrorCode::sandbox_unavailable);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) throw InfrastructureError("cannot write " + target, ErrorCode::sandbox_unavailable);
  }
  if (executable) {
    fs::permissions(target, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) throw InfrastructureError("chmod failed for " + target + ": " + ec.message(),
                                      ErrorCode::sandbox_unavailable);
  }
  return target;
}

std::optional<std::string> ScratchDir::read_file(const std::string& name) const {
  std::ifstream ifs(file(name), std::ios::binary);
  if (!ifs) return std::nullopt;
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

std::optional<std::string> resolve_executable(const std::string& name) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (access(name.c_str(), X_OK) == 0) return fs::absolute(name).string();
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  std::stringstream dirs(path_env && path_env[0] ? path_env : "/usr/local/bin:/usr/bin:/bin");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) continue;
    const fs::path candidate = fs::path(dir) / name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
      return fs::absolute(candidate).string();
    }
  }
  return std::nullopt;
}

}  // namespace warden

#endif
