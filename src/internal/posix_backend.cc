#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <climits>
#include <csignal>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "codebox/internal/backend.hpp"
#include "codebox/internal/clock.hpp"
#include "codebox/internal/wait_policy.hpp"
#include "codebox/platform.hpp"

namespace codebox::internal {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(1);
constexpr int kMaxScannedFds = 4096;

Error spawn_error(int code, std::string context) {
  return Error{.code = std::error_code(code, std::system_category()),
               .context = std::move(context)};
}

// Descriptors that would survive exec in the child: open and without FD_CLOEXEC.
std::vector<int> inheritable_fds() {
  std::vector<int> candidates;
#if CODEBOX_PLATFORM_LINUX
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
    const auto name = entry.path().filename().string();
    if (!name.empty() && std::all_of(name.begin(), name.end(), ::isdigit)) {
      candidates.push_back(std::stoi(name));
    }
  }
  if (ec) {
    candidates.clear();
  }
#endif
  if (candidates.empty()) {
    long limit = ::sysconf(_SC_OPEN_MAX);
    int upper = (limit < 0 || limit > kMaxScannedFds) ? kMaxScannedFds : static_cast<int>(limit);
    for (int fd = 0; fd < upper; ++fd) {
      candidates.push_back(fd);
    }
  }

  std::vector<int> inheritable;
  for (int fd : candidates) {
    if (fd <= STDERR_FILENO) {
      continue;
    }
    // The directory stream's own descriptor is already closed here and fails F_GETFD.
    int flags = ::fcntl(fd, F_GETFD);
    if (flags != -1 && (flags & FD_CLOEXEC) == 0) {
      inheritable.push_back(fd);
    }
  }
  return inheritable;
}

// posix_spawn file actions and attributes for one launch, destroyed with the plan.
class SpawnPlan {
 public:
  SpawnPlan() = default;
  SpawnPlan(const SpawnPlan&) = delete;
  SpawnPlan& operator=(const SpawnPlan&) = delete;
  ~SpawnPlan() {
    if (actions_ready_) {
      posix_spawn_file_actions_destroy(&actions_);
    }
    if (attr_ready_) {
      posix_spawnattr_destroy(&attr_);
    }
  }

  Result<void> init() {
    if (auto ok = check(posix_spawn_file_actions_init(&actions_), "file_actions_init"); !ok) {
      return ok;
    }
    actions_ready_ = true;
    if (auto ok = check(posix_spawnattr_init(&attr_), "spawnattr_init"); !ok) {
      return ok;
    }
    attr_ready_ = true;
    return {};
  }

  // New process group when asked; SIGPIPE back to default and nothing masked, whatever
  // the host has set.
  Result<void> set_attributes(bool new_process_group) {
    short flags = POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
    if (new_process_group) {
      flags = static_cast<short>(flags | POSIX_SPAWN_SETPGROUP);
      if (auto ok = check(posix_spawnattr_setpgroup(&attr_, 0), "spawnattr_setpgroup"); !ok) {
        return ok;
      }
    }
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    if (auto ok = check(posix_spawnattr_setsigdefault(&attr_, &defaults), "setsigdefault"); !ok) {
      return ok;
    }
    sigset_t none;
    sigemptyset(&none);
    if (auto ok = check(posix_spawnattr_setsigmask(&attr_, &none), "setsigmask"); !ok) {
      return ok;
    }
    return check(posix_spawnattr_setflags(&attr_, flags), "spawnattr_setflags");
  }

  Result<void> redirect(int from, int to) {
    return check(posix_spawn_file_actions_adddup2(&actions_, from, to), "file_actions_adddup2");
  }

  Result<void> read_null(int target) {
    return check(posix_spawn_file_actions_addopen(&actions_, target, "/dev/null", O_RDONLY, 0),
                 "file_actions_addopen");
  }

  // Threads that open descriptors without O_CLOEXEC would otherwise leak them into the child.
  Result<void> close_inherited() {
    for (int fd : inheritable_fds()) {
      if (auto ok = check(posix_spawn_file_actions_addclose(&actions_, fd), "addclose"); !ok) {
        return ok;
      }
    }
    return {};
  }

  const posix_spawn_file_actions_t* actions() const { return &actions_; }
  const posix_spawnattr_t* attributes() const { return &attr_; }

 private:
  static Result<void> check(int rc, const char* what) {
    if (rc != 0) {
      return spawn_error(rc, std::string("posix_spawn ") + what);
    }
    return {};
  }

  posix_spawn_file_actions_t actions_{};
  posix_spawnattr_t attr_{};
  bool actions_ready_ = false;
  bool attr_ready_ = false;
};

std::vector<char*> null_terminated(const std::vector<std::string>& items) {
  std::vector<char*> pointers;
  pointers.reserve(items.size() + 1);
  for (const auto& item : items) {
    pointers.push_back(const_cast<char*>(item.c_str()));
  }
  pointers.push_back(nullptr);
  return pointers;
}

Result<std::optional<ExitStatus>> reap_nohang(pid_t pid) {
  int raw = 0;
  pid_t rv = 0;
  do {
    rv = ::waitpid(pid, &raw, WNOHANG);
  } while (rv == -1 && errno == EINTR);
  if (rv == -1) {
    return errno_error("waitpid");
  }
  if (rv == 0) {
    return std::optional<ExitStatus>();
  }
  return std::optional<ExitStatus>(ExitStatus::from_wait_status(raw));
}

Result<ExitStatus> reap_blocking(pid_t pid) {
  int raw = 0;
  pid_t rv = 0;
  do {
    rv = ::waitpid(pid, &raw, 0);
  } while (rv == -1 && errno == EINTR);
  if (rv == -1) {
    return errno_error("waitpid");
  }
  return ExitStatus::from_wait_status(raw);
}

// Used where pidfds are missing or refused: non-blocking reaps paced by the clock seam.
Result<std::optional<ExitStatus>> reap_by_polling(pid_t pid, std::chrono::milliseconds budget) {
  auto& clock = default_clock();
  const auto deadline = clock.now() + budget;
  while (true) {
    auto status = reap_nohang(pid);
    if (!status || *status || clock.now() >= deadline) {
      return status;
    }
    clock.sleep_for(kReapPollInterval);
  }
}

Result<std::optional<ExitStatus>> reap_within(pid_t pid, std::chrono::milliseconds budget) {
#if defined(SYS_pidfd_open)
  unique_fd pidfd(static_cast<int>(::syscall(SYS_pidfd_open, pid, 0)));
  if (!pidfd) {
    if (errno == ENOSYS || errno == EPERM) {
      return reap_by_polling(pid, budget);
    }
    return errno_error("pidfd_open");
  }
  auto& clock = default_clock();
  const auto deadline = clock.now() + budget;
  while (true) {
    auto status = reap_nohang(pid);
    if (!status || *status) {
      return status;
    }
    auto left = remaining_until(clock, deadline);
    if (left.count() == 0) {
      return std::optional<ExitStatus>();
    }
    pollfd readable{.fd = pidfd.get(), .events = POLLIN, .revents = 0};
    if (::poll(&readable, 1, static_cast<int>(std::min<long long>(left.count(), INT_MAX))) == -1 &&
        errno != EINTR) {
      return errno_error("poll pidfd");
    }
  }
#else
  return reap_by_polling(pid, budget);
#endif
}

Result<void> deliver(const ProcessRef& process, int signo) {
  pid_t target = process.group_leader ? -process.pid : process.pid;
  if (::kill(target, signo) == -1 && errno != ESRCH) {
    return errno_error(process.group_leader ? "killpg" : "kill");
  }
  return {};
}

class PosixBackend final : public Backend {
 public:
  Result<Launched> launch(const LaunchSpec& spec) override {
    if (spec.argv.empty() || spec.argv.front().empty()) {
      return Error{.code = make_error_code(errc::empty_argv), .context = "launch"};
    }
    const auto& program = spec.argv.front();
    auto executable = resolve_program(program, spec.envp);
    if (!executable) {
      return spawn_error(ENOENT, "spawn " + program);
    }

    SpawnPlan plan;
    if (auto ok = plan.init(); !ok) {
      return ok.error();
    }
    if (auto ok = plan.set_attributes(spec.new_process_group); !ok) {
      return ok.error();
    }

    // Pipes are close-on-exec; only the dup2'd copies on 0/1/2 reach the child. The
    // child's ends are closed here once the spawn has happened.
    Launched launched;
    std::vector<unique_fd> child_ends;
    if (spec.pipe_stdin) {
      auto pipe = make_pipe();
      if (!pipe) {
        return pipe.error();
      }
      if (auto ok = plan.redirect(pipe->read_end.get(), STDIN_FILENO); !ok) {
        return ok.error();
      }
      child_ends.push_back(std::move(pipe->read_end));
      launched.stdin_pipe = std::move(pipe->write_end);
    } else if (auto ok = plan.read_null(STDIN_FILENO); !ok) {
      return ok.error();
    }

    for (auto [target, parent_end] : {std::pair{STDOUT_FILENO, &launched.stdout_pipe},
                                      std::pair{STDERR_FILENO, &launched.stderr_pipe}}) {
      auto pipe = make_pipe();
      if (!pipe) {
        return pipe.error();
      }
      if (auto ok = plan.redirect(pipe->write_end.get(), target); !ok) {
        return ok.error();
      }
      child_ends.push_back(std::move(pipe->write_end));
      *parent_end = std::move(pipe->read_end);
    }

    if (auto ok = plan.close_inherited(); !ok) {
      return ok.error();
    }

    auto argv = null_terminated(spec.argv);
    auto envp = null_terminated(spec.envp);
    pid_t pid = -1;
    int rc = ::posix_spawn(&pid, executable->c_str(), plan.actions(), plan.attributes(),
                           argv.data(), envp.data());
    if (rc != 0) {
      return spawn_error(rc, "spawn " + program);
    }
    launched.process = ProcessRef{.pid = pid, .group_leader = spec.new_process_group};
    return launched;
  }

  Result<ExitStatus> wait(const ProcessRef& process,
                          std::optional<std::chrono::milliseconds> timeout,
                          std::chrono::milliseconds kill_grace) override {
    const pid_t pid = process.pid;
    WaitOps ops;
    ops.wait_for = [pid](std::chrono::milliseconds budget) { return reap_within(pid, budget); };
    ops.reap = [pid]() { return reap_blocking(pid); };
    ops.terminate = [process]() { return deliver(process, SIGTERM); };
    ops.kill = [process]() { return deliver(process, SIGKILL); };
    if (process.group_leader) {
      // The group outlives its reaped leader while any member is alive.
      ops.sweep = [process]() { return deliver(process, SIGKILL); };
    }
    return wait_with_timeout(ops, timeout, kill_grace);
  }

  Result<void> kill(const ProcessRef& process) override { return deliver(process, SIGKILL); }
};

std::atomic<Backend*> g_backend_override{nullptr};

}  // namespace

ScopedBackendOverride::ScopedBackendOverride(Backend& backend)
    : previous_(g_backend_override.exchange(&backend)) {}

ScopedBackendOverride::~ScopedBackendOverride() { g_backend_override.store(previous_); }

Backend& default_backend() {
  if (auto* injected = g_backend_override.load()) {
    return *injected;
  }
  static PosixBackend backend;
  return backend;
}

}  // namespace codebox::internal
