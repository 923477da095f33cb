#pragma once

#include <chrono>
#include <optional>

#include "codebox/internal/fd.hpp"
#include "codebox/internal/launch.hpp"
#include "codebox/result.hpp"
#include "codebox/status.hpp"

namespace codebox::internal {

// Identifies a started child. A group leader's pgid equals its pid.
struct ProcessRef {
  int pid = -1;
  bool group_leader = false;
};

// A freshly started child and the supervisor's ends of its pipes.
struct Launched {
  ProcessRef process;
  unique_fd stdin_pipe;
  unique_fd stdout_pipe;
  unique_fd stderr_pipe;
};

// Process primitives behind the supervisor, swappable in tests.
class Backend {
 public:
  virtual ~Backend() = default;

  // Resolves argv[0] against the spec's PATH; a miss is ENOENT and starts nothing.
  virtual Result<Launched> launch(const LaunchSpec& spec) = 0;

  // Reaps the child. With a timeout, an overrun escalates SIGTERM, kill_grace, SIGKILL and
  // reports errc::timeout once the child is reaped. A group leader's group is killed after
  // every reap so no descendant outlives the call.
  virtual Result<ExitStatus> wait(const ProcessRef& process,
                                  std::optional<std::chrono::milliseconds> timeout,
                                  std::chrono::milliseconds kill_grace) = 0;

  // SIGKILL to the child, or to its whole group when it leads one. ESRCH is not an error.
  virtual Result<void> kill(const ProcessRef& process) = 0;
};

class ScopedBackendOverride {
 public:
  explicit ScopedBackendOverride(Backend& backend);
  ~ScopedBackendOverride();
  ScopedBackendOverride(const ScopedBackendOverride&) = delete;
  ScopedBackendOverride& operator=(const ScopedBackendOverride&) = delete;

 private:
  Backend* previous_ = nullptr;
};

Backend& default_backend();

}  // namespace codebox::internal
