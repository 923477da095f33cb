#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "codebox/result.hpp"
#include "codebox/status.hpp"

namespace codebox::internal {

// Primitives the escalation runs on; the POSIX backend binds them to one pid.
struct WaitOps {
  // Waits up to the duration; empty while the child is still running.
  std::function<Result<std::optional<ExitStatus>>(std::chrono::milliseconds)> wait_for;
  // Waits without a bound.
  std::function<Result<ExitStatus>()> reap;
  std::function<Result<void>()> terminate;
  std::function<Result<void>()> kill;
  // Runs once the child is reaped, on every path. Empty when there is nothing to clean up.
  std::function<Result<void>()> sweep;
};

// No timeout: reap and sweep. With a timeout: wait, then terminate, wait kill_grace, then
// kill and reap. An overrun always ends with the child reaped, the sweep run and
// errc::timeout, whether the child died from SIGTERM or SIGKILL.
Result<ExitStatus> wait_with_timeout(const WaitOps& ops,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::chrono::milliseconds kill_grace);

}  // namespace codebox::internal
