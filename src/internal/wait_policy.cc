#include "codebox/internal/wait_policy.hpp"

namespace codebox::internal {

namespace {

// Sweeps after a reap and passes the reap's result through unless the sweep fails.
Result<ExitStatus> finish(const WaitOps& ops, Result<ExitStatus> reaped) {
  if (!reaped || !ops.sweep) {
    return reaped;
  }
  auto swept = ops.sweep();
  if (!swept) {
    return swept.error();
  }
  return reaped;
}

Error overrun() { return Error{.code = make_error_code(errc::timeout), .context = "wait"}; }

}  // namespace

Result<ExitStatus> wait_with_timeout(const WaitOps& ops,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::chrono::milliseconds kill_grace) {
  if (!timeout) {
    return finish(ops, ops.reap());
  }

  auto first = ops.wait_for(*timeout);
  if (!first) {
    return first.error();
  }
  if (*first) {
    return finish(ops, **first);
  }

  if (auto termed = ops.terminate(); !termed) {
    return termed.error();
  }
  auto graced = ops.wait_for(kill_grace);
  if (!graced) {
    return graced.error();
  }

  if (!*graced) {
    if (auto killed = ops.kill(); !killed) {
      return killed.error();
    }
    auto reaped = ops.reap();
    if (!reaped) {
      return reaped.error();
    }
  }

  // The leader is gone either way; descendants that ignored SIGTERM are still swept.
  if (ops.sweep) {
    if (auto swept = ops.sweep(); !swept) {
      return swept.error();
    }
  }
  return overrun();
}

}  // namespace codebox::internal
