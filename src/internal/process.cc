#include "codebox/internal/process.hpp"

#include <utility>

#include "codebox/log.hpp"

namespace codebox::internal {

Process::Process(Launched launched) noexcept
    : ref_(launched.process),
      stdin_pipe_(std::move(launched.stdin_pipe)),
      stdout_pipe_(std::move(launched.stdout_pipe)),
      stderr_pipe_(std::move(launched.stderr_pipe)) {}

Process::Process(Process&& other) noexcept
    : ref_(std::exchange(other.ref_, ProcessRef{})),
      stdin_pipe_(std::move(other.stdin_pipe_)),
      stdout_pipe_(std::move(other.stdout_pipe_)),
      stderr_pipe_(std::move(other.stderr_pipe_)),
      reaped_(std::exchange(other.reaped_, true)) {}

Process& Process::operator=(Process&& other) noexcept {
  if (this != &other) {
    abandon();
    ref_ = std::exchange(other.ref_, ProcessRef{});
    stdin_pipe_ = std::move(other.stdin_pipe_);
    stdout_pipe_ = std::move(other.stdout_pipe_);
    stderr_pipe_ = std::move(other.stderr_pipe_);
    reaped_ = std::exchange(other.reaped_, true);
  }
  return *this;
}

Process::~Process() { abandon(); }

Result<ExitStatus> Process::wait(std::optional<std::chrono::milliseconds> timeout,
                                 std::chrono::milliseconds kill_grace) {
  if (ref_.pid <= 0 || reaped_) {
    return Error{.code = make_error_code(errc::no_process), .context = "wait"};
  }
  auto status = default_backend().wait(ref_, timeout, kill_grace);
  if (status || status.error().code == make_error_code(errc::timeout)) {
    reaped_ = true;
  }
  return status;
}

void Process::abandon() noexcept {
  // Pipes first, so a child blocked on them sees EOF or EPIPE.
  stdin_pipe_.close();
  stdout_pipe_.close();
  stderr_pipe_.close();
  if (reaped_ || ref_.pid <= 0) {
    return;
  }
  auto& backend = default_backend();
  auto killed = backend.kill(ref_);
  if (!killed) {
    logger()->error("could not kill pid {}: {}", ref_.pid, describe(killed.error()));
    return;
  }
  auto reaped = backend.wait(ref_, std::nullopt, std::chrono::milliseconds(0));
  if (!reaped) {
    logger()->error("could not reap pid {}: {}", ref_.pid, describe(reaped.error()));
  }
  reaped_ = true;
}

}  // namespace codebox::internal
