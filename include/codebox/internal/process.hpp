#pragma once

#include <chrono>
#include <optional>
#include <utility>

#include "codebox/internal/backend.hpp"
#include "codebox/result.hpp"
#include "codebox/status.hpp"

namespace codebox::internal {

// Owns a launched child until it is reaped. Destroying an unreaped Process kills it (its
// group, when it leads one) and reaps it, so an early return never leaves a process behind.
class Process {
 public:
  explicit Process(Launched launched) noexcept;
  Process(Process&& other) noexcept;
  Process& operator=(Process&& other) noexcept;
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  ~Process();

  [[nodiscard]] int pid() const noexcept { return ref_.pid; }

  unique_fd take_stdin() noexcept { return std::move(stdin_pipe_); }
  unique_fd take_stdout() noexcept { return std::move(stdout_pipe_); }
  unique_fd take_stderr() noexcept { return std::move(stderr_pipe_); }

  // See Backend::wait. A timeout error still leaves the process reaped.
  Result<ExitStatus> wait(std::optional<std::chrono::milliseconds> timeout,
                          std::chrono::milliseconds kill_grace);

 private:
  void abandon() noexcept;

  ProcessRef ref_;
  unique_fd stdin_pipe_;
  unique_fd stdout_pipe_;
  unique_fd stderr_pipe_;
  bool reaped_ = false;
};

}  // namespace codebox::internal
