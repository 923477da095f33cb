#include "codebox/status.hpp"

#include <sys/wait.h>

namespace codebox {

ExitStatus ExitStatus::from_wait_status(int raw) noexcept {
  if (WIFEXITED(raw)) {
    return exited(WEXITSTATUS(raw));
  }
  if (WIFSIGNALED(raw)) {
    return killed_by(WTERMSIG(raw));
  }
  // Stopped or continued: waitpid is never asked for these, so report neither.
  return ExitStatus{};
}

ExitStatus ExitStatus::exited(int code) noexcept {
  ExitStatus status;
  status.exit_code_ = code;
  return status;
}

ExitStatus ExitStatus::killed_by(int signo) noexcept {
  ExitStatus status;
  status.signal_ = signo;
  return status;
}

}  // namespace codebox
