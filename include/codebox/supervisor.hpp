#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "codebox/result.hpp"
#include "codebox/status.hpp"

namespace codebox {

/// @brief One bounded child-process run.
struct SupervisedRun {
  /// @brief Program and arguments; argv[0] is resolved against PATH.
  std::vector<std::string> argv;
  /// @brief Variables set on top of the inherited environment.
  std::map<std::string, std::string> env;
  /// @brief Bytes written to stdin, which is then closed. stdin is /dev/null when empty.
  std::optional<std::string> input;
  /// @brief Wall-clock budget for the whole run.
  std::chrono::milliseconds timeout{0};
  /// @brief Time between SIGTERM and SIGKILL once the budget is spent.
  std::chrono::milliseconds kill_grace{200};
  /// @brief Combined stdout+stderr bytes to keep.
  std::size_t output_limit = 1024 * 1024;
  /// @brief Run the child as the leader of a new process group.
  bool new_process_group = true;
};

/// @brief What a supervised run produced.
struct SupervisedOutput {
  /// @brief Exit status; meaningless when timed_out is set.
  ExitStatus status;
  /// @brief The budget ran out and the child was terminated.
  bool timed_out = false;
  /// @brief Output was cut at the byte limit.
  bool truncated = false;
  /// @brief Captured stdout (possibly partial).
  std::string stdout_data;
  /// @brief Captured stderr (possibly partial).
  std::string stderr_data;
};

/// @brief Spawns a child with input, waits with a bound, captures capped output.
///
/// Errors are spawn and I/O failures only; a timeout is reported through
/// SupervisedOutput::timed_out. A spawn whose executable cannot be found fails with
/// an ENOENT system error.
class Supervisor {
 public:
  virtual ~Supervisor() = default;
  virtual Result<SupervisedOutput> run(const SupervisedRun& request) = 0;
};

/// @brief Supervisor backed by real POSIX processes.
class PosixSupervisor final : public Supervisor {
 public:
  Result<SupervisedOutput> run(const SupervisedRun& request) override;
};

}  // namespace codebox
