#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "codebox/config.hpp"
#include "codebox/outcome.hpp"
#include "codebox/supervisor.hpp"

namespace codebox {

/// @brief One code-execution request.
struct ExecutionRequest {
  /// @brief Source text handed to the interpreter.
  std::string code;
  /// @brief Wall-clock budget; callers clamp it to the configured bounds.
  std::chrono::seconds timeout{10};
};

/// @brief Runs code snippets in a child interpreter and classifies the result.
///
/// Each call spawns at most one process and returns exactly one outcome. Blank code is
/// rejected without spawning. Calls are independent and may run concurrently as long as
/// the supervisor allows it (PosixSupervisor does).
class Executor {
 public:
  /// @brief The supervisor must outlive the executor.
  Executor(ExecutorConfig config, Supervisor& supervisor);

  /// @brief Execute a request. Never throws; every failure becomes an outcome.
  [[nodiscard]] ExecutionOutcome execute(const ExecutionRequest& request) const noexcept;
  /// @brief Convenience overload.
  [[nodiscard]] ExecutionOutcome execute(std::string_view code,
                                         std::chrono::seconds timeout) const noexcept;

  [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

 private:
  ExecutionOutcome run(const ExecutionRequest& request) const;

  ExecutorConfig config_;
  Supervisor* supervisor_;
};

}  // namespace codebox
