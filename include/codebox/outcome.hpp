#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace codebox {

/// @brief Why an execution did not succeed. Callers switch on this, not on messages.
enum class FailureKind : std::uint8_t {
  /// @brief Code was empty after trimming; nothing was spawned.
  empty_input,
  /// @brief The interpreter executable could not be found.
  interpreter_not_found,
  /// @brief The wall-clock budget ran out and the child was killed.
  timeout,
  /// @brief Spawning or talking to the child failed.
  process_error,
  /// @brief The child exited non-zero or died from a signal.
  non_zero_exit,
  /// @brief The orchestration itself failed.
  unexpected,
};

/// @brief snake_case name of a failure kind, as used in tool results.
std::string_view to_string(FailureKind kind) noexcept;

/// @brief The child ran and exited with code 0.
struct Success {
  std::string stdout_data;
  std::string stderr_data;
  int exit_code = 0;
  std::chrono::milliseconds elapsed{0};
  bool truncated = false;
};

/// @brief Anything other than a clean exit.
struct Failure {
  FailureKind kind = FailureKind::unexpected;
  /// @brief Human-readable summary.
  std::string message;
  /// @brief Remediation hint; only set for interpreter_not_found.
  std::string help;
  std::string stdout_data;
  std::string stderr_data;
  /// @brief Child exit code, or -1 when there is none.
  int exit_code = -1;
  std::chrono::milliseconds elapsed{0};
  bool truncated = false;
};

/// @brief Exactly one of Success or Failure for every execution request.
class ExecutionOutcome {
 public:
  ExecutionOutcome(Success value) : value_(std::move(value)) {}
  ExecutionOutcome(Failure value) : value_(std::move(value)) {}

  [[nodiscard]] bool success() const noexcept { return std::holds_alternative<Success>(value_); }
  /// @brief Failure details. Only valid when success() is false.
  [[nodiscard]] const Failure& failure() const { return std::get<Failure>(value_); }

  [[nodiscard]] const std::string& stdout_data() const noexcept;
  [[nodiscard]] const std::string& stderr_data() const noexcept;
  [[nodiscard]] int exit_code() const noexcept;
  [[nodiscard]] std::chrono::milliseconds elapsed() const noexcept;
  [[nodiscard]] bool truncated() const noexcept;

  [[nodiscard]] const std::variant<Success, Failure>& value() const noexcept { return value_; }

 private:
  std::variant<Success, Failure> value_;
};

}  // namespace codebox
