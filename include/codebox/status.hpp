#pragma once

#include <optional>

namespace codebox {

/// @brief How a supervised process ended.
///
/// Exactly one of exit_code() and signal() is set for a status decoded from a real wait
/// status; a default-constructed status has neither and is not a success.
class ExitStatus {
 public:
  ExitStatus() = default;

  /// @brief Decode a waitpid() status word.
  static ExitStatus from_wait_status(int raw) noexcept;
  /// @brief Normal termination with the given code.
  static ExitStatus exited(int code) noexcept;
  /// @brief Death by the given signal.
  static ExitStatus killed_by(int signo) noexcept;

  /// @brief True for a normal exit with code 0.
  [[nodiscard]] bool success() const noexcept { return exit_code_ == 0; }
  [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }
  [[nodiscard]] std::optional<int> signal() const noexcept { return signal_; }

 private:
  std::optional<int> exit_code_;
  std::optional<int> signal_;
};

}  // namespace codebox
