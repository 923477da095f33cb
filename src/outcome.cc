#include "codebox/outcome.hpp"

namespace codebox {

std::string_view to_string(FailureKind kind) noexcept {
  switch (kind) {
    case FailureKind::empty_input:
      return "empty_input";
    case FailureKind::interpreter_not_found:
      return "interpreter_not_found";
    case FailureKind::timeout:
      return "timeout";
    case FailureKind::process_error:
      return "process_error";
    case FailureKind::non_zero_exit:
      return "non_zero_exit";
    case FailureKind::unexpected:
      return "unexpected";
  }
  return "unexpected";
}

const std::string& ExecutionOutcome::stdout_data() const noexcept {
  return std::visit([](const auto& v) -> const std::string& { return v.stdout_data; }, value_);
}

const std::string& ExecutionOutcome::stderr_data() const noexcept {
  return std::visit([](const auto& v) -> const std::string& { return v.stderr_data; }, value_);
}

int ExecutionOutcome::exit_code() const noexcept {
  return std::visit([](const auto& v) { return v.exit_code; }, value_);
}

std::chrono::milliseconds ExecutionOutcome::elapsed() const noexcept {
  return std::visit([](const auto& v) { return v.elapsed; }, value_);
}

bool ExecutionOutcome::truncated() const noexcept {
  return std::visit([](const auto& v) { return v.truncated; }, value_);
}

}  // namespace codebox
