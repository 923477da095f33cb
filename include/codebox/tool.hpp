#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "codebox/executor.hpp"
#include "codebox/outcome.hpp"

namespace codebox {

/// @brief Render an outcome as the tool result object.
///
/// Always carries success, stdout, stderr, exit_code and execution_time_ms. Failures add
/// error and error_kind; help appears only for a missing interpreter and truncated only
/// when output was cut.
nlohmann::json to_json(const ExecutionOutcome& outcome);

/// @brief The "execute_code" tool exposed to an orchestrating agent.
class ExecuteCodeTool {
 public:
  /// @brief The executor must outlive the tool.
  explicit ExecuteCodeTool(const Executor& executor) : executor_(&executor) {}

  [[nodiscard]] std::string name() const { return "execute_code"; }
  [[nodiscard]] std::string description() const;
  /// @brief JSON schema of the accepted arguments.
  [[nodiscard]] nlohmann::json parameters() const;
  /// @brief name, description and parameters in one object.
  [[nodiscard]] nlohmann::json definition() const;

  /// @brief Decode arguments, execute, and return to_json of the outcome.
  nlohmann::json invoke(const nlohmann::json& arguments) const;

  /// @brief Timeout the tool would use for a given timeout_seconds argument.
  [[nodiscard]] std::chrono::seconds resolve_timeout(const nlohmann::json& value) const;

 private:
  const Executor* executor_;
};

}  // namespace codebox
