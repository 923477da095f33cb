#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codebox/result.hpp"

namespace codebox {

/// @brief How the code string reaches the interpreter.
enum class CodeDelivery : std::uint8_t {
  /// @brief Written to the child's stdin, which is then closed.
  standard_input,
  /// @brief Passed as the argument after argument_flag; stdin is /dev/null.
  argument,
};

/// @brief Largest timeoutSeconds.max validate() accepts.
inline constexpr std::chrono::seconds kMaxTimeout{3600};
/// @brief Largest killGraceMs validate() accepts.
inline constexpr std::chrono::milliseconds kMaxKillGrace{60000};

/// @brief Bounds for per-request timeouts, in whole seconds.
struct TimeoutBounds {
  std::chrono::seconds min{1};
  std::chrono::seconds max{30};
  std::chrono::seconds fallback{10};
};

/// @brief Everything an Executor needs to know about the interpreter it drives.
struct ExecutorConfig {
  /// @brief Interpreter command, resolved against PATH on every execution.
  std::string interpreter = "python3";
  /// @brief Arguments placed before the code (or before argument_flag).
  std::vector<std::string> interpreter_args;
  CodeDelivery delivery = CodeDelivery::standard_input;
  /// @brief Flag that precedes the code in CodeDelivery::argument mode.
  std::string argument_flag = "-c";
  /// @brief Combined stdout+stderr bytes kept per execution.
  std::size_t output_limit = 1024 * 1024;
  TimeoutBounds timeouts;
  /// @brief Delay between SIGTERM and SIGKILL after a timeout.
  std::chrono::milliseconds kill_grace{200};
  /// @brief Run the interpreter in its own process group so timeouts reach its children.
  bool new_process_group = true;
  /// @brief Variables set for the interpreter on top of the inherited environment.
  std::map<std::string, std::string> env;
  /// @brief Shown when the interpreter is missing.
  std::string install_hint = "Install Python from https://www.python.org/downloads/";
};

/// @brief Overlay recognised keys of a JSON object onto config. Wrongly typed keys are skipped.
void apply_config_json(ExecutorConfig& config, const nlohmann::json& data);

/// @brief Read a JSON config file and overlay it onto config.
Result<void> load_config_file(ExecutorConfig& config, const std::filesystem::path& path);

/// @brief Apply CODEBOX_INTERPRETER when set and non-empty.
void apply_env_overrides(ExecutorConfig& config);

/// @brief Reject configurations an Executor cannot honour.
Result<void> validate(const ExecutorConfig& config);

}  // namespace codebox
