#include "codebox/executor.hpp"

#include <cerrno>
#include <exception>
#include <optional>
#include <string_view>
#include <system_error>

#include "codebox/internal/clock.hpp"
#include "codebox/log.hpp"

namespace codebox {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_blank(std::string_view text) {
  return text.find_first_not_of(kWhitespace) == std::string_view::npos;
}

std::string trim_end(std::string text) {
  auto end = text.find_last_not_of(kWhitespace);
  text.erase(end == std::string::npos ? 0 : end + 1);
  return text;
}

bool is_not_found(const Error& error) {
  return error.code == std::error_code(ENOENT, std::system_category());
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(internal::default_clock().now() -
                                                               start);
}

}  // namespace

Executor::Executor(ExecutorConfig config, Supervisor& supervisor)
    : config_(std::move(config)), supervisor_(&supervisor) {}

ExecutionOutcome Executor::execute(std::string_view code,
                                   std::chrono::seconds timeout) const noexcept {
  try {
    return execute(ExecutionRequest{.code = std::string(code), .timeout = timeout});
  } catch (const std::exception& e) {
    return Failure{.kind = FailureKind::unexpected,
                   .message = std::string("Unexpected error during code execution: ") + e.what()};
  } catch (...) {
    return Failure{.kind = FailureKind::unexpected,
                   .message = "Unexpected error during code execution"};
  }
}

ExecutionOutcome Executor::execute(const ExecutionRequest& request) const noexcept {
  if (is_blank(request.code)) {
    logger()->debug("rejecting blank code");
    return Failure{.kind = FailureKind::empty_input, .message = "No code provided"};
  }

  auto start = internal::default_clock().now();
  try {
    return run(request);
  } catch (const std::exception& e) {
    logger()->error("execution aborted: {}", e.what());
    return Failure{.kind = FailureKind::unexpected,
                   .message = std::string("Unexpected error during code execution: ") + e.what(),
                   .elapsed = since(start)};
  } catch (...) {
    logger()->error("execution aborted by a non-standard exception");
    return Failure{.kind = FailureKind::unexpected,
                   .message = "Unexpected error during code execution",
                   .elapsed = since(start)};
  }
}

ExecutionOutcome Executor::run(const ExecutionRequest& request) const {
  auto start = internal::default_clock().now();

  SupervisedRun invocation;
  invocation.argv.push_back(config_.interpreter);
  invocation.argv.insert(invocation.argv.end(), config_.interpreter_args.begin(),
                         config_.interpreter_args.end());
  if (config_.delivery == CodeDelivery::argument) {
    invocation.argv.push_back(config_.argument_flag);
    invocation.argv.push_back(request.code);
  } else {
    invocation.input = request.code;
  }
  invocation.env = config_.env;
  invocation.timeout = request.timeout;
  invocation.kill_grace = config_.kill_grace;
  invocation.output_limit = config_.output_limit;
  invocation.new_process_group = config_.new_process_group;

  logger()->debug("executing {} bytes with {} (timeout {}s)", request.code.size(),
                  config_.interpreter, request.timeout.count());

  auto result = supervisor_->run(invocation);
  auto elapsed = since(start);

  if (!result) {
    const auto& error = result.error();
    if (is_not_found(error)) {
      logger()->error("interpreter {} not found", config_.interpreter);
      return Failure{.kind = FailureKind::interpreter_not_found,
                     .message = config_.interpreter + " is not installed or not found in PATH",
                     .help = config_.install_hint,
                     .stderr_data = config_.interpreter + " not found",
                     .elapsed = elapsed};
    }
    logger()->error("failed to run {}: {}", config_.interpreter, describe(error));
    return Failure{.kind = FailureKind::process_error,
                   .message = "Failed to start or run " + config_.interpreter +
                              " process: " + describe(error),
                   .elapsed = elapsed};
  }

  auto& output = result.value();
  auto stdout_data = trim_end(std::move(output.stdout_data));
  auto stderr_data = trim_end(std::move(output.stderr_data));

  if (output.timed_out) {
    logger()->warn("execution timed out after {}s", request.timeout.count());
    return Failure{.kind = FailureKind::timeout,
                   .message = "Execution timed out after " +
                              std::to_string(request.timeout.count()) + " seconds",
                   .stdout_data = std::move(stdout_data),
                   .stderr_data = std::move(stderr_data),
                   .elapsed = elapsed,
                   .truncated = output.truncated};
  }

  if (output.status.success()) {
    logger()->info("execution succeeded in {}ms", elapsed.count());
    return Success{.stdout_data = std::move(stdout_data),
                   .stderr_data = std::move(stderr_data),
                   .exit_code = 0,
                   .elapsed = elapsed,
                   .truncated = output.truncated};
  }

  std::string message;
  int exit_code = -1;
  if (auto code = output.status.exit_code()) {
    exit_code = *code;
    message = "Execution failed with exit code " + std::to_string(exit_code);
  } else if (auto signal = output.status.signal()) {
    message = "Execution terminated by signal " + std::to_string(*signal);
  } else {
    message = "Execution ended abnormally";
  }
  logger()->info("{}", message);
  return Failure{.kind = FailureKind::non_zero_exit,
                 .message = std::move(message),
                 .stdout_data = std::move(stdout_data),
                 .stderr_data = std::move(stderr_data),
                 .exit_code = exit_code,
                 .elapsed = elapsed,
                 .truncated = output.truncated};
}

}  // namespace codebox
