#include "codebox/tool.hpp"

#include <algorithm>
#include <cmath>

#include "codebox/log.hpp"

namespace codebox {

namespace {

// Child output is arbitrary bytes; invalid UTF-8 becomes U+FFFD so the result always dumps.
std::string valid_utf8(const std::string& text) {
  auto quoted =
      nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return nlohmann::json::parse(quoted).get<std::string>();
}

}  // namespace

nlohmann::json to_json(const ExecutionOutcome& outcome) {
  nlohmann::json result = {
      {"success", outcome.success()},
      {"stdout", valid_utf8(outcome.stdout_data())},
      {"stderr", valid_utf8(outcome.stderr_data())},
      {"exit_code", outcome.exit_code()},
      {"execution_time_ms", outcome.elapsed().count()},
  };
  if (!outcome.success()) {
    const auto& failure = outcome.failure();
    result["error"] = valid_utf8(failure.message);
    result["error_kind"] = std::string(to_string(failure.kind));
    if (failure.kind == FailureKind::interpreter_not_found) {
      result["help"] = valid_utf8(failure.help);
    }
  }
  if (outcome.truncated()) {
    result["truncated"] = true;
  }
  return result;
}

std::string ExecuteCodeTool::description() const {
  const auto& config = executor_->config();
  return "Execute " + config.interpreter +
         " code for data analysis, calculations, or processing. Runs the code in a separate "
         "process and returns its stdout, stderr and exit code.";
}

nlohmann::json ExecuteCodeTool::parameters() const {
  const auto& bounds = executor_->config().timeouts;
  return {
      {"type", "object"},
      {"properties",
       {{"code",
         {{"type", "string"},
          {"minLength", 1},
          {"description",
           "Complete code to execute. Should include all necessary imports and be "
           "self-contained."}}},
        {"timeout_seconds",
         {{"type", "integer"},
          {"minimum", bounds.min.count()},
          {"maximum", bounds.max.count()},
          {"default", bounds.fallback.count()},
          {"description", "Maximum execution time in seconds (" +
                              std::to_string(bounds.min.count()) + "-" +
                              std::to_string(bounds.max.count()) + ", default " +
                              std::to_string(bounds.fallback.count()) + ")"}}}}},
      {"required", nlohmann::json::array({"code"})},
  };
}

nlohmann::json ExecuteCodeTool::definition() const {
  return {{"name", name()}, {"description", description()}, {"parameters", parameters()}};
}

std::chrono::seconds ExecuteCodeTool::resolve_timeout(const nlohmann::json& value) const {
  const auto& bounds = executor_->config().timeouts;
  if (value.is_null()) {
    return bounds.fallback;
  }
  if (!value.is_number()) {
    logger()->warn("timeout_seconds has type {}, using default", value.type_name());
    return bounds.fallback;
  }
  double requested = std::trunc(value.get<double>());
  if (std::isnan(requested)) {
    return bounds.fallback;
  }
  double clamped = std::clamp(requested, static_cast<double>(bounds.min.count()),
                              static_cast<double>(bounds.max.count()));
  return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(clamped));
}

nlohmann::json ExecuteCodeTool::invoke(const nlohmann::json& arguments) const {
  std::string code;
  nlohmann::json timeout;
  if (arguments.is_object()) {
    auto code_it = arguments.find("code");
    if (code_it != arguments.end() && code_it->is_string()) {
      code = code_it->get<std::string>();
    }
    auto timeout_it = arguments.find("timeout_seconds");
    if (timeout_it != arguments.end()) {
      timeout = *timeout_it;
    }
  }
  return to_json(executor_->execute(ExecutionRequest{.code = std::move(code),
                                                     .timeout = resolve_timeout(timeout)}));
}

}  // namespace codebox
