#include "codebox/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>

#include "codebox/log.hpp"

namespace codebox {

namespace {

Error config_error(std::string context) {
  return Error{.code = make_error_code(errc::invalid_config), .context = std::move(context)};
}

// Out-of-range values saturate rather than wrap; validate() rejects them afterwards.
std::int64_t saturated_integer(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return static_cast<std::int64_t>(std::min<std::uint64_t>(
        value.get<std::uint64_t>(), std::numeric_limits<std::int64_t>::max()));
  }
  return value.get<std::int64_t>();
}

void apply_timeouts(TimeoutBounds& bounds, const nlohmann::json& data) {
  if (!data.is_object()) {
    return;
  }
  if (data.contains("min") && data["min"].is_number_integer()) {
    bounds.min = std::chrono::seconds(saturated_integer(data["min"]));
  }
  if (data.contains("max") && data["max"].is_number_integer()) {
    bounds.max = std::chrono::seconds(saturated_integer(data["max"]));
  }
  if (data.contains("default") && data["default"].is_number_integer()) {
    bounds.fallback = std::chrono::seconds(saturated_integer(data["default"]));
  }
}

}  // namespace

void apply_config_json(ExecutorConfig& config, const nlohmann::json& data) {
  if (!data.is_object()) {
    return;
  }
  if (data.contains("interpreter") && data["interpreter"].is_string()) {
    config.interpreter = data["interpreter"].get<std::string>();
  }
  if (data.contains("interpreterArgs") && data["interpreterArgs"].is_array()) {
    config.interpreter_args.clear();
    for (const auto& item : data["interpreterArgs"]) {
      if (item.is_string()) {
        config.interpreter_args.push_back(item.get<std::string>());
      }
    }
  }
  if (data.contains("delivery") && data["delivery"].is_string()) {
    const auto delivery = data["delivery"].get<std::string>();
    if (delivery == "stdin") {
      config.delivery = CodeDelivery::standard_input;
    } else if (delivery == "argument") {
      config.delivery = CodeDelivery::argument;
    } else {
      logger()->warn("config: unknown delivery '{}', keeping current", delivery);
    }
  }
  if (data.contains("argumentFlag") && data["argumentFlag"].is_string()) {
    config.argument_flag = data["argumentFlag"].get<std::string>();
  }
  if (data.contains("outputLimitBytes") && data["outputLimitBytes"].is_number_unsigned()) {
    config.output_limit = data["outputLimitBytes"].get<std::size_t>();
  }
  if (data.contains("timeoutSeconds")) {
    apply_timeouts(config.timeouts, data["timeoutSeconds"]);
  }
  if (data.contains("killGraceMs") && data["killGraceMs"].is_number_unsigned()) {
    config.kill_grace = std::chrono::milliseconds(saturated_integer(data["killGraceMs"]));
  }
  if (data.contains("newProcessGroup") && data["newProcessGroup"].is_boolean()) {
    config.new_process_group = data["newProcessGroup"].get<bool>();
  }
  if (data.contains("env") && data["env"].is_object()) {
    config.env.clear();
    for (const auto& [key, value] : data["env"].items()) {
      if (value.is_string()) {
        config.env[key] = value.get<std::string>();
      }
    }
  }
  if (data.contains("installHint") && data["installHint"].is_string()) {
    config.install_hint = data["installHint"].get<std::string>();
  }
}

Result<void> load_config_file(ExecutorConfig& config, const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input) {
    return config_error("cannot open config file " + path.string());
  }
  auto data = nlohmann::json::parse(input, nullptr, false);
  if (data.is_discarded()) {
    return config_error("malformed JSON in " + path.string());
  }
  if (!data.is_object()) {
    return config_error("config root must be an object in " + path.string());
  }
  apply_config_json(config, data);
  logger()->debug("loaded config from {}", path.string());
  return {};
}

void apply_env_overrides(ExecutorConfig& config) {
  const char* interpreter = std::getenv("CODEBOX_INTERPRETER");
  if (interpreter && *interpreter) {
    config.interpreter = interpreter;
  }
}

Result<void> validate(const ExecutorConfig& config) {
  if (config.interpreter.empty()) {
    return config_error("interpreter must not be empty");
  }
  if (config.delivery == CodeDelivery::argument && config.argument_flag.empty()) {
    return config_error("argumentFlag must not be empty in argument delivery");
  }
  if (config.output_limit == 0) {
    return config_error("outputLimitBytes must be positive");
  }
  const auto& t = config.timeouts;
  if (t.min < std::chrono::seconds(1)) {
    return config_error("timeoutSeconds.min must be at least 1");
  }
  if (t.max > kMaxTimeout) {
    return config_error("timeoutSeconds.max must not exceed " +
                        std::to_string(kMaxTimeout.count()));
  }
  if (t.min > t.max) {
    return config_error("timeoutSeconds.min exceeds timeoutSeconds.max");
  }
  if (t.fallback < t.min || t.fallback > t.max) {
    return config_error("timeoutSeconds.default outside [min, max]");
  }
  if (config.kill_grace < std::chrono::milliseconds(0) || config.kill_grace > kMaxKillGrace) {
    return config_error("killGraceMs must be between 0 and " +
                        std::to_string(kMaxKillGrace.count()));
  }
  return {};
}

}  // namespace codebox
