#include "codebox/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace codebox {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("codebox");
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt("codebox");
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

}  // namespace codebox
