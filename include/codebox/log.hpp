#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace codebox {

/// @brief Shared "codebox" logger. Writes to stderr; stdout is reserved for results.
std::shared_ptr<spdlog::logger> logger();

/// @brief Set the level of the shared logger.
void set_log_level(spdlog::level::level_enum level);

/// @brief Parse trace|debug|info|warn|error|off.
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

}  // namespace codebox
