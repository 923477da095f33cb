#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "codebox/internal/expected.hpp"
#include "codebox/platform.hpp"

namespace codebox {

/// @brief Failures that originate in codebox rather than in the OS.
///
/// OS failures keep their errno value in std::system_category(); callers compare against
/// std::error_code(ENOENT, std::system_category()) and friends.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,
  /// @brief A run was requested without a program to execute.
  empty_argv,
  /// @brief Executor configuration is unreadable or inconsistent.
  invalid_config,
  /// @brief A process handle was used after it was moved from.
  no_process,
  /// @brief The wall-clock budget ran out; the process was terminated and reaped.
  timeout,
};

/// @brief Error payload carried by every Result.
struct Error {
  /// @brief What went wrong, in the codebox or the system category.
  std::error_code code;
  /// @brief Where it went wrong, e.g. "spawn python3" or "poll".
  std::string context;
};

/// @brief The "codebox" error category.
const std::error_category& error_category() noexcept;
/// @brief Wrap an errc value in a std::error_code.
std::error_code make_error_code(errc value) noexcept;

/// @brief Error for the current errno value.
Error errno_error(std::string context);

/// @brief "context: message", or just the message when there is no context.
std::string describe(const Error& error);

/// @brief Value-or-Error return type; `return Error{...};` converts implicitly.
template <typename T>
using Result = expected<T, Error>;

}  // namespace codebox

namespace std {

template <>
struct is_error_code_enum<codebox::errc> : true_type {};

}  // namespace std
