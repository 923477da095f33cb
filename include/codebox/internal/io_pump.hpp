#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "codebox/internal/clock.hpp"
#include "codebox/internal/fd.hpp"
#include "codebox/result.hpp"

namespace codebox::internal {

struct PumpLimits {
  // Stop pumping once this passes; unbounded when empty.
  std::optional<std::chrono::steady_clock::time_point> deadline;
  // Combined stdout+stderr bytes to keep; the rest is read and discarded.
  std::size_t output_limit = std::numeric_limits<std::size_t>::max();
};

struct PumpResult {
  std::string stdout_data;
  std::string stderr_data;
  bool truncated = false;
  bool timed_out = false;
};

// Writes input to stdin_fd and closes it, while draining stdout_fd and stderr_fd until
// both reach EOF or the deadline passes. Descriptors that reach EOF or finish writing are
// closed; any of them may be null or already closed. When the cap cuts output, a UTF-8
// sequence split by the cut is dropped so the kept bytes end on a character boundary.
Result<PumpResult> pump_pipes(unique_fd* stdin_fd, std::string_view input, unique_fd* stdout_fd,
                              unique_fd* stderr_fd, Clock& clock, const PumpLimits& limits);

// Drops a trailing UTF-8 lead byte whose continuation bytes are missing.
void drop_partial_utf8(std::string& text);

}  // namespace codebox::internal
