#pragma once

#include <optional>
#include <string>
#include <vector>

#include "codebox/result.hpp"
#include "codebox/supervisor.hpp"

namespace codebox::internal {

// Everything the backend needs to start one supervised child. stdout and stderr are
// always piped back to the supervisor.
struct LaunchSpec {
  std::vector<std::string> argv;
  // Complete child environment as KEY=VALUE entries.
  std::vector<std::string> envp;
  // Pipe stdin from the supervisor; otherwise the child reads /dev/null.
  bool pipe_stdin = false;
  bool new_process_group = true;
};

// Inherits the host environment, applies the run's overrides and checks argv.
Result<LaunchSpec> make_launch_spec(const SupervisedRun& run);

// Value of key in a KEY=VALUE list.
std::optional<std::string> lookup_env(const std::vector<std::string>& envp,
                                      const std::string& key);

// Finds an executable for program on the PATH of envp (/usr/bin:/bin when unset).
// A program containing '/' is returned unchanged when it is executable. Nothing is cached.
std::optional<std::string> resolve_program(const std::string& program,
                                           const std::vector<std::string>& envp);

}  // namespace codebox::internal
