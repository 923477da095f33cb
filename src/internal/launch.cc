#include "codebox/internal/launch.hpp"

#include <unistd.h>

#include <filesystem>
#include <map>
#include <string_view>

#include "codebox/platform.hpp"

#if CODEBOX_PLATFORM_MACOS
#include <crt_externs.h>
#endif

namespace codebox::internal {

namespace {

constexpr std::string_view kDefaultPath = "/usr/bin:/bin";

char** host_environ() {
#if CODEBOX_PLATFORM_MACOS
  return *_NSGetEnviron();
#else
  return ::environ;
#endif
}

bool is_executable_file(const std::filesystem::path& candidate) {
  std::error_code ec;
  return ::access(candidate.c_str(), X_OK) == 0 &&
         !std::filesystem::is_directory(candidate, ec);
}

}  // namespace

Result<LaunchSpec> make_launch_spec(const SupervisedRun& run) {
  if (run.argv.empty() || run.argv.front().empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = "launch"};
  }

  std::map<std::string, std::string> merged;
  for (char** entry = host_environ(); entry != nullptr && *entry != nullptr; ++entry) {
    std::string_view text(*entry);
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    merged.emplace(std::string(text.substr(0, eq)), std::string(text.substr(eq + 1)));
  }
  for (const auto& [key, value] : run.env) {
    merged[key] = value;
  }

  LaunchSpec spec;
  spec.argv = run.argv;
  spec.envp.reserve(merged.size());
  for (const auto& [key, value] : merged) {
    spec.envp.push_back(key + "=" + value);
  }
  spec.pipe_stdin = run.input.has_value();
  spec.new_process_group = run.new_process_group;
  return spec;
}

std::optional<std::string> lookup_env(const std::vector<std::string>& envp,
                                      const std::string& key) {
  for (const auto& entry : envp) {
    if (entry.size() > key.size() && entry[key.size()] == '=' &&
        entry.compare(0, key.size(), key) == 0) {
      return entry.substr(key.size() + 1);
    }
  }
  return std::nullopt;
}

std::optional<std::string> resolve_program(const std::string& program,
                                           const std::vector<std::string>& envp) {
  if (program.empty()) {
    return std::nullopt;
  }
  if (program.find('/') != std::string::npos) {
    return is_executable_file(program) ? std::optional<std::string>(program) : std::nullopt;
  }

  std::string search = lookup_env(envp, "PATH").value_or(std::string(kDefaultPath));
  std::string_view rest(search);
  while (true) {
    auto colon = rest.find(':');
    auto dir = rest.substr(0, colon);
    // An empty PATH element means the current directory.
    auto candidate = std::filesystem::path(dir.empty() ? std::string_view(".") : dir) / program;
    if (is_executable_file(candidate)) {
      return candidate.string();
    }
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }
    rest.remove_prefix(colon + 1);
  }
}

}  // namespace codebox::internal
