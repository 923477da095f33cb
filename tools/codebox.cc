#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codebox/config.hpp"
#include "codebox/executor.hpp"
#include "codebox/log.hpp"
#include "codebox/supervisor.hpp"
#include "codebox/tool.hpp"

namespace {

constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
  out << "usage: codebox [--config PATH] [--interpreter CMD] [--log-level LEVEL] <command>\n"
         "\n"
         "commands:\n"
         "  describe                 print the execute_code tool definition\n"
         "  serve                    answer JSON-line tool calls on stdin (default)\n"
         "  run [--timeout N] [FILE] execute FILE (or stdin) once and print the result\n";
}

struct Options {
  std::optional<std::string> config_path;
  std::optional<std::string> interpreter;
  std::string log_level = "warn";
  std::string command = "serve";
  std::vector<std::string> rest;
};

std::optional<Options> parse_options(int argc, char** argv) {
  Options options;
  int i = 1;
  for (; i < argc; ++i) {
    std::string arg = argv[i];
    auto take_value = [&](std::optional<std::string>& slot) {
      if (i + 1 >= argc) {
        std::cerr << "codebox: " << arg << " needs a value\n";
        return false;
      }
      slot = argv[++i];
      return true;
    };
    if (arg == "--config") {
      if (!take_value(options.config_path)) {
        return std::nullopt;
      }
    } else if (arg == "--interpreter") {
      if (!take_value(options.interpreter)) {
        return std::nullopt;
      }
    } else if (arg == "--log-level") {
      std::optional<std::string> level;
      if (!take_value(level)) {
        return std::nullopt;
      }
      options.log_level = *level;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(std::cout);
      std::exit(0);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "codebox: unknown option " << arg << "\n";
      return std::nullopt;
    } else {
      break;
    }
  }
  if (i < argc) {
    options.command = argv[i++];
  }
  for (; i < argc; ++i) {
    options.rest.emplace_back(argv[i]);
  }
  return options;
}

std::optional<codebox::ExecutorConfig> build_config(const Options& options) {
  codebox::ExecutorConfig config;
  std::optional<std::string> path = options.config_path;
  if (!path) {
    if (const char* env_path = std::getenv("CODEBOX_CONFIG"); env_path && *env_path) {
      path = env_path;
    }
  }
  if (path) {
    auto loaded = codebox::load_config_file(config, *path);
    if (!loaded) {
      std::cerr << "codebox: " << codebox::describe(loaded.error()) << "\n";
      return std::nullopt;
    }
  }
  codebox::apply_env_overrides(config);
  if (options.interpreter) {
    config.interpreter = *options.interpreter;
  }
  auto valid = codebox::validate(config);
  if (!valid) {
    std::cerr << "codebox: " << codebox::describe(valid.error()) << "\n";
    return std::nullopt;
  }
  return config;
}

// Bytes that are not UTF-8 are written as U+FFFD instead of throwing.
std::string dump_lenient(const nlohmann::json& value, int indent) {
  return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json handle_line(const codebox::ExecuteCodeTool& tool, const std::string& line) {
  auto request = nlohmann::json::parse(line, nullptr, false);
  if (request.is_discarded() || !request.is_object()) {
    codebox::logger()->warn("ignoring malformed request line");
    return {{"success", false}, {"error", "Malformed request: expected a JSON object"}};
  }
  if (request.contains("name")) {
    if (!request["name"].is_string() || request["name"].get<std::string>() != tool.name()) {
      std::string name = request["name"].is_string() ? request["name"].get<std::string>()
                                                     : request["name"].dump();
      return {{"success", false}, {"error", "Tool '" + name + "' not found"}};
    }
    return tool.invoke(request.contains("arguments") ? request["arguments"]
                                                     : nlohmann::json::object());
  }
  return tool.invoke(request);
}

int serve(const codebox::ExecuteCodeTool& tool) {
  codebox::logger()->info("serving {} on stdin", tool.name());
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    std::cout << dump_lenient(handle_line(tool, line), -1) << std::endl;
  }
  return 0;
}

int run_once(const codebox::ExecuteCodeTool& tool, const std::vector<std::string>& args) {
  nlohmann::json timeout;
  std::optional<std::string> source;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--timeout") {
      if (i + 1 >= args.size()) {
        std::cerr << "codebox: --timeout needs a value\n";
        return kExitUsage;
      }
      try {
        timeout = std::stoll(args[++i]);
      } catch (const std::exception&) {
        std::cerr << "codebox: invalid --timeout " << args[i] << "\n";
        return kExitUsage;
      }
    } else if (!source) {
      source = args[i];
    } else {
      print_usage(std::cerr);
      return kExitUsage;
    }
  }

  std::string code;
  if (!source || *source == "-") {
    code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream input(*source, std::ios::binary);
    if (!input) {
      std::cerr << "codebox: cannot read " << *source << "\n";
      return kExitUsage;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    code = buffer.str();
  }

  auto result = tool.invoke({{"code", code}, {"timeout_seconds", timeout}});
  std::cout << dump_lenient(result, 2) << std::endl;
  return result["success"].get<bool>() ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  auto options = parse_options(argc, argv);
  if (!options) {
    print_usage(std::cerr);
    return kExitUsage;
  }
  auto level = codebox::parse_log_level(options->log_level);
  if (!level) {
    std::cerr << "codebox: unknown log level " << options->log_level << "\n";
    return kExitUsage;
  }
  codebox::set_log_level(*level);

  auto config = build_config(*options);
  if (!config) {
    return kExitUsage;
  }

  codebox::PosixSupervisor supervisor;
  codebox::Executor executor(std::move(*config), supervisor);
  codebox::ExecuteCodeTool tool(executor);

  if (options->command == "describe") {
    std::cout << tool.definition().dump(2) << std::endl;
    return 0;
  }
  if (options->command == "serve") {
    return serve(tool);
  }
  if (options->command == "run") {
    return run_once(tool, options->rest);
  }
  std::cerr << "codebox: unknown command " << options->command << "\n";
  print_usage(std::cerr);
  return kExitUsage;
}
