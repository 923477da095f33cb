#include <iostream>

#include "codebox/executor.hpp"
#include "codebox/supervisor.hpp"
#include "codebox/tool.hpp"

int main() {
  codebox::ExecutorConfig config;
  config.interpreter = "sh";

  codebox::PosixSupervisor supervisor;
  codebox::Executor executor(config, supervisor);

  auto outcome = executor.execute("echo 'out'; echo 'err' 1>&2", std::chrono::seconds(5));
  if (!outcome.success()) {
    std::cerr << "execution failed: " << outcome.failure().message << "\n";
    return 1;
  }
  if (outcome.stdout_data() != "out" || outcome.stderr_data() != "err") {
    std::cerr << "unexpected output: stdout='" << outcome.stdout_data() << "' stderr='"
              << outcome.stderr_data() << "'\n";
    return 1;
  }

  std::cout << codebox::to_json(outcome).dump() << "\n";
  return 0;
}
