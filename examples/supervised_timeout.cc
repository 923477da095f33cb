#include <chrono>
#include <iostream>

#include "codebox/supervisor.hpp"

int main() {
  codebox::SupervisedRun run;
  run.argv = {"/bin/sh", "-c", "printf 'tick'; sleep 10"};
  run.timeout = std::chrono::milliseconds(100);
  run.kill_grace = std::chrono::milliseconds(50);

  codebox::PosixSupervisor supervisor;
  auto result = supervisor.run(run);
  if (!result) {
    std::cerr << "run failed: " << codebox::describe(result.error()) << "\n";
    return 1;
  }
  if (!result->timed_out) {
    std::cerr << "expected timeout but process exited\n";
    return 1;
  }
  if (result->stdout_data != "tick") {
    std::cerr << "unexpected partial output: '" << result->stdout_data << "'\n";
    return 1;
  }

  return 0;
}
