#include "codebox/supervisor.hpp"

#include "codebox/internal/backend.hpp"
#include "codebox/internal/clock.hpp"
#include "codebox/internal/io_pump.hpp"
#include "codebox/internal/launch.hpp"
#include "codebox/internal/process.hpp"

namespace codebox {

Result<SupervisedOutput> PosixSupervisor::run(const SupervisedRun& request) {
  auto spec = internal::make_launch_spec(request);
  if (!spec) {
    return spec.error();
  }

  auto& clock = internal::default_clock();
  const auto deadline = clock.now() + request.timeout;

  auto launched = internal::default_backend().launch(*spec);
  if (!launched) {
    return launched.error();
  }
  internal::Process process(std::move(launched.value()));

  auto stdin_pipe = process.take_stdin();
  auto stdout_pipe = process.take_stdout();
  auto stderr_pipe = process.take_stderr();

  internal::PumpLimits limits{.deadline = deadline, .output_limit = request.output_limit};
  std::string_view input = request.input ? std::string_view(*request.input) : std::string_view();
  auto pumped = internal::pump_pipes(&stdin_pipe, input, &stdout_pipe, &stderr_pipe, clock, limits);
  if (!pumped) {
    // ~Process kills and reaps.
    return pumped.error();
  }

  // A descendant holding the pipes must not stall the reap.
  stdin_pipe.close();
  stdout_pipe.close();
  stderr_pipe.close();

  SupervisedOutput output;
  output.truncated = pumped->truncated;
  output.stdout_data = std::move(pumped->stdout_data);
  output.stderr_data = std::move(pumped->stderr_data);

  auto remaining = pumped->timed_out ? std::chrono::milliseconds(0)
                                     : internal::remaining_until(clock, deadline);
  auto status = process.wait(remaining, request.kill_grace);
  if (!status) {
    if (status.error().code == make_error_code(errc::timeout)) {
      output.timed_out = true;
      return output;
    }
    return status.error();
  }
  output.status = *status;
  // The leader exited in time but its pipes stayed open past the deadline; the wait
  // already killed whatever in its group held them.
  output.timed_out = pumped->timed_out;
  return output;
}

}  // namespace codebox
