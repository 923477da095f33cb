#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <optional>
#include <vector>

#include "codebox/internal/clock.hpp"
#include "codebox/internal/wait_policy.hpp"

namespace codebox {
namespace {

using std::chrono::milliseconds;

class FakeClock final : public internal::Clock {
 public:
  std::chrono::steady_clock::time_point now() override { return now_; }

  void sleep_for(milliseconds duration) override { now_ += duration; }

  void advance(milliseconds duration) { now_ += duration; }

 private:
  std::chrono::steady_clock::time_point now_{};
};

// Simulates a child that exits on its own, on SIGTERM, or only on SIGKILL.
struct TestOps {
  Result<std::optional<ExitStatus>> wait_for(milliseconds duration) {
    wait_for_calls.push_back(duration);
    if (wait_for_error) {
      return *wait_for_error;
    }
    if (immediate_exit || (exit_after_terminate && terminated)) {
      return std::optional<ExitStatus>(ExitStatus::exited(0));
    }
    return std::optional<ExitStatus>();
  }

  Result<ExitStatus> reap() {
    ++wait_calls;
    if (reap_error) {
      return *reap_error;
    }
    return ExitStatus::killed_by(9);
  }

  Result<void> terminate() {
    ++terminate_calls;
    terminated = true;
    return {};
  }

  Result<void> kill() {
    ++kill_calls;
    if (kill_error) {
      return *kill_error;
    }
    return {};
  }

  Result<void> sweep() {
    ++sweep_calls;
    if (sweep_error) {
      return *sweep_error;
    }
    return {};
  }

  internal::WaitOps bind() {
    internal::WaitOps ops;
    ops.wait_for = [this](milliseconds duration) { return wait_for(duration); };
    ops.reap = [this]() { return reap(); };
    ops.terminate = [this]() { return terminate(); };
    ops.kill = [this]() { return kill(); };
    if (with_sweep) {
      ops.sweep = [this]() { return sweep(); };
    }
    return ops;
  }

  std::vector<milliseconds> wait_for_calls;
  int terminate_calls = 0;
  int kill_calls = 0;
  int wait_calls = 0;
  int sweep_calls = 0;
  bool with_sweep = true;
  bool terminated = false;
  bool immediate_exit = false;
  bool exit_after_terminate = false;
  std::optional<Error> wait_for_error;
  std::optional<Error> reap_error;
  std::optional<Error> kill_error;
  std::optional<Error> sweep_error;
};

}  // namespace

TEST(TimeoutPolicyTest, NoTimeoutBlocks) {
  TestOps ops_impl;
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, std::nullopt, milliseconds(5));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(ops_impl.wait_calls, 1);
  EXPECT_TRUE(ops_impl.wait_for_calls.empty());
  EXPECT_EQ(ops_impl.terminate_calls, 0);
  EXPECT_EQ(ops_impl.sweep_calls, 1);
}

TEST(TimeoutPolicyTest, ReturnsStatusBeforeTimeout) {
  TestOps ops_impl;
  ops_impl.immediate_exit = true;
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(5), milliseconds(5));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->success());
  ASSERT_EQ(ops_impl.wait_for_calls.size(), 1u);
  EXPECT_EQ(ops_impl.wait_for_calls[0], milliseconds(5));
  EXPECT_EQ(ops_impl.terminate_calls, 0);
  EXPECT_EQ(ops_impl.kill_calls, 0);
  EXPECT_EQ(ops_impl.wait_calls, 0);
  EXPECT_EQ(ops_impl.sweep_calls, 1);
}

TEST(TimeoutPolicyTest, ClockOverrideRestoresDefault) {
  FakeClock clock;
  internal::Clock* before = &internal::default_clock();
  {
    internal::ScopedClockOverride override_clock(clock);
    EXPECT_EQ(&internal::default_clock(), &clock);
  }
  EXPECT_EQ(&internal::default_clock(), before);
}

TEST(TimeoutPolicyTest, RemainingUntilNeverNegative) {
  FakeClock clock;
  auto deadline = clock.now() + milliseconds(10);
  EXPECT_EQ(internal::remaining_until(clock, deadline), milliseconds(10));
  clock.advance(milliseconds(25));
  EXPECT_EQ(internal::remaining_until(clock, deadline), milliseconds(0));
}

TEST(TimeoutPolicyTest, TimeoutTriggersTerminateDuringGrace) {
  TestOps ops_impl;
  ops_impl.exit_after_terminate = true;
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(3), milliseconds(5));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::timeout));
  EXPECT_EQ(ops_impl.terminate_calls, 1);
  EXPECT_EQ(ops_impl.kill_calls, 0);
  EXPECT_EQ(ops_impl.wait_calls, 0);
  ASSERT_EQ(ops_impl.wait_for_calls.size(), 2u);
  EXPECT_EQ(ops_impl.wait_for_calls[1], milliseconds(5));
  // The leader died from SIGTERM; whatever it left in its group is still killed.
  EXPECT_EQ(ops_impl.sweep_calls, 1);
}

TEST(TimeoutPolicyTest, TimeoutEscalatesToKill) {
  TestOps ops_impl;
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(3), milliseconds(4));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::timeout));
  EXPECT_EQ(ops_impl.terminate_calls, 1);
  EXPECT_EQ(ops_impl.kill_calls, 1);
  EXPECT_EQ(ops_impl.wait_calls, 1);
  EXPECT_EQ(ops_impl.sweep_calls, 1);
}

TEST(TimeoutPolicyTest, KillFailurePropagates) {
  TestOps ops_impl;
  ops_impl.kill_error =
      Error{.code = std::error_code(EPERM, std::system_category()), .context = "kill"};
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(1), milliseconds(1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, std::error_code(EPERM, std::system_category()));
  EXPECT_EQ(ops_impl.wait_calls, 0);
}

TEST(TimeoutPolicyTest, ReapFailureAfterKillPropagates) {
  TestOps ops_impl;
  ops_impl.reap_error = Error{.code = std::error_code(ECHILD, std::system_category()),
                              .context = "waitpid"};
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(1), milliseconds(1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, std::error_code(ECHILD, std::system_category()));
  EXPECT_EQ(ops_impl.sweep_calls, 0);
}

TEST(TimeoutPolicyTest, WaitErrorStopsEscalation) {
  TestOps ops_impl;
  ops_impl.wait_for_error =
      Error{.code = std::error_code(EINVAL, std::system_category()), .context = "poll"};
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(1), milliseconds(1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, std::error_code(EINVAL, std::system_category()));
  EXPECT_EQ(ops_impl.terminate_calls, 0);
}

TEST(TimeoutPolicyTest, SweepFailureAfterGraceExitPropagates) {
  TestOps ops_impl;
  ops_impl.exit_after_terminate = true;
  ops_impl.sweep_error =
      Error{.code = std::error_code(EPERM, std::system_category()), .context = "killpg"};
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(1), milliseconds(1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, std::error_code(EPERM, std::system_category()));
  EXPECT_EQ(ops_impl.sweep_calls, 1);
}

TEST(TimeoutPolicyTest, SweepFailureAfterNormalExitPropagates) {
  TestOps ops_impl;
  ops_impl.immediate_exit = true;
  ops_impl.sweep_error =
      Error{.code = std::error_code(EPERM, std::system_category()), .context = "killpg"};
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(5), milliseconds(5));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().context, "killpg");
}

TEST(TimeoutPolicyTest, MissingSweepIsSkipped) {
  TestOps ops_impl;
  ops_impl.exit_after_terminate = true;
  ops_impl.with_sweep = false;
  auto ops = ops_impl.bind();

  auto result = internal::wait_with_timeout(ops, milliseconds(1), milliseconds(1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::timeout));
  EXPECT_EQ(ops_impl.sweep_calls, 0);
}

}  // namespace codebox
