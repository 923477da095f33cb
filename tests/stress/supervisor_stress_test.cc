#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "codebox/executor.hpp"
#include "codebox/supervisor.hpp"
#include "tests/helpers/process_watch.hpp"

namespace codebox {

using namespace std::chrono_literals;

namespace {

ExecutorConfig shell_config() {
  ExecutorConfig config;
  config.interpreter = "sh";
  config.kill_grace = 100ms;
  return config;
}

SupervisedRun sh_run(std::string script, std::chrono::milliseconds timeout) {
  SupervisedRun run;
  run.argv = {"/bin/sh", "-c", std::move(script)};
  run.timeout = timeout;
  run.kill_grace = 100ms;
  return run;
}

}  // namespace

TEST(SupervisorStressTest, RepeatedLargeOutput) {
  PosixSupervisor supervisor;
  constexpr int kRuns = 50;
  for (int i = 0; i < kRuns; ++i) {
    auto out = supervisor.run(
        sh_run("head -c 262144 /dev/zero; head -c 131072 /dev/zero >&2", 10s));
    ASSERT_TRUE(out.has_value()) << describe(out.error());
    EXPECT_EQ(out->stdout_data.size(), 262144u);
    EXPECT_EQ(out->stderr_data.size(), 131072u);
  }
}

TEST(ExecutorStressTest, ConcurrentExecutionsDoNotInterfere) {
  PosixSupervisor supervisor;
  Executor executor(shell_config(), supervisor);

  constexpr int kThreads = 8;
  constexpr int kRunsPerThread = 10;
  std::vector<std::thread> threads;
  std::vector<std::vector<std::string>> seen(kThreads);

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kRunsPerThread; ++i) {
        std::string marker = std::to_string(t) + ":" + std::to_string(i);
        auto outcome = executor.execute("echo " + marker, 10s);
        seen[t].push_back(outcome.success() ? outcome.stdout_data() : outcome.failure().message);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int t = 0; t < kThreads; ++t) {
    ASSERT_EQ(seen[t].size(), static_cast<std::size_t>(kRunsPerThread));
    for (int i = 0; i < kRunsPerThread; ++i) {
      EXPECT_EQ(seen[t][i], std::to_string(t) + ":" + std::to_string(i));
    }
  }
}

TEST(ExecutorStressTest, ConcurrentTimeoutsStayBounded) {
  PosixSupervisor supervisor;
  Executor executor(shell_config(), supervisor);

  constexpr int kThreads = 6;
  std::vector<std::thread> threads;
  std::vector<std::optional<FailureKind>> kinds(kThreads);

  auto start = std::chrono::steady_clock::now();
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      auto outcome = executor.execute("sleep 30", 1s);
      if (!outcome.success()) {
        kinds[t] = outcome.failure().kind;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  auto waited = std::chrono::steady_clock::now() - start;

  for (const auto& kind : kinds) {
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, FailureKind::timeout);
  }
  EXPECT_LT(waited, 5s);
}

TEST(SupervisorStressTest, RepeatedTimeouts) {
  PosixSupervisor supervisor;
  std::size_t before = codebox::testing::count_open_fds();
  for (int i = 0; i < 30; ++i) {
    auto out = supervisor.run(sh_run("sleep 5", 20ms));
    ASSERT_TRUE(out.has_value()) << describe(out.error());
    EXPECT_TRUE(out->timed_out);
  }
  EXPECT_EQ(codebox::testing::count_open_fds(), before);
}

}  // namespace codebox
