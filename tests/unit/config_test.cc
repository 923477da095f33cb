#include "codebox/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace codebox {

namespace {

class TempFile {
 public:
  explicit TempFile(const std::string& contents) {
    path_ = std::filesystem::temp_directory_path() /
            ("codebox_config_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++) +
             ".json");
    std::ofstream out(path_);
    out << contents;
  }
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  static inline int counter_ = 0;
  std::filesystem::path path_;
};

}  // namespace

TEST(ConfigTest, DefaultsAreValid) {
  ExecutorConfig config;
  EXPECT_EQ(config.interpreter, "python3");
  EXPECT_EQ(config.delivery, CodeDelivery::standard_input);
  EXPECT_EQ(config.output_limit, 1024u * 1024u);
  EXPECT_EQ(config.timeouts.min, std::chrono::seconds(1));
  EXPECT_EQ(config.timeouts.max, std::chrono::seconds(30));
  EXPECT_EQ(config.timeouts.fallback, std::chrono::seconds(10));
  EXPECT_TRUE(config.new_process_group);
  EXPECT_TRUE(validate(config).has_value());
}

TEST(ConfigTest, JsonOverlaysKnownKeys) {
  ExecutorConfig config;
  apply_config_json(config, nlohmann::json::parse(R"({
    "interpreter": "node",
    "interpreterArgs": ["--no-warnings", 7],
    "delivery": "argument",
    "argumentFlag": "-e",
    "outputLimitBytes": 4096,
    "timeoutSeconds": {"min": 2, "max": 20, "default": 5},
    "killGraceMs": 50,
    "newProcessGroup": false,
    "env": {"NODE_ENV": "sandbox", "IGNORED": 1},
    "installHint": "Install Node.js"
  })"));

  EXPECT_EQ(config.interpreter, "node");
  ASSERT_EQ(config.interpreter_args.size(), 1u);
  EXPECT_EQ(config.interpreter_args[0], "--no-warnings");
  EXPECT_EQ(config.delivery, CodeDelivery::argument);
  EXPECT_EQ(config.argument_flag, "-e");
  EXPECT_EQ(config.output_limit, 4096u);
  EXPECT_EQ(config.timeouts.min, std::chrono::seconds(2));
  EXPECT_EQ(config.timeouts.max, std::chrono::seconds(20));
  EXPECT_EQ(config.timeouts.fallback, std::chrono::seconds(5));
  EXPECT_EQ(config.kill_grace, std::chrono::milliseconds(50));
  EXPECT_FALSE(config.new_process_group);
  ASSERT_EQ(config.env.size(), 1u);
  EXPECT_EQ(config.env.at("NODE_ENV"), "sandbox");
  EXPECT_EQ(config.install_hint, "Install Node.js");
}

TEST(ConfigTest, WronglyTypedKeysAreIgnored) {
  ExecutorConfig config;
  apply_config_json(config, nlohmann::json::parse(R"({
    "interpreter": 3,
    "delivery": "carrier-pigeon",
    "outputLimitBytes": -1,
    "timeoutSeconds": {"max": "lots"},
    "newProcessGroup": "yes"
  })"));
  ExecutorConfig defaults;
  EXPECT_EQ(config.interpreter, defaults.interpreter);
  EXPECT_EQ(config.delivery, defaults.delivery);
  EXPECT_EQ(config.output_limit, defaults.output_limit);
  EXPECT_EQ(config.timeouts.max, defaults.timeouts.max);
  EXPECT_EQ(config.new_process_group, defaults.new_process_group);
}

TEST(ConfigTest, LoadsFile) {
  TempFile file(R"({"interpreter": "python3.12", "timeoutSeconds": {"default": 3}})");
  ExecutorConfig config;
  auto loaded = load_config_file(config, file.path());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(config.interpreter, "python3.12");
  EXPECT_EQ(config.timeouts.fallback, std::chrono::seconds(3));
}

TEST(ConfigTest, MissingFileIsInvalidConfig) {
  ExecutorConfig config;
  auto loaded = load_config_file(config, "/nonexistent/codebox/config.json");
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code, make_error_code(errc::invalid_config));
}

TEST(ConfigTest, MalformedFileIsInvalidConfig) {
  TempFile file("{ not json");
  ExecutorConfig config;
  auto loaded = load_config_file(config, file.path());
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code, make_error_code(errc::invalid_config));
}

TEST(ConfigTest, NonObjectRootIsInvalidConfig) {
  TempFile file("[1, 2, 3]");
  ExecutorConfig config;
  auto loaded = load_config_file(config, file.path());
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code, make_error_code(errc::invalid_config));
}

TEST(ConfigTest, EnvironmentOverridesInterpreter) {
  ::setenv("CODEBOX_INTERPRETER", "/usr/bin/env-python", 1);
  ExecutorConfig config;
  apply_env_overrides(config);
  EXPECT_EQ(config.interpreter, "/usr/bin/env-python");

  ::setenv("CODEBOX_INTERPRETER", "", 1);
  ExecutorConfig untouched;
  apply_env_overrides(untouched);
  EXPECT_EQ(untouched.interpreter, "python3");
  ::unsetenv("CODEBOX_INTERPRETER");
}

TEST(ConfigTest, ValidateRejectsInconsistentValues) {
  auto rejects = [](auto mutate) {
    ExecutorConfig config;
    mutate(config);
    auto result = validate(config);
    return !result.has_value() && result.error().code == make_error_code(errc::invalid_config);
  };
  EXPECT_TRUE(rejects([](ExecutorConfig& c) { c.interpreter.clear(); }));
  EXPECT_TRUE(rejects([](ExecutorConfig& c) { c.output_limit = 0; }));
  EXPECT_TRUE(rejects([](ExecutorConfig& c) { c.timeouts.min = std::chrono::seconds(0); }));
  EXPECT_TRUE(rejects([](ExecutorConfig& c) {
    c.timeouts.min = std::chrono::seconds(20);
    c.timeouts.max = std::chrono::seconds(10);
  }));
  EXPECT_TRUE(rejects([](ExecutorConfig& c) { c.timeouts.fallback = std::chrono::seconds(31); }));
  EXPECT_TRUE(rejects([](ExecutorConfig& c) {
    c.delivery = CodeDelivery::argument;
    c.argument_flag.clear();
  }));
  EXPECT_TRUE(rejects(
      [](ExecutorConfig& c) { c.timeouts.max = kMaxTimeout + std::chrono::seconds(1); }));
  EXPECT_TRUE(rejects(
      [](ExecutorConfig& c) { c.kill_grace = kMaxKillGrace + std::chrono::milliseconds(1); }));
  EXPECT_TRUE(rejects([](ExecutorConfig& c) { c.kill_grace = std::chrono::milliseconds(-1); }));
}

TEST(ConfigTest, CeilingsThemselvesAreAccepted) {
  ExecutorConfig config;
  config.timeouts.max = kMaxTimeout;
  config.kill_grace = kMaxKillGrace;
  EXPECT_TRUE(validate(config).has_value());
}

TEST(ConfigTest, HugeJsonNumbersSaturateAndAreRejected) {
  ExecutorConfig grace;
  apply_config_json(grace, nlohmann::json::parse(R"({"killGraceMs": 18446744073709551615})"));
  EXPECT_GT(grace.kill_grace, std::chrono::milliseconds(0));
  EXPECT_FALSE(validate(grace).has_value());

  ExecutorConfig timeouts;
  apply_config_json(timeouts,
                    nlohmann::json::parse(R"({"timeoutSeconds": {"max": 18446744073709551615}})"));
  EXPECT_GT(timeouts.timeouts.max, std::chrono::seconds(0));
  auto result = validate(timeouts);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::invalid_config));

  ExecutorConfig negative;
  apply_config_json(negative, nlohmann::json::parse(R"({"timeoutSeconds": {"max": -5}})"));
  EXPECT_FALSE(validate(negative).has_value());
}

}  // namespace codebox
