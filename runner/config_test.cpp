#include "runner/config.hpp"

#include <string>
#include <vector>

#include <kj/exception.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

// Flags are process-wide: every test starts from a valid setup, with only a
// shell enabled, and the previous values are restored afterwards.
class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_interpreter_ = Flags::interpreter;
    saved_languages_ = Flags::languages;
    saved_output_ = Flags::max_output_bytes;
    saved_timeout_ = Flags::execution_timeout_millis;
    saved_code_ = Flags::max_code_bytes;
    saved_concurrency_ = Flags::max_concurrent_executions;
    saved_files_ = Flags::max_files;
    saved_temp_ = Flags::temp_directory;

    Flags::interpreter = "";
    Flags::languages = {"sh=/bin/sh"};
  }

  void TearDown() override {
    Flags::interpreter = saved_interpreter_;
    Flags::languages = saved_languages_;
    Flags::max_output_bytes = saved_output_;
    Flags::execution_timeout_millis = saved_timeout_;
    Flags::max_code_bytes = saved_code_;
    Flags::max_concurrent_executions = saved_concurrency_;
    Flags::max_files = saved_files_;
    Flags::temp_directory = saved_temp_;
  }

 private:
  std::string saved_interpreter_;
  std::vector<std::string> saved_languages_;
  uint32_t saved_output_ = 0;
  uint32_t saved_timeout_ = 0;
  uint32_t saved_code_ = 0;
  int32_t saved_concurrency_ = 0;
  int32_t saved_files_ = 0;
  std::string saved_temp_;
};

// NOLINTNEXTLINE
TEST_F(ConfigTest, Defaults) {
  runner::Config config = runner::Config::FromFlags();
  EXPECT_EQ(config.max_code_bytes, 64 * 1024);
  EXPECT_EQ(config.execution_timeout_millis, 10000);
  EXPECT_EQ(config.max_output_bytes, 64 * 1024);
  EXPECT_EQ(config.memory_limit_kb, 512 * 1024);
  EXPECT_GE(config.max_concurrent_executions, 1);
  EXPECT_NE(config.languages.Find("sh"), nullptr);
  EXPECT_EQ(config.languages.Find("python"), nullptr);
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, ExplicitValues) {
  Flags::max_output_bytes = 1;
  Flags::execution_timeout_millis = 250;
  Flags::max_concurrent_executions = 3;
  runner::Config config = runner::Config::FromFlags();
  EXPECT_EQ(config.max_output_bytes, 1);
  EXPECT_EQ(config.execution_timeout_millis, 250);
  EXPECT_EQ(config.max_concurrent_executions, 3);
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, ZeroOutputCapIsRefused) {
  Flags::max_output_bytes = 0;
  EXPECT_THROW(runner::Config::FromFlags(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, ZeroTimeoutIsRefused) {
  Flags::execution_timeout_millis = 0;
  EXPECT_THROW(runner::Config::FromFlags(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, ZeroCodeSizeIsRefused) {
  Flags::max_code_bytes = 0;
  EXPECT_THROW(runner::Config::FromFlags(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, NegativeFileLimitIsRefused) {
  Flags::max_files = -1;
  EXPECT_THROW(runner::Config::FromFlags(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, EmptyTempDirIsRefused) {
  Flags::temp_directory = "";
  EXPECT_THROW(runner::Config::FromFlags(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ConfigTest, NoLanguageIsRefused) {
  Flags::languages.clear();
  EXPECT_THROW(runner::Config::FromFlags(), kj::Exception);  // NOLINT
}

}  // namespace
