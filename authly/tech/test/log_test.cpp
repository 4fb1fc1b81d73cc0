#include "authly/log.hpp"

#include <gtest/gtest.h>

#include "authly/scoped-env-var.hpp"

namespace authly {

class LogLevelTest : public ::testing::Test {
 protected:
  void TearDown() override { log::set_level(initialLevel); }

  log::level::level_enum initialLevel = log::get_level();
};

TEST_F(LogLevelTest, UnsetVariableKeepsLevel) {
  test::ScopedEnvVar env("AUTHLY_LOG_LEVEL", nullptr);
  EXPECT_FALSE(SetLogLevelFromEnv());
  EXPECT_EQ(log::get_level(), initialLevel);
}

TEST_F(LogLevelTest, KnownLevel) {
  test::ScopedEnvVar env("AUTHLY_LOG_LEVEL", "debug");
  EXPECT_TRUE(SetLogLevelFromEnv());
  EXPECT_EQ(log::get_level(), log::level::debug);
}

TEST_F(LogLevelTest, Off) {
  test::ScopedEnvVar env("AUTHLY_LOG_LEVEL", "off");
  EXPECT_TRUE(SetLogLevelFromEnv());
  EXPECT_EQ(log::get_level(), log::level::off);
}

TEST_F(LogLevelTest, UnknownLevelIsIgnored) {
  test::ScopedEnvVar env("AUTHLY_LOG_LEVEL", "verbose");
  EXPECT_FALSE(SetLogLevelFromEnv());
  EXPECT_EQ(log::get_level(), initialLevel);
}

}  // namespace authly
