#include <cstdlib>

#include <gtest/gtest.h>

#include "dipnet/config.hpp"
#include "dipnet/observability.hpp"

namespace {

class ConfigEnvFixture : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* key : {"DIPNET_HOST", "DIPNET_PORT", "DIPNET_REQUEST_TIMEOUT_MS", "DIPNET_LOG_LEVEL",
                            "FAKE_SERVER_PORT", "FAKE_SERVER_RESENT_CACHE"}) {
      unsetenv(key);
    }
  }
};

TEST_F(ConfigEnvFixture, ClientDefaultsWithoutEnvironment) {
  auto config = dipnet::LoadClientConfigFromEnv();
  EXPECT_EQ(config.host, "localhost");
  EXPECT_EQ(config.port, 8432);
  EXPECT_EQ(config.target, "/");
  EXPECT_EQ(config.request_timeout_ms, 30000u);
  EXPECT_EQ(config.handler_threads, 2u);
  EXPECT_EQ(dipnet::ParseLogLevel(config.log_level), dipnet::LogLevel::kInfo);
}

TEST_F(ConfigEnvFixture, ClientReadsEnvironment) {
  setenv("DIPNET_HOST", "diplomacy.example", 1);
  setenv("DIPNET_PORT", "9000", 1);
  setenv("DIPNET_REQUEST_TIMEOUT_MS", "1500", 1);
  setenv("DIPNET_LOG_LEVEL", "WARNING", 1);
  auto config = dipnet::LoadClientConfigFromEnv();
  EXPECT_EQ(config.host, "diplomacy.example");
  EXPECT_EQ(config.port, 9000);
  EXPECT_EQ(config.request_timeout_ms, 1500u);
  EXPECT_EQ(dipnet::ParseLogLevel(config.log_level), dipnet::LogLevel::kWarn);
}

TEST_F(ConfigEnvFixture, FakeServerReadsEnvironment) {
  setenv("FAKE_SERVER_PORT", "0", 1);
  setenv("FAKE_SERVER_RESENT_CACHE", "8", 1);
  auto config = dipnet::LoadFakeServerConfigFromEnv();
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 0);
  EXPECT_EQ(config.resent_cache_size, 8u);
  EXPECT_EQ(config.queue_limit_bytes, 1024u * 1024u);
}

}  // namespace
