#include "authly/client-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "authly/scoped-env-var.hpp"

namespace authly {

using namespace std::chrono_literals;

TEST(ClientConfig, DefaultsAreValid) {
  ClientConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.url, "https://authly");
  EXPECT_EQ(config.caPath.string(), "/etc/authly/certs/local.crt");
  EXPECT_EQ(config.identityPath.string(), "/etc/authly/identity/identity.pem");
  EXPECT_EQ(config.retryCount, 0U);
  EXPECT_TRUE(config.expectedPeerIdentity.empty());
  EXPECT_EQ(config.keepAliveIdleTimeout, 0ms);
  EXPECT_EQ(config.handshakeTimeout, 10s);
}

TEST(ClientConfig, FromEnvironmentOverridesUrlAndPaths) {
  test::ScopedEnvVar url("AUTHLY_URL", "https://authly.internal:9443");
  test::ScopedEnvVar ca("AUTHLY_LOCAL_CA", "/tmp/ca.crt");
  test::ScopedEnvVar id("AUTHLY_IDENTITY", "/tmp/identity.pem");

  const auto config = ClientConfig::FromEnvironment();
  EXPECT_EQ(config.url, "https://authly.internal:9443");
  EXPECT_EQ(config.caPath.string(), "/tmp/ca.crt");
  EXPECT_EQ(config.identityPath.string(), "/tmp/identity.pem");
}

TEST(ClientConfig, FromEnvironmentIgnoresUnsetOrEmpty) {
  test::ScopedEnvVar url("AUTHLY_URL", "");
  test::ScopedEnvVar ca("AUTHLY_LOCAL_CA", nullptr);
  test::ScopedEnvVar id("AUTHLY_IDENTITY", nullptr);

  const auto config = ClientConfig::FromEnvironment();
  EXPECT_TRUE(config == ClientConfig{});
}

TEST(ClientConfig, FluentSetters) {
  auto config = ClientConfig{}
                    .withUrl("https://localhost:1234")
                    .withHandshakeTimeout(500ms)
                    .withRetryCount(3)
                    .withRetryBackoff(10ms, 40ms)
                    .withExpectedPeerIdentity("authly")
                    .withTlsMinVersion("TLS1.3")
                    .withKeepAliveIdleTimeout(1s);
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.retryCount, 3U);
  EXPECT_EQ(config.retryBackoffMax, 40ms);
  EXPECT_EQ(config.expectedPeerIdentity, "authly");
  EXPECT_EQ(config.minVersion, "TLS1.3");
}

TEST(ClientConfig, InvalidUrl) {
  EXPECT_THROW(ClientConfig{}.withUrl("http://authly").validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withUrl("").validate(), std::invalid_argument);
}

TEST(ClientConfig, InvalidDurations) {
  EXPECT_THROW(ClientConfig{}.withHandshakeTimeout(0ms).validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withRequestTimeout(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withKeepAliveIdleTimeout(-1ms).validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withRetryBackoff(0ms, 1s).validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withRetryBackoff(2s, 1s).validate(), std::invalid_argument);
}

TEST(ClientConfig, InvalidTlsVersions) {
  EXPECT_THROW(ClientConfig{}.withTlsMinVersion("TLS1.1").validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withTlsMaxVersion("SSL3").validate(), std::invalid_argument);
  EXPECT_THROW(ClientConfig{}.withTlsMinVersion("TLS1.3").withTlsMaxVersion("TLS1.2").validate(),
               std::invalid_argument);
  EXPECT_NO_THROW(ClientConfig{}.withTlsMaxVersion("TLS1.2").validate());
}

TEST(ClientConfig, InvalidFrameSize) {
  EXPECT_THROW(ClientConfig{}.withMaxFrameSize(0).validate(), std::invalid_argument);
  EXPECT_NO_THROW(ClientConfig{}.withMaxFrameSize(1024).validate());
}

}  // namespace authly
