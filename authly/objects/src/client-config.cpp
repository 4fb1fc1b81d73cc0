#include "authly/client-config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include "authly/endpoint.hpp"
#include "authly/log.hpp"

namespace authly {

namespace {

const char* NonEmptyEnv(std::string_view name) {
  const char* value = std::getenv(std::string(name).c_str());
  return (value == nullptr || *value == '\0') ? nullptr : value;
}

int TlsVersionRank(std::string_view ver) {
  if (ver == ClientConfig::kTls12) {
    return 2;
  }
  if (ver == ClientConfig::kTls13) {
    return 3;
  }
  return 0;
}

}  // namespace

ClientConfig ClientConfig::FromEnvironment() {
  ClientConfig config;
  if (const char* envUrl = NonEmptyEnv(kUrlEnvVar)) {
    config.url = envUrl;
  }
  if (const char* envCa = NonEmptyEnv(kCaPathEnvVar)) {
    config.caPath = envCa;
  }
  if (const char* envIdentity = NonEmptyEnv(kIdentityPathEnvVar)) {
    config.identityPath = envIdentity;
  }
  log::debug("Client configuration from environment: url={} ca={} identity={}", config.url, config.caPath.string(),
             config.identityPath.string());
  return config;
}

void ClientConfig::validate() const {
  // throws std::invalid_argument on malformed / non https URL
  [[maybe_unused]] const auto endpoint = Endpoint::Parse(url);

  if (handshakeTimeout.count() <= 0) {
    throw std::invalid_argument("handshakeTimeout must be strictly positive");
  }
  if (requestTimeout.count() <= 0) {
    throw std::invalid_argument("requestTimeout must be strictly positive");
  }
  if (keepAliveIdleTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveIdleTimeout must not be negative");
  }
  if (retryBackoffInitial.count() <= 0) {
    throw std::invalid_argument("retryBackoffInitial must be strictly positive");
  }
  if (retryBackoffMax < retryBackoffInitial) {
    throw std::invalid_argument("retryBackoffMax must not be lower than retryBackoffInitial");
  }
  if (credentialRotationMargin.count() < 0) {
    throw std::invalid_argument("credentialRotationMargin must not be negative");
  }

  const int minRank = TlsVersionRank(minVersion);
  if (minRank == 0) {
    log::critical("Unsupported tls minVersion '{}', allowed: TLS1.2, TLS1.3", minVersion);
    throw std::invalid_argument("Unsupported tls minVersion");
  }
  if (!maxVersion.empty()) {
    const int maxRank = TlsVersionRank(maxVersion);
    if (maxRank == 0) {
      log::critical("Unsupported tls maxVersion '{}', allowed: TLS1.2, TLS1.3", maxVersion);
      throw std::invalid_argument("Unsupported tls maxVersion");
    }
    if (maxRank < minRank) {
      throw std::invalid_argument("tls maxVersion is lower than minVersion");
    }
  }

  if (maxFrameSize == 0 || maxFrameSize > kMaxFrameSizeUpperBound) {
    throw std::invalid_argument("maxFrameSize must be in [1, 1GiB]");
  }
}

}  // namespace authly
