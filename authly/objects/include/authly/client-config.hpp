#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace authly {

// Options driving ConnectionManager, HandshakeEngine and Session.
class ClientConfig {
 public:
  static constexpr std::string_view kDefaultUrl = "https://authly";
  static constexpr std::string_view kDefaultCaPath = "/etc/authly/certs/local.crt";
  static constexpr std::string_view kDefaultIdentityPath = "/etc/authly/identity/identity.pem";

  static constexpr std::string_view kUrlEnvVar = "AUTHLY_URL";
  static constexpr std::string_view kCaPathEnvVar = "AUTHLY_LOCAL_CA";
  static constexpr std::string_view kIdentityPathEnvVar = "AUTHLY_IDENTITY";

  static constexpr std::string_view kTls12 = "TLS1.2";
  static constexpr std::string_view kTls13 = "TLS1.3";

  static constexpr std::uint32_t kDefaultMaxFrameSize = 16U * 1024U * 1024U;
  static constexpr std::uint32_t kMaxFrameSizeUpperBound = 1U << 30;

  // Default configuration, with url and file paths overridden by AUTHLY_URL, AUTHLY_LOCAL_CA and AUTHLY_IDENTITY
  // when set and non-empty.
  static ClientConfig FromEnvironment();

  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  ClientConfig& withUrl(std::string_view value) {
    url = value;
    return *this;
  }

  ClientConfig& withCaPath(std::filesystem::path value) {
    caPath = std::move(value);
    return *this;
  }

  ClientConfig& withIdentityPath(std::filesystem::path value) {
    identityPath = std::move(value);
    return *this;
  }

  ClientConfig& withHandshakeTimeout(std::chrono::milliseconds timeout) {
    handshakeTimeout = timeout;
    return *this;
  }

  ClientConfig& withRequestTimeout(std::chrono::milliseconds timeout) {
    requestTimeout = timeout;
    return *this;
  }

  // Zero disables idle expiry.
  ClientConfig& withKeepAliveIdleTimeout(std::chrono::milliseconds timeout) {
    keepAliveIdleTimeout = timeout;
    return *this;
  }

  ClientConfig& withRetryCount(std::uint32_t count) {
    retryCount = count;
    return *this;
  }

  ClientConfig& withRetryBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max) {
    retryBackoffInitial = initial;
    retryBackoffMax = max;
    return *this;
  }

  // Empty disables peer identity pinning.
  ClientConfig& withExpectedPeerIdentity(std::string_view identity) {
    expectedPeerIdentity = identity;
    return *this;
  }

  ClientConfig& withVerifyHostname(bool on = true) {
    verifyHostname = on;
    return *this;
  }

  ClientConfig& withRequireClientAuth(bool on = true) {
    requireClientAuth = on;
    return *this;
  }

  ClientConfig& withTlsMinVersion(std::string_view ver) {
    minVersion = ver;
    return *this;
  }

  ClientConfig& withTlsMaxVersion(std::string_view ver) {
    maxVersion = ver;
    return *this;
  }

  ClientConfig& withCipherList(std::string_view ciphers) {
    cipherList = ciphers;
    return *this;
  }

  ClientConfig& withMaxFrameSize(std::uint32_t size) {
    maxFrameSize = size;
    return *this;
  }

  ClientConfig& withCredentialRotationMargin(std::chrono::seconds margin) {
    credentialRotationMargin = margin;
    return *this;
  }

  ClientConfig& withLogHandshake(bool on = true) {
    logHandshake = on;
    return *this;
  }

  bool operator==(const ClientConfig&) const = default;

  std::string url{kDefaultUrl};
  std::filesystem::path caPath{kDefaultCaPath};
  std::filesystem::path identityPath{kDefaultIdentityPath};

  // Whole handshake budget, measured from the start of the attempt.
  std::chrono::milliseconds handshakeTimeout{std::chrono::seconds{10}};
  // Maximum wait for the response of one Session request.
  std::chrono::milliseconds requestTimeout{std::chrono::seconds{30}};
  std::chrono::milliseconds keepAliveIdleTimeout{0};

  // Additional attempts after a retriable failure (TransportError, TimeoutError).
  std::uint32_t retryCount{0};
  std::chrono::milliseconds retryBackoffInitial{100};
  std::chrono::milliseconds retryBackoffMax{std::chrono::seconds{10}};

  std::string expectedPeerIdentity;

  std::string minVersion{kTls12};
  std::string maxVersion;  // empty -> highest supported
  std::string cipherList;  // TLS 1.2 cipher list, empty -> OpenSSL default

  std::uint32_t maxFrameSize{kDefaultMaxFrameSize};
  std::chrono::seconds credentialRotationMargin{std::chrono::minutes{5}};

  bool verifyHostname{true};
  bool requireClientAuth{true};
  bool logHandshake{false};
};

}  // namespace authly
