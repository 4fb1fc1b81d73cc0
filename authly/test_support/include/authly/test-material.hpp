#pragma once

#include <string_view>

#include "authly/temp-file.hpp"
#include "authly/test-mtls-server.hpp"
#include "authly/test-pki.hpp"

namespace authly::test {

inline constexpr std::string_view kClientEntityId = "e.0123456789abcdef0123456789abcdef";
inline constexpr std::string_view kServerEntityId = "e.fedcba9876543210fedcba9876543210";

inline CertOptions ServerCertOptions() {
  CertOptions options;
  options.commonName = "authly";
  options.entityId = kServerEntityId;
  options.usage = CertUsage::Server;
  return options;
}

inline CertOptions ClientCertOptions() {
  CertOptions options;
  options.commonName = "test-service";
  options.dnsNames = {"test-service"};
  options.ipAddresses.clear();
  options.entityId = kClientEntityId;
  options.usage = CertUsage::Client;
  return options;
}

// A CA with a server and a client identity, written as CA file and combined identity file in a temporary directory.
struct TestMaterial {
  explicit TestMaterial(const CertOptions& clientOptions = ClientCertOptions(),
                        const CertOptions& serverOptions = ServerCertOptions())
      : server(ca.issue(serverOptions)),
        client(ca.issue(clientOptions)),
        caFile(dir, "local.crt", ca.certPem()),
        identityFile(dir, "identity.pem", client.identityPem()) {}

  [[nodiscard]] TestMtlsServerConfig serverConfig(ServerMode mode = ServerMode::Echo) const {
    TestMtlsServerConfig config;
    config.certPem = server.certPem;
    config.chainPem = server.chainPem;
    config.keyPem = server.keyPem;
    config.clientCaPem = ca.certPem();
    config.mode = mode;
    return config;
  }

  TestCa ca;
  CertKey server;
  CertKey client;
  ScopedTempDir dir;
  ScopedTempFile caFile;
  ScopedTempFile identityFile;
};

}  // namespace authly::test
