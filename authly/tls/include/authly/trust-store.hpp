#pragma once

#include <openssl/x509.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "authly/identity.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

// Immutable set of trust anchors (CA certificates) used to validate peer certificate chains.
// Anchors do not need to be self-signed: a local CA issued by an offline root can be trusted on its own.
// Safe to share across threads once loaded.
class TrustStore {
 public:
  enum class Purpose : std::uint8_t { Any, Server, Client };

  struct VerifyOptions {
    // If non empty, the leaf must be valid for this DNS name (or IP address if hostIsIp).
    std::string_view host;
    bool hostIsIp{false};
    // Verification time, now if not set.
    std::optional<SysTimePoint> at;
    Purpose purpose{Purpose::Server};
  };

  // Load all certificates of a PEM file (or a single DER certificate).
  // Throws TrustMaterialError if the file is unreadable, empty or contains anything else than certificates.
  static TrustStore FromFile(const std::filesystem::path& path);

  // Same as FromFile, from an in-memory buffer.
  static TrustStore FromPem(std::string_view pem);

  TrustStore(const TrustStore&) = delete;
  TrustStore(TrustStore&&) noexcept = default;
  TrustStore& operator=(const TrustStore&) = delete;
  TrustStore& operator=(TrustStore&&) noexcept = default;

  ~TrustStore() = default;

  // Validate that 'leaf' chains up to one of the anchors, using 'intermediates' (may be null, may contain the leaf)
  // as untrusted chain elements. Returns the identity of the verified leaf.
  // Throws:
  //  - UntrustedPeerError if no anchor is reachable, or if the host / purpose does not match
  //  - ExpiredCertificateError if a certificate of the chain is outside its validity window
  //  - MalformedChainError for any other structural problem (bad signature, invalid CA, path length...)
  [[nodiscard]] Identity verifyChain(X509* leaf, STACK_OF(X509) * intermediates, const VerifyOptions& options) const;

  [[nodiscard]] std::size_t size() const noexcept { return _anchors.size(); }

  [[nodiscard]] const std::vector<Identity>& anchors() const noexcept { return _anchors; }

 private:
  explicit TrustStore(X509StorePtr store) noexcept : _store(std::move(store)) {}

  X509StorePtr _store;
  std::vector<Identity> _anchors;
};

}  // namespace authly
