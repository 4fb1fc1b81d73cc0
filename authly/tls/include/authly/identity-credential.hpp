#pragma once

#include <openssl/ssl.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "authly/identity.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

// Private key and certificate chain representing the local service identity.
// The private key never leaves this object: it is only used to sign, or installed into a TLS connection.
// Immutable once loaded, typically shared as std::shared_ptr<const IdentityCredential>.
class IdentityCredential {
 public:
  // Load a combined PEM file holding the certificate chain (leaf first) and the private key, in any order.
  // Accepted key encodings: PKCS#8, PKCS#1 (RSA) and SEC1 (EC).
  // Throws:
  //  - CredentialLoadError if the file is unreadable, malformed, encrypted or lacks the certificate or the key
  //  - KeyMismatchError if the private key does not correspond to the leaf certificate
  //  - ExpiredCertificateError if the leaf certificate is not valid at 'now'
  static IdentityCredential FromPemFile(const std::filesystem::path& path, SysTimePoint now = SysClock::now());

  // Same as FromPemFile, with key and certificate chain in separate files.
  static IdentityCredential FromFiles(const std::filesystem::path& keyPath, const std::filesystem::path& certPath,
                                      SysTimePoint now = SysClock::now());

  // Same as FromPemFile, from an in-memory combined PEM.
  static IdentityCredential FromPem(std::string_view combinedPem, SysTimePoint now = SysClock::now());

  // Same as FromFiles, from in-memory PEM buffers.
  static IdentityCredential FromPem(std::string_view keyPem, std::string_view certPem,
                                    SysTimePoint now = SysClock::now());

  IdentityCredential(const IdentityCredential&) = delete;
  IdentityCredential(IdentityCredential&&) noexcept = default;
  IdentityCredential& operator=(const IdentityCredential&) = delete;
  IdentityCredential& operator=(IdentityCredential&&) noexcept = default;

  ~IdentityCredential() = default;

  [[nodiscard]] const Identity& identity() const noexcept { return _identity; }

  [[nodiscard]] SysTimePoint notBefore() const noexcept { return _identity.notBefore; }

  // Expiry (notAfter) of the leaf certificate.
  [[nodiscard]] SysTimePoint expiry() const noexcept { return _identity.notAfter; }

  // Throws ExpiredCertificateError if the leaf certificate is not valid at 'now'.
  void checkValidity(SysTimePoint now) const;

  // True if the leaf certificate expires before now + margin.
  [[nodiscard]] bool expiresWithin(std::chrono::seconds margin, SysTimePoint now = SysClock::now()) const noexcept {
    return expiry() <= now + margin;
  }

  // Sign 'data' with the private key (SHA-256 digest, or pure signature for EdDSA keys).
  // Throws SigningError if the key operation fails.
  [[nodiscard]] std::vector<std::byte> sign(std::span<const std::byte> data) const;

  // Verify 'signature' of 'data' against the leaf certificate public key.
  [[nodiscard]] bool verify(std::span<const std::byte> data, std::span<const std::byte> signature) const;

  // Install certificate chain and private key into given (not yet handshaken) TLS connection.
  // Throws CredentialLoadError if OpenSSL refuses the material.
  void presentTo(SSL* ssl) const;

  // Number of intermediate certificates presented after the leaf.
  [[nodiscard]] std::size_t chainLength() const noexcept { return _chain.size(); }

  // OpenSSL name of the key type ("RSA", "EC", "ED25519"...).
  [[nodiscard]] std::string_view keyType() const noexcept;

 private:
  IdentityCredential(PKeyPtr key, X509Ptr leaf, std::vector<X509Ptr> chain, Identity identity) noexcept
      : _key(std::move(key)), _leaf(std::move(leaf)), _chain(std::move(chain)), _identity(std::move(identity)) {}

  static IdentityCredential Build(std::string_view keyPem, std::string_view certPem, bool combined, SysTimePoint now);

  PKeyPtr _key;
  X509Ptr _leaf;
  std::vector<X509Ptr> _chain;
  Identity _identity;
};

}  // namespace authly
