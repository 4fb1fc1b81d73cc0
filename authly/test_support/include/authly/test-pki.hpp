#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "authly/tls-raii.hpp"

namespace authly::test {

// In-memory certificate generation for tests only.
enum class KeyAlgorithm : uint8_t { Rsa2048, EcdsaP256, Ed25519 };

enum class CertUsage : uint8_t { Server, Client, ServerAndClient };

struct CertOptions {
  std::string commonName{"localhost"};
  std::vector<std::string> dnsNames{"localhost"};
  std::vector<std::string> ipAddresses{"127.0.0.1"};
  // Textual entity id stored in the x500UniqueIdentifier subject attribute, none if empty.
  std::string entityId;
  // Validity window, relative to now.
  std::chrono::seconds notBeforeOffset{-60};
  std::chrono::seconds notAfterOffset{std::chrono::hours{1}};
  CertUsage usage{CertUsage::ServerAndClient};
  KeyAlgorithm keyAlgorithm{KeyAlgorithm::EcdsaP256};
};

struct CertKey {
  // Combined identity file: leaf certificate, intermediates then private key.
  [[nodiscard]] std::string identityPem() const { return certPem + chainPem + keyPem; }

  std::string certPem;   // leaf certificate
  std::string chainPem;  // intermediate certificates (may be empty)
  std::string keyPem;    // PKCS#8 private key
};

// Certificate authority able to issue leaf and intermediate certificates.
class TestCa {
 public:
  // Self-signed root CA.
  explicit TestCa(const std::string& commonName = "Authly Test CA", KeyAlgorithm alg = KeyAlgorithm::EcdsaP256);

  TestCa(const TestCa&) = delete;
  TestCa(TestCa&&) noexcept = default;
  TestCa& operator=(const TestCa&) = delete;
  TestCa& operator=(TestCa&&) noexcept = default;

  ~TestCa() = default;

  // Intermediate CA signed by this one.
  [[nodiscard]] TestCa issueIntermediate(const std::string& commonName) const;

  // Leaf certificate signed by this CA. Its chainPem holds this CA certificate if it is an intermediate.
  [[nodiscard]] CertKey issue(const CertOptions& options = {}) const;

  [[nodiscard]] const std::string& certPem() const noexcept { return _certPem; }

  [[nodiscard]] const std::string& keyPem() const noexcept { return _keyPem; }

 private:
  TestCa(PKeyPtr key, X509Ptr cert, std::string chainPem);

  PKeyPtr _key;
  X509Ptr _cert;
  std::string _certPem;
  std::string _keyPem;
  // Intermediate certificates from this CA (included) up to the root (excluded).
  std::string _chainPem;
};

// Self-signed leaf certificate, trusted by nobody.
CertKey MakeSelfSigned(const CertOptions& options = {});

// Fresh PKCS#8 private key, unrelated to any certificate.
std::string MakeKeyPem(KeyAlgorithm alg = KeyAlgorithm::EcdsaP256);

// Re-encode a PKCS#8 private key in its traditional form (PKCS#1 for RSA, SEC1 for EC).
std::string ToTraditionalKeyPem(const std::string& pkcs8Pem);

// Encrypt a PKCS#8 private key with 'password' (AES-256-CBC).
std::string ToEncryptedKeyPem(const std::string& pkcs8Pem, const std::string& password);

// DER encoding of a PEM certificate.
std::string ToDer(const std::string& certPem);

}  // namespace authly::test
