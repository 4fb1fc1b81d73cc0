#include "authly/identity-credential.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "authly/authly-error.hpp"
#include "authly/identity.hpp"
#include "authly/log.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/pem-reader.hpp"
#include "authly/timedef.hpp"
#include "authly/timestring.hpp"
#include "authly/tls-raii.hpp"
#include "authly/x509-utils.hpp"

namespace authly {

namespace {

struct ParsedMaterial {
  PKeyPtr key{nullptr, ::EVP_PKEY_free};
  std::vector<X509Ptr> certs;
};

PKeyPtr DecodePrivateKey(const PemBlock& block) {
  const auto* data = reinterpret_cast<const unsigned char*>(block.der.data());
  const auto len = static_cast<long>(block.der.size());
  EVP_PKEY* pkey = nullptr;
  if (block.label == "PRIVATE KEY") {
    pkey = ::d2i_AutoPrivateKey(nullptr, &data, len);
  } else if (block.label == "RSA PRIVATE KEY") {
    pkey = ::d2i_PrivateKey(EVP_PKEY_RSA, nullptr, &data, len);
  } else if (block.label == "EC PRIVATE KEY") {
    pkey = ::d2i_PrivateKey(EVP_PKEY_EC, nullptr, &data, len);
  }
  if (pkey == nullptr) {
    throw CredentialLoadError(WithOpenSslErrors("Unparseable '" + block.label + "' block"));
  }
  return {pkey, ::EVP_PKEY_free};
}

bool IsPrivateKeyLabel(std::string_view label) {
  return label == "PRIVATE KEY" || label == "RSA PRIVATE KEY" || label == "EC PRIVATE KEY" ||
         label == "ENCRYPTED PRIVATE KEY";
}

void ParseInto(std::string_view pem, ParsedMaterial& material) {
  const auto blocks = ParsePemBlocks(pem, ErrorKind::CredentialLoad);
  if (blocks.empty() && !pem.empty()) {
    throw CredentialLoadError("Invalid PEM: no PEM block found");
  }
  for (const PemBlock& block : blocks) {
    if (block.label == "CERTIFICATE") {
      auto cert = ParseCertificateDer(block.der);
      if (!cert) {
        throw CredentialLoadError(WithOpenSslErrors("Unparseable certificate #" +
                                                    std::to_string(material.certs.size() + 1)));
      }
      material.certs.push_back(std::move(cert));
    } else if (IsPrivateKeyLabel(block.label)) {
      if (block.isEncrypted()) {
        throw CredentialLoadError("Encrypted private keys are not supported");
      }
      if (material.key) {
        throw CredentialLoadError("More than one private key found");
      }
      material.key = DecodePrivateKey(block);
    } else if (block.label == "EC PARAMETERS") {
      // emitted by 'openssl ecparam -genkey' before the key, redundant with it
      continue;
    } else {
      throw CredentialLoadError("Unsupported PEM block '" + block.label + "'");
    }
  }
}

}  // namespace

IdentityCredential IdentityCredential::FromPemFile(const std::filesystem::path& path, SysTimePoint now) {
  const auto content = ReadWholeFile(path, ErrorKind::CredentialLoad);
  try {
    return Build(content, {}, true, now);
  } catch (const CredentialLoadError& ex) {
    throw CredentialLoadError(path.string() + ": " + ex.what());
  }
}

IdentityCredential IdentityCredential::FromFiles(const std::filesystem::path& keyPath,
                                                 const std::filesystem::path& certPath, SysTimePoint now) {
  const auto keyContent = ReadWholeFile(keyPath, ErrorKind::CredentialLoad);
  const auto certContent = ReadWholeFile(certPath, ErrorKind::CredentialLoad);
  return Build(keyContent, certContent, false, now);
}

IdentityCredential IdentityCredential::FromPem(std::string_view combinedPem, SysTimePoint now) {
  return Build(combinedPem, {}, true, now);
}

IdentityCredential IdentityCredential::FromPem(std::string_view keyPem, std::string_view certPem, SysTimePoint now) {
  return Build(keyPem, certPem, false, now);
}

IdentityCredential IdentityCredential::Build(std::string_view keyPem, std::string_view certPem, bool combined,
                                             SysTimePoint now) {
  ParsedMaterial material;
  ParseInto(keyPem, material);
  if (!combined) {
    ParseInto(certPem, material);
  }
  if (material.certs.empty()) {
    throw CredentialLoadError("Certificate not found");
  }
  if (!material.key) {
    throw CredentialLoadError("Private key not found");
  }

  X509Ptr leaf = std::move(material.certs.front());
  std::vector<X509Ptr> chain;
  chain.reserve(material.certs.size() - 1U);
  for (std::size_t idx = 1; idx < material.certs.size(); ++idx) {
    chain.push_back(std::move(material.certs[idx]));
  }

  if (::X509_check_private_key(leaf.get(), material.key.get()) != 1) {
    ::ERR_clear_error();
    throw KeyMismatchError("Private key does not match the certificate public key");
  }

  Identity identity;
  try {
    identity = ExtractIdentity(leaf.get());
  } catch (const std::runtime_error& ex) {
    throw CredentialLoadError(std::string("Invalid certificate: ") + ex.what());
  }

  IdentityCredential credential(std::move(material.key), std::move(leaf), std::move(chain), std::move(identity));
  credential.checkValidity(now);

  log::debug("Loaded identity {} ({} key, chain length {}, expires {})", credential._identity.displayName(),
             credential.keyType(), credential._chain.size(), TimeToStringISO8601UTC(credential.expiry()));
  return credential;
}

void IdentityCredential::checkValidity(SysTimePoint now) const {
  if (now < _identity.notBefore) {
    throw ExpiredCertificateError("Local certificate " + _identity.subject + " is not valid before " +
                                  TimeToStringISO8601UTC(_identity.notBefore));
  }
  if (now > _identity.notAfter) {
    throw ExpiredCertificateError("Local certificate " + _identity.subject + " expired at " +
                                  TimeToStringISO8601UTC(_identity.notAfter));
  }
}

std::vector<std::byte> IdentityCredential::sign(std::span<const std::byte> data) const {
  auto mdCtx = MakeMdCtx();
  // EdDSA keys sign the message directly, without a separate digest
  const EVP_MD* md = (::EVP_PKEY_is_a(_key.get(), "ED25519") == 1 || ::EVP_PKEY_is_a(_key.get(), "ED448") == 1)
                         ? nullptr
                         : ::EVP_sha256();
  if (::EVP_DigestSignInit(mdCtx.get(), nullptr, md, nullptr, _key.get()) != 1) {
    throw SigningError(WithOpenSslErrors("Unable to initialize signature"));
  }
  const auto* in = reinterpret_cast<const unsigned char*>(data.data());
  std::size_t sigLen = 0;
  if (::EVP_DigestSign(mdCtx.get(), nullptr, &sigLen, in, data.size()) != 1) {
    throw SigningError(WithOpenSslErrors("Unable to compute signature length"));
  }
  std::vector<std::byte> signature(sigLen);
  if (::EVP_DigestSign(mdCtx.get(), reinterpret_cast<unsigned char*>(signature.data()), &sigLen, in, data.size()) !=
      1) {
    throw SigningError(WithOpenSslErrors("Signature failed"));
  }
  signature.resize(sigLen);
  return signature;
}

bool IdentityCredential::verify(std::span<const std::byte> data, std::span<const std::byte> signature) const {
  EVP_PKEY* pubKey = ::X509_get0_pubkey(_leaf.get());
  if (pubKey == nullptr) {
    ::ERR_clear_error();
    return false;
  }
  auto mdCtx = MakeMdCtx();
  const EVP_MD* md =
      (::EVP_PKEY_is_a(pubKey, "ED25519") == 1 || ::EVP_PKEY_is_a(pubKey, "ED448") == 1) ? nullptr : ::EVP_sha256();
  const bool ok = ::EVP_DigestVerifyInit(mdCtx.get(), nullptr, md, nullptr, pubKey) == 1 &&
                  ::EVP_DigestVerify(mdCtx.get(), reinterpret_cast<const unsigned char*>(signature.data()),
                                     signature.size(), reinterpret_cast<const unsigned char*>(data.data()),
                                     data.size()) == 1;
  ::ERR_clear_error();
  return ok;
}

void IdentityCredential::presentTo(SSL* ssl) const {
  auto chain = MakeX509BorrowedStack();
  for (const auto& cert : _chain) {
    if (sk_X509_push(chain.get(), cert.get()) <= 0) {
      throw CredentialLoadError("Unable to build certificate chain");
    }
  }
  // certificate, key and chain are up-referenced by OpenSSL
  if (::SSL_use_cert_and_key(ssl, _leaf.get(), _key.get(), chain.get(), 1) != 1) {
    throw CredentialLoadError(WithOpenSslErrors("TLS connection refused the local identity"));
  }
}

std::string_view IdentityCredential::keyType() const noexcept {
  const char* name = ::EVP_PKEY_get0_type_name(_key.get());
  return name == nullptr ? std::string_view("unknown") : std::string_view(name);
}

}  // namespace authly
