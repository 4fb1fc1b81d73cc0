#include "authly/test-pki.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "authly/tls-raii.hpp"

namespace authly::test {

namespace {

std::atomic<long> gNextSerial{1};

PKeyPtr GenerateKey(KeyAlgorithm alg) {
  const char* algName = "EC";
  if (alg == KeyAlgorithm::Rsa2048) {
    algName = "RSA";
  } else if (alg == KeyAlgorithm::Ed25519) {
    algName = "ED25519";
  }
  PKeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, algName, nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr || ::EVP_PKEY_keygen_init(kctx.get()) != 1) {
    throw std::runtime_error("Unable to initialize key generation");
  }
  if (alg == KeyAlgorithm::Rsa2048 && ::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) != 1) {
    throw std::runtime_error("Unable to set RSA key size");
  }
  if (alg == KeyAlgorithm::EcdsaP256 &&
      ::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1) {
    throw std::runtime_error("Unable to set EC curve");
  }
  EVP_PKEY* pkey = nullptr;
  if (::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    throw std::runtime_error("Key generation failed");
  }
  return MakePKey(pkey);
}

std::string BioContent(BIO* bio) {
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio, &data);
  return {data, static_cast<std::size_t>(len)};
}

std::string CertToPem(X509* cert) {
  auto bio = MakeMemoryBio();
  if (::PEM_write_bio_X509(bio.get(), cert) != 1) {
    throw std::runtime_error("PEM_write_bio_X509 failed");
  }
  return BioContent(bio.get());
}

std::string KeyToPem(EVP_PKEY* key) {
  auto bio = MakeMemoryBio();
  if (::PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM_write_bio_PrivateKey failed");
  }
  return BioContent(bio.get());
}

PKeyPtr KeyFromPem(const std::string& keyPem) {
  auto bio = MakeMemBio(keyPem.data(), static_cast<int>(keyPem.size()));
  EVP_PKEY* key = ::PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (key == nullptr) {
    throw std::runtime_error("Unable to read private key PEM");
  }
  return MakePKey(key);
}

void AddNameEntry(X509_NAME* name, int nid, std::string_view value) {
  if (::X509_NAME_add_entry_by_NID(name, nid, MBSTRING_UTF8, reinterpret_cast<const unsigned char*>(value.data()),
                                   static_cast<int>(value.size()), -1, 0) != 1) {
    throw std::runtime_error("X509_NAME_add_entry_by_NID failed");
  }
}

void AddExtension(X509* cert, X509* issuer, int nid, const std::string& value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
  X509_EXTENSION* ext = ::X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
  if (ext == nullptr) {
    throw std::runtime_error("Invalid certificate extension " + value);
  }
  const int ret = ::X509_add_ext(cert, ext, -1);
  ::X509_EXTENSION_free(ext);
  if (ret != 1) {
    throw std::runtime_error("X509_add_ext failed");
  }
}

std::string SubjectAltNames(const CertOptions& options) {
  std::string san;
  for (const auto& dnsName : options.dnsNames) {
    san.append(san.empty() ? "" : ",").append("DNS:").append(dnsName);
  }
  for (const auto& ip : options.ipAddresses) {
    san.append(san.empty() ? "" : ",").append("IP:").append(ip);
  }
  return san;
}

const char* ExtendedKeyUsage(CertUsage usage) {
  switch (usage) {
    case CertUsage::Server:
      return "serverAuth";
    case CertUsage::Client:
      return "clientAuth";
    default:
      return "serverAuth,clientAuth";
  }
}

// Builds and signs a certificate for 'subjectKey'. Self-signed when issuerCert is null.
X509Ptr BuildCertificate(EVP_PKEY* subjectKey, const CertOptions& options, bool isCa, X509* issuerCert,
                         EVP_PKEY* issuerKey) {
  X509Ptr cert = MakeX509(::X509_new());
  X509* x509 = cert.get();
  ::X509_set_version(x509, X509_VERSION_3);
  ::ASN1_INTEGER_set(::X509_get_serialNumber(x509), gNextSerial.fetch_add(1));
  ::X509_gmtime_adj(::X509_getm_notBefore(x509), static_cast<long>(options.notBeforeOffset.count()));
  ::X509_gmtime_adj(::X509_getm_notAfter(x509), static_cast<long>(options.notAfterOffset.count()));
  ::X509_set_pubkey(x509, subjectKey);

  X509_NAME* name = ::X509_get_subject_name(x509);
  AddNameEntry(name, NID_countryName, "XX");
  AddNameEntry(name, NID_organizationName, "AuthlyTest");
  AddNameEntry(name, NID_commonName, options.commonName);
  if (!options.entityId.empty()) {
    AddNameEntry(name, NID_x500UniqueIdentifier, options.entityId);
  }
  X509* issuer = issuerCert == nullptr ? x509 : issuerCert;
  ::X509_set_issuer_name(x509, ::X509_get_subject_name(issuer));

  AddExtension(x509, issuer, NID_subject_key_identifier, "hash");
  if (issuerCert != nullptr) {
    AddExtension(x509, issuer, NID_authority_key_identifier, "keyid:always");
  }
  if (isCa) {
    AddExtension(x509, issuer, NID_basic_constraints, "critical,CA:TRUE");
    AddExtension(x509, issuer, NID_key_usage, "critical,keyCertSign,cRLSign");
  } else {
    AddExtension(x509, issuer, NID_basic_constraints, "critical,CA:FALSE");
    AddExtension(x509, issuer, NID_key_usage, "critical,digitalSignature,keyEncipherment");
    AddExtension(x509, issuer, NID_ext_key_usage, ExtendedKeyUsage(options.usage));
    const std::string san = SubjectAltNames(options);
    if (!san.empty()) {
      AddExtension(x509, issuer, NID_subject_alt_name, san);
    }
  }

  EVP_PKEY* signingKey = issuerKey == nullptr ? subjectKey : issuerKey;
  const EVP_MD* md = ::EVP_PKEY_get_id(signingKey) == EVP_PKEY_ED25519 ? nullptr : ::EVP_sha256();
  if (::X509_sign(x509, signingKey, md) <= 0) {
    throw std::runtime_error("X509_sign failed");
  }
  return cert;
}

}  // namespace

TestCa::TestCa(const std::string& commonName, KeyAlgorithm alg)
    : TestCa(GenerateKey(alg), X509Ptr{nullptr, ::X509_free}, {}) {
  CertOptions options;
  options.commonName = commonName;
  options.notAfterOffset = std::chrono::hours{24};
  _cert = BuildCertificate(_key.get(), options, true, nullptr, nullptr);
  _certPem = CertToPem(_cert.get());
}

TestCa::TestCa(PKeyPtr key, X509Ptr cert, std::string chainPem)
    : _key(std::move(key)), _cert(std::move(cert)), _keyPem(KeyToPem(_key.get())), _chainPem(std::move(chainPem)) {
  if (_cert) {
    _certPem = CertToPem(_cert.get());
  }
}

TestCa TestCa::issueIntermediate(const std::string& commonName) const {
  CertOptions options;
  options.commonName = commonName;
  options.notAfterOffset = std::chrono::hours{24};
  PKeyPtr key = GenerateKey(KeyAlgorithm::EcdsaP256);
  X509Ptr cert = BuildCertificate(key.get(), options, true, _cert.get(), _key.get());
  std::string chainPem = CertToPem(cert.get()) + _chainPem;
  return {std::move(key), std::move(cert), std::move(chainPem)};
}

CertKey TestCa::issue(const CertOptions& options) const {
  PKeyPtr key = GenerateKey(options.keyAlgorithm);
  X509Ptr cert = BuildCertificate(key.get(), options, false, _cert.get(), _key.get());
  return {CertToPem(cert.get()), _chainPem, KeyToPem(key.get())};
}

CertKey MakeSelfSigned(const CertOptions& options) {
  PKeyPtr key = GenerateKey(options.keyAlgorithm);
  X509Ptr cert = BuildCertificate(key.get(), options, false, nullptr, nullptr);
  return {CertToPem(cert.get()), std::string{}, KeyToPem(key.get())};
}

std::string MakeKeyPem(KeyAlgorithm alg) { return KeyToPem(GenerateKey(alg).get()); }

std::string ToTraditionalKeyPem(const std::string& pkcs8Pem) {
  PKeyPtr key = KeyFromPem(pkcs8Pem);
  auto bio = MakeMemoryBio();
  if (::PEM_write_bio_PrivateKey_traditional(bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM_write_bio_PrivateKey_traditional failed");
  }
  return BioContent(bio.get());
}

std::string ToEncryptedKeyPem(const std::string& pkcs8Pem, const std::string& password) {
  PKeyPtr key = KeyFromPem(pkcs8Pem);
  auto bio = MakeMemoryBio();
  if (::PEM_write_bio_PKCS8PrivateKey(bio.get(), key.get(), ::EVP_aes_256_cbc(), password.data(),
                                      static_cast<int>(password.size()), nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM_write_bio_PKCS8PrivateKey failed");
  }
  return BioContent(bio.get());
}

std::string ToDer(const std::string& certPem) {
  auto bio = MakeMemBio(certPem.data(), static_cast<int>(certPem.size()));
  X509Ptr cert = MakeX509(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  unsigned char* der = nullptr;
  const int len = ::i2d_X509(cert.get(), &der);
  if (len <= 0) {
    throw std::runtime_error("i2d_X509 failed");
  }
  std::string out(reinterpret_cast<const char*>(der), static_cast<std::size_t>(len));
  OPENSSL_free(der);
  return out;
}

}  // namespace authly::test
