#include "authly/trust-store.hpp"

#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "authly/authly-error.hpp"
#include "authly/identity.hpp"
#include "authly/log.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/pem-reader.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"
#include "authly/x509-utils.hpp"

namespace authly {

namespace {

constexpr std::string_view kCertificateLabel = "CERTIFICATE";

ErrorKind ClassifyVerifyError(int err) noexcept {
  switch (err) {
    case X509_V_ERR_CERT_HAS_EXPIRED:
    case X509_V_ERR_CERT_NOT_YET_VALID:
      return ErrorKind::ExpiredCertificate;
    case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT:
    case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY:
    case X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE:
    case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
    case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
    case X509_V_ERR_CERT_UNTRUSTED:
    case X509_V_ERR_CERT_REJECTED:
    case X509_V_ERR_HOSTNAME_MISMATCH:
    case X509_V_ERR_IP_ADDRESS_MISMATCH:
    case X509_V_ERR_INVALID_PURPOSE:
      return ErrorKind::UntrustedPeer;
    default:
      return ErrorKind::MalformedChain;
  }
}

int ToOpenSslPurpose(TrustStore::Purpose purpose) noexcept {
  switch (purpose) {
    case TrustStore::Purpose::Server:
      return X509_PURPOSE_SSL_SERVER;
    case TrustStore::Purpose::Client:
      return X509_PURPOSE_SSL_CLIENT;
    default:
      return X509_PURPOSE_ANY;
  }
}

}  // namespace

TrustStore TrustStore::FromFile(const std::filesystem::path& path) {
  const auto content = ReadWholeFile(path, ErrorKind::TrustMaterial);
  try {
    return FromPem(content);
  } catch (const TrustMaterialError& ex) {
    throw TrustMaterialError(path.string() + ": " + ex.what());
  }
}

TrustStore TrustStore::FromPem(std::string_view pem) {
  X509_STORE* rawStore = ::X509_STORE_new();
  if (rawStore == nullptr) {
    throw TrustMaterialError(WithOpenSslErrors("Unable to allocate X509 store"));
  }
  TrustStore trustStore(X509StorePtr(rawStore, ::X509_STORE_free));

  auto addAnchor = [&trustStore](X509Ptr cert, std::size_t pos) {
    if (!cert) {
      throw TrustMaterialError(WithOpenSslErrors("Unparseable certificate #" + std::to_string(pos)));
    }
    if (::X509_get0_pubkey(cert.get()) == nullptr) {
      throw TrustMaterialError(WithOpenSslErrors("Certificate #" + std::to_string(pos) + " has no usable public key"));
    }
    // duplicates are tolerated by X509_STORE_add_cert since OpenSSL 1.1.1
    if (::X509_STORE_add_cert(trustStore._store.get(), cert.get()) != 1) {
      throw TrustMaterialError(WithOpenSslErrors("Unable to add certificate #" + std::to_string(pos)));
    }
    try {
      trustStore._anchors.push_back(ExtractIdentity(cert.get()));
    } catch (const std::runtime_error& ex) {
      throw TrustMaterialError("Certificate #" + std::to_string(pos) + ": " + ex.what());
    }
  };

  if (LooksLikePem(pem)) {
    const auto blocks = ParsePemBlocks(pem, ErrorKind::TrustMaterial);
    for (std::size_t idx = 0; idx < blocks.size(); ++idx) {
      if (blocks[idx].label != kCertificateLabel) {
        throw TrustMaterialError("PEM block #" + std::to_string(idx + 1) + " is a '" + blocks[idx].label +
                                 "', expected a certificate");
      }
      addAnchor(ParseCertificateDer(blocks[idx].der), idx + 1);
    }
  } else if (!pem.empty()) {
    addAnchor(ParseCertificateDer(pem), 1);
  }

  if (trustStore._anchors.empty()) {
    throw TrustMaterialError("No trust anchor found");
  }
  log::debug("Trust store loaded with {} anchor(s), first: {}", trustStore._anchors.size(),
             trustStore._anchors.front().subject);
  return trustStore;
}

Identity TrustStore::verifyChain(X509* leaf, STACK_OF(X509) * intermediates, const VerifyOptions& options) const {
  if (leaf == nullptr) {
    throw MalformedChainError("Peer did not present any certificate");
  }
  auto storeCtx = MakeX509StoreCtx();
  if (::X509_STORE_CTX_init(storeCtx.get(), _store.get(), leaf, intermediates) != 1) {
    throw MalformedChainError(WithOpenSslErrors("Unable to initialize chain verification"));
  }
  X509_VERIFY_PARAM* param = ::X509_STORE_CTX_get0_param(storeCtx.get());
  ::X509_VERIFY_PARAM_set_flags(param, X509_V_FLAG_PARTIAL_CHAIN);
  if (options.at) {
    ::X509_VERIFY_PARAM_set_time(param, SysClock::to_time_t(*options.at));
  }
  ::X509_STORE_CTX_set_purpose(storeCtx.get(), ToOpenSslPurpose(options.purpose));
  if (!options.host.empty()) {
    const std::string host(options.host);
    const int rc = options.hostIsIp ? ::X509_VERIFY_PARAM_set1_ip_asc(param, host.c_str())
                                    : ::X509_VERIFY_PARAM_set1_host(param, host.data(), host.size());
    if (rc != 1) {
      throw UntrustedPeerError(WithOpenSslErrors("Invalid expected peer host '" + host + "'"));
    }
  }

  if (::X509_verify_cert(storeCtx.get()) == 1) {
    ::ERR_clear_error();
    try {
      return ExtractIdentity(leaf);
    } catch (const std::runtime_error& ex) {
      throw MalformedChainError(std::string("Peer certificate: ") + ex.what());
    }
  }

  const int err = ::X509_STORE_CTX_get_error(storeCtx.get());
  const int depth = ::X509_STORE_CTX_get_error_depth(storeCtx.get());
  ::ERR_clear_error();
  std::string msg("Peer certificate chain rejected at depth ");
  msg.append(std::to_string(depth));
  msg.append(": ");
  msg.append(::X509_verify_cert_error_string(err));
  if (X509* current = ::X509_STORE_CTX_get_current_cert(storeCtx.get())) {
    msg.append(" [");
    msg.append(X509NameToString(::X509_get_subject_name(current)));
    msg.push_back(']');
  }
  ThrowAuthlyError(ClassifyVerifyError(err), msg);
}

}  // namespace authly
