#include "authly/client-tls-context.hpp"

#include <fmt/format.h>
#include <openssl/prov_ssl.h>
#include <openssl/ssl.h>
#include <openssl/tls1.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "authly/client-config.hpp"
#include "authly/endpoint.hpp"
#include "authly/log.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

namespace {

const int kHooksIndex = []() { return ::SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr); }();

ClientHandshakeHooks* HooksOf(SSL* ssl) {
  return static_cast<ClientHandshakeHooks*>(::SSL_get_ex_data(ssl, kHooksIndex));
}

int ParseTlsVersion(std::string_view ver) {
  if (ver == ClientConfig::kTls12) {
    return TLS1_2_VERSION;
  }
  if (ver == ClientConfig::kTls13) {
    return TLS1_3_VERSION;
  }
  return 0;
}

// Replaces OpenSSL's own chain building: the whole decision is made by the hooks.
int CertVerifyCallback(X509_STORE_CTX* storeCtx, void* /*arg*/) {
  auto* ssl = static_cast<SSL*>(::X509_STORE_CTX_get_ex_data(storeCtx, ::SSL_get_ex_data_X509_STORE_CTX_idx()));
  ClientHandshakeHooks* hooks = ssl == nullptr ? nullptr : HooksOf(ssl);
  if (hooks == nullptr) {
    log::error("Certificate verification requested on a connection without hooks");
    ::X509_STORE_CTX_set_error(storeCtx, X509_V_ERR_APPLICATION_VERIFICATION);
    return 0;
  }
  if (!hooks->onPeerCertificateChain(::X509_STORE_CTX_get0_cert(storeCtx), ::X509_STORE_CTX_get0_untrusted(storeCtx))) {
    ::X509_STORE_CTX_set_error(storeCtx, X509_V_ERR_CERT_REJECTED);
    return 0;
  }
  ::X509_STORE_CTX_set_error(storeCtx, X509_V_OK);
  return 1;
}

int CertRequestCallback(SSL* ssl, void* /*arg*/) {
  ClientHandshakeHooks* hooks = HooksOf(ssl);
  if (hooks == nullptr) {
    log::error("Client certificate requested on a connection without hooks");
    return 0;
  }
  return hooks->onClientCertificateRequested(ssl) ? 1 : 0;
}

}  // namespace

ClientTlsContext::ClientTlsContext(const ClientConfig& config, std::shared_ptr<const TrustStore> trustStore,
                                   std::shared_ptr<const IdentityCredential> credential)
    : _ctx(::SSL_CTX_new(TLS_client_method()), ::SSL_CTX_free),
      _trustStore(std::move(trustStore)),
      _credential(std::move(credential)) {
  if (!_ctx) {
    throw std::runtime_error(WithOpenSslErrors("Failed to create client SSL_CTX"));
  }
  if (!_trustStore || !_credential) {
    throw std::invalid_argument("ClientTlsContext requires a trust store and a credential");
  }

  const int minVersion = ParseTlsVersion(config.minVersion);
  if (minVersion == 0 || ::SSL_CTX_set_min_proto_version(_ctx.get(), minVersion) != 1) {
    throw std::invalid_argument(fmt::format("Unsupported minimum TLS version '{}'", config.minVersion));
  }
  if (!config.maxVersion.empty()) {
    const int maxVersion = ParseTlsVersion(config.maxVersion);
    if (maxVersion == 0 || ::SSL_CTX_set_max_proto_version(_ctx.get(), maxVersion) != 1) {
      throw std::invalid_argument(fmt::format("Unsupported maximum TLS version '{}'", config.maxVersion));
    }
  }
  ::SSL_CTX_set_options(_ctx.get(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION | SSL_OP_NO_TICKET |
                                         SSL_OP_IGNORE_UNEXPECTED_EOF);
  if (!config.cipherList.empty() && ::SSL_CTX_set_cipher_list(_ctx.get(), config.cipherList.c_str()) != 1) {
    throw std::invalid_argument(WithOpenSslErrors("Invalid cipher list"));
  }
  // Sessions are never resumed: each connection performs a full handshake with peer verification.
  ::SSL_CTX_set_session_cache_mode(_ctx.get(), SSL_SESS_CACHE_OFF);

  ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_PEER, nullptr);
  ::SSL_CTX_set_cert_verify_callback(_ctx.get(), &CertVerifyCallback, nullptr);
  ::SSL_CTX_set_cert_cb(_ctx.get(), &CertRequestCallback, nullptr);
}

SslPtr ClientTlsContext::newConnection(int fd, const Endpoint& endpoint, ClientHandshakeHooks& hooks) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl) {
    throw std::runtime_error(WithOpenSslErrors("SSL_new failed"));
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    throw std::runtime_error(WithOpenSslErrors("SSL_set_fd failed"));
  }
  // SNI is only defined for host names (RFC 6066)
  if (!endpoint.isIpLiteral && ::SSL_set_tlsext_host_name(ssl.get(), endpoint.host.c_str()) != 1) {
    throw std::runtime_error(WithOpenSslErrors("Unable to set SNI host name"));
  }
  if (::SSL_set_ex_data(ssl.get(), kHooksIndex, &hooks) != 1) {
    throw std::runtime_error(WithOpenSslErrors("Unable to attach handshake hooks"));
  }
  ::SSL_set_connect_state(ssl.get());
  return ssl;
}

}  // namespace authly
