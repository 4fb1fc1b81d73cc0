#pragma once

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>

#include "authly/client-config.hpp"
#include "authly/endpoint.hpp"
#include "authly/identity-credential.hpp"
#include "authly/tls-raii.hpp"
#include "authly/trust-store.hpp"

namespace authly {

// Callbacks invoked by OpenSSL from within the handshake of one connection. They must not throw: failures are
// reported by returning false, the implementation keeps the failure details for later reporting.
class ClientHandshakeHooks {
 public:
  virtual ~ClientHandshakeHooks() = default;

  // Peer presented its certificate chain. Returning false aborts the handshake.
  virtual bool onPeerCertificateChain(X509* leaf, STACK_OF(X509) * untrusted) noexcept = 0;

  // Peer requested the client certificate. The implementation installs the local identity into 'ssl'.
  // Returning false aborts the handshake.
  virtual bool onClientCertificateRequested(SSL* ssl) noexcept = 0;
};

// Client side OpenSSL context: protocol bounds, cipher list and the routing of certificate verification and
// certificate request callbacks to the ClientHandshakeHooks of each connection.
// Peer chain verification is delegated to the hooks (which use the TrustStore), so the context itself does not
// carry any trust anchor.
class ClientTlsContext {
 public:
  // Throws std::invalid_argument for unsupported TLS versions or cipher list, std::runtime_error on OpenSSL failure.
  ClientTlsContext(const ClientConfig& config, std::shared_ptr<const TrustStore> trustStore,
                   std::shared_ptr<const IdentityCredential> credential);

  ClientTlsContext(const ClientTlsContext&) = delete;
  ClientTlsContext(ClientTlsContext&&) noexcept = default;
  ClientTlsContext& operator=(const ClientTlsContext&) = delete;
  ClientTlsContext& operator=(ClientTlsContext&&) noexcept = default;

  ~ClientTlsContext() = default;

  // Create a client TLS connection over connected socket 'fd', bound to the host of 'endpoint' (SNI for host
  // names) and routing its callbacks to 'hooks', which must outlive the handshake.
  [[nodiscard]] SslPtr newConnection(int fd, const Endpoint& endpoint, ClientHandshakeHooks& hooks) const;

  [[nodiscard]] const TrustStore& trustStore() const noexcept { return *_trustStore; }

  [[nodiscard]] const IdentityCredential& credential() const noexcept { return *_credential; }

  [[nodiscard]] const std::shared_ptr<const TrustStore>& sharedTrustStore() const noexcept { return _trustStore; }

  [[nodiscard]] const std::shared_ptr<const IdentityCredential>& sharedCredential() const noexcept {
    return _credential;
  }

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

 private:
  SslCtxPtr _ctx;
  std::shared_ptr<const TrustStore> _trustStore;
  std::shared_ptr<const IdentityCredential> _credential;
};

}  // namespace authly
