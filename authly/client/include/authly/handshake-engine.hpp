#pragma once

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "authly/authly-error.hpp"
#include "authly/base-fd.hpp"
#include "authly/client-config.hpp"
#include "authly/client-tls-context.hpp"
#include "authly/endpoint.hpp"
#include "authly/event.hpp"
#include "authly/handshake-state.hpp"
#include "authly/identity.hpp"
#include "authly/io-waiter.hpp"
#include "authly/session.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-transport.hpp"

namespace authly {

struct HandshakeOptions {
  using TransitionObserver = std::function<void(HandshakeState from, HandshakeState to)>;
  using Clock = std::function<SysTimePoint()>;

  static HandshakeOptions FromConfig(const ClientConfig& config);

  // Budget of the whole attempt, measured from Init.
  std::chrono::milliseconds timeout{std::chrono::seconds{10}};
  // Check that the server certificate is valid for the endpoint host.
  bool verifyHostname{true};
  // Fail with ProtocolViolationError if the server never requests the client certificate.
  bool requireClientAuth{true};
  bool logHandshake{false};
  SessionOptions session;
  // Called after each state change, from the thread running the handshake. Exceptions are logged and ignored.
  TransitionObserver onTransition;
  // Time used for certificate validity checks, SysClock::now if empty.
  Clock clock;
};

// Drives one mutual TLS connection attempt:
//   Init -> TransportConnecting -> TLSNegotiating -> PeerVerifying -> IdentityPresenting -> Established
// with Failed reachable from any non terminal state.
// The peer chain is verified against the trust store before the local identity is presented, so an
// unauthenticated peer never receives any proof of possession of the private key.
// Established is only reached once the server answered a confirmation ping, that is after it accepted the
// client certificate, whatever the TLS version.
// Single use: a retry needs a new engine.
class HandshakeEngine : private ClientHandshakeHooks {
 public:
  HandshakeEngine(Endpoint endpoint, std::shared_ptr<const ClientTlsContext> tlsContext,
                  HandshakeOptions options = {});

  HandshakeEngine(const HandshakeEngine&) = delete;
  HandshakeEngine(HandshakeEngine&&) = delete;
  HandshakeEngine& operator=(const HandshakeEngine&) = delete;
  HandshakeEngine& operator=(HandshakeEngine&&) = delete;

  ~HandshakeEngine() override = default;

  // Run the handshake until Established (returns the Session) or Failed (throws the classified AuthlyError).
  // The socket is closed before any error is thrown.
  // Throws CancelledError if 'stopToken' is triggered before completion, TimeoutError if the deadline passes.
  // Throws std::logic_error if called more than once.
  std::unique_ptr<Session> run(std::stop_token stopToken = {});

  [[nodiscard]] HandshakeState state() const noexcept { return _state; }

  // Kind of the failure when state() is Failed.
  [[nodiscard]] std::optional<ErrorKind> failureKind() const noexcept { return _failureKind; }

  // True while this engine holds an open socket.
  [[nodiscard]] bool transportOpen() const noexcept;

  // Time spent in run(), zero before it started.
  [[nodiscard]] SteadyDuration elapsed() const noexcept { return _elapsed; }

  [[nodiscard]] const Endpoint& endpoint() const noexcept { return _endpoint; }

 private:
  struct PendingFailure {
    ErrorKind kind;
    std::string message;
  };

  bool onPeerCertificateChain(X509* leaf, STACK_OF(X509) * untrusted) noexcept override;

  bool onClientCertificateRequested(SSL* ssl) noexcept override;

  std::unique_ptr<Session> establish(const std::stop_token& stopToken);

  void connectTransport(const std::stop_token& stopToken);

  void negotiate(const std::stop_token& stopToken);

  // Ping / pong round trip proving that the server accepted the client certificate.
  void confirmAcceptance(const std::stop_token& stopToken);

  void sendAll(std::string_view data, const std::stop_token& stopToken);

  [[noreturn]] void throwUnconfirmed(std::string_view what);

  void waitFor(int fd, EventBmp events, const std::stop_token& stopToken);

  [[noreturn]] void throwHandshakeFailure();

  void proveKeyPossession() const;

  void transition(HandshakeState next) noexcept;

  void recordCallbackFailure(ErrorKind kind, const char* message) noexcept;

  void releaseTransport() noexcept;

  [[nodiscard]] SysTimePoint now() const { return _options.clock ? _options.clock() : SysClock::now(); }

  Endpoint _endpoint;
  std::shared_ptr<const ClientTlsContext> _tlsContext;
  HandshakeOptions _options;
  IoWaiter _waiter;
  BaseFd _fd;
  std::optional<TlsTransport> _transport;
  std::optional<PendingFailure> _callbackFailure;
  Identity _peerIdentity;
  SteadyTimePoint _deadline;
  SteadyDuration _elapsed{};
  std::optional<ErrorKind> _failureKind;
  HandshakeState _state{HandshakeState::Init};
  bool _peerVerified{false};
  bool _clientCertificateRequested{false};
};

}  // namespace authly
