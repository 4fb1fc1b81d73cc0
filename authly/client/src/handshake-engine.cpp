#include "authly/handshake-engine.hpp"

#include <fmt/format.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "authly/authly-error.hpp"
#include "authly/client-config.hpp"
#include "authly/client-tls-context.hpp"
#include "authly/endpoint.hpp"
#include "authly/event.hpp"
#include "authly/frame.hpp"
#include "authly/handshake-state.hpp"
#include "authly/io-waiter.hpp"
#include "authly/log.hpp"
#include "authly/name-resolver.hpp"
#include "authly/openssl-errors.hpp"
#include "authly/session.hpp"
#include "authly/tcp-connector.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-transport.hpp"
#include "authly/trust-store.hpp"

namespace authly {

namespace {
constexpr std::size_t kPossessionChallengeSize = 32;
// Sequence of the confirmation ping. Sessions number their frames from 1.
constexpr uint64_t kConfirmationSequence = 0;
constexpr std::size_t kConfirmationReadSize = 4096;
}  // namespace

HandshakeOptions HandshakeOptions::FromConfig(const ClientConfig& config) {
  HandshakeOptions options;
  options.timeout = config.handshakeTimeout;
  options.verifyHostname = config.verifyHostname;
  options.requireClientAuth = config.requireClientAuth;
  options.logHandshake = config.logHandshake;
  options.session.requestTimeout = config.requestTimeout;
  options.session.keepAliveIdleTimeout = config.keepAliveIdleTimeout;
  options.session.maxFrameSize = config.maxFrameSize;
  return options;
}

HandshakeEngine::HandshakeEngine(Endpoint endpoint, std::shared_ptr<const ClientTlsContext> tlsContext,
                                 HandshakeOptions options)
    : _endpoint(std::move(endpoint)), _tlsContext(std::move(tlsContext)), _options(std::move(options)) {
  if (!_tlsContext) {
    throw std::invalid_argument("HandshakeEngine requires a TLS context");
  }
}

bool HandshakeEngine::transportOpen() const noexcept {
  return static_cast<bool>(_fd) || (_transport.has_value() && _transport->isOpen());
}

std::unique_ptr<Session> HandshakeEngine::run(std::stop_token stopToken) {
  if (_state != HandshakeState::Init) {
    throw std::logic_error("HandshakeEngine::run can only be called once");
  }
  const auto start = SteadyClock::now();
  _deadline = start + _options.timeout;

  // Cancellation interrupts any wait on the socket.
  std::stop_callback wakeOnStop(stopToken, [this]() { _waiter.wakeup(); });

  try {
    auto session = establish(stopToken);
    _elapsed = SteadyClock::now() - start;
    return session;
  } catch (const AuthlyError& ex) {
    _elapsed = SteadyClock::now() - start;
    _failureKind = ex.kind();
    releaseTransport();
    log::error("Handshake with {} failed in state {} ({}): {}", _endpoint.str(), HandshakeStateName(_state),
               ex.kindName(), ex.what());
    transition(HandshakeState::Failed);
    throw;
  } catch (const std::exception& ex) {
    // Local failures (OpenSSL object creation, epoll) are reported as transport errors.
    _elapsed = SteadyClock::now() - start;
    _failureKind = ErrorKind::Transport;
    releaseTransport();
    log::error("Handshake with {} failed in state {}: {}", _endpoint.str(), HandshakeStateName(_state), ex.what());
    transition(HandshakeState::Failed);
    throw TransportError(fmt::format("Handshake with {} failed: {}", _endpoint.str(), ex.what()));
  }
}

std::unique_ptr<Session> HandshakeEngine::establish(const std::stop_token& stopToken) {
  connectTransport(stopToken);
  negotiate(stopToken);

  if (!_peerVerified) {
    throw ProtocolViolationError(fmt::format("{} completed the handshake without a verified certificate",
                                             _endpoint.str()));
  }
  if (!_clientCertificateRequested && _options.requireClientAuth) {
    throw ProtocolViolationError(
        fmt::format("{} did not request the client certificate, mutual authentication is required", _endpoint.str()));
  }
  confirmAcceptance(stopToken);

  auto session = std::make_unique<Session>(std::move(*_transport), std::move(_peerIdentity), _options.session);
  _transport.reset();
  transition(HandshakeState::Established);
  if (_options.logHandshake) {
    log::info("Mutual TLS session established with {} ({}) as {} using {} {}", _endpoint.str(),
              session->peerIdentity().displayName(), _tlsContext->credential().identity().displayName(),
              session->negotiatedVersion(), session->negotiatedCipher());
  }
  return session;
}

void HandshakeEngine::connectTransport(const std::stop_token& stopToken) {
  transition(HandshakeState::TransportConnecting);
  if (stopToken.stop_requested()) {
    throw CancelledError("Handshake cancelled before connecting");
  }

  // Resolution runs aside so that the deadline and cancellation apply to it as well
  PendingResolution resolution(_endpoint.host, _endpoint.portStr());
  if (!resolution.done()) {
    waitFor(resolution.readyFd(), EventIn, stopToken);
  }
  _waiter.unwatch();
  std::string failureReason;
  AddrInfoPtr addresses = resolution.takeAddresses(failureReason);
  if (!addresses) {
    throw TransportError(fmt::format("Unable to connect to {}: {}", _endpoint.str(), failureReason));
  }

  ConnectResult cnx = ConnectTCP(addresses.get(), _endpoint.host, _endpoint.portStr());
  if (cnx.failure) {
    throw TransportError(fmt::format("Unable to connect to {}: {}", _endpoint.str(), cnx.failureReason));
  }
  _fd = std::move(cnx.fd);
  log::debug("Connecting to {} on fd # {}", _endpoint.str(), _fd.fd());
  if (cnx.connectPending) {
    waitFor(_fd.fd(), EventOut, stopToken);
    const int err = PendingConnectError(_fd.fd());
    if (err != 0) {
      throw TransportError(
          fmt::format("Unable to connect to {}: {}", _endpoint.str(), std::system_category().message(err)));
    }
  }
}

void HandshakeEngine::negotiate(const std::stop_token& stopToken) {
  transition(HandshakeState::TLSNegotiating);

  SslPtr ssl = _tlsContext->newConnection(_fd.fd(), _endpoint, *this);
  _transport.emplace(std::move(ssl), std::move(_fd));

  while (true) {
    if (stopToken.stop_requested()) {
      throw CancelledError(fmt::format("Handshake cancelled in state {}", HandshakeStateName(_state)));
    }
    const TransportHint hint = _transport->handshakeStep();
    if (hint == TransportHint::None) {
      return;
    }
    if (hint == TransportHint::Error) {
      throwHandshakeFailure();
    }
    waitFor(_transport->fd(), hint == TransportHint::WriteReady ? EventOut : EventIn, stopToken);
  }
}

void HandshakeEngine::confirmAcceptance(const std::stop_token& stopToken) {
  // With TLS 1.3 the client finishes its handshake before the server has checked the client certificate,
  // so a refusal only shows up on the first read. A ping round trip makes it part of the handshake.
  log::debug("Waiting for {} to confirm the handshake", _endpoint.str());
  std::string ping;
  AppendFrame(ping, FrameType::Ping, kConfirmationSequence, {});
  sendAll(ping, stopToken);

  FrameDecoder decoder(_options.session.maxFrameSize);
  std::array<char, kConfirmationReadSize> buf;
  while (true) {
    while (auto frame = decoder.next()) {
      switch (frame->type) {
        case FrameType::Pong:
          if (frame->sequence != kConfirmationSequence) {
            throw ProtocolViolationError(fmt::format("{} answered the handshake confirmation with sequence {}",
                                                     _endpoint.str(), frame->sequence));
          }
          if (decoder.bufferedBytes() != 0) {
            throw ProtocolViolationError(
                fmt::format("{} sent unsolicited data before the session was established", _endpoint.str()));
          }
          return;
        case FrameType::Ping: {
          std::string pong;
          AppendFrame(pong, FrameType::Pong, frame->sequence, frame->payload);
          sendAll(pong, stopToken);
          break;
        }
        case FrameType::Close:
          throwUnconfirmed("closed the session");
        default:
          throw ProtocolViolationError(fmt::format("{} sent an unexpected {} frame before confirming the handshake",
                                                   _endpoint.str(), FrameTypeName(frame->type)));
      }
    }
    if (stopToken.stop_requested()) {
      throw CancelledError(fmt::format("Handshake cancelled in state {}", HandshakeStateName(_state)));
    }
    const auto [nbRead, want] = _transport->read(buf.data(), buf.size());
    if (nbRead != 0) {
      decoder.feed(std::string_view(buf.data(), nbRead));
      continue;
    }
    if (want == TransportHint::None) {
      throwUnconfirmed("closed the connection");
    }
    if (want == TransportHint::Error) {
      throwUnconfirmed("broke the connection");
    }
    waitFor(_transport->fd(), want == TransportHint::WriteReady ? EventOut : EventIn, stopToken);
  }
}

void HandshakeEngine::sendAll(std::string_view data, const std::stop_token& stopToken) {
  while (!data.empty()) {
    if (stopToken.stop_requested()) {
      throw CancelledError(fmt::format("Handshake cancelled in state {}", HandshakeStateName(_state)));
    }
    const auto [written, want] = _transport->write(data);
    data.remove_prefix(written);
    if (want == TransportHint::Error) {
      // A peer refusing our certificate closes right after its alert, which may still be readable.
      std::array<char, kConfirmationReadSize> buf;
      static_cast<void>(_transport->read(buf.data(), buf.size()));
      throwUnconfirmed("broke the connection");
    }
    if (want != TransportHint::None) {
      waitFor(_transport->fd(), want == TransportHint::WriteReady ? EventOut : EventIn, stopToken);
    }
  }
}

void HandshakeEngine::throwUnconfirmed(std::string_view what) {
  if (const auto alert = _transport->peerAlert()) {
    ThrowAuthlyError(PeerAlertErrorKind(*alert), fmt::format("{} rejected the handshake with TLS alert '{}'",
                                                             _endpoint.str(), ::SSL_alert_desc_string_long(*alert)));
  }
  throw TransportError(fmt::format("{} {} before confirming the handshake", _endpoint.str(), what));
}

void HandshakeEngine::waitFor(int fd, EventBmp events, const std::stop_token& stopToken) {
  _waiter.watch(fd, events);
  while (true) {
    const auto result = _waiter.waitUntil(_deadline);
    switch (result.status) {
      case IoWaiter::Status::Ready:
        return;
      case IoWaiter::Status::Timeout:
        throw TimeoutError(fmt::format("Handshake with {} timed out after {} ms in state {}", _endpoint.str(),
                                       _options.timeout.count(), HandshakeStateName(_state)));
      case IoWaiter::Status::Woken:
        if (stopToken.stop_requested()) {
          throw CancelledError(fmt::format("Handshake cancelled in state {}", HandshakeStateName(_state)));
        }
        break;
      default:
        throw TransportError(fmt::format("Failed to wait for {} socket readiness", _endpoint.str()));
    }
  }
}

void HandshakeEngine::throwHandshakeFailure() {
  if (_callbackFailure) {
    // The callback already classified the failure, OpenSSL errors only repeat it.
    const std::string details = DrainOpenSslErrors();
    log::debug("OpenSSL errors after rejected handshake: {}", details);
    ThrowAuthlyError(_callbackFailure->kind, _callbackFailure->message);
  }
  std::optional<int> alert;
  std::string details = DrainOpenSslErrors(alert);
  if (alert) {
    ThrowAuthlyError(PeerAlertErrorKind(*alert),
                     fmt::format("{} rejected the TLS handshake with alert '{}' ({})", _endpoint.str(),
                                 ::SSL_alert_desc_string_long(*alert), details));
  }
  if (details.empty()) {
    throw TransportError(fmt::format("Connection to {} closed during TLS handshake", _endpoint.str()));
  }
  throw ProtocolViolationError(fmt::format("TLS handshake with {} failed: {}", _endpoint.str(), details));
}

bool HandshakeEngine::onPeerCertificateChain(X509* leaf, STACK_OF(X509) * untrusted) noexcept {
  transition(HandshakeState::PeerVerifying);
  try {
    TrustStore::VerifyOptions verifyOptions;
    if (_options.verifyHostname) {
      verifyOptions.host = _endpoint.host;
      verifyOptions.hostIsIp = _endpoint.isIpLiteral;
    }
    verifyOptions.at = now();
    verifyOptions.purpose = TrustStore::Purpose::Server;
    _peerIdentity = _tlsContext->trustStore().verifyChain(leaf, untrusted, verifyOptions);
    _peerVerified = true;
    log::debug("Peer {} verified as {}", _endpoint.str(), _peerIdentity.displayName());
    return true;
  } catch (const AuthlyError& ex) {
    recordCallbackFailure(ex.kind(), ex.what());
  } catch (const std::exception& ex) {
    recordCallbackFailure(ErrorKind::MalformedChain, ex.what());
  }
  return false;
}

bool HandshakeEngine::onClientCertificateRequested(SSL* ssl) noexcept {
  if (!_peerVerified) {
    // Never present the local identity to a peer that has not been authenticated.
    recordCallbackFailure(ErrorKind::ProtocolViolation, "Client certificate requested before peer verification");
    return false;
  }
  _clientCertificateRequested = true;
  transition(HandshakeState::IdentityPresenting);
  try {
    const IdentityCredential& credential = _tlsContext->credential();
    credential.checkValidity(now());
    proveKeyPossession();
    credential.presentTo(ssl);
    log::debug("Presenting identity {} to {}", credential.identity().displayName(), _endpoint.str());
    return true;
  } catch (const AuthlyError& ex) {
    recordCallbackFailure(ex.kind(), ex.what());
  } catch (const std::exception& ex) {
    recordCallbackFailure(ErrorKind::CredentialLoad, ex.what());
  }
  return false;
}

void HandshakeEngine::proveKeyPossession() const {
  std::array<std::byte, kPossessionChallengeSize> challenge;
  if (::RAND_bytes(reinterpret_cast<unsigned char*>(challenge.data()), static_cast<int>(challenge.size())) != 1) {
    throw SigningError(WithOpenSslErrors("Unable to generate possession challenge"));
  }
  const IdentityCredential& credential = _tlsContext->credential();
  const auto signature = credential.sign(challenge);
  if (!credential.verify(challenge, signature)) {
    throw SigningError("Signature of the possession challenge does not verify against the certificate");
  }
}

void HandshakeEngine::recordCallbackFailure(ErrorKind kind, const char* message) noexcept {
  if (!_callbackFailure) {
    _callbackFailure.emplace(kind, message);
  }
}

void HandshakeEngine::transition(HandshakeState next) noexcept {
  const HandshakeState prev = _state;
  if (prev == next || IsTerminal(prev)) {
    return;
  }
  _state = next;
  log::debug("Handshake with {}: {} -> {}", _endpoint.host, HandshakeStateName(prev), HandshakeStateName(next));
  if (!_options.onTransition) {
    return;
  }
  try {
    _options.onTransition(prev, next);
  } catch (const std::exception& ex) {
    log::warn("Handshake transition observer threw: {}", ex.what());
  } catch (...) {
    log::warn("Handshake transition observer threw an unknown exception");
  }
}

void HandshakeEngine::releaseTransport() noexcept {
  if (_transport) {
    _transport->shutdown();
    _transport.reset();
  }
  _fd.close();
}

}  // namespace authly
