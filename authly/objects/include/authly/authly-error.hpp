#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace authly {

// Classification of every failure surfaced by the client.
enum class ErrorKind : std::uint8_t {
  TrustMaterial,
  CredentialLoad,
  KeyMismatch,
  Transport,
  UntrustedPeer,
  ExpiredCertificate,
  MalformedChain,
  Signing,
  Timeout,
  ChannelClosed,
  ProtocolViolation,
  Cancelled,
};

inline constexpr std::size_t kNbErrorKinds = static_cast<std::size_t>(ErrorKind::Cancelled) + 1U;

// Phase in which an error kind is raised.
enum class ErrorPhase : std::uint8_t { Load, Handshake, Session };

[[nodiscard]] std::string_view ErrorKindName(ErrorKind kind) noexcept;

[[nodiscard]] std::string_view ErrorPhaseName(ErrorPhase phase) noexcept;

// Transient transport-level failures, which may be retried with the same trust policy.
[[nodiscard]] constexpr bool IsRetriable(ErrorKind kind) noexcept {
  return kind == ErrorKind::Transport || kind == ErrorKind::Timeout;
}

// Failures caused by local trust material or credential files. They are never retried.
[[nodiscard]] constexpr bool IsConfigurationError(ErrorKind kind) noexcept {
  return kind == ErrorKind::TrustMaterial || kind == ErrorKind::CredentialLoad || kind == ErrorKind::KeyMismatch;
}

// Load kinds map to Load, ChannelClosed to Session and everything else to Handshake.
// Timeout and ProtocolViolation may also be raised by an established Session.
[[nodiscard]] constexpr ErrorPhase ErrorPhaseOf(ErrorKind kind) noexcept {
  if (IsConfigurationError(kind)) {
    return ErrorPhase::Load;
  }
  if (kind == ErrorKind::ChannelClosed) {
    return ErrorPhase::Session;
  }
  return ErrorPhase::Handshake;
}

// Base of all classified client errors.
class AuthlyError : public std::runtime_error {
 public:
  AuthlyError(ErrorKind kind, const std::string& what) : std::runtime_error(what), _kind(kind) {}
  AuthlyError(ErrorKind kind, const char* what) : std::runtime_error(what), _kind(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  [[nodiscard]] std::string_view kindName() const noexcept { return ErrorKindName(_kind); }

 private:
  ErrorKind _kind;
};

template <ErrorKind Kind>
class TypedAuthlyError : public AuthlyError {
 public:
  static constexpr ErrorKind kKind = Kind;

  explicit TypedAuthlyError(const std::string& what) : AuthlyError(Kind, what) {}
  explicit TypedAuthlyError(const char* what) : AuthlyError(Kind, what) {}
};

// CA file unreadable, empty or not parseable as certificates.
using TrustMaterialError = TypedAuthlyError<ErrorKind::TrustMaterial>;
// Identity file unreadable, unparseable, encrypted or missing a part.
using CredentialLoadError = TypedAuthlyError<ErrorKind::CredentialLoad>;
// Private key does not match the certificate public key.
using KeyMismatchError = TypedAuthlyError<ErrorKind::KeyMismatch>;
// Name resolution, connection refused or unreachable, I/O failure during handshake.
using TransportError = TypedAuthlyError<ErrorKind::Transport>;
// Peer chain does not lead to a trust anchor, or peer identity is not the expected one.
using UntrustedPeerError = TypedAuthlyError<ErrorKind::UntrustedPeer>;
// A certificate (peer or local) is outside its validity window.
using ExpiredCertificateError = TypedAuthlyError<ErrorKind::ExpiredCertificate>;
// Peer chain is structurally invalid.
using MalformedChainError = TypedAuthlyError<ErrorKind::MalformedChain>;
// Proof-of-possession with the local key failed.
using SigningError = TypedAuthlyError<ErrorKind::Signing>;
// Deadline passed before completion.
using TimeoutError = TypedAuthlyError<ErrorKind::Timeout>;
// The channel was torn down by the peer or closed locally.
using ChannelClosedError = TypedAuthlyError<ErrorKind::ChannelClosed>;
// Unexpected message, framing error or missing mutual authentication.
using ProtocolViolationError = TypedAuthlyError<ErrorKind::ProtocolViolation>;
// The caller requested cancellation.
using CancelledError = TypedAuthlyError<ErrorKind::Cancelled>;

// Throws the concrete error type corresponding to 'kind'.
[[noreturn]] void ThrowAuthlyError(ErrorKind kind, const std::string& what);

}  // namespace authly
