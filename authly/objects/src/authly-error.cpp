#include "authly/authly-error.hpp"

#include <string>
#include <string_view>

namespace authly {

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::TrustMaterial:
      return "TrustMaterialError";
    case ErrorKind::CredentialLoad:
      return "CredentialLoadError";
    case ErrorKind::KeyMismatch:
      return "KeyMismatchError";
    case ErrorKind::Transport:
      return "TransportError";
    case ErrorKind::UntrustedPeer:
      return "UntrustedPeerError";
    case ErrorKind::ExpiredCertificate:
      return "ExpiredCertificateError";
    case ErrorKind::MalformedChain:
      return "MalformedChainError";
    case ErrorKind::Signing:
      return "SigningError";
    case ErrorKind::Timeout:
      return "TimeoutError";
    case ErrorKind::ChannelClosed:
      return "ChannelClosedError";
    case ErrorKind::ProtocolViolation:
      return "ProtocolViolationError";
    case ErrorKind::Cancelled:
      return "CancelledError";
    default:
      return "UnknownError";
  }
}

std::string_view ErrorPhaseName(ErrorPhase phase) noexcept {
  switch (phase) {
    case ErrorPhase::Load:
      return "load";
    case ErrorPhase::Handshake:
      return "handshake";
    case ErrorPhase::Session:
      return "session";
    default:
      return "unknown";
  }
}

void ThrowAuthlyError(ErrorKind kind, const std::string& what) {
  switch (kind) {
    case ErrorKind::TrustMaterial:
      throw TrustMaterialError(what);
    case ErrorKind::CredentialLoad:
      throw CredentialLoadError(what);
    case ErrorKind::KeyMismatch:
      throw KeyMismatchError(what);
    case ErrorKind::Transport:
      throw TransportError(what);
    case ErrorKind::UntrustedPeer:
      throw UntrustedPeerError(what);
    case ErrorKind::ExpiredCertificate:
      throw ExpiredCertificateError(what);
    case ErrorKind::MalformedChain:
      throw MalformedChainError(what);
    case ErrorKind::Signing:
      throw SigningError(what);
    case ErrorKind::Timeout:
      throw TimeoutError(what);
    case ErrorKind::ChannelClosed:
      throw ChannelClosedError(what);
    case ErrorKind::ProtocolViolation:
      throw ProtocolViolationError(what);
    case ErrorKind::Cancelled:
      throw CancelledError(what);
    default:
      throw AuthlyError(kind, what);
  }
}

}  // namespace authly
