#pragma once

#include <cstdint>
#include <string_view>

namespace authly {

// States of one mutual TLS connection attempt. Established and Failed are terminal.
enum class HandshakeState : std::uint8_t {
  Init,
  TransportConnecting,
  TLSNegotiating,
  PeerVerifying,
  IdentityPresenting,
  Established,
  Failed,
};

constexpr std::string_view HandshakeStateName(HandshakeState state) noexcept {
  switch (state) {
    case HandshakeState::Init:
      return "Init";
    case HandshakeState::TransportConnecting:
      return "TransportConnecting";
    case HandshakeState::TLSNegotiating:
      return "TLSNegotiating";
    case HandshakeState::PeerVerifying:
      return "PeerVerifying";
    case HandshakeState::IdentityPresenting:
      return "IdentityPresenting";
    case HandshakeState::Established:
      return "Established";
    case HandshakeState::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

constexpr bool IsTerminal(HandshakeState state) noexcept {
  return state == HandshakeState::Established || state == HandshakeState::Failed;
}

}  // namespace authly
