#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "authly/authly-error.hpp"

namespace authly {

// Pop all errors of the calling thread's OpenSSL error queue, joined with "; ". Empty string if there were none.
std::string DrainOpenSslErrors();

// Same as above, also reporting in 'receivedAlert' the first fatal TLS alert sent by the peer, if any.
std::string DrainOpenSslErrors(std::optional<int>& receivedAlert);

// Alert description (SSL_AD_*) carried by 'errCode' if it reports a TLS alert received from the peer.
std::optional<int> ReceivedTlsAlert(unsigned long errCode) noexcept;

// Classifies a fatal alert the peer sent about our certificate: ExpiredCertificate for certificate_expired,
// UntrustedPeer when the peer refused our identity (unknown_ca, bad_certificate, certificate_required...),
// ProtocolViolation for any other alert.
ErrorKind PeerAlertErrorKind(int alertDescription) noexcept;

// Pop and log (at error level) all errors of the calling thread's OpenSSL error queue, prefixed by 'context'.
void LogOpenSslErrors(std::string_view context) noexcept;

// 'message', followed by the drained OpenSSL error queue between parentheses when not empty.
std::string WithOpenSslErrors(std::string_view message);

}  // namespace authly
