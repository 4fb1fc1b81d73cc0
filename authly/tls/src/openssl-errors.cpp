#include "authly/openssl-errors.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <optional>
#include <string>
#include <string_view>

#include "authly/authly-error.hpp"
#include "authly/log.hpp"

namespace authly {

std::string DrainOpenSslErrors() {
  std::optional<int> receivedAlert;
  return DrainOpenSslErrors(receivedAlert);
}

std::string DrainOpenSslErrors(std::optional<int>& receivedAlert) {
  std::string out;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    if (!out.empty()) {
      out.append("; ");
    }
    out.append(errBuf);
    if (!receivedAlert) {
      receivedAlert = ReceivedTlsAlert(errVal);
    }
  }
  return out;
}

std::optional<int> ReceivedTlsAlert(unsigned long errCode) noexcept {
  // libssl reports a received alert with reason SSL_AD_REASON_OFFSET + alert description
  if (ERR_GET_LIB(errCode) != ERR_LIB_SSL) {
    return std::nullopt;
  }
  const int reason = ERR_GET_REASON(errCode);
  if (reason < SSL_AD_REASON_OFFSET || reason > SSL_AD_REASON_OFFSET + 255) {
    return std::nullopt;
  }
  return reason - SSL_AD_REASON_OFFSET;
}

ErrorKind PeerAlertErrorKind(int alertDescription) noexcept {
  switch (alertDescription) {
    case SSL_AD_CERTIFICATE_EXPIRED:
      return ErrorKind::ExpiredCertificate;
    case SSL_AD_BAD_CERTIFICATE:
      [[fallthrough]];
    case SSL_AD_UNSUPPORTED_CERTIFICATE:
      [[fallthrough]];
    case SSL_AD_CERTIFICATE_REVOKED:
      [[fallthrough]];
    case SSL_AD_CERTIFICATE_UNKNOWN:
      [[fallthrough]];
    case SSL_AD_UNKNOWN_CA:
      [[fallthrough]];
    case SSL_AD_ACCESS_DENIED:
      [[fallthrough]];
    case SSL_AD_CERTIFICATE_REQUIRED:
      return ErrorKind::UntrustedPeer;
    default:
      return ErrorKind::ProtocolViolation;
  }
}

void LogOpenSslErrors(std::string_view context) noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("{}: OpenSSL error: {}", context, std::string_view(errBuf));
  }
}

std::string WithOpenSslErrors(std::string_view message) {
  std::string out(message);
  const auto errors = DrainOpenSslErrors();
  if (!errors.empty()) {
    out.append(" (");
    out.append(errors);
    out.push_back(')');
  }
  return out;
}

}  // namespace authly
