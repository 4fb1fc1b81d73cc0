#include "authly/openssl-errors.hpp"

#include <gtest/gtest.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <optional>
#include <string>

#include "authly/authly-error.hpp"

namespace authly {

TEST(OpenSslErrors, ReceivedTlsAlert) {
  EXPECT_EQ(ReceivedTlsAlert(ERR_PACK(ERR_LIB_SSL, 0, SSL_R_TLSV1_ALERT_UNKNOWN_CA)), SSL_AD_UNKNOWN_CA);
  EXPECT_EQ(ReceivedTlsAlert(ERR_PACK(ERR_LIB_SSL, 0, SSL_R_SSLV3_ALERT_CERTIFICATE_EXPIRED)),
            SSL_AD_CERTIFICATE_EXPIRED);
  EXPECT_EQ(ReceivedTlsAlert(ERR_PACK(ERR_LIB_SSL, 0, SSL_R_TLSV13_ALERT_CERTIFICATE_REQUIRED)),
            SSL_AD_CERTIFICATE_REQUIRED);

  // locally detected failures are not alerts from the peer
  EXPECT_EQ(ReceivedTlsAlert(ERR_PACK(ERR_LIB_SSL, 0, SSL_R_CERTIFICATE_VERIFY_FAILED)), std::nullopt);
  EXPECT_EQ(ReceivedTlsAlert(ERR_PACK(ERR_LIB_X509, 0, SSL_AD_REASON_OFFSET + SSL_AD_UNKNOWN_CA)), std::nullopt);
  EXPECT_EQ(ReceivedTlsAlert(0), std::nullopt);
}

TEST(OpenSslErrors, PeerAlertErrorKind) {
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_CERTIFICATE_EXPIRED), ErrorKind::ExpiredCertificate);
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_UNKNOWN_CA), ErrorKind::UntrustedPeer);
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_BAD_CERTIFICATE), ErrorKind::UntrustedPeer);
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_CERTIFICATE_REVOKED), ErrorKind::UntrustedPeer);
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_CERTIFICATE_REQUIRED), ErrorKind::UntrustedPeer);
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_HANDSHAKE_FAILURE), ErrorKind::ProtocolViolation);
  EXPECT_EQ(PeerAlertErrorKind(SSL_AD_PROTOCOL_VERSION), ErrorKind::ProtocolViolation);
}

TEST(OpenSslErrors, DrainReportsFirstReceivedAlert) {
  ::ERR_clear_error();
  ERR_raise(ERR_LIB_SSL, SSL_R_CERTIFICATE_VERIFY_FAILED);
  ERR_raise(ERR_LIB_SSL, SSL_R_SSLV3_ALERT_BAD_CERTIFICATE);
  ERR_raise(ERR_LIB_SSL, SSL_R_TLSV1_ALERT_UNKNOWN_CA);

  std::optional<int> alert;
  const std::string details = DrainOpenSslErrors(alert);
  EXPECT_FALSE(details.empty());
  EXPECT_EQ(alert, SSL_AD_BAD_CERTIFICATE);
  EXPECT_EQ(::ERR_peek_error(), 0UL);
}

TEST(OpenSslErrors, DrainWithoutErrors) {
  ::ERR_clear_error();
  std::optional<int> alert;
  EXPECT_TRUE(DrainOpenSslErrors(alert).empty());
  EXPECT_FALSE(alert.has_value());
  EXPECT_EQ(WithOpenSslErrors("message"), "message");
}

}  // namespace authly
