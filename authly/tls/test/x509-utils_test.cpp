#include "authly/x509-utils.hpp"

#include <gtest/gtest.h>
#include <openssl/asn1.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "authly/test-pki.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"

namespace authly {

namespace {

X509Ptr Parse(const std::string& certPem) { return ParseCertificateDer(test::ToDer(certPem)); }

}  // namespace

TEST(X509Utils, ExtractIdentity) {
  test::TestCa ca("Local CA");
  test::CertOptions options;
  options.commonName = "billing";
  options.dnsNames = {"billing.internal", "Billing.Example"};
  options.entityId = "e.0123456789abcdef0123456789abcdef";
  const auto cert = Parse(ca.issue(options).certPem);
  ASSERT_TRUE(cert);

  const Identity identity = ExtractIdentity(cert.get());
  EXPECT_EQ(identity.commonName, "billing");
  EXPECT_NE(identity.subject.find("CN=billing"), std::string::npos);
  EXPECT_NE(identity.issuer.find("CN=Local CA"), std::string::npos);
  EXPECT_EQ(identity.dnsNames, (std::vector<std::string>{"billing.internal", "Billing.Example"}));
  ASSERT_TRUE(identity.entityId.has_value());
  EXPECT_EQ(identity.entityId->str(), "e.0123456789abcdef0123456789abcdef");
  EXPECT_EQ(identity.fingerprint.size(), 64U);
  EXPECT_LT(identity.notBefore, identity.notAfter);
  EXPECT_TRUE(identity.isValidAt(SysClock::now()));
}

TEST(X509Utils, EntityIdFromCommonName) {
  test::CertOptions options;
  options.commonName = "e.fedcba9876543210fedcba9876543210";
  const Identity identity = ExtractIdentity(Parse(test::MakeSelfSigned(options).certPem).get());
  ASSERT_TRUE(identity.entityId.has_value());
  EXPECT_EQ(identity.entityId->str(), "e.fedcba9876543210fedcba9876543210");
}

TEST(X509Utils, MalformedEntityIdIsRejected) {
  test::CertOptions options;
  options.entityId = "e.not-an-id";
  const auto cert = Parse(test::MakeSelfSigned(options).certPem);
  EXPECT_THROW((void)ExtractIdentity(cert.get()), std::runtime_error);

  // an entity id attribute takes precedence over a well formed common name
  options.commonName = "e.fedcba9876543210fedcba9876543210";
  const auto withIdLikeName = Parse(test::MakeSelfSigned(options).certPem);
  EXPECT_THROW((void)ExtractIdentity(withIdLikeName.get()), std::runtime_error);
}

TEST(X509Utils, CommonNameNotShapedLikeEntityIdGivesNoEntityId) {
  const Identity identity = ExtractIdentity(Parse(test::MakeSelfSigned().certPem).get());
  EXPECT_FALSE(identity.entityId.has_value());
  EXPECT_EQ(identity.commonName, "localhost");
}

TEST(X509Utils, FingerprintDiffersBetweenCertificates) {
  const auto first = ExtractIdentity(Parse(test::MakeSelfSigned().certPem).get());
  const auto second = ExtractIdentity(Parse(test::MakeSelfSigned().certPem).get());
  EXPECT_NE(first.fingerprint, second.fingerprint);
  EXPECT_EQ(first.subject, second.subject);
}

TEST(X509Utils, ParseCertificateDerRejectsGarbage) {
  EXPECT_FALSE(ParseCertificateDer(""));
  EXPECT_FALSE(ParseCertificateDer("not a certificate"));
  auto der = test::ToDer(test::MakeSelfSigned().certPem);
  EXPECT_TRUE(ParseCertificateDer(der));
  der.push_back('x');
  EXPECT_FALSE(ParseCertificateDer(der));
}

TEST(X509Utils, Asn1TimeToTimePoint) {
  ASN1_TIME* raw = ::ASN1_TIME_new();
  ASSERT_NE(raw, nullptr);
  ASSERT_EQ(::ASN1_TIME_set_string(raw, "20240229120000Z"), 1);
  EXPECT_EQ(SysClock::to_time_t(Asn1TimeToTimePoint(raw)), 1709208000);
  ::ASN1_TIME_free(raw);

  EXPECT_THROW((void)Asn1TimeToTimePoint(nullptr), std::runtime_error);
}

TEST(X509Utils, NullNameIsEmpty) { EXPECT_TRUE(X509NameToString(nullptr).empty()); }

}  // namespace authly
