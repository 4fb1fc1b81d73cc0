#include "authly/trust-store.hpp"

#include <gtest/gtest.h>
#include <openssl/x509.h>

#include <chrono>
#include <string>

#include "authly/authly-error.hpp"
#include "authly/temp-file.hpp"
#include "authly/test-pki.hpp"
#include "authly/timedef.hpp"
#include "authly/tls-raii.hpp"
#include "authly/x509-utils.hpp"

namespace authly {

namespace {

X509Ptr ParsePem(const std::string& pem) { return ParseCertificateDer(test::ToDer(pem)); }

test::CertOptions ServerOptions() {
  test::CertOptions options;
  options.commonName = "authly";
  options.entityId = "e.00000000000000000000000000009000";
  options.usage = test::CertUsage::Server;
  return options;
}

TrustStore::VerifyOptions ForHost(std::string_view host, bool isIp = false) {
  TrustStore::VerifyOptions options;
  options.host = host;
  options.hostIsIp = isIp;
  return options;
}

}  // namespace

TEST(TrustStore, LoadsSingleAnchor) {
  test::TestCa ca("Local CA");
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  ASSERT_EQ(trustStore.size(), 1U);
  EXPECT_EQ(trustStore.anchors().front().commonName, "Local CA");
}

TEST(TrustStore, LoadsSeveralAnchorsInOrder) {
  test::TestCa first("First CA");
  test::TestCa second("Second CA");
  const auto trustStore = TrustStore::FromPem(first.certPem() + second.certPem());
  ASSERT_EQ(trustStore.size(), 2U);
  EXPECT_EQ(trustStore.anchors()[0].commonName, "First CA");
  EXPECT_EQ(trustStore.anchors()[1].commonName, "Second CA");
}

TEST(TrustStore, LoadsDerAnchor) {
  test::TestCa ca("Der CA");
  const auto trustStore = TrustStore::FromPem(test::ToDer(ca.certPem()));
  ASSERT_EQ(trustStore.size(), 1U);
  EXPECT_EQ(trustStore.anchors().front().commonName, "Der CA");
}

TEST(TrustStore, LoadsFromFile) {
  test::TestCa ca;
  test::ScopedTempDir dir;
  test::ScopedTempFile caFile(dir, "local.crt", ca.certPem());
  EXPECT_EQ(TrustStore::FromFile(caFile.filePath()).size(), 1U);
}

TEST(TrustStore, MissingFileIsTrustMaterialError) {
  test::ScopedTempDir dir;
  EXPECT_THROW((void)TrustStore::FromFile(dir.dirPath() / "missing.crt"), TrustMaterialError);
}

TEST(TrustStore, EmptySourceIsTrustMaterialError) {
  EXPECT_THROW((void)TrustStore::FromPem(""), TrustMaterialError);
  test::ScopedTempDir dir;
  test::ScopedTempFile empty(dir, "empty.crt", "");
  EXPECT_THROW((void)TrustStore::FromFile(empty.filePath()), TrustMaterialError);
}

TEST(TrustStore, NonCertificateBlockIsTrustMaterialError) {
  test::TestCa ca;
  EXPECT_THROW((void)TrustStore::FromPem(ca.certPem() + test::MakeKeyPem()), TrustMaterialError);
}

TEST(TrustStore, UnparseableCertificateIsTrustMaterialError) {
  EXPECT_THROW((void)TrustStore::FromPem("-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n"),
               TrustMaterialError);
  EXPECT_THROW((void)TrustStore::FromPem(std::string("\x30\x03\x02\x01\x01", 5)), TrustMaterialError);
}

TEST(TrustStore, VerifiesLeafIssuedByAnchor) {
  test::TestCa ca;
  const auto server = ca.issue(ServerOptions());
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  const auto leaf = ParsePem(server.certPem);

  const Identity identity = trustStore.verifyChain(leaf.get(), nullptr, ForHost("localhost"));
  EXPECT_EQ(identity.commonName, "authly");
  ASSERT_TRUE(identity.entityId.has_value());
  EXPECT_EQ(identity.entityId->str(), "e.00000000000000000000000000009000");
  EXPECT_EQ(identity.issuer, trustStore.anchors().front().subject);
}

TEST(TrustStore, MalformedPeerEntityIdIsMalformedChain) {
  test::TestCa ca;
  auto options = ServerOptions();
  options.entityId = "e.9000";
  const auto server = ca.issue(options);
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  const auto leaf = ParsePem(server.certPem);

  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("localhost")), MalformedChainError);
}

TEST(TrustStore, AnchorWithMalformedEntityIdIsTrustMaterialError) {
  auto options = ServerOptions();
  options.entityId = "not an entity id";
  EXPECT_THROW((void)TrustStore::FromPem(test::MakeSelfSigned(options).certPem), TrustMaterialError);
}

TEST(TrustStore, VerifiesIpAddress) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  const auto leaf = ParsePem(ca.issue(ServerOptions()).certPem);
  EXPECT_NO_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("127.0.0.1", true)));
  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("10.0.0.1", true)), UntrustedPeerError);
}

TEST(TrustStore, HostnameMismatchIsUntrusted) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  const auto leaf = ParsePem(ca.issue(ServerOptions()).certPem);
  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("other.example")), UntrustedPeerError);
}

TEST(TrustStore, VerifiesThroughIntermediate) {
  test::TestCa root("Root CA");
  const auto intermediate = root.issueIntermediate("Intermediate CA");
  const auto server = intermediate.issue(ServerOptions());
  const auto trustStore = TrustStore::FromPem(root.certPem());

  const auto leaf = ParsePem(server.certPem);
  const auto intermediateCert = ParsePem(server.chainPem);
  auto untrusted = MakeX509BorrowedStack();
  sk_X509_push(untrusted.get(), intermediateCert.get());

  EXPECT_NO_THROW((void)trustStore.verifyChain(leaf.get(), untrusted.get(), ForHost("localhost")));
  // without the intermediate, the issuer cannot be found
  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("localhost")), UntrustedPeerError);
}

TEST(TrustStore, IntermediateCanBeTheAnchor) {
  test::TestCa root("Root CA");
  const auto intermediate = root.issueIntermediate("Local CA");
  const auto trustStore = TrustStore::FromPem(intermediate.certPem());
  const auto leaf = ParsePem(intermediate.issue(ServerOptions()).certPem);
  EXPECT_NO_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("localhost")));
}

TEST(TrustStore, UnrelatedAnchorIsUntrusted) {
  test::TestCa ca;
  test::TestCa unrelated("Unrelated CA");
  const auto trustStore = TrustStore::FromPem(unrelated.certPem());
  const auto leaf = ParsePem(ca.issue(ServerOptions()).certPem);
  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("localhost")), UntrustedPeerError);
}

TEST(TrustStore, SelfSignedLeafIsUntrusted) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  const auto leaf = ParsePem(test::MakeSelfSigned(ServerOptions()).certPem);
  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, ForHost("localhost")), UntrustedPeerError);
}

TEST(TrustStore, ExpiredOrNotYetValidLeaf) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());

  auto options = ServerOptions();
  options.notBeforeOffset = -std::chrono::hours{2};
  options.notAfterOffset = -std::chrono::hours{1};
  const auto expired = ParsePem(ca.issue(options).certPem);
  EXPECT_THROW((void)trustStore.verifyChain(expired.get(), nullptr, ForHost("localhost")), ExpiredCertificateError);

  options.notBeforeOffset = std::chrono::minutes{30};
  options.notAfterOffset = std::chrono::hours{2};
  const auto notYetValid = ParsePem(ca.issue(options).certPem);
  EXPECT_THROW((void)trustStore.verifyChain(notYetValid.get(), nullptr, ForHost("localhost")),
               ExpiredCertificateError);
}

TEST(TrustStore, VerificationTimeCanBeGiven) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  const auto leaf = ParsePem(ca.issue(ServerOptions()).certPem);
  auto options = ForHost("localhost");
  options.at = SysClock::now() + std::chrono::hours{2};
  EXPECT_THROW((void)trustStore.verifyChain(leaf.get(), nullptr, options), ExpiredCertificateError);
}

TEST(TrustStore, PurposeIsChecked) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  auto clientOptions = ServerOptions();
  clientOptions.usage = test::CertUsage::Client;
  const auto clientLeaf = ParsePem(ca.issue(clientOptions).certPem);

  auto options = ForHost("localhost");
  EXPECT_THROW((void)trustStore.verifyChain(clientLeaf.get(), nullptr, options), UntrustedPeerError);
  options.purpose = TrustStore::Purpose::Client;
  EXPECT_NO_THROW((void)trustStore.verifyChain(clientLeaf.get(), nullptr, options));
}

TEST(TrustStore, MissingLeafIsMalformedChain) {
  test::TestCa ca;
  const auto trustStore = TrustStore::FromPem(ca.certPem());
  EXPECT_THROW((void)trustStore.verifyChain(nullptr, nullptr, {}), MalformedChainError);
}

}  // namespace authly
