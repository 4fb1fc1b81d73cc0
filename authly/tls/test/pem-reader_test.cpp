#include "authly/pem-reader.hpp"

#include <gtest/gtest.h>

#include <string>

#include "authly/authly-error.hpp"
#include "authly/temp-file.hpp"
#include "authly/test-pki.hpp"

namespace authly {

TEST(PemReader, LooksLikePem) {
  EXPECT_TRUE(LooksLikePem("garbage\n-----BEGIN CERTIFICATE-----\n"));
  EXPECT_FALSE(LooksLikePem(""));
  EXPECT_FALSE(LooksLikePem(std::string("\x30\x82\x01\x0a", 4)));
}

TEST(PemReader, ParsesBlocksInOrder) {
  const auto material = test::MakeSelfSigned();
  const auto blocks = ParsePemBlocks("leading text\n" + material.certPem + "between\n" + material.keyPem,
                                     ErrorKind::CredentialLoad);
  ASSERT_EQ(blocks.size(), 2U);
  EXPECT_EQ(blocks[0].label, "CERTIFICATE");
  EXPECT_EQ(blocks[0].der, test::ToDer(material.certPem));
  EXPECT_EQ(blocks[1].label, "PRIVATE KEY");
  EXPECT_FALSE(blocks[1].isEncrypted());
}

TEST(PemReader, NoBlock) { EXPECT_TRUE(ParsePemBlocks("nothing here", ErrorKind::TrustMaterial).empty()); }

TEST(PemReader, DetectsEncryptedKeys) {
  const auto encrypted = test::ToEncryptedKeyPem(test::MakeKeyPem(), "password");
  const auto blocks = ParsePemBlocks(encrypted, ErrorKind::CredentialLoad);
  ASSERT_EQ(blocks.size(), 1U);
  EXPECT_TRUE(blocks[0].isEncrypted());
}

TEST(PemReader, MalformedBlockThrowsGivenKind) {
  const std::string truncated = "-----BEGIN CERTIFICATE-----\nMIIB\n";
  EXPECT_THROW((void)ParsePemBlocks(truncated, ErrorKind::TrustMaterial), TrustMaterialError);
  EXPECT_THROW((void)ParsePemBlocks(truncated, ErrorKind::CredentialLoad), CredentialLoadError);
}

TEST(PemReader, ReadWholeFile) {
  test::ScopedTempDir dir;
  test::ScopedTempFile file(dir, "data.bin", std::string("a\0b", 3));
  EXPECT_EQ(ReadWholeFile(file.filePath(), ErrorKind::TrustMaterial), std::string("a\0b", 3));
  EXPECT_THROW((void)ReadWholeFile(dir.dirPath() / "missing", ErrorKind::TrustMaterial), TrustMaterialError);
}

}  // namespace authly
