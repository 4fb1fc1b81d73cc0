#include "authly/entity-id.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace authly {

TEST(EntityId, ParseAndFormat) {
  const auto id = EntityId::Parse("e.1234abcd1234abcd1234abcd1234abcd");
  EXPECT_EQ(id.high(), 0x1234abcd1234abcdULL);
  EXPECT_EQ(id.low(), 0x1234abcd1234abcdULL);
  EXPECT_EQ(id.str(), "e.1234abcd1234abcd1234abcd1234abcd");
}

TEST(EntityId, UpperCaseHexIsNormalized) {
  const auto id = EntityId::Parse("e.1234ABCD1234ABCD1234ABCD1234ABCD");
  EXPECT_EQ(id.str(), "e.1234abcd1234abcd1234abcd1234abcd");
}

TEST(EntityId, WrongPrefixIsRejected) {
  EXPECT_FALSE(EntityId::TryParse("d.1234abcd1234abcd1234abcd1234abcd"));
  EXPECT_FALSE(EntityId::TryParse("1234abcd1234abcd1234abcd1234abcd"));
  EXPECT_THROW(EntityId::Parse("s.1234abcd1234abcd1234abcd1234abcd"), std::invalid_argument);
}

TEST(EntityId, WrongLengthOrDigitsAreRejected) {
  EXPECT_FALSE(EntityId::TryParse("e.1234abcd"));
  EXPECT_FALSE(EntityId::TryParse("e.1234abcd1234abcd1234abcd1234abcd00"));
  EXPECT_FALSE(EntityId::TryParse("e.1234abcd1234abcd1234abcd1234abcg"));
  EXPECT_FALSE(EntityId::TryParse(""));
}

TEST(EntityId, ReservedRange) {
  EXPECT_TRUE(EntityId::TryParse("e.00000000000000000000000000000000"));
  EXPECT_FALSE(EntityId::TryParse("e.00000000000000000000000000000001"));
  EXPECT_FALSE(EntityId::TryParse("e.00000000000000000000000000007fff"));
  EXPECT_TRUE(EntityId::TryParse("e.00000000000000000000000000008000"));
  EXPECT_TRUE(EntityId::TryParse("e.00000000000000010000000000000000"));
}

TEST(EntityId, Ordering) {
  EXPECT_LT(EntityId(0, 40000), EntityId(1, 0));
  EXPECT_EQ(EntityId(5, 6), EntityId(5, 6));
  EXPECT_TRUE(EntityId().isZero());
}

}  // namespace authly
