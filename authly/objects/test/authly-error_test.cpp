#include "authly/authly-error.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <set>
#include <stdexcept>
#include <string_view>

namespace authly {

TEST(AuthlyError, ThrowAuthlyErrorThrowsConcreteType) {
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::TrustMaterial, "x"), TrustMaterialError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::CredentialLoad, "x"), CredentialLoadError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::KeyMismatch, "x"), KeyMismatchError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::Transport, "x"), TransportError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::UntrustedPeer, "x"), UntrustedPeerError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::ExpiredCertificate, "x"), ExpiredCertificateError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::MalformedChain, "x"), MalformedChainError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::Signing, "x"), SigningError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::Timeout, "x"), TimeoutError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::ChannelClosed, "x"), ChannelClosedError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::ProtocolViolation, "x"), ProtocolViolationError);
  EXPECT_THROW(ThrowAuthlyError(ErrorKind::Cancelled, "x"), CancelledError);
}

TEST(AuthlyError, CarriesKindAndMessage) {
  try {
    ThrowAuthlyError(ErrorKind::UntrustedPeer, "peer chain rejected");
    FAIL() << "expected exception";
  } catch (const AuthlyError& ex) {
    EXPECT_EQ(ex.kind(), ErrorKind::UntrustedPeer);
    EXPECT_EQ(ex.kindName(), "UntrustedPeerError");
    EXPECT_STREQ(ex.what(), "peer chain rejected");
  }
}

TEST(AuthlyError, CatchableAsRuntimeError) {
  EXPECT_THROW(throw TimeoutError("deadline"), std::runtime_error);
  static_assert(TimeoutError::kKind == ErrorKind::Timeout);
}

TEST(AuthlyError, KindNamesAreUnique) {
  std::set<std::string_view> names;
  for (std::size_t idx = 0; idx < kNbErrorKinds; ++idx) {
    const auto name = ErrorKindName(static_cast<ErrorKind>(idx));
    EXPECT_TRUE(name.ends_with("Error")) << name;
    names.insert(name);
  }
  EXPECT_EQ(names.size(), kNbErrorKinds);
}

TEST(AuthlyError, RetriableKinds) {
  EXPECT_TRUE(IsRetriable(ErrorKind::Transport));
  EXPECT_TRUE(IsRetriable(ErrorKind::Timeout));
  EXPECT_FALSE(IsRetriable(ErrorKind::UntrustedPeer));
  EXPECT_FALSE(IsRetriable(ErrorKind::ExpiredCertificate));
  EXPECT_FALSE(IsRetriable(ErrorKind::MalformedChain));
  EXPECT_FALSE(IsRetriable(ErrorKind::KeyMismatch));
  EXPECT_FALSE(IsRetriable(ErrorKind::Cancelled));
}

TEST(AuthlyError, Phases) {
  EXPECT_EQ(ErrorPhaseOf(ErrorKind::TrustMaterial), ErrorPhase::Load);
  EXPECT_EQ(ErrorPhaseOf(ErrorKind::CredentialLoad), ErrorPhase::Load);
  EXPECT_EQ(ErrorPhaseOf(ErrorKind::KeyMismatch), ErrorPhase::Load);
  EXPECT_EQ(ErrorPhaseOf(ErrorKind::UntrustedPeer), ErrorPhase::Handshake);
  EXPECT_EQ(ErrorPhaseOf(ErrorKind::ChannelClosed), ErrorPhase::Session);
  EXPECT_EQ(ErrorPhaseName(ErrorPhase::Session), "session");
  EXPECT_TRUE(IsConfigurationError(ErrorKind::KeyMismatch));
  EXPECT_FALSE(IsConfigurationError(ErrorKind::Transport));
}

}  // namespace authly
