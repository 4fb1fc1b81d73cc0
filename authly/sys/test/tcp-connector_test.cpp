#include "authly/tcp-connector.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "authly/base-fd.hpp"
#include "authly/event.hpp"
#include "authly/io-waiter.hpp"
#include "authly/name-resolver.hpp"
#include "authly/timedef.hpp"

using namespace authly;
using namespace std::chrono_literals;

namespace {

// Binds a listening socket on an ephemeral loopback port.
struct LoopbackListener {
  LoopbackListener() : fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd.fd(), 4) != 0) {
      fd.close();
      return;
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd.fd(), reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
  }

  BaseFd fd;
  uint16_t port{};
};

// Waits for the resolution to complete and takes its result.
AddrInfoPtr Resolve(PendingResolution& resolution, std::string& failureReason) {
  IoWaiter waiter;
  waiter.watch(resolution.readyFd(), EventIn);
  if (waiter.waitUntil(SteadyClock::now() + 10s).status != IoWaiter::Status::Ready) {
    failureReason = "resolution did not complete";
    return {nullptr, &::freeaddrinfo};
  }
  return resolution.takeAddresses(failureReason);
}

ConnectResult Connect(std::string_view host, std::string_view port) {
  PendingResolution resolution(host, port);
  std::string failureReason;
  auto addresses = Resolve(resolution, failureReason);
  if (!addresses) {
    ConnectResult res;
    res.failure = true;
    res.failureReason = failureReason;
    return res;
  }
  return ConnectTCP(addresses.get(), host, port);
}

// Returns a loopback port on which nothing listens.
uint16_t UnusedPort() {
  LoopbackListener listener;
  return listener.port;  // closed on return
}

}  // namespace

TEST(TcpConnector, ConnectsToLoopbackListener) {
  LoopbackListener listener;
  ASSERT_TRUE(listener.fd);

  auto res = Connect("127.0.0.1", std::to_string(listener.port));
  ASSERT_FALSE(res.failure) << res.failureReason;
  ASSERT_TRUE(res.fd);
  if (res.connectPending) {
    IoWaiter waiter;
    waiter.watch(res.fd.fd(), EventOut);
    ASSERT_EQ(waiter.waitUntil(SteadyClock::now() + 5s).status, IoWaiter::Status::Ready);
  }
  EXPECT_EQ(PendingConnectError(res.fd.fd()), 0);
}

TEST(TcpConnector, RefusedPortReportsErrorAfterCompletion) {
  const auto port = UnusedPort();
  auto res = Connect("127.0.0.1", std::to_string(port));
  if (res.failure) {
    EXPECT_FALSE(res.fd);
    EXPECT_FALSE(res.failureReason.empty());
    return;
  }
  ASSERT_TRUE(res.connectPending);
  IoWaiter waiter;
  waiter.watch(res.fd.fd(), EventOut);
  ASSERT_EQ(waiter.waitUntil(SteadyClock::now() + 5s).status, IoWaiter::Status::Ready);
  EXPECT_NE(PendingConnectError(res.fd.fd()), 0);
}

TEST(TcpConnector, UnresolvableHostFails) {
  PendingResolution resolution("host.invalid", "443");
  std::string failureReason;
  EXPECT_FALSE(Resolve(resolution, failureReason));
  EXPECT_TRUE(resolution.done());
  EXPECT_NE(failureReason.find("cannot resolve 'host.invalid'"), std::string::npos);
}

TEST(TcpConnector, ResolutionSignalsReadyDescriptor) {
  PendingResolution resolution("127.0.0.1", "8443");
  EXPECT_EQ(resolution.host(), "127.0.0.1");
  std::string failureReason;
  auto addresses = Resolve(resolution, failureReason);
  ASSERT_TRUE(addresses) << failureReason;
  EXPECT_EQ(addresses->ai_family, AF_INET);
  EXPECT_EQ(addresses->ai_socktype, SOCK_STREAM);
  EXPECT_TRUE(failureReason.empty());
}

TEST(TcpConnector, ResultsCannotBeTakenBeforeCompletionIsSignalled) {
  PendingResolution resolution("localhost", "443");
  std::string failureReason;
  if (!resolution.done()) {
    EXPECT_THROW(static_cast<void>(resolution.takeAddresses(failureReason)), std::logic_error);
  }
  static_cast<void>(Resolve(resolution, failureReason));
  EXPECT_TRUE(resolution.done());
}

TEST(TcpConnector, AbandonedResolutionsCompleteInBackground) {
  for (int iter = 0; iter < 16; ++iter) {
    PendingResolution resolution("localhost", "443");
  }
  // A resolution started afterwards is unaffected
  PendingResolution resolution("127.0.0.1", "443");
  std::string failureReason;
  EXPECT_TRUE(Resolve(resolution, failureReason)) << failureReason;
}
