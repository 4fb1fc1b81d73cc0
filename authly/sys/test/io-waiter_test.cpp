#include "authly/io-waiter.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "authly/base-fd.hpp"
#include "authly/event.hpp"
#include "authly/timedef.hpp"

using namespace authly;
using namespace std::chrono_literals;

namespace {

struct Pipe {
  Pipe() {
    int fds[2];
    if (::pipe(fds) == 0) {
      rd = BaseFd(fds[0]);
      wr = BaseFd(fds[1]);
    }
  }

  BaseFd rd;
  BaseFd wr;
};

}  // namespace

TEST(IoWaiter, TimesOutWhenNothingIsReady) {
  Pipe pipe;
  ASSERT_TRUE(pipe.rd);
  IoWaiter waiter;
  waiter.watch(pipe.rd.fd(), EventIn);

  const auto start = SteadyClock::now();
  const auto res = waiter.waitUntil(start + 50ms);
  const auto elapsed = SteadyClock::now() - start;

  EXPECT_EQ(res.status, IoWaiter::Status::Timeout);
  EXPECT_GE(elapsed, 50ms);
  EXPECT_LT(elapsed, 2s);
}

TEST(IoWaiter, PastDeadlineReturnsImmediately) {
  IoWaiter waiter;
  const auto res = waiter.waitUntil(SteadyClock::now() - 1s);
  EXPECT_EQ(res.status, IoWaiter::Status::Timeout);
}

TEST(IoWaiter, ReportsReadiness) {
  Pipe pipe;
  ASSERT_TRUE(pipe.rd);
  IoWaiter waiter;
  waiter.watch(pipe.rd.fd(), EventIn);
  ASSERT_EQ(1, ::write(pipe.wr.fd(), "x", 1));

  const auto res = waiter.waitUntil(SteadyClock::now() + 5s);
  EXPECT_EQ(res.status, IoWaiter::Status::Ready);
  EXPECT_NE(res.events & EventIn, 0U);
  EXPECT_EQ(waiter.watchedFd(), pipe.rd.fd());
}

TEST(IoWaiter, WatchSwitchesInterestSet) {
  Pipe pipe;
  ASSERT_TRUE(pipe.wr);
  IoWaiter waiter;
  waiter.watch(pipe.wr.fd(), EventIn);
  EXPECT_EQ(waiter.waitUntil(SteadyClock::now() + 20ms).status, IoWaiter::Status::Timeout);
  waiter.watch(pipe.wr.fd(), EventOut);
  EXPECT_EQ(waiter.waitUntil(SteadyClock::now() + 5s).status, IoWaiter::Status::Ready);
  waiter.unwatch();
  EXPECT_EQ(waiter.watchedFd(), BaseFd::kClosedFd);
}

TEST(IoWaiter, WakeupFromAnotherThreadInterruptsWait) {
  Pipe pipe;
  ASSERT_TRUE(pipe.rd);
  IoWaiter waiter;
  waiter.watch(pipe.rd.fd(), EventIn);

  std::jthread waker([&waiter] {
    std::this_thread::sleep_for(30ms);
    waiter.wakeup();
  });

  const auto start = SteadyClock::now();
  const auto res = waiter.waitUntil(start + 10s);
  EXPECT_EQ(res.status, IoWaiter::Status::Woken);
  EXPECT_LT(SteadyClock::now() - start, 5s);
}

TEST(IoWaiter, WakeupBeforeWaitIsNotLost) {
  IoWaiter waiter;
  waiter.wakeup();
  EXPECT_EQ(waiter.waitUntil(SteadyClock::now() + 5s).status, IoWaiter::Status::Woken);
  // drained: next wait times out
  EXPECT_EQ(waiter.waitUntil(SteadyClock::now() + 10ms).status, IoWaiter::Status::Timeout);
}
