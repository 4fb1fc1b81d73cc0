#include "authly/event-loop.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>

#include "authly/base-fd.hpp"
#include "authly/event.hpp"

using namespace authly;
using namespace std::chrono_literals;

TEST(EventLoop, EventFdKeepsDescriptorAndEvents) {
  const EventLoop::EventFd event{7, EventIn | EventOut};
  EXPECT_EQ(event.fd, 7);
  EXPECT_EQ(event.eventBmp, EventIn | EventOut);
}

TEST(EventLoop, ReportsReadyDescriptor) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  EventLoop loop;
  loop.addOrThrow(EventLoop::EventFd{rd.fd(), EventIn});
  auto events = loop.poll(0ms);
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);

  ASSERT_EQ(::write(wr.fd(), "x", 1), 1);
  events = loop.poll(1000ms);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events.front().fd, rd.fd());
  EXPECT_NE(events.front().eventBmp & EventIn, 0U);

  loop.del(rd.fd());
  EXPECT_TRUE(loop.poll(0ms).empty());
}
