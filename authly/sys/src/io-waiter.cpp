#include "authly/io-waiter.hpp"

#include <chrono>

#include "authly/base-fd.hpp"
#include "authly/errno-throw.hpp"
#include "authly/event.hpp"
#include "authly/timedef.hpp"

namespace authly {

IoWaiter::IoWaiter() { _eventLoop.addOrThrow(EventLoop::EventFd{_wakeupFd.fd(), EventIn}); }

void IoWaiter::watch(int fd, EventBmp events) {
  if (fd == _watchedFd) {
    if (events == _watchedEvents) {
      return;
    }
    if (!_eventLoop.mod(EventLoop::EventFd{fd, events})) {
      throw_errno("Unable to update watched events of fd # {}", fd);
    }
  } else {
    unwatch();
    _eventLoop.addOrThrow(EventLoop::EventFd{fd, events});
    _watchedFd = fd;
  }
  _watchedEvents = events;
}

void IoWaiter::unwatch() noexcept {
  if (_watchedFd != BaseFd::kClosedFd) {
    _eventLoop.del(_watchedFd);
    _watchedFd = BaseFd::kClosedFd;
    _watchedEvents = {};
  }
}

IoWaiter::Result IoWaiter::waitUntil(SteadyTimePoint deadline) {
  while (true) {
    const auto now = SteadyClock::now();
    if (now >= deadline) {
      return {Status::Timeout, 0};
    }
    // Round up so that we never wake up just before the deadline and spin on a zero timeout.
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
    const auto events = _eventLoop.poll(remaining);
    if (events.data() == nullptr) {
      return {Status::Error, 0};
    }
    Result result{Status::Timeout, 0};
    for (const auto& event : events) {
      if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.read();
        return {Status::Woken, 0};
      }
      if (event.fd == _watchedFd) {
        result = {Status::Ready, event.eventBmp};
      }
    }
    if (result.status == Status::Ready) {
      return result;
    }
    // timeout, EINTR: loop and re-check deadline
  }
}

}  // namespace authly
