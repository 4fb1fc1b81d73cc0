#pragma once

#include <cstdint>

#include "authly/event-fd.hpp"
#include "authly/event-loop.hpp"
#include "authly/event.hpp"
#include "authly/timedef.hpp"

namespace authly {

// Blocks the calling thread until a watched descriptor becomes ready, a deadline expires or another thread
// requests a wakeup. Combines an EventLoop with an EventFd so that waiting never spins.
class IoWaiter {
 public:
  enum class Status : std::uint8_t { Ready, Timeout, Woken, Error };

  struct Result {
    Status status;
    EventBmp events;  // ready events of the watched fd, only meaningful when status == Ready
  };

  IoWaiter();

  // Set the descriptor and interest set to wait for. Replaces any previously watched descriptor.
  // Throws std::system_error on failure.
  void watch(int fd, EventBmp events);

  // Stop watching the current descriptor, if any.
  void unwatch() noexcept;

  // Wait until the watched fd is ready, the deadline is reached or wakeup() is called.
  // A wakeup that happened before the call is not lost.
  [[nodiscard]] Result waitUntil(SteadyTimePoint deadline);

  // Wake up a current or future waitUntil call. Safe to call from any thread.
  void wakeup() const noexcept { _wakeupFd.send(); }

  [[nodiscard]] int watchedFd() const noexcept { return _watchedFd; }

 private:
  EventLoop _eventLoop;
  EventFd _wakeupFd;
  int _watchedFd{BaseFd::kClosedFd};
  EventBmp _watchedEvents{};
};

}  // namespace authly
