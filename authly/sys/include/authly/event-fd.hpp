#pragma once

#include "authly/base-fd.hpp"

namespace authly {

// Simple RAII class wrapping a Linux eventfd (non-blocking, close-on-exec), used to wake up a blocked poll from
// another thread.
class EventFd {
 public:
  EventFd();

  // Send a wakeup event. Safe to call from any thread.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace authly
