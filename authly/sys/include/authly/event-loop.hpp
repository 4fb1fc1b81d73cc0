#pragma once

#include <chrono>
#include <cstdint>
#include <span>

#include "authly/base-fd.hpp"
#include "authly/event.hpp"

namespace authly {

// Thin RAII wrapper over epoll.
// A client only ever watches a handful of descriptors (its socket and a wakeup fd), so the event buffer has a
// fixed capacity and is allocated once at construction.
class EventLoop {
 public:
  static constexpr uint32_t kDefaultCapacity = 8;

  struct EventFd {
    EventFd(int watchedFd, EventBmp events) : eventBmp(events), fd(watchedFd) {}

    EventBmp eventBmp;
    int fd;
    uint32_t _padding;
  };

  explicit EventLoop(uint32_t capacity = kDefaultCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring.
  // Log on error.
  void del(int fd) const;

  // Polls for ready events for at most 'timeout' (negative timeout blocks indefinitely).
  //
  // Returns a span over an internal, reusable buffer.
  //  - On success: returns a non-empty span of ready events.
  //  - On timeout or when interrupted by a signal (EINTR): returns an empty span with non-null data() pointer.
  //  - On unrecoverable poll failure (already logged): returns an empty span with nullptr data() pointer.
  [[nodiscard]] std::span<const EventFd> poll(std::chrono::milliseconds timeout);

  [[nodiscard]] uint32_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  uint32_t _capacity = 0;
  BaseFd _baseFd;
  void* _pEvents = nullptr;
};

}  // namespace authly
