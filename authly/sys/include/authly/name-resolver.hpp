#pragma once

#include <netdb.h>

#include <memory>
#include <string>
#include <string_view>

namespace authly {

using AddrInfoPtr = std::unique_ptr<addrinfo, void (*)(addrinfo*)>;

// Host name resolution (getaddrinfo) running on a helper thread, so that the caller can wait for it with its
// own deadline and wakeup source instead of blocking in the resolver.
// The object may be destroyed at any time: an abandoned resolution finishes in the background and frees its result.
class PendingResolution {
 public:
  // Starts resolving host:port for stream sockets. 'family' filters the address family, 0 for unspecified.
  // Throws std::system_error if the helper thread or its notification descriptor cannot be created.
  PendingResolution(std::string_view host, std::string_view port, int family = 0);

  // Descriptor that becomes readable once the resolution is done.
  [[nodiscard]] int readyFd() const noexcept;

  [[nodiscard]] bool done() const noexcept;

  [[nodiscard]] std::string_view host() const noexcept;

  // Takes the resolved address list. Returns null if the resolution failed, with the cause in 'failureReason'.
  // Throws std::logic_error if called before done().
  AddrInfoPtr takeAddresses(std::string& failureReason);

 private:
  struct State;

  std::shared_ptr<State> _state;
};

}  // namespace authly
