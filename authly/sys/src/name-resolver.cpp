#include "authly/name-resolver.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "authly/event-fd.hpp"
#include "authly/log.hpp"

namespace authly {

struct PendingResolution::State {
  State(std::string_view hostName, std::string_view portName) : host(hostName), port(portName) {}

  State(const State&) = delete;
  State(State&&) = delete;
  State& operator=(const State&) = delete;
  State& operator=(State&&) = delete;

  ~State() {
    if (result != nullptr) {
      ::freeaddrinfo(result);
    }
  }

  // getaddrinfo expects null-terminated strings
  const std::string host;
  const std::string port;
  EventFd readyEvent;
  addrinfo* result{nullptr};
  int gaiError{0};
  std::atomic<bool> finished{false};
};

PendingResolution::PendingResolution(std::string_view host, std::string_view port, int family)
    : _state(std::make_shared<State>(host, port)) {
  // The helper owns its own reference to the state so that the caller may leave at any time
  std::thread([state = _state, family]() {
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = SOCK_STREAM;

    state->gaiError = ::getaddrinfo(state->host.c_str(), state->port.c_str(), &hints, &state->result);
    state->finished.store(true, std::memory_order_release);
    state->readyEvent.send();
  }).detach();
}

int PendingResolution::readyFd() const noexcept { return _state->readyEvent.fd(); }

bool PendingResolution::done() const noexcept { return _state->finished.load(std::memory_order_acquire); }

std::string_view PendingResolution::host() const noexcept { return _state->host; }

AddrInfoPtr PendingResolution::takeAddresses(std::string& failureReason) {
  if (!done()) {
    throw std::logic_error("Name resolution is still in progress");
  }
  if (_state->gaiError != 0) {
    log::warn("getaddrinfo('{}', '{}') failed: {}", _state->host, _state->port, ::gai_strerror(_state->gaiError));
    failureReason = "cannot resolve '" + _state->host + "': " + ::gai_strerror(_state->gaiError);
    return {nullptr, &::freeaddrinfo};
  }
  return {std::exchange(_state->result, nullptr), &::freeaddrinfo};
}

}  // namespace authly
