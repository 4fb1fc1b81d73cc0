#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>

#include "authly/session.hpp"

namespace authly {

// Connection attempt running on its own thread.
// Destroying the task requests cancellation and waits for the attempt to finish.
class ConnectTask {
 public:
  using Job = std::function<std::shared_ptr<Session>(std::stop_token)>;

  explicit ConnectTask(Job job);

  ConnectTask(const ConnectTask&) = delete;
  ConnectTask(ConnectTask&&) noexcept = default;
  ConnectTask& operator=(const ConnectTask&) = delete;
  ConnectTask& operator=(ConnectTask&&) noexcept = default;

  ~ConnectTask() = default;

  // Wait for the attempt and return its Session, or rethrow its classified error.
  // Can only be called once (std::future_error afterwards).
  std::shared_ptr<Session> get();

  // Returns true if the attempt finished within 'timeout'.
  [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

  [[nodiscard]] bool ready() const { return waitFor(std::chrono::milliseconds{0}); }

  // Request cancellation. The attempt then fails with CancelledError, unless it already finished.
  void cancel() noexcept { _thread.request_stop(); }

 private:
  // Destroyed after the thread is joined.
  std::future<std::shared_ptr<Session>> _future;
  std::jthread _thread;
};

}  // namespace authly
