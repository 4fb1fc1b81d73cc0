#pragma once

#include <chrono>
#include <thread>

namespace authly::test {
using namespace std::chrono_literals;

// Poll 'pred' until it returns true or 'timeout' elapses. Returns the last value of 'pred'.
template <class Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = 2s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return pred();
    }
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

}  // namespace authly::test
