#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "authly/authly-error.hpp"

namespace authly {

// Connection establishment counters of a ConnectionManager.
struct ConnectionStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of scalar numeric fields (order matches serialization prefix order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("connectAttempts", connectAttempts);
    fun("handshakesSucceeded", handshakesSucceeded);
    fun("connectFailures", connectFailures);
    fun("retries", retries);
    fun("supersessions", supersessions);
    fun("handshakeDurationCount", handshakeDurationCount);
    fun("handshakeDurationTotalNs", handshakeDurationTotalNs);
    fun("handshakeDurationMaxNs", handshakeDurationMaxNs);
    fun("lastHandshakeDurationNs", lastHandshakeDurationNs);
  }

  [[nodiscard]] uint64_t failuresOf(ErrorKind kind) const noexcept {
    return failuresByKind[static_cast<std::size_t>(kind)];
  }

  void recordFailure(ErrorKind kind) noexcept {
    ++connectFailures;
    ++failuresByKind[static_cast<std::size_t>(kind)];
  }

  void recordHandshakeDuration(uint64_t durationNs) noexcept;

  uint64_t connectAttempts{};  // handshake attempts, retries included
  uint64_t handshakesSucceeded{};
  uint64_t connectFailures{};  // failed connect calls (after retries)
  uint64_t retries{};
  uint64_t supersessions{};  // live sessions closed by a new connect
  uint64_t handshakeDurationCount{};
  uint64_t handshakeDurationTotalNs{};
  uint64_t handshakeDurationMaxNs{};
  uint64_t lastHandshakeDurationNs{};
  std::array<uint64_t, kNbErrorKinds> failuresByKind{};
};

}  // namespace authly
