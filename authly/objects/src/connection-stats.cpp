#include "authly/connection-stats.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include "authly/authly-error.hpp"

namespace authly {

std::string ConnectionStats::json_str() const {
  std::string out;
  out.reserve(512UL);
  out.push_back('{');
  for_each_field([&out](std::string_view name, uint64_t value) {
    fmt::format_to(std::back_inserter(out), "\"{}\":{},", name, value);
  });
  out.append("\"failuresByKind\":{");
  bool first = true;
  for (std::size_t kindPos = 0; kindPos < kNbErrorKinds; ++kindPos) {
    if (failuresByKind[kindPos] == 0) {
      continue;
    }
    if (!first) {
      out.push_back(',');
    } else {
      first = false;
    }
    fmt::format_to(std::back_inserter(out), "\"{}\":{}", ErrorKindName(static_cast<ErrorKind>(kindPos)),
                   failuresByKind[kindPos]);
  }
  out.append("}}");
  return out;
}

void ConnectionStats::recordHandshakeDuration(uint64_t durationNs) noexcept {
  ++handshakeDurationCount;
  handshakeDurationTotalNs += durationNs;
  handshakeDurationMaxNs = std::max(handshakeDurationMaxNs, durationNs);
  lastHandshakeDurationNs = durationNs;
}

}  // namespace authly
